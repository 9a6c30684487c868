#pragma once

#include "scanner/ExtractionStrategy.hpp"
#include "scanner/TagVocabulary.hpp"
#include <functional>

namespace debtscan::scanner {

// Metadata parsed from the parenthetical group of an annotated tag
struct TagMetadata {
    std::optional<std::string> author;
    std::optional<std::string> issue;
    std::optional<model::Priority> priority;
};

/**
 * CommentExtractor: baseline tag scanner.
 *
 * Walks content line by line with a two-state machine (Outside /
 * InsideBlock). Outside a block, whichever of the line marker and the
 * block-open delimiter occurs first on the line decides the span kind;
 * when both start at the same column the block delimiter wins (Lua's
 * "--[[" vs "--"). Inside a block, the first close delimiter ends it.
 *
 * Only comment text is searched for tags. String literals are not
 * modelled, so a marker-like sequence inside a string starts a span;
 * AstCommentVerifier removes those candidates.
 */
class CommentExtractor : public ExtractionStrategy {
public:
    explicit CommentExtractor(TagVocabulary vocabulary = TagVocabulary());

    ExtractionResult extract(const std::string& file,
                             std::string_view content,
                             const LanguageSyntax& syntax) const override;

    std::string name() const override { return "baseline"; }
    std::string signature() const override { return name() + "/" + vocabulary_.signature(); }

    const TagVocabulary& vocabulary() const { return vocabulary_; }

    static ExtractionResult scan(const std::string& file,
                                 std::string_view content,
                                 const LanguageSyntax& syntax,
                                 const TagVocabulary& vocabulary);

    static std::vector<model::CommentSpan> find_spans(std::string_view content,
                                                      const LanguageSyntax& syntax);

    // Classify the comma-separated fields of "TAG(...)"; order does not matter
    static TagMetadata parse_metadata(std::string_view fields);

private:
    // Comment text on one line: [begin, end) columns within `line`
    struct Segment {
        size_t line_number;
        size_t line_offset;
        std::string_view line;
        size_t begin;
        size_t end;
        model::SpanKind kind;
    };

    static void walk_comments(std::string_view content,
                              const LanguageSyntax& syntax,
                              const std::function<void(const Segment&)>& on_segment,
                              const std::function<void(const model::CommentSpan&)>& on_span);

    static void match_segment(const Segment& segment,
                              const TagVocabulary& vocabulary,
                              const std::string& file,
                              std::vector<model::FindingRecord>& out);

    TagVocabulary vocabulary_;
};

}  // namespace debtscan::scanner
