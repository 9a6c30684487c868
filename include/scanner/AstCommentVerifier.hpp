#pragma once

#include "scanner/CommentExtractor.hpp"
#include <atomic>
#include <utility>

namespace debtscan::scanner {

struct VerificationStats {
    size_t total_candidates = 0;
    size_t verified = 0;
    size_t filtered = 0;
    size_t fallbacks = 0;  // files returned unfiltered (no grammar / parse failure)

    double accuracy_percentage() const {
        if (total_candidates == 0) return 100.0;
        return static_cast<double>(verified) / static_cast<double>(total_candidates) * 100.0;
    }
};

struct VerificationResult {
    std::vector<model::FindingRecord> findings;
    VerificationStats stats;
    bool fell_back = false;
    std::string fallback_reason;
};

/**
 * AstCommentVerifier: precision layer over the baseline scanner.
 *
 * Candidates from the wrapped CommentExtractor are kept only when their
 * byte offset lies inside a comment node of the tree-sitter syntax tree.
 * The layer is fail-open: without a grammar for the language, or when the
 * parser produces no tree, the candidates are returned unchanged. Trees
 * with ERROR nodes are still used for filtering. It never produces a finding the baseline did not.
 */
class AstCommentVerifier : public ExtractionStrategy {
public:
    explicit AstCommentVerifier(TagVocabulary vocabulary = TagVocabulary());

    ExtractionResult extract(const std::string& file,
                             std::string_view content,
                             const LanguageSyntax& syntax) const override;

    std::string name() const override { return "ast-verified"; }
    std::string signature() const override {
        return name() + "/" + baseline_.vocabulary().signature();
    }

    [[nodiscard]] VerificationResult verify(std::string_view content,
                                            const LanguageSyntax& syntax,
                                            std::vector<model::FindingRecord> candidates) const;

    static bool has_grammar(const std::string& language_name);

    // Byte ranges [start, end) of every comment node, in document order.
    // Empty optional when no grammar exists or parsing fails.
    static std::optional<std::vector<std::pair<size_t, size_t>>> comment_ranges(
        std::string_view content, const std::string& language_name, std::string* failure = nullptr);

    // Totals accumulated over every verify() call on this instance
    VerificationStats totals() const;

private:
    CommentExtractor baseline_;

    mutable std::atomic<size_t> total_candidates_{0};
    mutable std::atomic<size_t> verified_{0};
    mutable std::atomic<size_t> filtered_{0};
    mutable std::atomic<size_t> fallbacks_{0};
};

}  // namespace debtscan::scanner
