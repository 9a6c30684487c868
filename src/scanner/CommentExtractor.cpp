#include "scanner/CommentExtractor.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cctype>

namespace debtscan::scanner {

namespace {

constexpr size_t npos = std::string_view::npos;

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string_view trim_right(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// "PROJ-123", "GH-7"
bool is_issue_key(std::string_view token) {
    size_t dash = token.find('-');
    if (dash == npos || dash < 2 || dash + 1 >= token.size()) return false;
    if (!std::isupper(static_cast<unsigned char>(token[0]))) return false;
    for (size_t i = 1; i < dash; ++i) {
        char c = token[i];
        if (!std::isupper(static_cast<unsigned char>(c)) && !std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    for (size_t i = dash + 1; i < token.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) return false;
    }
    return true;
}

bool is_identifier(std::string_view token) {
    if (token.empty()) return false;
    char first = token[0];
    if (!std::isalpha(static_cast<unsigned char>(first)) && first != '_') return false;
    for (char c : token) {
        if (!is_word_char(c) && c != '.' && c != '-') return false;
    }
    return true;
}

struct TagHit {
    size_t column;
    size_t length;
    size_t tag_index;
};

}  // namespace

CommentExtractor::CommentExtractor(TagVocabulary vocabulary)
    : vocabulary_(std::move(vocabulary)) {}

ExtractionResult CommentExtractor::extract(const std::string& file,
                                           std::string_view content,
                                           const LanguageSyntax& syntax) const {
    return scan(file, content, syntax, vocabulary_);
}

ExtractionResult CommentExtractor::scan(const std::string& file,
                                        std::string_view content,
                                        const LanguageSyntax& syntax,
                                        const TagVocabulary& vocabulary) {
    ExtractionResult result;

    size_t bad_offset = 0;
    switch (util::check_text(content, &bad_offset)) {
        case util::TextCheck::Ok:
            break;
        case util::TextCheck::ContainsNul:
            result.error = model::ScanError{file, model::ErrorKind::EncodingError,
                "binary content (NUL byte at offset " + std::to_string(bad_offset) + ")"};
            return result;
        case util::TextCheck::InvalidUtf8:
            result.error = model::ScanError{file, model::ErrorKind::EncodingError,
                "invalid UTF-8 at offset " + std::to_string(bad_offset)};
            return result;
    }

    if (vocabulary.empty()) {
        return result;
    }

    walk_comments(content, syntax,
        [&](const Segment& segment) { match_segment(segment, vocabulary, file, result.findings); },
        [](const model::CommentSpan&) {});

    std::stable_sort(result.findings.begin(), result.findings.end(), model::finding_position_less);
    return result;
}

std::vector<model::CommentSpan> CommentExtractor::find_spans(std::string_view content,
                                                             const LanguageSyntax& syntax) {
    std::vector<model::CommentSpan> spans;
    walk_comments(content, syntax,
        [](const Segment&) {},
        [&](const model::CommentSpan& span) { spans.push_back(span); });
    return spans;
}

void CommentExtractor::walk_comments(std::string_view content,
                                     const LanguageSyntax& syntax,
                                     const std::function<void(const Segment&)>& on_segment,
                                     const std::function<void(const model::CommentSpan&)>& on_span) {
    enum class State { Outside, InsideBlock };

    const std::string* marker = nullptr;
    if (syntax.line_marker && !syntax.line_marker->empty()) {
        marker = &*syntax.line_marker;
    }
    const BlockDelimiters* block = nullptr;
    if (syntax.block && !syntax.block->open.empty() && !syntax.block->close.empty()) {
        block = &*syntax.block;
    }
    if (!marker && !block) {
        return;
    }

    State state = State::Outside;
    model::CommentSpan open_block;

    size_t line_number = 0;
    size_t line_offset = 0;
    std::string_view line;

    while (true) {
        size_t newline = content.find('\n', line_offset);
        size_t line_end = newline == npos ? content.size() : newline;
        line = content.substr(line_offset, line_end - line_offset);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        ++line_number;

        size_t pos = 0;
        while (pos <= line.size()) {
            if (state == State::InsideBlock) {
                size_t close = line.find(block->close, pos);
                size_t segment_end = close == npos ? line.size() : close;
                on_segment({line_number, line_offset, line, pos, segment_end, model::SpanKind::Block});
                if (close == npos) {
                    break;
                }

                state = State::Outside;
                pos = close + block->close.size();
                open_block.end_line = line_number;
                open_block.end_column = pos;
                open_block.end_offset = line_offset + pos;
                on_span(open_block);
                continue;
            }

            size_t line_at = marker ? line.find(*marker, pos) : npos;
            size_t block_at = block ? line.find(block->open, pos) : npos;
            if (line_at == npos && block_at == npos) {
                break;
            }

            if (block_at != npos && (line_at == npos || block_at <= line_at)) {
                state = State::InsideBlock;
                open_block = model::CommentSpan{};
                open_block.kind = model::SpanKind::Block;
                open_block.start_line = line_number;
                open_block.start_column = block_at;
                open_block.start_offset = line_offset + block_at;
                pos = block_at + block->open.size();
                continue;
            }

            // Line comment runs to the end of the line
            on_segment({line_number, line_offset, line, line_at + marker->size(), line.size(),
                        model::SpanKind::Line});
            on_span({model::SpanKind::Line, line_number, line_at, line_number, line.size(),
                     line_offset + line_at, line_offset + line.size()});
            break;
        }

        if (newline == npos) {
            break;
        }
        line_offset = newline + 1;
    }

    // Unterminated block comment extends to end of content
    if (state == State::InsideBlock) {
        open_block.end_line = line_number;
        open_block.end_column = line.size();
        open_block.end_offset = content.size();
        on_span(open_block);
    }
}

void CommentExtractor::match_segment(const Segment& segment,
                                     const TagVocabulary& vocabulary,
                                     const std::string& file,
                                     std::vector<model::FindingRecord>& out) {
    if (segment.begin >= segment.end) {
        return;
    }

    std::string_view searchable = segment.line.substr(0, segment.end);
    std::vector<TagHit> hits;

    const auto& searchers = vocabulary.searchers();
    for (size_t t = 0; t < searchers.size(); ++t) {
        const auto& searcher = searchers[t];
        const size_t length = searcher.pattern().size();

        size_t pos = segment.begin;
        while (true) {
            size_t hit = searcher.search(searchable, pos);
            if (hit == util::BoyerMooreSearch::npos) break;
            pos = hit + 1;

            bool left_ok = hit == 0 || !is_word_char(searchable[hit - 1]);
            bool right_ok = hit + length >= searchable.size() || !is_word_char(searchable[hit + length]);
            if (left_ok && right_ok) {
                hits.push_back({hit, length, t});
            }
        }
    }

    if (hits.empty()) {
        return;
    }

    std::sort(hits.begin(), hits.end(), [](const TagHit& a, const TagHit& b) {
        if (a.column != b.column) return a.column < b.column;
        return a.length > b.length;
    });

    const std::string context(trim_right(segment.line));
    size_t covered_until = 0;

    for (const auto& hit : hits) {
        if (hit.column < covered_until) continue;
        covered_until = hit.column + hit.length;

        std::string_view rest = searchable.substr(hit.column + hit.length);
        std::string_view after = rest;
        TagMetadata metadata;

        if (!rest.empty() && rest.front() == '(') {
            size_t close = rest.find(')');
            if (close != npos) {
                metadata = parse_metadata(rest.substr(1, close - 1));
                after = rest.substr(close + 1);
                // Words inside the group are metadata, not further tags
                covered_until = hit.column + hit.length + close + 1;
            }
        }

        while (!after.empty() &&
               (after.front() == ':' || after.front() == '-' ||
                std::isspace(static_cast<unsigned char>(after.front())))) {
            after.remove_prefix(1);
        }
        after = trim_right(after);

        model::FindingRecord finding;
        finding.tag = model::Tag::from_name(vocabulary.tags()[hit.tag_index]);
        finding.message = std::string(after);
        finding.file = file;
        finding.line = segment.line_number;
        finding.column = hit.column;
        finding.author = std::move(metadata.author);
        finding.issue = std::move(metadata.issue);
        finding.priority = metadata.priority;
        finding.context_line = context;
        out.push_back(std::move(finding));
    }
}

TagMetadata CommentExtractor::parse_metadata(std::string_view fields) {
    TagMetadata metadata;

    size_t start = 0;
    while (start <= fields.size()) {
        size_t comma = fields.find(',', start);
        size_t end = comma == npos ? fields.size() : comma;
        std::string_view token = trim(fields.substr(start, end - start));

        if (!token.empty()) {
            if (token.front() == '#') {
                if (!metadata.issue && token.size() > 1) {
                    metadata.issue = std::string(token.substr(1));
                }
            } else if (auto priority = model::priority_from_string(std::string(token))) {
                if (!metadata.priority) metadata.priority = priority;
            } else if (is_issue_key(token)) {
                if (!metadata.issue) metadata.issue = std::string(token);
            } else {
                std::string_view name = token.front() == '@' ? token.substr(1) : token;
                if (!metadata.author && is_identifier(name)) {
                    metadata.author = std::string(name);
                }
                // Anything else (free text, URLs, key=value) is not metadata
            }
        }

        if (comma == npos) break;
        start = comma + 1;
    }

    return metadata;
}

}  // namespace debtscan::scanner
