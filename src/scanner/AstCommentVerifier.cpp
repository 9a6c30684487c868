#include "scanner/AstCommentVerifier.hpp"
#include "util/Logger.hpp"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <unordered_map>

extern "C" {
const TSLanguage* tree_sitter_rust(void);
const TSLanguage* tree_sitter_python(void);
const TSLanguage* tree_sitter_javascript(void);
const TSLanguage* tree_sitter_typescript(void);
const TSLanguage* tree_sitter_go(void);
const TSLanguage* tree_sitter_java(void);
const TSLanguage* tree_sitter_c(void);
const TSLanguage* tree_sitter_cpp(void);
const TSLanguage* tree_sitter_ruby(void);
}

namespace debtscan::scanner {

namespace {

using GrammarFn = const TSLanguage* (*)(void);

// Keyed by LanguageSyntax::name
const std::unordered_map<std::string, GrammarFn>& grammars() {
    static const std::unordered_map<std::string, GrammarFn> table = {
        {"Rust", tree_sitter_rust},
        {"Python", tree_sitter_python},
        {"JavaScript", tree_sitter_javascript},
        {"TypeScript", tree_sitter_typescript},
        {"Go", tree_sitter_go},
        {"Java", tree_sitter_java},
        {"C", tree_sitter_c},
        {"C++", tree_sitter_cpp},
        {"Ruby", tree_sitter_ruby},
    };
    return table;
}

// line_comment, block_comment, comment, ...
bool is_comment_node(TSNode node) {
    const char* type = ts_node_type(node);
    return type && std::strstr(type, "comment") != nullptr;
}

std::vector<size_t> line_start_offsets(std::string_view content) {
    std::vector<size_t> starts{0};
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') starts.push_back(i + 1);
    }
    return starts;
}

}  // namespace

AstCommentVerifier::AstCommentVerifier(TagVocabulary vocabulary)
    : baseline_(std::move(vocabulary)) {}

bool AstCommentVerifier::has_grammar(const std::string& language_name) {
    return grammars().count(language_name) > 0;
}

std::optional<std::vector<std::pair<size_t, size_t>>> AstCommentVerifier::comment_ranges(
    std::string_view content, const std::string& language_name, std::string* failure) {

    auto set_failure = [&](const std::string& reason) {
        if (failure) *failure = reason;
    };

    auto grammar = grammars().find(language_name);
    if (grammar == grammars().end()) {
        set_failure("no grammar for " + language_name);
        return std::nullopt;
    }

    // TSParser is not thread-safe; one per call keeps workers independent
    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), grammar->second())) {
        set_failure("incompatible grammar version for " + language_name);
        return std::nullopt;
    }

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
        ts_parser_parse_string(parser.get(), nullptr, content.data(),
                               static_cast<uint32_t>(content.size())),
        ts_tree_delete);
    if (!tree) {
        set_failure("parser returned no tree");
        return std::nullopt;
    }

    // Error-tolerant: comment nodes are still collected from trees with ERROR nodes
    TSNode root = ts_tree_root_node(tree.get());

    std::vector<std::pair<size_t, size_t>> ranges;

    // Depth-first walk; comment nodes are recorded and not descended into
    TSTreeCursor cursor = ts_tree_cursor_new(root);
    bool descend = true;
    while (true) {
        if (descend) {
            TSNode node = ts_tree_cursor_current_node(&cursor);
            if (is_comment_node(node)) {
                ranges.emplace_back(ts_node_start_byte(node), ts_node_end_byte(node));
            } else if (ts_tree_cursor_goto_first_child(&cursor)) {
                continue;
            }
        }
        if (ts_tree_cursor_goto_next_sibling(&cursor)) {
            descend = true;
            continue;
        }
        if (!ts_tree_cursor_goto_parent(&cursor)) {
            break;
        }
        descend = false;
    }
    ts_tree_cursor_delete(&cursor);

    std::sort(ranges.begin(), ranges.end());
    return ranges;
}

VerificationResult AstCommentVerifier::verify(std::string_view content,
                                              const LanguageSyntax& syntax,
                                              std::vector<model::FindingRecord> candidates) const {
    VerificationResult result;
    result.stats.total_candidates = candidates.size();
    total_candidates_ += candidates.size();

    if (candidates.empty()) {
        return result;
    }

    std::string failure;
    auto ranges = comment_ranges(content, syntax.name, &failure);
    if (!ranges) {
        result.fell_back = true;
        result.fallback_reason = failure;
        result.stats.verified = candidates.size();
        result.stats.fallbacks = 1;
        verified_ += candidates.size();
        fallbacks_++;
        result.findings = std::move(candidates);
        return result;
    }

    const auto line_starts = line_start_offsets(content);

    for (auto& candidate : candidates) {
        bool inside = false;
        if (candidate.line >= 1 && candidate.line <= line_starts.size()) {
            size_t offset = line_starts[candidate.line - 1] + candidate.column;

            // Last range starting at or before offset
            auto it = std::upper_bound(ranges->begin(), ranges->end(), offset,
                [](size_t value, const std::pair<size_t, size_t>& range) {
                    return value < range.first;
                });
            if (it != ranges->begin()) {
                --it;
                inside = offset >= it->first && offset < it->second;
            }
        }

        if (inside) {
            result.findings.push_back(std::move(candidate));
        } else {
            result.stats.filtered++;
        }
    }

    result.stats.verified = result.findings.size();
    verified_ += result.stats.verified;
    filtered_ += result.stats.filtered;
    return result;
}

ExtractionResult AstCommentVerifier::extract(const std::string& file,
                                             std::string_view content,
                                             const LanguageSyntax& syntax) const {
    ExtractionResult result = baseline_.extract(file, content, syntax);
    if (result.error || result.findings.empty()) {
        return result;
    }

    auto verification = verify(content, syntax, std::move(result.findings));
    result.findings = std::move(verification.findings);

    if (verification.fell_back) {
        result.diagnostic = model::ScanError{file, model::ErrorKind::ParseError,
                                             verification.fallback_reason};
        util::Logger::debug("AstCommentVerifier: Keeping baseline candidates for " + file +
                            " (" + verification.fallback_reason + ")");
    } else if (verification.stats.filtered > 0) {
        util::Logger::debug("AstCommentVerifier: Filtered " +
                            std::to_string(verification.stats.filtered) + " of " +
                            std::to_string(verification.stats.total_candidates) +
                            " candidates in " + file);
    }

    return result;
}

VerificationStats AstCommentVerifier::totals() const {
    VerificationStats stats;
    stats.total_candidates = total_candidates_.load();
    stats.verified = verified_.load();
    stats.filtered = filtered_.load();
    stats.fallbacks = fallbacks_.load();
    return stats;
}

}  // namespace debtscan::scanner
