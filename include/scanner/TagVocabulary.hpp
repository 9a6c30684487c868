#pragma once

#include "util/BoyerMoore.hpp"
#include <string>
#include <vector>

namespace debtscan::scanner {

/**
 * Set of tag keywords the extractor recognizes, supplied by the caller.
 *
 * Built-in and custom tags are matched the same way. Matching is exact-case
 * unless the vocabulary is built case-insensitive, in which case keywords
 * are normalized to uppercase and findings report the normalized name.
 */
class TagVocabulary {
public:
    static const std::vector<std::string>& builtin_tags();

    // Built-in tags only, exact case
    TagVocabulary();
    explicit TagVocabulary(const std::vector<std::string>& tags, bool case_sensitive = true);

    static TagVocabulary with_custom(const std::vector<std::string>& custom_tags,
                                     bool case_sensitive = true);

    const std::vector<std::string>& tags() const { return tags_; }
    const std::vector<util::BoyerMooreSearch>& searchers() const { return searchers_; }
    bool case_sensitive() const { return case_sensitive_; }
    bool empty() const { return tags_.empty(); }

    // Stable text identifying the tag set and case mode, e.g. "cs:FIXME,TODO"
    std::string signature() const;

private:
    std::vector<std::string> tags_;
    std::vector<util::BoyerMooreSearch> searchers_;
    bool case_sensitive_ = true;
};

}  // namespace debtscan::scanner
