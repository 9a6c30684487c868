#include "scanner/TagVocabulary.hpp"
#include "util/UnicodeUtils.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace debtscan::scanner {

const std::vector<std::string>& TagVocabulary::builtin_tags() {
    static const std::vector<std::string> tags = {"TODO", "FIXME", "HACK", "BUG", "XXX"};
    return tags;
}

TagVocabulary::TagVocabulary() : TagVocabulary(builtin_tags(), true) {}

TagVocabulary::TagVocabulary(const std::vector<std::string>& tags, bool case_sensitive)
    : case_sensitive_(case_sensitive) {
    for (const auto& raw : tags) {
        if (raw.empty()) continue;

        std::string tag = case_sensitive_ ? raw : util::to_upper(raw);
        if (std::find(tags_.begin(), tags_.end(), tag) != tags_.end()) continue;

        tags_.push_back(tag);
    }

    // Longest first so "FIXME" is tried before a custom "FIX" at the same column
    std::stable_sort(tags_.begin(), tags_.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });

    searchers_.reserve(tags_.size());
    for (const auto& tag : tags_) {
        searchers_.emplace_back(tag, case_sensitive_);
    }

    util::Logger::debug("TagVocabulary: " + std::to_string(tags_.size()) + " tags, " +
                        (case_sensitive_ ? "case-sensitive" : "case-insensitive"));
}

std::string TagVocabulary::signature() const {
    std::vector<std::string> sorted = tags_;
    std::sort(sorted.begin(), sorted.end());

    std::string out = case_sensitive_ ? "cs:" : "ci:";
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) out += ',';
        out += sorted[i];
    }
    return out;
}

TagVocabulary TagVocabulary::with_custom(const std::vector<std::string>& custom_tags,
                                         bool case_sensitive) {
    std::vector<std::string> all = builtin_tags();
    all.insert(all.end(), custom_tags.begin(), custom_tags.end());
    return TagVocabulary(all, case_sensitive);
}

}  // namespace debtscan::scanner
