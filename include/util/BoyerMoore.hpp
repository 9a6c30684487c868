#pragma once

#include <string>
#include <string_view>
#include <cstddef>

namespace debtscan::util {

/**
 * Boyer-Moore-Horspool (BMH) literal search - O(1) extra space
 * Fast average-case search using only bad-character table.
 *
 * Used by the comment extractor to locate tag keywords inside comment
 * text; one searcher per vocabulary entry, built once and shared
 * read-only across worker threads.
 *
 * Average case: O(n/m) sublinear performance
 * Worst case: O(n*m) (extremely rare)
 */
class BoyerMooreSearch {
public:
    static constexpr size_t npos = std::string_view::npos;

    /**
     * @param pattern The search pattern (at most MAX_PATTERN bytes)
     * @param case_sensitive Whether to compare bytes exactly or ASCII case-folded
     */
    explicit BoyerMooreSearch(std::string_view pattern, bool case_sensitive = true);

    /**
     * @param text The text to search in
     * @param start_pos Starting position in text
     * @return Position of first match at or after start_pos, or npos
     */
    size_t search(std::string_view text, size_t start_pos = 0) const;

    const std::string& pattern() const { return pattern_; }
    bool case_sensitive() const { return case_sensitive_; }

private:
    static constexpr size_t ALPHABET_SIZE = 256;
    static constexpr size_t MAX_PATTERN = 256;

    // Bad character skip table (no heap allocation)
    size_t bad_char_[ALPHABET_SIZE];

    std::string pattern_;
    size_t pattern_len_;
    bool case_sensitive_;

    inline unsigned char normalize_char(unsigned char c) const {
        if (case_sensitive_) return c;
        return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c - 'A' + 'a') : c;
    }

    // Precompute bad character rule (BMH variant)
    void compute_bad_char();
};

} // namespace debtscan::util
