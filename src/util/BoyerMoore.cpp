#include "util/BoyerMoore.hpp"

namespace debtscan::util {

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern, bool case_sensitive)
    : pattern_(pattern),
      pattern_len_(pattern.length()),
      case_sensitive_(case_sensitive) {

    if (pattern_len_ > MAX_PATTERN) {
        pattern_len_ = 0;
    }

    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    // Initialize all characters to pattern length (maximum shift)
    for (size_t i = 0; i < ALPHABET_SIZE; ++i) {
        bad_char_[i] = pattern_len_;
    }

    // Only the last occurrence of each byte matters, the final byte is excluded
    for (size_t i = 0; i + 1 < pattern_len_; ++i) {
        unsigned char c = normalize_char(static_cast<unsigned char>(pattern_[i]));
        bad_char_[c] = pattern_len_ - 1 - i;
    }
}

size_t BoyerMooreSearch::search(std::string_view text, size_t start_pos) const {
    const size_t m = pattern_len_;
    const size_t n = text.length();

    if (m == 0 || start_pos >= n || m > n - start_pos) {
        return npos;
    }

    size_t i = start_pos;
    while (i <= n - m) {
        size_t j = m;

        // Compare pattern with text from right to left
        while (j > 0 &&
               normalize_char(static_cast<unsigned char>(text[i + j - 1])) ==
               normalize_char(static_cast<unsigned char>(pattern_[j - 1]))) {
            --j;
        }

        if (j == 0) {
            return i;
        }

        unsigned char bad = normalize_char(static_cast<unsigned char>(text[i + m - 1]));
        size_t shift = bad_char_[bad];
        i += shift > 0 ? shift : 1;
    }

    return npos;
}

} // namespace debtscan::util
