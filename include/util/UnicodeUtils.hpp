#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstring>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace debtscan::util {

/// Result of checking a buffer before it is scanned as source text
enum class TextCheck {
    Ok,
    ContainsNul,
    InvalidUtf8,
};

/// Validate that content is scannable text: no NUL bytes and well-formed UTF-8.
/// `bad_offset` receives the byte offset of the first offending sequence.
inline TextCheck check_text(std::string_view content, size_t* bad_offset = nullptr) {
    if (const void* nul = std::memchr(content.data(), '\0', content.size())) {
        if (bad_offset) {
            *bad_offset = static_cast<const char*>(nul) - content.data();
        }
        return TextCheck::ContainsNul;
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(content.data());
    const int32_t length = static_cast<int32_t>(content.size());
    int32_t i = 0;
    while (i < length) {
        // ASCII fast path; most source files never leave it
        if (bytes[i] < 0x80) {
            ++i;
            continue;
        }
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            if (bad_offset) *bad_offset = static_cast<size_t>(start);
            return TextCheck::InvalidUtf8;
        }
    }
    return TextCheck::Ok;
}

/// Uppercase a UTF-8 string using ICU's full case mapping
inline std::string to_upper(const std::string& text) {
    if (text.empty()) {
        return text;
    }
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    std::string result;
    unicode_text.toUpper().toUTF8String(result);
    return result;
}

/// Case-insensitive string equality using ICU case folding
inline bool equals_ignore_case(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);
    ua.foldCase();
    ub.foldCase();
    return ua == ub;
}

} // namespace debtscan::util
