#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace vellum::core {

inline bool isUtf8Continuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

/// Largest code point boundary <= pos.
inline std::size_t utf8FloorBoundary(std::string_view text, std::size_t pos) noexcept {
    if (pos >= text.size())
        return text.size();
    while (pos > 0 && isUtf8Continuation(static_cast<unsigned char>(text[pos]))) {
        --pos;
    }
    return pos;
}

/// Smallest code point boundary > pos (pos must be < size).
inline std::size_t utf8NextBoundary(std::string_view text, std::size_t pos) noexcept {
    ++pos;
    while (pos < text.size() && isUtf8Continuation(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

/// Strict validation: rejects overlongs, surrogates and code points above U+10FFFF.
bool isValidUtf8(std::string_view data) noexcept;

/// Every byte is taken as an ISO-8859-1 code point.
std::string latin1ToUtf8(std::string_view data);

} // namespace vellum::core
