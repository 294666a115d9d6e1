#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace nb::util {

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ASCII case folding only; multi-byte UTF-8 sequences must match exactly.
inline bool containsIgnoreCase(std::string_view haystack, std::string_view lowerNeedle) {
    if (lowerNeedle.empty()) return true;
    return toLower(haystack).find(lowerNeedle) != std::string::npos;
}

// Number of code points, counting every byte that is not a continuation byte.
inline std::size_t utf8Length(std::string_view s) {
    return static_cast<std::size_t>(std::ranges::count_if(s, [](const unsigned char c) { return (c & 0xC0) != 0x80; }));
}

} // namespace nb::util
