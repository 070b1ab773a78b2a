#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace escp::utf8 {

constexpr char32_t REPLACEMENT = 0xFFFD;

// Decode one code point starting at text[i] and advance i past it.
// A malformed or truncated sequence consumes a single byte and yields
// REPLACEMENT, so every call produces exactly one page cell.
inline char32_t next(std::string_view text, size_t& i) {
    auto lead = static_cast<uint8_t>(text[i++]);
    if (lead < 0x80) return lead;

    int extra;
    char32_t cp;
    if ((lead & 0xE0) == 0xC0)      { extra = 1; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
    else return REPLACEMENT;

    if (i + extra > text.size()) return REPLACEMENT;
    for (int k = 0; k < extra; ++k) {
        auto b = static_cast<uint8_t>(text[i + k]);
        if ((b & 0xC0) != 0x80) return REPLACEMENT;
        cp = (cp << 6) | (b & 0x3F);
    }
    i += extra;
    return cp;
}

} // namespace escp::utf8
