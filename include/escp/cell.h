#pragma once

#include <cstdint>

namespace escp {

//=============================================================================
// StyleFlags - bold/underline bitset, compared by value
//=============================================================================
class StyleFlags {
public:
    static const StyleFlags NONE;
    static const StyleFlags BOLD;
    static const StyleFlags UNDERLINE;

    constexpr StyleFlags() = default;

    constexpr bool bold() const { return (_bits & 0x01) != 0; }
    constexpr bool underline() const { return (_bits & 0x02) != 0; }

    constexpr StyleFlags withBold() const { return StyleFlags(_bits | 0x01); }
    constexpr StyleFlags withUnderline() const { return StyleFlags(_bits | 0x02); }

    constexpr uint8_t bits() const { return _bits; }

    constexpr StyleFlags operator|(StyleFlags other) const {
        return StyleFlags(_bits | other._bits);
    }

    constexpr bool operator==(const StyleFlags&) const = default;

private:
    constexpr explicit StyleFlags(uint8_t bits) : _bits(bits) {}

    uint8_t _bits = 0;
};

inline constexpr StyleFlags StyleFlags::NONE{0x00};
inline constexpr StyleFlags StyleFlags::BOLD{0x01};
inline constexpr StyleFlags StyleFlags::UNDERLINE{0x02};

//=============================================================================
// Cell - one character position on the page
//
// Only printable ASCII (32..126) is stored; anything else becomes '?'.
//=============================================================================
class Cell {
public:
    static const Cell EMPTY;

    constexpr Cell() = default;

    constexpr explicit Cell(char32_t ch, StyleFlags style = StyleFlags::NONE)
        : _character(ch >= 32 && ch <= 126 ? static_cast<char>(ch) : '?')
        , _style(style) {}

    constexpr char character() const { return _character; }
    constexpr StyleFlags style() const { return _style; }

    constexpr bool operator==(const Cell&) const = default;

private:
    char _character = ' ';
    StyleFlags _style;
};

inline constexpr Cell Cell::EMPTY{};

} // namespace escp
