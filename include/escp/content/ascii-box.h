#pragma once

#include <escp/container.h>
#include <escp/content/text.h>
#include <escp/render-context.h>
#include <optional>
#include <string>

namespace escp::content {

//=============================================================================
// AsciiBox - '+', '-', '|' border around an inner container
//
// The inner container is (width-2)x(height-2) and sits at (1,1), so children
// added through inner() are validated against the space inside the border.
// An optional title is written over the top border starting at column 2.
//=============================================================================
class AsciiBox : public Widget {
public:
    static constexpr uint16_t MIN_SIZE = 3;

    static Result<AsciiBox> create(uint16_t width, uint16_t height) {
        if (width < MIN_SIZE || height < MIN_SIZE) {
            return Err<AsciiBox>(InvalidDimensions{width, height});
        }
        return AsciiBox(width, height);
    }

    AsciiBox(AsciiBox&&) noexcept = default;
    AsciiBox& operator=(AsciiBox&&) noexcept = default;

    AsciiBox&& withTitle(std::string title) && {
        _title = std::move(title);
        return std::move(*this);
    }

    void setTitle(std::string title) { _title = std::move(title); }
    const std::optional<std::string>& title() const { return _title; }

    Container& inner() { return _inner; }
    const Container& inner() const { return _inner; }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override {
        std::string horizontal(_width, '-');
        horizontal.front() = '+';
        horizontal.back() = '+';

        if (auto res = ctx.writeText(horizontal, absolute); !res) return res;

        std::string edge(1, '|');
        for (uint16_t dy = 1; dy + 1 < _height; ++dy) {
            uint16_t y = static_cast<uint16_t>(absolute.y + dy);
            if (auto res = ctx.writeText(edge, {absolute.x, y}); !res) return res;
            if (auto res = ctx.writeText(edge, {static_cast<uint16_t>(absolute.x + _width - 1), y}); !res) {
                return res;
            }
        }

        Position bottom{absolute.x, static_cast<uint16_t>(absolute.y + _height - 1)};
        if (auto res = ctx.writeText(horizontal, bottom); !res) return res;

        if (_title && !_title->empty() && _width > 4) {
            Position at{static_cast<uint16_t>(absolute.x + 2), absolute.y};
            if (auto res = ctx.writeText(clipText(*_title, _width - 4u), at); !res) return res;
        }

        Position innerAt{static_cast<uint16_t>(absolute.x + 1), static_cast<uint16_t>(absolute.y + 1)};
        return _inner.renderTo(ctx, innerAt);
    }

private:
    AsciiBox(uint16_t width, uint16_t height)
        : _width(width), _height(height)
        , _inner(static_cast<uint16_t>(width - 2), static_cast<uint16_t>(height - 2)) {}

    uint16_t _width;
    uint16_t _height;
    std::optional<std::string> _title;
    Container _inner;
};

} // namespace escp::content
