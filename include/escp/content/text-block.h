#pragma once

#include <escp/content/text.h>
#include <escp/render-context.h>
#include <escp/widget.h>
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace escp::content {

//=============================================================================
// TextBlock - preformatted lines, no wrapping
//=============================================================================
class TextBlock : public Widget {
public:
    TextBlock(uint16_t width, uint16_t height, std::vector<std::string> lines)
        : _width(width), _height(height), _lines(std::move(lines)) {}

    static TextBlock fromText(uint16_t width, uint16_t height, std::string_view text) {
        return TextBlock(width, height, splitLines(text));
    }

    const std::vector<std::string>& lines() const { return _lines; }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override {
        size_t count = std::min<size_t>(_lines.size(), _height);
        for (size_t i = 0; i < count; ++i) {
            if (_lines[i].empty()) continue;
            Position at{absolute.x, static_cast<uint16_t>(absolute.y + i)};
            if (auto res = ctx.writeText(clipText(_lines[i], _width), at); !res) {
                return res;
            }
        }
        return Ok();
    }

private:
    uint16_t _width;
    uint16_t _height;
    std::vector<std::string> _lines;
};

} // namespace escp::content
