#pragma once

#include <escp/cell.h>
#include <escp/content/text.h>
#include <escp/render-context.h>
#include <escp/widget.h>
#include <algorithm>
#include <string>

namespace escp::content {

//=============================================================================
// Paragraph - word-wrapped text; lines beyond the height are dropped
//=============================================================================
class Paragraph : public Widget {
public:
    Paragraph(uint16_t width, uint16_t height, std::string text,
              StyleFlags style = StyleFlags::NONE)
        : _width(width), _height(height), _text(std::move(text)), _style(style) {}

    const std::string& text() const { return _text; }
    StyleFlags style() const { return _style; }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override {
        auto lines = wrapText(_text, _width);
        size_t count = std::min<size_t>(lines.size(), _height);
        for (size_t i = 0; i < count; ++i) {
            Position at{absolute.x, static_cast<uint16_t>(absolute.y + i)};
            if (auto res = ctx.writeStyled(lines[i], at, _style); !res) {
                return res;
            }
        }
        return Ok();
    }

private:
    uint16_t _width;
    uint16_t _height;
    std::string _text;
    StyleFlags _style;
};

} // namespace escp::content
