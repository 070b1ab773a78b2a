#pragma once

#include <escp/cell.h>
#include <escp/widget.h>
#include <optional>
#include <string>

namespace escp {

//=============================================================================
// Label - single line of styled text, height 1
//
// Text is validated when attached: it must fit the width in bytes and must
// not contain line breaks. Styling returns a modified copy.
//=============================================================================
class Label : public Widget {
public:
    explicit Label(uint16_t width) : _width(width) {}

    template<uint16_t W>
    static Label fixed() {
        static_assert(W > 0, "Label width must be greater than zero");
        return Label(W);
    }

    Result<Label> addText(std::string text) const;

    Label bold() const;
    Label underline() const;

    const std::optional<std::string>& text() const { return _text; }
    StyleFlags style() const { return _style; }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return 1; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override;

private:
    uint16_t _width;
    std::optional<std::string> _text;
    StyleFlags _style;
};

} // namespace escp
