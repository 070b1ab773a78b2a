#include <escp/label.h>
#include <escp/render-context.h>

namespace escp {

Result<Label> Label::addText(std::string text) const {
    if (text.size() > _width || text.find_first_of("\r\n") != std::string::npos) {
        return Err<Label>(TextExceedsWidth{text.size(), _width});
    }
    Label out(*this);
    out._text = std::move(text);
    return out;
}

Label Label::bold() const {
    Label out(*this);
    out._style = _style.withBold();
    return out;
}

Label Label::underline() const {
    Label out(*this);
    out._style = _style.withUnderline();
    return out;
}

Result<void> Label::renderTo(RenderContext& ctx, Position absolute) const {
    if (!_text) return Ok();
    return ctx.writeStyled(*_text, absolute, _style);
}

} // namespace escp
