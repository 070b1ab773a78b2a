#include <escp/render-context.h>
#include <escp/page.h>

namespace escp {

Result<void> RenderContext::writeText(std::string_view text, Position position) {
    return writeStyled(text, position, StyleFlags::NONE);
}

Result<void> RenderContext::writeStyled(std::string_view text, Position position, StyleFlags style) {
    if (position.x >= _clip.width || position.y >= _clip.height) {
        return Err(OutOfBounds{position, _clip});
    }
    _page.writeStr(position.x, position.y, text, style);
    return Ok();
}

} // namespace escp
