#pragma once

#include <escp/cell.h>
#include <escp/result.hpp>
#include <escp/types.h>
#include <string_view>

namespace escp {

class PageBuilder;

//=============================================================================
// RenderContext - write access to a PageBuilder during one render pass
//
// Only the start position of a write is validated against the clip bounds;
// text running past the right edge is truncated by the page itself.
//=============================================================================
class RenderContext {
public:
    explicit RenderContext(PageBuilder& page)
        : _page(page), _clip{0, 0, PAGE_WIDTH, PAGE_HEIGHT} {}

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;

    Result<void> writeText(std::string_view text, Position position);
    Result<void> writeStyled(std::string_view text, Position position, StyleFlags style);

    const Bounds& clipBounds() const { return _clip; }

private:
    PageBuilder& _page;
    Bounds _clip;
};

} // namespace escp
