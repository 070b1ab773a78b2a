#include <escp/page.h>
#include <escp/region.h>
#include <escp/render-context.h>
#include <escp/utf8.h>
#include <cassert>
#include <escp/widget.h>

namespace escp {

//=============================================================================
// Page
//=============================================================================

PageBuilder Page::builder() {
    return PageBuilder();
}

std::optional<Cell> Page::cell(uint16_t x, uint16_t y) const {
    if (x >= PAGE_WIDTH || y >= PAGE_HEIGHT) return std::nullopt;
    return (*_cells)[y][x];
}

std::string Page::text() const {
    std::string out;
    out.reserve(size_t(PAGE_HEIGHT) * (PAGE_WIDTH + 1));
    for (uint16_t y = 0; y < PAGE_HEIGHT; ++y) {
        const auto& row = (*_cells)[y];
        size_t end = PAGE_WIDTH;
        while (end > 0 && row[end - 1].character() == ' ') --end;
        for (size_t x = 0; x < end; ++x) {
            out.push_back(row[x].character());
        }
        if (y + 1 < PAGE_HEIGHT) out.push_back('\n');
    }
    return out;
}

//=============================================================================
// PageBuilder
//=============================================================================

PageBuilder::PageBuilder()
    : _cells(std::make_unique<CellGrid>()) {}

PageBuilder& PageBuilder::writeAt(uint16_t x, uint16_t y, char32_t ch, StyleFlags style) {
    assert(_cells && "PageBuilder used after build()");
    if (x < PAGE_WIDTH && y < PAGE_HEIGHT) {
        (*_cells)[y][x] = Cell(ch, style);
    }
    return *this;
}

PageBuilder& PageBuilder::writeStr(uint16_t x, uint16_t y, std::string_view text, StyleFlags style) {
    assert(_cells && "PageBuilder used after build()");
    if (y >= PAGE_HEIGHT) return *this;

    uint32_t col = x;
    size_t i = 0;
    while (i < text.size() && col < PAGE_WIDTH) {
        char32_t ch = utf8::next(text, i);
        (*_cells)[y][col] = Cell(ch, style);
        ++col;
    }
    return *this;
}

PageBuilder& PageBuilder::fillRegion(const Region& region, char32_t ch, StyleFlags style) {
    assert(_cells && "PageBuilder used after build()");
    Cell cell(ch, style);
    for (uint32_t y = region.y(); y < uint32_t(region.y()) + region.height(); ++y) {
        for (uint32_t x = region.x(); x < uint32_t(region.x()) + region.width(); ++x) {
            (*_cells)[y][x] = cell;
        }
    }
    return *this;
}

Result<void> PageBuilder::render(const Widget& root) {
    RenderContext ctx(*this);
    return root.renderTo(ctx, {0, 0});
}

Result<void> PageBuilder::renderIn(const Region& region, const Widget& widget) {
    if (widget.width() > region.width() || widget.height() > region.height()) {
        return Err(ChildExceedsParent{region.width(), region.height(),
                                      widget.width(), widget.height(), region.origin()});
    }
    RenderContext ctx(*this);
    return widget.renderTo(ctx, region.origin());
}

Page PageBuilder::build() && {
    assert(_cells && "PageBuilder used after build()");
    return Page(std::shared_ptr<const CellGrid>(std::move(_cells)));
}

} // namespace escp
