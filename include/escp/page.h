#pragma once

#include <escp/cell.h>
#include <escp/result.hpp>
#include <escp/types.h>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace escp {

class PageBuilder;
class Region;
class Widget;

using CellRow = std::array<Cell, PAGE_WIDTH>;
using CellGrid = std::array<CellRow, PAGE_HEIGHT>;

//=============================================================================
// Page - frozen 160x51 grid
//
// Copies share the same immutable grid, so a Page can be handed to any number
// of readers (documents, serializers, threads) without synchronisation.
//=============================================================================
class Page {
public:
    static PageBuilder builder();

    // Copy-only: a "moved-from" Page still shares the grid and stays readable
    Page(const Page&) = default;
    Page& operator=(const Page&) = default;

    // Cell at (x, y), or nullopt outside the grid
    std::optional<Cell> cell(uint16_t x, uint16_t y) const;

    const CellGrid& cells() const { return *_cells; }

    // Plain-text rendering: rows with trailing blanks stripped, '\n'-joined
    std::string text() const;

private:
    friend class PageBuilder;
    explicit Page(std::shared_ptr<const CellGrid> cells) : _cells(std::move(cells)) {}

    std::shared_ptr<const CellGrid> _cells;
};

//=============================================================================
// PageBuilder - exclusive mutable phase of a Page
//
// Raw writes never fail: anything outside the grid is silently dropped.
// build() consumes the builder; use a fresh builder for every page. Writing
// to a built or moved-from builder is a programming error (checked in debug
// builds).
//=============================================================================
class PageBuilder {
public:
    PageBuilder();
    ~PageBuilder() = default;

    PageBuilder(PageBuilder&&) noexcept = default;
    PageBuilder& operator=(PageBuilder&&) noexcept = default;
    PageBuilder(const PageBuilder&) = delete;
    PageBuilder& operator=(const PageBuilder&) = delete;

    PageBuilder& writeAt(uint16_t x, uint16_t y, char32_t ch, StyleFlags style);

    // UTF-8 text, one cell per code point, truncated at the right edge
    PageBuilder& writeStr(uint16_t x, uint16_t y, std::string_view text, StyleFlags style);

    PageBuilder& fillRegion(const Region& region, char32_t ch, StyleFlags style);

    // Render a widget tree rooted at (0, 0); fails fast on the first error
    Result<void> render(const Widget& root);

    // Render a widget at a region's origin after checking it fits the region
    Result<void> renderIn(const Region& region, const Widget& widget);

    Page build() &&;

private:
    std::unique_ptr<CellGrid> _cells;
};

} // namespace escp
