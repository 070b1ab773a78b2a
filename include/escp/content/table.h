#pragma once

#include <escp/cell.h>
#include <escp/content/text.h>
#include <escp/render-context.h>
#include <escp/widget.h>
#include <algorithm>
#include <string>
#include <vector>

namespace escp::content {

//=============================================================================
// Table - bold header row followed by data rows
//
// Columns are laid out left to right at their declared widths; a column that
// starts past the table's right edge is not drawn, one that straddles it is
// cut. Missing cells in a short row render empty.
//=============================================================================
class Table : public Widget {
public:
    struct Column {
        std::string name;
        uint16_t width;
    };

    using Row = std::vector<std::string>;

    Table(uint16_t width, uint16_t height, std::vector<Column> columns, std::vector<Row> rows)
        : _width(width), _height(height)
        , _columns(std::move(columns)), _rows(std::move(rows)) {}

    const std::vector<Column>& columns() const { return _columns; }
    const std::vector<Row>& rows() const { return _rows; }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override {
        if (_height == 0) return Ok();

        auto header = [](const Column& col, size_t) -> const std::string& { return col.name; };
        if (auto res = renderLine(ctx, absolute, header, StyleFlags::BOLD); !res) {
            return res;
        }

        size_t count = std::min<size_t>(_rows.size(), _height - 1u);
        for (size_t r = 0; r < count; ++r) {
            const Row& row = _rows[r];
            auto cellText = [&row](const Column&, size_t c) -> const std::string& {
                static const std::string EMPTY;
                return c < row.size() ? row[c] : EMPTY;
            };
            Position at{absolute.x, static_cast<uint16_t>(absolute.y + 1 + r)};
            if (auto res = renderLine(ctx, at, cellText, StyleFlags::NONE); !res) {
                return res;
            }
        }
        return Ok();
    }

private:
    template<typename TextFn>
    Result<void> renderLine(RenderContext& ctx, Position at, TextFn&& textOf,
                            StyleFlags style) const {
        uint32_t offset = 0;
        for (size_t c = 0; c < _columns.size(); ++c) {
            const Column& col = _columns[c];
            if (offset >= _width) break;

            size_t room = std::min<uint32_t>(col.width, _width - offset);
            std::string_view text = clipText(textOf(col, c), room);
            if (!text.empty()) {
                Position cellAt{static_cast<uint16_t>(at.x + offset), at.y};
                if (auto res = ctx.writeStyled(text, cellAt, style); !res) {
                    return res;
                }
            }
            offset += col.width;
        }
        return Ok();
    }

    uint16_t _width;
    uint16_t _height;
    std::vector<Column> _columns;
    std::vector<Row> _rows;
};

} // namespace escp::content
