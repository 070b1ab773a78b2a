#pragma once

#include <escp/content/text.h>
#include <escp/render-context.h>
#include <escp/widget.h>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace escp::content {

//=============================================================================
// KeyValueList - one "key<separator>value" entry per line
//=============================================================================
class KeyValueList : public Widget {
public:
    using Entry = std::pair<std::string, std::string>;

    static constexpr const char* DEFAULT_SEPARATOR = ": ";

    KeyValueList(uint16_t width, uint16_t height, std::vector<Entry> entries,
                 std::string separator = DEFAULT_SEPARATOR)
        : _width(width), _height(height)
        , _entries(std::move(entries)), _separator(std::move(separator)) {}

    const std::vector<Entry>& entries() const { return _entries; }
    const std::string& separator() const { return _separator; }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override {
        size_t count = std::min<size_t>(_entries.size(), _height);
        for (size_t i = 0; i < count; ++i) {
            std::string line = _entries[i].first + _separator + _entries[i].second;
            Position at{absolute.x, static_cast<uint16_t>(absolute.y + i)};
            if (auto res = ctx.writeText(clipText(line, _width), at); !res) {
                return res;
            }
        }
        return Ok();
    }

private:
    uint16_t _width;
    uint16_t _height;
    std::vector<Entry> _entries;
    std::string _separator;
};

} // namespace escp::content
