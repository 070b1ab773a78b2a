#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace escp::content {

// Greedy word wrap on whitespace. Words longer than `width` are hard-split.
// Widths are counted in code points (one page cell each).
std::vector<std::string> wrapText(std::string_view text, size_t width);

// Leading `maxCells` code points of `text`
std::string_view clipText(std::string_view text, size_t maxCells);

// Number of page cells `text` occupies
size_t cellCount(std::string_view text);

// Split on '\n', dropping a trailing '\r' from each line
std::vector<std::string> splitLines(std::string_view text);

} // namespace escp::content
