#include <escp/content/text.h>
#include <escp/utf8.h>
#include <cctype>

namespace escp::content {

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Decoded the same way PageBuilder::writeStr decodes, so a count here is
// exactly the number of cells written there
size_t cellCount(std::string_view text) {
    size_t n = 0;
    for (size_t i = 0; i < text.size(); ++n) {
        utf8::next(text, i);
    }
    return n;
}

std::string_view clipText(std::string_view text, size_t maxCells) {
    size_t i = 0;
    for (size_t cells = 0; i < text.size() && cells < maxCells; ++cells) {
        utf8::next(text, i);
    }
    return text.substr(0, i);
}

std::vector<std::string> wrapText(std::string_view text, size_t width) {
    std::vector<std::string> lines;
    if (width == 0) return lines;

    std::string current;
    size_t currentCells = 0;

    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !isSpace(text[i])) ++i;
        if (start == i) break;

        std::string_view word = text.substr(start, i - start);
        size_t wordCells = cellCount(word);

        if (wordCells > width) {
            if (!current.empty()) {
                lines.push_back(std::move(current));
                current.clear();
                currentCells = 0;
            }
            while (!word.empty()) {
                std::string_view chunk = clipText(word, width);
                lines.emplace_back(chunk);
                word.remove_prefix(chunk.size());
            }
            continue;
        }

        if (!current.empty() && currentCells + 1 + wordCells > width) {
            lines.push_back(std::move(current));
            current.clear();
            currentCells = 0;
        }
        if (!current.empty()) {
            current.push_back(' ');
            ++currentCells;
        }
        current.append(word);
        currentCells += wordCells;
    }

    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    if (text.empty()) return lines;

    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

} // namespace escp::content
