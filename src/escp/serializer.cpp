#include <escp/serializer.h>
#include <escp/commands.h>
#include <escp/document.h>
#include <ytrace/ytrace.hpp>

namespace escp {

template<size_t N>
static void append(std::vector<uint8_t>& out, const std::array<uint8_t, N>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

//=============================================================================
// StyleState
//=============================================================================

void StyleState::transitionTo(StyleFlags target, std::vector<uint8_t>& out) {
    if (target.bold() != _bold) {
        append(out, target.bold() ? cmd::BOLD_ON : cmd::BOLD_OFF);
        _bold = target.bold();
    }
    if (target.underline() != _underline) {
        append(out, target.underline() ? cmd::UNDERLINE_ON : cmd::UNDERLINE_OFF);
        _underline = target.underline();
    }
}

void StyleState::reset(std::vector<uint8_t>& out) {
    transitionTo(StyleFlags::NONE, out);
}

//=============================================================================
// Rendering
//=============================================================================

void renderPage(const Page& page, StyleState& state, std::vector<uint8_t>& out) {
    for (const auto& row : page.cells()) {
        for (const auto& cell : row) {
            state.transitionTo(cell.style(), out);
            out.push_back(static_cast<uint8_t>(cell.character()));
        }
        append(out, cmd::ROW_END);
        state.reset(out);
    }
}

std::vector<uint8_t> renderDocument(const Document& document) {
    std::vector<uint8_t> out;
    // Worst case is one style change per cell; plain pages need ~8.3 KB each
    out.reserve(cmd::RESET.size() + cmd::CONDENSED.size() +
                document.pageCount() * (size_t(PAGE_WIDTH + 2) * PAGE_HEIGHT + 1));

    append(out, cmd::RESET);
    append(out, cmd::CONDENSED);

    StyleState state;
    for (const auto& page : document.pages()) {
        renderPage(page, state, out);
        out.push_back(cmd::FF);
    }

    ydebug("Serializer: rendered {} pages, {} bytes", document.pageCount(), out.size());
    return out;
}

} // namespace escp
