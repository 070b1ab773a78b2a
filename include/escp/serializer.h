#pragma once

#include <escp/cell.h>
#include <cstdint>
#include <vector>

namespace escp {

class Document;
class Page;

//=============================================================================
// StyleState - printer-side bold/underline state during serialization
//
// Only changes are emitted: bold is handled before underline, and "on"/"off"
// commands appear only when the respective flag actually flips.
//=============================================================================
class StyleState {
public:
    void transitionTo(StyleFlags target, std::vector<uint8_t>& out);

    // Turn off every active flag (bold first, then underline)
    void reset(std::vector<uint8_t>& out);

    bool bold() const { return _bold; }
    bool underline() const { return _underline; }

private:
    bool _bold = false;
    bool _underline = false;
};

// Init sequence, then every page followed by a form feed
std::vector<uint8_t> renderDocument(const Document& document);

// One page's rows (no init, no form feed), appended to `out`
void renderPage(const Page& page, StyleState& state, std::vector<uint8_t>& out);

} // namespace escp
