#pragma once

#include <cstdint>

namespace escp {

//=============================================================================
// PrinterStatus - decoded DLE EOT 1 response byte
//=============================================================================
struct PrinterStatus {
    static constexpr uint8_t OFFLINE_BIT = 0x08;
    static constexpr uint8_t PAPER_OUT_BIT = 0x20;
    static constexpr uint8_t ERROR_BIT = 0x40;

    bool online = false;
    bool paperOut = false;
    bool error = false;

    static constexpr PrinterStatus fromByte(uint8_t b) {
        return PrinterStatus{
            (b & OFFLINE_BIT) == 0,
            (b & PAPER_OUT_BIT) != 0,
            (b & ERROR_BIT) != 0,
        };
    }

    constexpr bool isReady() const { return online && !paperOut && !error; }

    bool operator==(const PrinterStatus&) const = default;
};

} // namespace escp
