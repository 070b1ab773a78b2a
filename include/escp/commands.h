#pragma once

#include <array>
#include <cstdint>

//=============================================================================
// ESC/P command bytes (EPSON LQ-2090II subset)
//=============================================================================

namespace escp::cmd {

static constexpr uint8_t ESC = 0x1B;
static constexpr uint8_t DLE = 0x10;
static constexpr uint8_t EOT = 0x04;

static constexpr uint8_t CR = 0x0D;
static constexpr uint8_t LF = 0x0A;
static constexpr uint8_t FF = 0x0C;
static constexpr uint8_t SI = 0x0F;  // condensed mode

static constexpr std::array<uint8_t, 2> RESET = {ESC, '@'};
static constexpr std::array<uint8_t, 1> CONDENSED = {SI};

static constexpr std::array<uint8_t, 2> BOLD_ON = {ESC, 'E'};
static constexpr std::array<uint8_t, 2> BOLD_OFF = {ESC, 'F'};

static constexpr std::array<uint8_t, 3> UNDERLINE_ON = {ESC, '-', 0x01};
static constexpr std::array<uint8_t, 3> UNDERLINE_OFF = {ESC, '-', 0x00};

static constexpr std::array<uint8_t, 2> ROW_END = {CR, LF};

// DLE EOT 1: real-time printer status request
static constexpr std::array<uint8_t, 3> STATUS_REQUEST = {DLE, EOT, 0x01};

} // namespace escp::cmd
