#pragma once

#include <escp/printer-status.h>
#include <escp/result.hpp>
#include <escp/transport.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace escp {

class Document;

//=============================================================================
// Printer - ESC/P command channel on top of a Transport
//=============================================================================
class Printer {
public:
    using Ptr = std::shared_ptr<Printer>;

    static constexpr std::chrono::milliseconds DEFAULT_STATUS_TIMEOUT{1000};

    // Open a printer device node (e.g. /dev/usb/lp0)
    static Result<Ptr> open(const std::string& path);

    static Result<Ptr> create(Transport::Ptr transport);

    Result<void> send(std::span<const uint8_t> bytes);

    // ESC followed by `bytes`
    Result<void> esc(std::span<const uint8_t> bytes);

    // ESC @
    Result<void> reset();

    // Send DLE EOT 1 and decode the single response byte
    Result<PrinterStatus> queryStatus(std::chrono::milliseconds timeout = DEFAULT_STATUS_TIMEOUT);

    // Send the complete rendered byte stream of `document`
    Result<void> print(const Document& document);

    Transport& transport() { return *_transport; }

private:
    explicit Printer(Transport::Ptr transport) : _transport(std::move(transport)) {}

    Transport::Ptr _transport;
};

} // namespace escp
