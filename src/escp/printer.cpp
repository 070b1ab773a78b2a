#include <escp/printer.h>
#include <escp/commands.h>
#include <escp/document.h>
#include <ytrace/ytrace.hpp>
#include <vector>

namespace escp {

Result<Printer::Ptr> Printer::open(const std::string& path) {
    auto transportResult = FileTransport::open(path);
    if (!transportResult) {
        return Err<Ptr>("Failed to open printer", transportResult);
    }
    return create(*transportResult);
}

Result<Printer::Ptr> Printer::create(Transport::Ptr transport) {
    if (!transport) {
        return Err<Ptr>("Printer::create: null transport");
    }
    return Ptr(new Printer(std::move(transport)));
}

Result<void> Printer::send(std::span<const uint8_t> bytes) {
    return writeAll(*_transport, bytes.data(), bytes.size());
}

Result<void> Printer::esc(std::span<const uint8_t> bytes) {
    std::vector<uint8_t> command;
    command.reserve(bytes.size() + 1);
    command.push_back(cmd::ESC);
    command.insert(command.end(), bytes.begin(), bytes.end());
    return send(command);
}

Result<void> Printer::reset() {
    return send(cmd::RESET);
}

Result<PrinterStatus> Printer::queryStatus(std::chrono::milliseconds timeout) {
    if (auto res = send(cmd::STATUS_REQUEST); !res) {
        return Err<PrinterStatus>("Failed to send status request", res);
    }
    auto byteResult = _transport->readByte(timeout);
    if (!byteResult) {
        ywarn("Printer: no status response: {}", error_msg(byteResult));
        return Err<PrinterStatus>(byteResult.error());
    }
    auto status = PrinterStatus::fromByte(*byteResult);
    ydebug("Printer: status 0x{:02X} online={} paperOut={} error={}",
           *byteResult, status.online, status.paperOut, status.error);
    return status;
}

Result<void> Printer::print(const Document& document) {
    auto bytes = document.render();
    if (auto res = send(bytes); !res) {
        return Err<void>("Failed to print document", res);
    }
    yinfo("Printer: sent {} pages ({} bytes)", document.pageCount(), bytes.size());
    return Ok();
}

} // namespace escp
