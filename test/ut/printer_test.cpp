//=============================================================================
// Printer / Transport Unit Tests
//
// Uses MockTransport for the command channel and a temporary regular file
// for FileTransport.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/mock_transport.h"
#include <escp/commands.h>
#include <escp/document.h>
#include <escp/printer.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace boost::ut;
using namespace escp;
using escp::test::MockTransport;

namespace {

std::shared_ptr<MockTransport> mockTransport() {
    return std::make_shared<MockTransport>();
}

Printer::Ptr printerOn(const std::shared_ptr<MockTransport>& transport) {
    auto res = Printer::create(transport);
    expect(res.has_value()) << error_msg(res);
    return *res;
}

std::filesystem::path tempPath(const char* name) {
    return std::filesystem::temp_directory_path() /
           (std::string(name) + "-" + std::to_string(::getpid()));
}

} // namespace

suite printer_status_tests = [] {
    "clear byte means ready"_test = [] {
        auto status = PrinterStatus::fromByte(0x00);
        expect(status.online);
        expect(!status.paperOut);
        expect(!status.error);
        expect(status.isReady());
    };

    "offline bit is inverted"_test = [] {
        auto status = PrinterStatus::fromByte(0x08);
        expect(!status.online);
        expect(!status.isReady());
    };

    "paper out and error bits"_test = [] {
        expect(PrinterStatus::fromByte(0x20).paperOut);
        expect(PrinterStatus::fromByte(0x40).error);
        expect(!PrinterStatus::fromByte(0x20).isReady());
        expect(PrinterStatus::fromByte(0x68) == PrinterStatus{false, true, true});
    };

    "unrelated bits are ignored"_test = [] {
        expect(PrinterStatus::fromByte(0x97).isReady());
    };
};

suite transport_tests = [] {
    "writeAll loops over partial writes and flushes once"_test = [] {
        MockTransport transport;
        transport.setMaxChunk(3);
        std::vector<uint8_t> data(10, 0xAB);
        expect(writeAll(transport, data.data(), data.size()).has_value());
        expect(transport.written() == data);
        expect(transport.writeCalls() == 4_i);
        expect(transport.flushCount() == 1_i);
    };

    "zero-byte write is an Io error"_test = [] {
        MockTransport transport;
        transport.setMaxChunk(4);
        transport.setZeroWriteAfter(4);
        std::vector<uint8_t> data(10, 0x01);
        auto res = writeAll(transport, data.data(), data.size());
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::Io);
        expect(res.error().message() == "failed to write whole buffer");
        expect(transport.flushCount() == 0_i);
    };

    "write failure keeps its kind and reports progress"_test = [] {
        MockTransport transport;
        transport.setFailWrites(true);
        uint8_t byte = 0x42;
        auto res = writeAll(transport, &byte, 1);
        expect(res.error().kind() == ErrorKind::Io);
        expect(res.error().message().find("after 0 of 1 bytes") != std::string::npos);
    };

    "FileTransport on a missing path is DeviceNotFound"_test = [] {
        auto res = FileTransport::open("/nonexistent/escp-test/lp0");
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::DeviceNotFound);
        expect(res.error().as<DeviceFailure>()->path == "/nonexistent/escp-test/lp0");
    };

    "FileTransport writes to a regular file"_test = [] {
        auto path = tempPath("escp-transport");
        { std::ofstream create(path); }

        {
            auto transport = FileTransport::open(path.string());
            expect(transport.has_value()) << error_msg(transport);
            const uint8_t bytes[] = {0x1B, 0x40, 'o', 'k'};
            expect(writeAll(**transport, bytes, sizeof(bytes)).has_value());
            expect((*transport)->path() == path.string());
        }

        std::ifstream in(path, std::ios::binary);
        std::vector<char> contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        expect(contents == std::vector<char>{0x1B, 0x40, 'o', 'k'});
        std::filesystem::remove(path);
    };

    "FileTransport read at end of file is Disconnected"_test = [] {
        auto path = tempPath("escp-eof");
        { std::ofstream create(path); }

        auto transport = FileTransport::open(path.string());
        expect(transport.has_value());
        auto res = (*transport)->readByte(std::chrono::milliseconds(50));
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::Disconnected);
        std::filesystem::remove(path);
    };
};

suite printer_tests = [] {
    "create rejects a null transport"_test = [] {
        expect(!Printer::create(nullptr).has_value());
    };

    "open on a missing device keeps DeviceNotFound"_test = [] {
        auto res = Printer::open("/nonexistent/escp-test/lp0");
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::DeviceNotFound);
    };

    "send writes the bytes unchanged"_test = [] {
        auto transport = mockTransport();
        auto printer = printerOn(transport);
        const std::vector<uint8_t> bytes = {'a', 'b', 0x0D, 0x0A};
        expect(printer->send(bytes).has_value());
        expect(transport->written() == bytes);
    };

    "esc prefixes ESC"_test = [] {
        auto transport = mockTransport();
        auto printer = printerOn(transport);
        const uint8_t bold[] = {'E'};
        expect(printer->esc(bold).has_value());
        expect(transport->written() == std::vector<uint8_t>{0x1B, 'E'});
    };

    "reset sends ESC @"_test = [] {
        auto transport = mockTransport();
        auto printer = printerOn(transport);
        expect(printer->reset().has_value());
        expect(transport->written() == std::vector<uint8_t>{0x1B, 0x40});
    };

    "queryStatus sends DLE EOT 1 and decodes the reply"_test = [] {
        auto transport = mockTransport();
        transport->queueResponse(0x20);
        auto printer = printerOn(transport);

        auto status = printer->queryStatus();
        expect(status.has_value()) << error_msg(status);
        expect(transport->written() == std::vector<uint8_t>{0x10, 0x04, 0x01});
        expect(status->online);
        expect(status->paperOut);
        expect(!status->isReady());
    };

    "queryStatus without a reply times out"_test = [] {
        auto transport = mockTransport();
        auto printer = printerOn(transport);
        auto status = printer->queryStatus(std::chrono::milliseconds(5));
        expect(!status.has_value());
        expect(status.error().kind() == ErrorKind::Timeout);
        expect(status.error().as<TimeoutExpired>()->timeout == std::chrono::milliseconds(5));
    };

    "queryStatus on a closed channel is Disconnected"_test = [] {
        auto transport = mockTransport();
        transport->setDisconnected(true);
        auto printer = printerOn(transport);
        expect(printer->queryStatus().error().kind() == ErrorKind::Disconnected);
    };

    "print sends the rendered document"_test = [] {
        auto builder = Page::builder();
        builder.writeStr(0, 0, "Invoice", StyleFlags::BOLD);
        auto doc = Document::builder().addPage(std::move(builder).build()).build();

        auto transport = mockTransport();
        transport->setMaxChunk(512);
        auto printer = printerOn(transport);
        expect(printer->print(doc).has_value());
        expect(transport->written() == doc.render());
        expect(transport->flushCount() == 1_i);
    };

    "print failure is wrapped with context"_test = [] {
        auto transport = mockTransport();
        transport->setFailWrites(true);
        auto printer = printerOn(transport);
        auto res = printer->print(Document::builder().build());
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::Io);
        expect(res.error().to_string().starts_with("Failed to print document"));
    };
};
