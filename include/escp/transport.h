#pragma once

#include <escp/result.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace escp {

/**
 * Transport - byte channel to a printer
 *
 * Implementations:
 * - FileTransport: character device or regular file (/dev/usb/lp0, /dev/lp0)
 * - test mocks recording written bytes and replaying responses
 */
class Transport {
public:
    using Ptr = std::shared_ptr<Transport>;

    virtual ~Transport() = default;

    /**
     * Write up to `len` bytes; returns how many were accepted (may be fewer)
     */
    virtual Result<size_t> write(const uint8_t* data, size_t len) = 0;

    /**
     * Push buffered bytes to the device
     */
    virtual Result<void> flush() = 0;

    /**
     * Read one byte, waiting at most `timeout`
     * Fails with ErrorKind::Timeout on expiry, ErrorKind::Disconnected at end of stream
     */
    virtual Result<uint8_t> readByte(std::chrono::milliseconds timeout) = 0;
};

// Write the whole buffer, looping over partial writes, then flush
Result<void> writeAll(Transport& transport, const uint8_t* data, size_t len);

//=============================================================================
// FileTransport - POSIX file descriptor opened read/write
//=============================================================================
class FileTransport : public Transport {
public:
    using Ptr = std::shared_ptr<FileTransport>;

    static Result<Ptr> open(const std::string& path);

    ~FileTransport() override;

    FileTransport(const FileTransport&) = delete;
    FileTransport& operator=(const FileTransport&) = delete;

    Result<size_t> write(const uint8_t* data, size_t len) override;
    Result<void> flush() override;
    Result<uint8_t> readByte(std::chrono::milliseconds timeout) override;

    const std::string& path() const { return _path; }

private:
    FileTransport(std::string path, int fd) : _path(std::move(path)), _fd(fd) {}

    std::string _path;
    int _fd = -1;
};

} // namespace escp
