#include <escp/transport.h>
#include <ytrace/ytrace.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace escp {

//=============================================================================
// writeAll
//=============================================================================

Result<void> writeAll(Transport& transport, const uint8_t* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        auto res = transport.write(data + offset, len - offset);
        if (!res) {
            return Err<void>("write failed after " + std::to_string(offset) + " of " +
                             std::to_string(len) + " bytes", res);
        }
        if (*res == 0) {
            return Err(Error(ErrorKind::Io, "failed to write whole buffer"));
        }
        offset += *res;
    }
    return transport.flush();
}

//=============================================================================
// FileTransport
//=============================================================================

static Error errnoError(ErrorKind kind, const std::string& what, const std::string& path, int err) {
    return Error(kind, what + " '" + path + "': " + std::string(strerror(err)),
                 DeviceFailure{path, err});
}

Result<FileTransport::Ptr> FileTransport::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            return Err<Ptr>(Error(ErrorKind::DeviceNotFound,
                                  "Printer device not found: " + path,
                                  DeviceFailure{path, err}));
        }
        if (err == EACCES || err == EPERM) {
            return Err<Ptr>(Error(ErrorKind::Permission,
                                  "Cannot access printer device '" + path + "'.\n"
                                  "Solutions:\n"
                                  "- Add your user to 'lp' group: sudo usermod -aG lp $USER\n"
                                  "- Or run with sudo (not recommended)\n"
                                  "- Or adjust device permissions: sudo chmod 666 " + path,
                                  DeviceFailure{path, err}));
        }
        return Err<Ptr>(errnoError(ErrorKind::Io, "Failed to open", path, err));
    }

    yinfo("FileTransport: opened {} (fd={})", path, fd);
    return Ptr(new FileTransport(path, fd));
}

FileTransport::~FileTransport() {
    if (_fd >= 0) {
        ::close(_fd);
        ydebug("FileTransport: closed {}", _path);
    }
}

Result<size_t> FileTransport::write(const uint8_t* data, size_t len) {
    while (true) {
        ssize_t n = ::write(_fd, data, len);
        if (n >= 0) return static_cast<size_t>(n);

        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            struct pollfd pfd = {_fd, POLLOUT, 0};
            if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
                return Err<size_t>(errnoError(ErrorKind::Io, "poll failed on", _path, errno));
            }
            continue;
        }
        return Err<size_t>(errnoError(ErrorKind::Io, "Write failed on", _path, errno));
    }
}

Result<void> FileTransport::flush() {
    // Character devices without sync support report EINVAL/EROFS: nothing to flush
    if (::fsync(_fd) < 0 && errno != EINVAL && errno != EROFS) {
        return Err(errnoError(ErrorKind::Io, "Flush failed on", _path, errno));
    }
    return Ok();
}

Result<uint8_t> FileTransport::readByte(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);

        struct pollfd pfd = {_fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return Err<uint8_t>(errnoError(ErrorKind::Io, "poll failed on", _path, errno));
        }
        if (ret == 0) {
            return Err<uint8_t>(TimeoutExpired{timeout});
        }

        uint8_t byte = 0;
        ssize_t n = ::read(_fd, &byte, 1);
        if (n == 1) return byte;
        if (n == 0) {
            return Err<uint8_t>(Error(ErrorKind::Disconnected,
                                      "Printer disconnected: " + _path));
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        return Err<uint8_t>(errnoError(ErrorKind::Io, "Read failed on", _path, errno));
    }
}

} // namespace escp
