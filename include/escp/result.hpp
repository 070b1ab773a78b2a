#pragma once

#include <escp/error.h>
#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace escp {

//=============================================================================
// Error - kind + message + typed detail + optional cause chain
//=============================================================================
class Error {
public:
    Error() = default;

    explicit Error(std::string message)
        : _message(std::move(message)) {}

    Error(std::string message, Error cause)
        : _kind(cause.kind())
        , _message(std::move(message))
        , _cause(std::make_shared<const Error>(std::move(cause))) {}

    explicit Error(ErrorDetail detail)
        : _kind(kindOf(detail)), _message(describe(detail)), _detail(std::move(detail)) {}

    Error(ErrorKind kind, std::string message, ErrorDetail detail = {})
        : _kind(kind), _message(std::move(message)), _detail(std::move(detail)) {}

    ErrorKind kind() const { return _kind; }
    const std::string& message() const { return _message; }
    const ErrorDetail& detail() const { return _detail; }
    const Error* cause() const { return _cause.get(); }

    // Typed access to the detail of this error or, failing that, of its causes
    template<typename D>
    const D* as() const {
        if (auto* d = std::get_if<D>(&_detail)) return d;
        return _cause ? _cause->as<D>() : nullptr;
    }

    // "outer: inner: root cause"
    std::string to_string() const {
        if (!_cause) return _message;
        return _message + ": " + _cause->to_string();
    }

private:
    ErrorKind _kind = ErrorKind::Generic;
    std::string _message;
    ErrorDetail _detail;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

//-----------------------------------------------------------------------------
// Construction helpers
//-----------------------------------------------------------------------------

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(std::unexpect, Error(std::move(message)));
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::unexpect, std::move(error));
}

template<typename T = void>
Result<T> Err(ErrorDetail detail) {
    return Result<T>(std::unexpect, Error(std::move(detail)));
}

// Wrap the failure of another result with context
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(std::unexpect, Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace escp

