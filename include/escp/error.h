#pragma once

#include <escp/types.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace escp {

//=============================================================================
// ErrorKind - every failure the library reports
//=============================================================================
enum class ErrorKind : uint8_t {
    Generic,

    // Region algebra
    InvalidDimensions,
    RegionOutOfBounds,
    InvalidSplit,

    // Composition
    ChildExceedsParent,
    OverlappingChildren,
    InsufficientSpace,
    IntegerOverflow,

    // Content
    TextExceedsWidth,

    // Render pass
    OutOfBounds,

    // Printer transport
    Io,
    DeviceNotFound,
    Permission,
    Disconnected,
    Timeout,

    // Configuration / layout files
    Config,
};

std::string_view toString(ErrorKind kind);

//=============================================================================
// Error details - the concrete offending values, one struct per kind
//=============================================================================

struct InvalidDimensions {
    uint16_t width;
    uint16_t height;
};

struct RegionOutOfBounds {
    uint16_t x;
    uint16_t y;
    uint16_t width;
    uint16_t height;
};

struct InvalidSplit {
    uint16_t parentSize;
    uint16_t splitSize;
};

struct ChildExceedsParent {
    uint16_t parentWidth;
    uint16_t parentHeight;
    uint16_t childWidth;
    uint16_t childHeight;
    Position position;
};

struct OverlappingChildren {
    Bounds existing;
    Bounds incoming;
};

struct InsufficientSpace {
    uint16_t available;
    uint16_t required;
    std::string_view layout;  // "Column", "Row"
};

struct IntegerOverflow {
    std::string operation;
};

struct TextExceedsWidth {
    size_t textLength;
    uint16_t widgetWidth;
};

struct OutOfBounds {
    Position position;
    Bounds bounds;
};

struct DeviceFailure {
    std::string path;
    int errnoValue = 0;
};

struct TimeoutExpired {
    std::chrono::milliseconds timeout;
};

using ErrorDetail = std::variant<
    std::monostate,
    InvalidDimensions,
    RegionOutOfBounds,
    InvalidSplit,
    ChildExceedsParent,
    OverlappingChildren,
    InsufficientSpace,
    IntegerOverflow,
    TextExceedsWidth,
    OutOfBounds,
    DeviceFailure,
    TimeoutExpired>;

// Kind implied by a detail (DeviceFailure maps to Io, monostate to Generic)
ErrorKind kindOf(const ErrorDetail& detail);

// Human-readable message built from the detail values
std::string describe(const ErrorDetail& detail);

} // namespace escp
