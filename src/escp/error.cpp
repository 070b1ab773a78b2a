#include <escp/error.h>

namespace escp {

std::string_view toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic:             return "Generic";
    case ErrorKind::InvalidDimensions:   return "InvalidDimensions";
    case ErrorKind::RegionOutOfBounds:   return "RegionOutOfBounds";
    case ErrorKind::InvalidSplit:        return "InvalidSplit";
    case ErrorKind::ChildExceedsParent:  return "ChildExceedsParent";
    case ErrorKind::OverlappingChildren: return "OverlappingChildren";
    case ErrorKind::InsufficientSpace:   return "InsufficientSpace";
    case ErrorKind::IntegerOverflow:     return "IntegerOverflow";
    case ErrorKind::TextExceedsWidth:    return "TextExceedsWidth";
    case ErrorKind::OutOfBounds:         return "OutOfBounds";
    case ErrorKind::Io:                  return "Io";
    case ErrorKind::DeviceNotFound:      return "DeviceNotFound";
    case ErrorKind::Permission:          return "Permission";
    case ErrorKind::Disconnected:        return "Disconnected";
    case ErrorKind::Timeout:             return "Timeout";
    case ErrorKind::Config:              return "Config";
    }
    return "Unknown";
}

ErrorKind kindOf(const ErrorDetail& detail) {
    if (std::holds_alternative<InvalidDimensions>(detail))   return ErrorKind::InvalidDimensions;
    if (std::holds_alternative<RegionOutOfBounds>(detail))   return ErrorKind::RegionOutOfBounds;
    if (std::holds_alternative<InvalidSplit>(detail))        return ErrorKind::InvalidSplit;
    if (std::holds_alternative<ChildExceedsParent>(detail))  return ErrorKind::ChildExceedsParent;
    if (std::holds_alternative<OverlappingChildren>(detail)) return ErrorKind::OverlappingChildren;
    if (std::holds_alternative<InsufficientSpace>(detail))   return ErrorKind::InsufficientSpace;
    if (std::holds_alternative<IntegerOverflow>(detail))     return ErrorKind::IntegerOverflow;
    if (std::holds_alternative<TextExceedsWidth>(detail))    return ErrorKind::TextExceedsWidth;
    if (std::holds_alternative<OutOfBounds>(detail))         return ErrorKind::OutOfBounds;
    if (std::holds_alternative<DeviceFailure>(detail))       return ErrorKind::Io;
    if (std::holds_alternative<TimeoutExpired>(detail))      return ErrorKind::Timeout;
    return ErrorKind::Generic;
}

static std::string boundsString(const Bounds& b) {
    return "(x:" + std::to_string(b.x) + ", y:" + std::to_string(b.y) +
           ", w:" + std::to_string(b.width) + ", h:" + std::to_string(b.height) + ")";
}

std::string describe(const ErrorDetail& detail) {
    if (auto* d = std::get_if<InvalidDimensions>(&detail)) {
        return "Invalid region dimensions: " + std::to_string(d->width) + "x" +
               std::to_string(d->height) + " (must be non-zero and within page bounds)";
    }
    if (auto* d = std::get_if<RegionOutOfBounds>(&detail)) {
        return "Region out of bounds: position (" + std::to_string(d->x) + ", " +
               std::to_string(d->y) + "), size (" + std::to_string(d->width) + "x" +
               std::to_string(d->height) + ") exceeds page dimensions (" +
               std::to_string(PAGE_WIDTH) + "x" + std::to_string(PAGE_HEIGHT) + ")";
    }
    if (auto* d = std::get_if<InvalidSplit>(&detail)) {
        return "Invalid region split: split size " + std::to_string(d->splitSize) +
               " exceeds parent size " + std::to_string(d->parentSize);
    }
    if (auto* d = std::get_if<ChildExceedsParent>(&detail)) {
        return "Child widget (" + std::to_string(d->childWidth) + "x" +
               std::to_string(d->childHeight) + ") at position (" +
               std::to_string(d->position.x) + ", " + std::to_string(d->position.y) +
               ") exceeds parent bounds (" + std::to_string(d->parentWidth) + "x" +
               std::to_string(d->parentHeight) + ")";
    }
    if (auto* d = std::get_if<OverlappingChildren>(&detail)) {
        return "Child widgets overlap: existing " + boundsString(d->existing) +
               " intersects new " + boundsString(d->incoming);
    }
    if (auto* d = std::get_if<InsufficientSpace>(&detail)) {
        return std::string(d->layout) + " layout requires " + std::to_string(d->required) +
               " units but only " + std::to_string(d->available) + " available";
    }
    if (auto* d = std::get_if<IntegerOverflow>(&detail)) {
        return "Integer overflow in " + d->operation;
    }
    if (auto* d = std::get_if<TextExceedsWidth>(&detail)) {
        return "Text length (" + std::to_string(d->textLength) +
               ") exceeds widget width (" + std::to_string(d->widgetWidth) +
               ") or text spans multiple lines";
    }
    if (auto* d = std::get_if<OutOfBounds>(&detail)) {
        return "Position (" + std::to_string(d->position.x) + ", " +
               std::to_string(d->position.y) + ") exceeds bounds " + boundsString(d->bounds);
    }
    if (auto* d = std::get_if<DeviceFailure>(&detail)) {
        return "I/O error on " + d->path + " (errno " + std::to_string(d->errnoValue) + ")";
    }
    if (auto* d = std::get_if<TimeoutExpired>(&detail)) {
        return "Timeout waiting for printer response after " +
               std::to_string(d->timeout.count()) + "ms";
    }
    return "Unknown error";
}

} // namespace escp
