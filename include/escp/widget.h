#pragma once

#include <escp/result.hpp>
#include <escp/types.h>
#include <cstdint>
#include <memory>

namespace escp {

class RenderContext;

//=============================================================================
// Widget - node of the composition tree
//
// Sizes are fixed at construction. renderTo() receives the absolute position
// of the widget's top-left corner and may be called any number of times.
//=============================================================================
class Widget {
public:
    using Ptr = std::unique_ptr<Widget>;

    virtual ~Widget() = default;

    virtual uint16_t width() const = 0;
    virtual uint16_t height() const = 0;

    virtual Result<void> renderTo(RenderContext& ctx, Position absolute) const = 0;
};

} // namespace escp
