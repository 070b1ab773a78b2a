#include <escp/document.h>
#include <escp/serializer.h>

namespace escp {

DocumentBuilder Document::builder() {
    return DocumentBuilder();
}

std::vector<uint8_t> Document::render() const {
    return renderDocument(*this);
}

} // namespace escp
