#pragma once

#include <escp/page.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace escp {

class DocumentBuilder;

//=============================================================================
// Document - frozen, ordered sequence of pages
//=============================================================================
class Document {
public:
    static DocumentBuilder builder();

    const std::vector<Page>& pages() const { return _pages; }
    size_t pageCount() const { return _pages.size(); }

    // Complete ESC/P byte stream; identical on every call
    std::vector<uint8_t> render() const;

private:
    friend class DocumentBuilder;
    explicit Document(std::vector<Page> pages) : _pages(std::move(pages)) {}

    std::vector<Page> _pages;
};

//-----------------------------------------------------------------------------
// DocumentBuilder - append-only page list, consumed by build()
//-----------------------------------------------------------------------------
class DocumentBuilder {
public:
    DocumentBuilder& addPage(Page page) & {
        _pages.push_back(std::move(page));
        return *this;
    }

    DocumentBuilder&& addPage(Page page) && {
        _pages.push_back(std::move(page));
        return std::move(*this);
    }

    size_t pageCount() const { return _pages.size(); }

    Document build() && { return Document(std::move(_pages)); }

private:
    std::vector<Page> _pages;
};

} // namespace escp
