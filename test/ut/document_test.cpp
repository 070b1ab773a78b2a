#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <escp/commands.h>
#include <escp/document.h>

using namespace boost::ut;
using namespace escp;

static Page pageWith(const char* text) {
    auto builder = Page::builder();
    builder.writeStr(0, 0, text, StyleFlags::NONE);
    return std::move(builder).build();
}

suite document_tests = [] {
    "builder keeps pages in insertion order"_test = [] {
        auto builder = Document::builder();
        builder.addPage(pageWith("one"));
        builder.addPage(pageWith("two"));
        expect(builder.pageCount() == 2_u);

        auto doc = std::move(builder).build();
        expect(doc.pageCount() == 2_u);
        expect(doc.pages()[0].text().starts_with("one"));
        expect(doc.pages()[1].text().starts_with("two"));
    };

    "chained addPage on a temporary builder"_test = [] {
        auto doc = Document::builder()
            .addPage(pageWith("a"))
            .addPage(pageWith("b"))
            .addPage(pageWith("c"))
            .build();
        expect(doc.pageCount() == 3_u);
    };

    "empty document has no pages"_test = [] {
        auto doc = Document::builder().build();
        expect(doc.pageCount() == 0_u);
        expect(doc.pages().empty());
    };

    "one form feed per page"_test = [] {
        auto doc = Document::builder()
            .addPage(pageWith("first"))
            .addPage(pageWith("second"))
            .build();
        auto out = doc.render();
        expect(std::count(out.begin(), out.end(), cmd::FF) == 2_i);
        expect(out.back() == cmd::FF);
    };

    "page order is preserved in the byte stream"_test = [] {
        auto doc = Document::builder()
            .addPage(pageWith("X"))
            .addPage(pageWith("Y"))
            .build();
        auto out = doc.render();
        auto x = std::find(out.begin(), out.end(), uint8_t('X'));
        auto y = std::find(out.begin(), out.end(), uint8_t('Y'));
        auto ff = std::find(out.begin(), out.end(), cmd::FF);
        expect(x < ff) << "first page ends before the second starts";
        expect(ff < y);
    };

    "pages share their grid when the document is copied"_test = [] {
        auto doc = Document::builder().addPage(pageWith("shared")).build();
        Document copy = doc;
        expect(&copy.pages()[0].cells() == &doc.pages()[0].cells());
        expect(copy.render() == doc.render());
    };
};
