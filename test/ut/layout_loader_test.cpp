//=============================================================================
// Layout Loader Unit Tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <escp/layout-loader.h>

#include <string>

using namespace boost::ut;
using namespace escp;

namespace {

// Row `y` of the first page with trailing blanks stripped
std::string firstPageRow(const Document& doc, uint16_t y) {
    std::string text = doc.pages().front().text();
    size_t start = 0;
    for (uint16_t i = 0; i < y; ++i) start = text.find('\n', start) + 1;
    return text.substr(start, text.find('\n', start) - start);
}

} // namespace

suite layout_loader_tests = [] {
    "container with labels"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: container
      width: 160
      height: 51
      children:
        - { type: label, x: 2, y: 1, width: 20, text: "INVOICE", bold: true }
        - { type: label, x: 2, y: 3, width: 20, text: "Total" }
)");
        expect(doc.has_value()) << error_msg(doc);
        expect(doc->pageCount() == 1_u);
        expect(firstPageRow(*doc, 1) == "  INVOICE");
        expect(firstPageRow(*doc, 3) == "  Total");
        expect(doc->pages()[0].cell(2, 1)->style() == StyleFlags::BOLD);
    };

    "overlapping children keep their error kind"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: container
      width: 40
      height: 5
      children:
        - { type: label, width: 20 }
        - { type: label, x: 10, width: 20 }
)");
        expect(!doc.has_value());
        expect(doc.error().kind() == ErrorKind::OverlappingChildren);
        expect(doc.error().to_string().find("pages[0].root.children[1]") != std::string::npos);
        expect(doc.error().as<OverlappingChildren>() != nullptr);
    };

    "text wider than its label is TextExceedsWidth"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root: { type: label, width: 3, text: "too long" }
)");
        expect(doc.error().kind() == ErrorKind::TextExceedsWidth);
    };

    "invalid YAML is a Config error"_test = [] {
        auto doc = loadDocument("pages: [ { root: ");
        expect(!doc.has_value());
        expect(doc.error().kind() == ErrorKind::Config);
    };

    "missing pages sequence is a Config error"_test = [] {
        expect(loadDocument("title: nothing").error().kind() == ErrorKind::Config);
        expect(loadDocument("- a\n- b\n").error().kind() == ErrorKind::Config);
        expect(loadDocument("pages:\n  - {}\n").error().kind() == ErrorKind::Config);
    };

    "unknown widget type names the node"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root: { type: barcode, width: 10, height: 2 }
)");
        expect(doc.error().kind() == ErrorKind::Config);
        expect(doc.error().message().find("barcode") != std::string::npos);
        expect(doc.error().message().find("pages[0].root") != std::string::npos);
    };

    "missing size is a Config error"_test = [] {
        auto doc = loadDocument("pages:\n  - root: { type: container, width: 10 }\n");
        expect(doc.error().kind() == ErrorKind::Config);
        expect(doc.error().message().find("height") != std::string::npos);
    };

    "zero size is InvalidDimensions"_test = [] {
        auto doc = loadDocument("pages:\n  - root: { type: container, width: 0, height: 5 }\n");
        expect(doc.error().kind() == ErrorKind::InvalidDimensions);
    };

    "wrongly typed value is a Config error"_test = [] {
        auto doc = loadDocument("pages:\n  - root: { type: container, width: wide, height: 5 }\n");
        expect(doc.error().kind() == ErrorKind::Config);
    };

    "column areas stack vertically"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: column
      width: 160
      height: 51
      areas:
        - size: 2
          children: [ { type: label, width: 5, text: "top" } ]
        - size: 3
          children: [ { type: label, width: 5, text: "mid" } ]
)");
        expect(doc.has_value()) << error_msg(doc);
        expect(firstPageRow(*doc, 0) == "top");
        expect(firstPageRow(*doc, 2) == "mid");
    };

    "column over-allocation is InsufficientSpace"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: column
      width: 20
      height: 4
      areas: [ { size: 3 }, { size: 2 } ]
)");
        expect(doc.error().kind() == ErrorKind::InsufficientSpace);
        expect(doc.error().as<InsufficientSpace>()->layout == "Column");
    };

    "row areas sit side by side"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: row
      width: 160
      height: 51
      areas:
        - size: 10
          children: [ { type: label, width: 4, text: "L" } ]
        - size: 10
          children: [ { type: label, width: 4, text: "R" } ]
)");
        expect(doc.has_value()) << error_msg(doc);
        expect(firstPageRow(*doc, 0) == "L         R");
    };

    "stack layers overwrite earlier layers"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: stack
      width: 160
      height: 51
      layers:
        - children: [ { type: label, width: 10, text: "AAAAAAAAAA" } ]
        - children: [ { type: label, x: 2, width: 3, text: "BBB" } ]
)");
        expect(doc.has_value()) << error_msg(doc);
        expect(firstPageRow(*doc, 0) == "AABBBAAAAA");
    };

    "box children are placed inside the border"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: box
      width: 12
      height: 3
      title: Hi
      children: [ { type: label, width: 10, text: "inside" } ]
)");
        expect(doc.has_value()) << error_msg(doc);
        expect(firstPageRow(*doc, 0) == "+-Hi-------+");
        expect(firstPageRow(*doc, 1) == "|inside    |");
    };

    "root larger than the page fails at render"_test = [] {
        auto doc = loadDocument(R"(
pages:
  - root:
      type: container
      width: 200
      height: 10
      children: [ { type: label, x: 170, width: 5, text: "far" } ]
)");
        expect(doc.error().kind() == ErrorKind::OutOfBounds);
        expect(doc.error().to_string().starts_with("pages[0]: render failed"));
    };

    "parseWidget builds a single widget"_test = [] {
        auto node = YAML::Load("{ type: kv, width: 20, height: 2, entries: [ { key: a, value: b } ] }");
        auto widget = parseWidget(node);
        expect(widget.has_value()) << error_msg(widget);
        expect((*widget)->width() == 20_u);
        expect((*widget)->height() == 2_u);
    };

    "invoice layout file loads two pages"_test = [] {
        auto doc = loadDocumentFile(std::string(ESCP_TEST_DATA_DIR) + "/invoice.yaml");
        expect(doc.has_value()) << error_msg(doc);
        expect(doc->pageCount() == 2_u);
        expect(firstPageRow(*doc, 0).starts_with("+-ACME Supplies-"));
        expect(firstPageRow(*doc, 1) == "| INVOICE 2024-0042" + std::string(140, ' ') + "|");
        expect(firstPageRow(*doc, 5) == "  Customer: Globex");
        expect(firstPageRow(*doc, 15).starts_with("  Item"));
    };

    "missing layout file is a Config error"_test = [] {
        auto doc = loadDocumentFile(std::string(ESCP_TEST_DATA_DIR) + "/does-not-exist.yaml");
        expect(doc.error().kind() == ErrorKind::Config);
    };
};
