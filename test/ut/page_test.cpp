//=============================================================================
// Page / PageBuilder Unit Tests
//
// Covers: raw writes, silent clipping, UTF-8 handling, fills, freezing
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <escp/label.h>
#include <escp/page.h>
#include <escp/region.h>

using namespace boost::ut;
using namespace escp;

suite page_tests = [] {
    "new page is all EMPTY"_test = [] {
        auto page = Page::builder().build();
        bool allEmpty = true;
        for (const auto& row : page.cells()) {
            for (const auto& cell : row) {
                allEmpty = allEmpty && cell == Cell::EMPTY;
            }
        }
        expect(allEmpty);
        expect(page.cells().size() == 51_u);
        expect(page.cells()[0].size() == 160_u);
    };

    "writeAt stores a styled cell"_test = [] {
        auto builder = Page::builder();
        builder.writeAt(10, 5, U'X', StyleFlags::BOLD);
        auto page = std::move(builder).build();
        expect(page.cell(10, 5) == Cell(U'X', StyleFlags::BOLD));
    };

    "writeAt outside the grid is silently ignored"_test = [] {
        auto builder = Page::builder();
        builder.writeAt(200, 0, U'X', StyleFlags::NONE);
        builder.writeAt(0, 51, U'X', StyleFlags::NONE);
        builder.writeAt(160, 50, U'X', StyleFlags::NONE);
        auto page = std::move(builder).build();
        expect(page.text().find('X') == std::string::npos);
    };

    "cell() outside the grid is nullopt"_test = [] {
        auto page = Page::builder().build();
        expect(!page.cell(160, 0).has_value());
        expect(!page.cell(0, 51).has_value());
        expect(page.cell(159, 50).has_value());
    };

    "writeStr truncates at the right edge"_test = [] {
        auto builder = Page::builder();
        builder.writeStr(155, 0, "HelloWorld", StyleFlags::NONE);
        auto page = std::move(builder).build();
        expect(page.cell(155, 0)->character() == 'H');
        expect(page.cell(159, 0)->character() == 'o');
        expect(page.cell(0, 1)->character() == ' ') << "no wrap to the next row";
    };

    "writeStr uses one cell per code point"_test = [] {
        auto builder = Page::builder();
        builder.writeStr(0, 0, "a\xC3\xA9" "b", StyleFlags::NONE);  // a, e-acute, b
        auto page = std::move(builder).build();
        expect(page.cell(0, 0)->character() == 'a');
        expect(page.cell(1, 0)->character() == '?');
        expect(page.cell(2, 0)->character() == 'b');
        expect(page.cell(3, 0)->character() == ' ');
    };

    "writeStr replaces malformed UTF-8 per byte"_test = [] {
        auto builder = Page::builder();
        builder.writeStr(0, 0, "\xFF" "A", StyleFlags::NONE);
        auto page = std::move(builder).build();
        expect(page.cell(0, 0)->character() == '?');
        expect(page.cell(1, 0)->character() == 'A');
    };

    "fillRegion covers exactly the region"_test = [] {
        auto builder = Page::builder();
        builder.fillRegion(*Region::create(2, 3, 4, 2), U'#', StyleFlags::UNDERLINE);
        auto page = std::move(builder).build();
        expect(page.cell(2, 3) == Cell(U'#', StyleFlags::UNDERLINE));
        expect(page.cell(5, 4) == Cell(U'#', StyleFlags::UNDERLINE));
        expect(page.cell(6, 4) == Cell::EMPTY);
        expect(page.cell(2, 5) == Cell::EMPTY);
        expect(page.cell(1, 3) == Cell::EMPTY);
    };

    "renderIn places a widget at the region origin"_test = [] {
        auto label = *Label(10).addText("Hi");
        auto builder = Page::builder();
        auto res = builder.renderIn(*Region::create(20, 7, 30, 3), label);
        expect(res.has_value());
        auto page = std::move(builder).build();
        expect(page.cell(20, 7)->character() == 'H');
        expect(page.cell(21, 7)->character() == 'i');
    };

    "renderIn rejects a widget larger than the region"_test = [] {
        auto label = *Label(10).addText("Hi");
        auto builder = Page::builder();
        auto res = builder.renderIn(*Region::create(0, 0, 5, 1), label);
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::ChildExceedsParent);
    };

    "text() strips trailing blanks"_test = [] {
        auto builder = Page::builder();
        builder.writeStr(0, 0, "Total", StyleFlags::BOLD);
        builder.writeStr(3, 2, "x", StyleFlags::NONE);
        auto text = std::move(builder).build().text();
        expect(text.starts_with("Total\n\n   x\n"));
        expect(std::count(text.begin(), text.end(), '\n') == 50_i);
    };

    "copies share the frozen grid"_test = [] {
        auto builder = Page::builder();
        builder.writeAt(0, 0, U'Q', StyleFlags::NONE);
        auto page = std::move(builder).build();
        Page copy = page;
        expect(&copy.cells() == &page.cells());
        expect(copy.cell(0, 0)->character() == 'Q');
    };

    "a moved-from page stays readable"_test = [] {
        auto builder = Page::builder();
        builder.writeAt(1, 1, U'M', StyleFlags::UNDERLINE);
        auto page = std::move(builder).build();

        Page moved = std::move(page);
        expect(moved.cell(1, 1)->character() == 'M');
        expect(page.cell(1, 1)->character() == 'M');
        expect(page.text() == moved.text());
        expect(&page.cells() == &moved.cells());
    };

    "writes follow the builder when it is moved"_test = [] {
        auto first = Page::builder();
        first.writeAt(0, 0, U'A', StyleFlags::NONE);
        PageBuilder second = std::move(first);
        second.writeAt(1, 0, U'B', StyleFlags::NONE);
        auto page = std::move(second).build();
        expect(page.text().starts_with("AB\n"));
    };
};
