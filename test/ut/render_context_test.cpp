#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <escp/container.h>
#include <escp/label.h>
#include <escp/page.h>
#include <escp/render-context.h>

using namespace boost::ut;
using namespace escp;

suite render_context_tests = [] {
    "clip bounds cover the page"_test = [] {
        auto builder = Page::builder();
        RenderContext ctx(builder);
        expect(ctx.clipBounds() == Bounds{0, 0, 160, 51});
    };

    "writeText writes unstyled cells"_test = [] {
        auto builder = Page::builder();
        RenderContext ctx(builder);
        expect(ctx.writeText("abc", {4, 2}).has_value());
        auto page = std::move(builder).build();
        expect(page.cell(4, 2) == Cell(U'a'));
        expect(page.cell(6, 2) == Cell(U'c'));
    };

    "writeStyled applies the style"_test = [] {
        auto builder = Page::builder();
        RenderContext ctx(builder);
        expect(ctx.writeStyled("u", {0, 0}, StyleFlags::UNDERLINE).has_value());
        expect(std::move(builder).build().cell(0, 0)->style() == StyleFlags::UNDERLINE);
    };

    "start position outside the page is OutOfBounds"_test = [] {
        auto builder = Page::builder();
        RenderContext ctx(builder);

        auto res = ctx.writeText("x", {160, 0});
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::OutOfBounds);
        auto* d = res.error().as<OutOfBounds>();
        expect(d->position == Position{160, 0});
        expect(d->bounds == Bounds{0, 0, 160, 51});

        expect(ctx.writeText("x", {0, 51}).error().kind() == ErrorKind::OutOfBounds);
    };

    "text starting inside is truncated, not rejected"_test = [] {
        auto builder = Page::builder();
        RenderContext ctx(builder);
        expect(ctx.writeText("0123456789", {155, 50}).has_value());
        auto page = std::move(builder).build();
        expect(page.cell(159, 50)->character() == '4');
    };

    "oversized root reports the first child outside the page"_test = [] {
        Container root(200, 60);
        expect(root.addChild(*Label(5).addText("ok"), {0, 0}).has_value());
        expect(root.addChild(*Label(5).addText("far"), {170, 0}).has_value());

        auto builder = Page::builder();
        auto res = builder.render(root);
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::OutOfBounds);
        expect(res.error().as<OutOfBounds>()->position == Position{170, 0});
    };
};
