#include <stealth/descriptor.hpp>
#include <stealth/rectangle.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <limits>

using stealth::Rectangle;

static const Rectangle kSamples[] = {
    {0, 0, 4, 4},
    {1, 2, 3, 8},
    {5, 5, 2, 2}, // degenerate
    {0, 0, 0, 0},
    {2, 0, 10, 1},
};

static void testWidthHeight() {
    Rectangle r = Rectangle::withWidthHeight(3, 5);
    assert(r.x == 0 && r.y == 0);
    assert(r.width() == 3 && r.height() == 5);
    assert(!r.empty());

    Rectangle degenerate{5, 5, 2, 2};
    assert(degenerate.width() == 0 && degenerate.height() == 0);
    assert(degenerate.empty());

    auto layout = stealth::BufferLayout::withTexel(
        stealth::Texel::withSrgb({stealth::SampleParts::Rgba, stealth::SampleBits::Int8x4}), 7, 9);
    assert(Rectangle::withLayout(*layout) == Rectangle::withWidthHeight(7, 9));

    std::printf("  width and height: ok\n");
}

static void testLaws() {
    for (const auto& a : kSamples) {
        assert(a.meet(a) == a);
        assert(a.join(a) == a);
        assert(a.contains(a));
        assert(a.normalize().width() == a.width());
        assert(a.normalize().height() == a.height());

        for (const auto& b : kSamples) {
            assert(a.meet(b) == b.meet(a));
        }
    }

    std::printf("  laws: ok\n");
}

static void testContains() {
    Rectangle outer{0, 0, 4, 4};
    assert(outer.contains(Rectangle{0, 0, 2, 2}));
    assert(outer.contains(Rectangle{2, 2, 4, 4}));
    assert(!outer.contains(Rectangle{2, 2, 5, 4}));
    assert(!Rectangle({1, 1, 4, 4}).contains(Rectangle{0, 1, 2, 2}));

    // Any empty rectangle inside the bounds fits.
    assert(outer.contains(Rectangle{3, 3, 3, 3}));

    std::printf("  contains: ok\n");
}

static void testMeetJoinInset() {
    Rectangle a{0, 0, 4, 4};
    Rectangle b{2, 1, 6, 3};
    assert(a.meet(b) == (Rectangle{2, 1, 4, 3}));
    assert(a.join(b) == (Rectangle{0, 0, 6, 4}));

    assert(a.inset(1) == (Rectangle{1, 1, 3, 3}));
    assert(a.inset(3).empty());

    std::uint32_t max = std::numeric_limits<std::uint32_t>::max();
    Rectangle edge{max - 1, 0, max, 1};
    assert(edge.inset(4).empty());

    std::printf("  meet, join, inset: ok\n");
}

int main() {
    testWidthHeight();
    testLaws();
    testContains();
    testMeetJoinInset();

    std::printf("all rectangle tests passed\n");
    return 0;
}
