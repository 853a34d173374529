#include <stealth/descriptor.hpp>
#include <stealth/rectangle.hpp>

#include <algorithm>
#include <limits>

namespace stealth {

static std::uint32_t saturatingAdd(std::uint32_t a, std::uint32_t b) {
    std::uint32_t limit = std::numeric_limits<std::uint32_t>::max();
    return (limit - a < b) ? limit : a + b;
}

static std::uint32_t saturatingSub(std::uint32_t a, std::uint32_t b) {
    return a > b ? a - b : 0;
}

Rectangle Rectangle::withWidthHeight(std::uint32_t width, std::uint32_t height) {
    return Rectangle{0, 0, width, height};
}

Rectangle Rectangle::withLayout(const BufferLayout& layout) {
    return withWidthHeight(layout.width(), layout.height());
}

bool Rectangle::contains(const Rectangle& other) const {
    if (x > other.x || y > other.y)
        return false;

    // Offsets can not wrap after the check above.
    std::uint32_t offsetX = other.x - x;
    std::uint32_t offsetY = other.y - y;
    if (offsetX > width() || offsetY > height())
        return false;

    return width() - offsetX >= other.width() && height() - offsetY >= other.height();
}

Rectangle Rectangle::normalize() const {
    return Rectangle{x, y, x + width(), y + height()};
}

Rectangle Rectangle::meet(const Rectangle& other) const {
    return Rectangle{
        std::max(x, other.x),
        std::max(y, other.y),
        std::min(maxX, other.maxX),
        std::min(maxY, other.maxY),
    };
}

Rectangle Rectangle::join(const Rectangle& other) const {
    return Rectangle{
        std::min(x, other.x),
        std::min(y, other.y),
        std::max(maxX, other.maxX),
        std::max(maxY, other.maxY),
    };
}

Rectangle Rectangle::inset(std::uint32_t border) const {
    return Rectangle{
        saturatingAdd(x, border),
        saturatingAdd(y, border),
        saturatingSub(maxX, border),
        saturatingSub(maxY, border),
    };
}

} // namespace stealth
