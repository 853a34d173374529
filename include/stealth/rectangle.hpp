#pragma once

#include <cstdint>

namespace stealth {

class BufferLayout;

// A rectangle in uint32 space, min inclusive and max exclusive.
// Any rectangle with max < min is empty. Such rectangles are legal values so
// that the arithmetic below stays total.
struct Rectangle {
    std::uint32_t x = 0;
    std::uint32_t y = 0;
    std::uint32_t maxX = 0;
    std::uint32_t maxY = 0;

    // A rectangle at the origin.
    [[nodiscard]] static Rectangle withWidthHeight(std::uint32_t width, std::uint32_t height);

    // The rectangle covering a complete buffer.
    [[nodiscard]] static Rectangle withLayout(const BufferLayout& layout);

    [[nodiscard]] std::uint32_t width() const { return maxX > x ? maxX - x : 0; }
    [[nodiscard]] std::uint32_t height() const { return maxY > y ? maxY - y : 0; }
    [[nodiscard]] bool empty() const { return width() == 0 || height() == 0; }

    // True if this rectangle fully contains `other`.
    [[nodiscard]] bool contains(const Rectangle& other) const;

    // Min and max form a true interval afterwards.
    [[nodiscard]] Rectangle normalize() const;

    // Overlap of both.
    [[nodiscard]] Rectangle meet(const Rectangle& other) const;

    // Smallest rectangle containing both bounds.
    [[nodiscard]] Rectangle join(const Rectangle& other) const;

    // Remove a border from all sides. When the rectangle is smaller than the
    // border the result is empty and otherwise unspecified.
    [[nodiscard]] Rectangle inset(std::uint32_t border) const;

    [[nodiscard]] bool operator==(const Rectangle&) const = default;
};

} // namespace stealth
