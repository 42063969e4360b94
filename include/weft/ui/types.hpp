#pragma once

/// @file types.hpp
/// @brief Terminal cell geometry and the render buffer for weft_ui

#include "fwd.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace weft_ui {

// =============================================================================
// Layout Types
// =============================================================================

/// Cell coordinate (column, row)
struct Position {
    std::uint16_t x = 0;
    std::uint16_t y = 0;

    constexpr Position() = default;
    constexpr Position(std::uint16_t x_, std::uint16_t y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Position&) const = default;
};

/// Size in cells
struct Size {
    std::uint16_t width = 0;
    std::uint16_t height = 0;

    constexpr Size() = default;
    constexpr Size(std::uint16_t w, std::uint16_t h) : width(w), height(h) {}

    [[nodiscard]] constexpr std::uint32_t area() const {
        return static_cast<std::uint32_t>(width) * height;
    }
    [[nodiscard]] constexpr bool is_empty() const { return width == 0 || height == 0; }

    constexpr bool operator==(const Size&) const = default;
};

/// Rectangle of cells. The right and bottom edges are exclusive.
struct Rect {
    std::uint16_t x = 0;
    std::uint16_t y = 0;
    std::uint16_t width = 0;
    std::uint16_t height = 0;

    constexpr Rect() = default;
    constexpr Rect(std::uint16_t x_, std::uint16_t y_, std::uint16_t w, std::uint16_t h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Position pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    [[nodiscard]] constexpr Position position() const { return {x, y}; }
    [[nodiscard]] constexpr Size size() const { return {width, height}; }
    [[nodiscard]] constexpr std::uint32_t area() const { return size().area(); }
    [[nodiscard]] constexpr bool is_empty() const { return width == 0 || height == 0; }

    [[nodiscard]] constexpr std::uint32_t left() const { return x; }
    [[nodiscard]] constexpr std::uint32_t right() const { return std::uint32_t{x} + width; }
    [[nodiscard]] constexpr std::uint32_t top() const { return y; }
    [[nodiscard]] constexpr std::uint32_t bottom() const { return std::uint32_t{y} + height; }

    [[nodiscard]] constexpr bool contains(Position p) const {
        return p.x >= left() && p.x < right() && p.y >= top() && p.y < bottom();
    }

    [[nodiscard]] constexpr bool contains(std::uint16_t column, std::uint16_t row) const {
        return contains(Position{column, row});
    }

    [[nodiscard]] constexpr bool intersects(const Rect& other) const {
        return left() < other.right() && other.left() < right() &&
               top() < other.bottom() && other.top() < bottom();
    }

    /// Overlapping part of two rects (empty when disjoint)
    [[nodiscard]] constexpr Rect intersection(const Rect& other) const {
        if (!intersects(other)) {
            return Rect{};
        }
        auto l = std::max(left(), other.left());
        auto t = std::max(top(), other.top());
        auto r = std::min(right(), other.right());
        auto b = std::min(bottom(), other.bottom());
        return Rect{
            static_cast<std::uint16_t>(l), static_cast<std::uint16_t>(t),
            static_cast<std::uint16_t>(r - l), static_cast<std::uint16_t>(b - t)};
    }

    /// Shrink by a margin on every side
    [[nodiscard]] constexpr Rect inner(std::uint16_t margin) const {
        if (width < margin * 2 || height < margin * 2) {
            return Rect{x, y, 0, 0};
        }
        return Rect{
            static_cast<std::uint16_t>(x + margin), static_cast<std::uint16_t>(y + margin),
            static_cast<std::uint16_t>(width - margin * 2), static_cast<std::uint16_t>(height - margin * 2)};
    }

    constexpr bool operator==(const Rect&) const = default;
};

// =============================================================================
// Buffer
// =============================================================================

/// One terminal cell
struct Cell {
    std::string symbol = " ";

    bool operator==(const Cell&) const = default;
};

/// Grid of cells covering an area of the screen.
///
/// Writes outside the area are clipped.
class Buffer {
public:
    Buffer() = default;
    explicit Buffer(Rect area);

    /// Filled with the given symbol
    [[nodiscard]] static Buffer filled(Rect area, std::string_view symbol);

    [[nodiscard]] const Rect& area() const noexcept { return m_area; }

    /// Resize and clear
    void resize(Rect area);

    /// Reset every cell to a blank
    void reset();

    /// Cell at absolute screen coordinates, nullptr outside the area
    [[nodiscard]] Cell* cell(Position pos);
    [[nodiscard]] const Cell* cell(Position pos) const;

    /// Write a string starting at (x, y), one UTF-8 code point per cell, clipped
    /// to the area. Wide characters still take a single cell.
    /// @return Number of cells written
    std::size_t set_string(std::uint16_t x, std::uint16_t y, std::string_view text);

    /// Fill a rect with a symbol
    void fill(Rect area, std::string_view symbol);

    /// Row contents with trailing cells concatenated
    [[nodiscard]] std::string line(std::uint16_t row) const;

    /// All rows, top to bottom
    [[nodiscard]] std::vector<std::string> lines() const;

    bool operator==(const Buffer&) const = default;

private:
    [[nodiscard]] std::size_t index_of(Position pos) const;

    Rect m_area;
    std::vector<Cell> m_cells;
};

} // namespace weft_ui
