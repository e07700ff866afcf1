#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace UI
{

/// Rectangle in character cells. (x, y) is the top-left cell.
struct Rect
{
    std::uint16_t x = 0;
    std::uint16_t y = 0;
    std::uint16_t width = 0;
    std::uint16_t height = 0;

    [[nodiscard]] bool operator==(const Rect&) const = default;

    [[nodiscard]] bool empty() const noexcept
    {
        return width == 0 || height == 0;
    }

    [[nodiscard]] std::uint32_t area() const noexcept
    {
        return static_cast<std::uint32_t>(width) * height;
    }

    /// Shrink by margin cells on every side, saturating at zero size.
    [[nodiscard]] Rect inner(std::uint16_t margin) const noexcept;
};

enum class Direction
{
    Horizontal, // Chunks laid out left to right
    Vertical,   // Chunks laid out top to bottom
};

/// Size request for one chunk of a split.
struct Constraint
{
    enum class Kind
    {
        Percentage, // value% of the available length
        Length,     // exactly value cells (clamped to what is left)
        Min,        // at least value cells, takes any leftover space
    };

    Kind kind = Kind::Percentage;
    std::uint16_t value = 0;

    [[nodiscard]] static constexpr Constraint percentage(std::uint16_t percent) noexcept
    {
        return {.kind = Kind::Percentage, .value = percent};
    }

    [[nodiscard]] static constexpr Constraint length(std::uint16_t cells) noexcept
    {
        return {.kind = Kind::Length, .value = cells};
    }

    [[nodiscard]] static constexpr Constraint min(std::uint16_t cells) noexcept
    {
        return {.kind = Kind::Min, .value = cells};
    }
};

namespace Layout
{

/// Partition area (after removing margin on every side) along direction.
/// Returns one Rect per constraint. The last chunk absorbs any rounding remainder,
/// and chunks never extend past the area.
[[nodiscard]] std::vector<Rect> split(const Rect& area, Direction direction, std::uint16_t margin, std::initializer_list<Constraint> constraints);

/// Two equal halves, the common case for detail panes.
[[nodiscard]] std::vector<Rect> splitEven(const Rect& area, Direction direction, std::uint16_t margin);

} // namespace Layout

} // namespace UI
