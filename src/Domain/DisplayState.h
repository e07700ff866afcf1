#pragma once

#include <cstddef>

namespace Domain
{

/// Which detail view the disk panel shows.
enum class DisplayMode
{
    Activity,
    Usage,
};

/// Selection state owned by input handling; read-only to rendering.
struct DisplayState
{
    DisplayMode mode = DisplayMode::Activity;
    std::size_t selectedIndex = 0; // Index into MetricsSnapshot::disks; may be out of range
};

[[nodiscard]] constexpr DisplayMode toggled(DisplayMode mode) noexcept
{
    return (mode == DisplayMode::Activity) ? DisplayMode::Usage : DisplayMode::Activity;
}

} // namespace Domain
