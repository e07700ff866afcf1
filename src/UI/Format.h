#pragma once

#include <array>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <format>
#include <string>

namespace UI::Format
{

struct ByteUnit
{
    const char* suffix = "B";
    double scale = 1.0;
    int decimals = 1;
};

inline constexpr double BYTE_UNIT_STEP = 1024.0;

inline constexpr std::array<const char*, 6> BYTE_UNIT_SUFFIXES = {"B", "KB", "MB", "GB", "TB", "PB"};

/// Largest binary unit that keeps the scaled value >= 1 (B for anything below 1024).
[[nodiscard]] inline auto chooseByteUnit(double bytes) -> ByteUnit
{
    const double absBytes = std::abs(bytes);
    double scale = 1.0;
    std::size_t index = 0;
    while (index + 1 < BYTE_UNIT_SUFFIXES.size() && absBytes >= scale * BYTE_UNIT_STEP)
    {
        scale *= BYTE_UNIT_STEP;
        ++index;
    }
    return {.suffix = BYTE_UNIT_SUFFIXES[index], .scale = scale, .decimals = 1};
}

[[nodiscard]] inline auto formatBytesWithUnit(double bytes, ByteUnit unit) -> std::string
{
    const double value = bytes / unit.scale;
    return std::format("{:.{}f} {}", value, unit.decimals, unit.suffix);
}

[[nodiscard]] inline auto formatBytes(double bytes) -> std::string
{
    return formatBytesWithUnit(bytes, chooseByteUnit(bytes));
}

template<std::unsigned_integral T> [[nodiscard]] inline auto formatBytes(T bytes) -> std::string
{
    return formatBytes(static_cast<double>(bytes));
}

} // namespace UI::Format
