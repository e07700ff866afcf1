#pragma once

#include "Domain/Numeric.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace UI::Numeric
{

using Domain::Numeric::narrowOr;
using Domain::Numeric::toDouble;

// ImPlot series counts are int; keep conversion explicit + checked.
[[nodiscard]] constexpr auto checkedCount(std::size_t value) noexcept -> int
{
    return narrowOr<int>(value, std::numeric_limits<int>::max());
}

/// value / max clamped to [0, 1]; max of 0 is treated as 1.
[[nodiscard]] constexpr auto fraction01(std::uint64_t value, std::uint64_t max) noexcept -> double
{
    const double denom = toDouble(std::max<std::uint64_t>(max, 1));
    return std::clamp(toDouble(value) / denom, 0.0, 1.0);
}

} // namespace UI::Numeric
