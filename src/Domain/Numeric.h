#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <limits>
#include <utility>

namespace Domain::Numeric
{

template<typename T>
    requires(std::integral<T> || std::floating_point<T>)
[[nodiscard]] constexpr auto toDouble(T value) noexcept -> double
{
    return static_cast<double>(value);
}

/// Safe narrowing conversion with fallback value.
/// Returns fallback if value is out of range for target type.
template<std::integral To, std::integral From> [[nodiscard]] constexpr auto narrowOr(From value, To fallback) noexcept -> To
{
    if (!std::in_range<To>(value))
    {
        return fallback;
    }
    return static_cast<To>(value);
}

/// Unsigned subtraction that stops at zero instead of wrapping.
[[nodiscard]] constexpr auto saturatingSub(std::uint64_t lhs, std::uint64_t rhs) noexcept -> std::uint64_t
{
    return (lhs >= rhs) ? (lhs - rhs) : 0;
}

/// Ratio as a percentage; 0 when the denominator is 0.
[[nodiscard]] constexpr auto percentOf(std::uint64_t part, std::uint64_t whole) noexcept -> double
{
    if (whole == 0)
    {
        return 0.0;
    }
    return (toDouble(part) / toDouble(whole)) * 100.0;
}

} // namespace Domain::Numeric
