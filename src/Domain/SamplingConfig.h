#pragma once

#include <algorithm>
#include <cstddef>

namespace Domain::Sampling
{

// Refresh cadence (milliseconds)
inline constexpr int REFRESH_INTERVAL_DEFAULT_MS = 1000;
inline constexpr int REFRESH_INTERVAL_MIN_MS = 100;
inline constexpr int REFRESH_INTERVAL_MAX_MS = 5000;

// History window (seconds)
inline constexpr int HISTORY_SECONDS_DEFAULT = 300; // 5 minutes
inline constexpr int HISTORY_SECONDS_MIN = 10;
inline constexpr int HISTORY_SECONDS_MAX = 1800; // 30 minutes

// Zoom (raw samples per displayed point)
inline constexpr int ZOOM_FACTOR_DEFAULT = 1;
inline constexpr int ZOOM_FACTOR_MIN = 1;
inline constexpr int ZOOM_FACTOR_MAX = 64;

template<typename T> [[nodiscard]] constexpr T clampRefreshInterval(T value)
{
    return std::clamp(value, static_cast<T>(REFRESH_INTERVAL_MIN_MS), static_cast<T>(REFRESH_INTERVAL_MAX_MS));
}

template<typename T> [[nodiscard]] constexpr T clampHistorySeconds(T value)
{
    return std::clamp(value, static_cast<T>(HISTORY_SECONDS_MIN), static_cast<T>(HISTORY_SECONDS_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampZoomFactor(T value)
{
    return std::clamp(value, static_cast<T>(ZOOM_FACTOR_MIN), static_cast<T>(ZOOM_FACTOR_MAX));
}

/// Samples needed to cover the history window at the given cadence.
[[nodiscard]] constexpr std::size_t historyCapacity(int historySeconds, int refreshIntervalMs)
{
    const int seconds = clampHistorySeconds(historySeconds);
    const int intervalMs = clampRefreshInterval(refreshIntervalMs);
    return static_cast<std::size_t>((seconds * 1000 + intervalMs - 1) / intervalMs);
}

} // namespace Domain::Sampling
