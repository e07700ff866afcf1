#pragma once

#include <cstddef>

namespace Domain
{

/// Zoom/time-window descriptor for a series query.
/// Only the series store interprets it; the panel passes it through untouched.
struct HistoryView
{
    std::size_t width = 120;    // Maximum number of points returned
    std::size_t zoomFactor = 1; // Raw samples folded into one returned point
    std::size_t offset = 0;     // Returned points skipped back from the newest (scrollback)

    [[nodiscard]] bool operator==(const HistoryView&) const = default;
};

} // namespace Domain
