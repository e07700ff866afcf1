#pragma once

#include "Domain/HistoryView.h"
#include "Domain/SeriesKind.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace Domain
{

/// Read side of the metrics history.
/// Implementations own retention and down-sampling; callers only ask for a window.
class ISeriesStore
{
  public:
    virtual ~ISeriesStore() = default;

    ISeriesStore() = default;
    ISeriesStore(const ISeriesStore&) = default;
    ISeriesStore& operator=(const ISeriesStore&) = default;
    ISeriesStore(ISeriesStore&&) = default;
    ISeriesStore& operator=(ISeriesStore&&) = default;

    /// Samples for (kind, view), oldest first.
    /// std::nullopt when the kind is not tracked yet; never throws for unknown keys.
    [[nodiscard]] virtual std::optional<std::vector<std::uint64_t>> lookup(const SeriesKind& kind, const HistoryView& view) const = 0;
};

} // namespace Domain
