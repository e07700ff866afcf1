#pragma once

#include "Domain/History.h"
#include "Domain/HistoryView.h"
#include "Domain/ISeriesStore.h"
#include "Domain/SeriesKind.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace Domain
{

/// In-memory history for every tracked series.
/// Thread-safe (allows a collector thread to push while the UI queries).
class SeriesStore : public ISeriesStore
{
  public:
    explicit SeriesStore(std::size_t capacity);
    ~SeriesStore() override = default;

    SeriesStore(const SeriesStore&) = delete;
    SeriesStore& operator=(const SeriesStore&) = delete;
    SeriesStore(SeriesStore&&) = delete;
    SeriesStore& operator=(SeriesStore&&) = delete;

    /// Append one sample; the first push for a kind starts tracking it.
    void push(const SeriesKind& kind, std::uint64_t value);

    /// Start tracking a kind without data, so lookups return an empty window instead of nullopt.
    void track(const SeriesKind& kind);

    /// Stop tracking a kind (e.g. a filesystem was unmounted).
    void forget(const SeriesKind& kind);

    /// Change retention for all series, keeping the newest samples.
    void setCapacity(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const;
    [[nodiscard]] std::size_t trackedCount() const;

    /// Zoomed window, oldest first. Each returned point is the max of zoomFactor raw samples,
    /// so short spikes survive down-sampling. At most view.width points, ending view.offset
    /// points before the newest.
    [[nodiscard]] std::optional<std::vector<std::uint64_t>> lookup(const SeriesKind& kind, const HistoryView& view) const override;

  private:
    mutable std::shared_mutex m_Mutex;
    std::unordered_map<SeriesKind, History<std::uint64_t>> m_Series;
    std::size_t m_Capacity;
};

} // namespace Domain
