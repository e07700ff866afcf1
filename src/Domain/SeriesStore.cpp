#include "SeriesStore.h"

#include "Domain/History.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace Domain
{

SeriesStore::SeriesStore(std::size_t capacity) : m_Capacity(std::max<std::size_t>(capacity, 1))
{
}

void SeriesStore::push(const SeriesKind& kind, std::uint64_t value)
{
    std::unique_lock lock(m_Mutex);
    auto it = m_Series.find(kind);
    if (it == m_Series.end())
    {
        spdlog::debug("SeriesStore: tracking {} '{}'", toString(kind.tag()), kind.key());
        it = m_Series.try_emplace(kind, m_Capacity).first;
    }
    it->second.push(value);
}

void SeriesStore::track(const SeriesKind& kind)
{
    std::unique_lock lock(m_Mutex);
    if (m_Series.try_emplace(kind, m_Capacity).second)
    {
        spdlog::debug("SeriesStore: tracking {} '{}'", toString(kind.tag()), kind.key());
    }
}

void SeriesStore::forget(const SeriesKind& kind)
{
    std::unique_lock lock(m_Mutex);
    if (m_Series.erase(kind) > 0)
    {
        spdlog::debug("SeriesStore: dropped {} '{}'", toString(kind.tag()), kind.key());
    }
}

void SeriesStore::setCapacity(std::size_t capacity)
{
    std::unique_lock lock(m_Mutex);
    m_Capacity = std::max<std::size_t>(capacity, 1);
    for (auto& [kind, history] : m_Series)
    {
        history.resize(m_Capacity);
    }
}

std::size_t SeriesStore::capacity() const
{
    std::shared_lock lock(m_Mutex);
    return m_Capacity;
}

std::size_t SeriesStore::trackedCount() const
{
    std::shared_lock lock(m_Mutex);
    return m_Series.size();
}

std::optional<std::vector<std::uint64_t>> SeriesStore::lookup(const SeriesKind& kind, const HistoryView& view) const
{
    std::shared_lock lock(m_Mutex);

    const auto it = m_Series.find(kind);
    if (it == m_Series.end())
    {
        return std::nullopt;
    }

    const auto& history = it->second;
    std::vector<std::uint64_t> out;

    std::size_t zoom = view.zoomFactor;
    if (zoom == 0)
    {
        spdlog::warn("SeriesStore: zoom factor 0 for {}, using 1", toString(kind.tag()));
        zoom = 1;
    }

    // Buckets are aligned to the newest sample so the right edge stays stable as data arrives.
    const std::size_t bucketCount = (history.size() / zoom) + ((history.size() % zoom != 0) ? 1 : 0);
    if (view.width == 0 || view.offset >= bucketCount)
    {
        return out;
    }

    const std::size_t lastBucket = bucketCount - view.offset; // exclusive, counted from the oldest
    const std::size_t firstBucket = (lastBucket > view.width) ? lastBucket - view.width : 0;
    out.reserve(lastBucket - firstBucket);

    for (std::size_t bucket = firstBucket; bucket < lastBucket; ++bucket)
    {
        // Bucket b (from the newest end) covers raw indices [size - (n-b)*zoom, size - (n-b-1)*zoom)
        const std::size_t fromNewest = bucketCount - bucket;
        const std::size_t end = history.size() - ((fromNewest - 1) * zoom);
        const std::size_t begin = (end > zoom) ? end - zoom : 0;

        std::uint64_t peak = 0;
        for (std::size_t i = begin; i < end; ++i)
        {
            peak = std::max(peak, history[i]);
        }
        out.push_back(peak);
    }

    spdlog::trace("SeriesStore: {} '{}' -> {} points (zoom {})", toString(kind.tag()), kind.key(), out.size(), zoom);
    return out;
}

} // namespace Domain
