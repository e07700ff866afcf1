#include "ProcessTable.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace Domain
{

ProcessTable::ProcessTable(const std::vector<ProcessInfo>& processes)
{
    update(processes);
}

void ProcessTable::update(const std::vector<ProcessInfo>& processes)
{
    m_Processes.clear();
    m_Processes.reserve(processes.size());
    for (const auto& process : processes)
    {
        m_Processes.insert_or_assign(process.pid, process);
    }

    spdlog::trace("ProcessTable: {} processes", m_Processes.size());
}

std::optional<ProcessInfo> ProcessTable::lookup(std::int32_t pid) const
{
    const auto it = m_Processes.find(pid);
    if (it == m_Processes.end())
    {
        return std::nullopt;
    }
    return it->second;
}

template<typename RateFn> std::optional<std::int32_t> ProcessTable::topBy(RateFn rate) const
{
    std::optional<std::int32_t> best;
    double bestRate = 0.0;

    for (const auto& [pid, process] : m_Processes)
    {
        const double value = rate(process);
        if (value <= 0.0)
        {
            continue;
        }

        if (!best.has_value() || value > bestRate || (value == bestRate && pid < *best))
        {
            best = pid;
            bestRate = value;
        }
    }

    return best;
}

std::optional<std::int32_t> ProcessTable::topDiskReader() const
{
    return topBy([](const ProcessInfo& p) { return p.ioReadBytesPerSec; });
}

std::optional<std::int32_t> ProcessTable::topDiskWriter() const
{
    return topBy([](const ProcessInfo& p) { return p.ioWriteBytesPerSec; });
}

} // namespace Domain
