#pragma once

#include "Domain/IProcessLookup.h"
#include "Domain/ProcessInfo.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Domain
{

/// In-memory process table keyed by pid.
/// Replaced wholesale each refresh, like the snapshots it is built from.
class ProcessTable : public IProcessLookup
{
  public:
    ProcessTable() = default;
    explicit ProcessTable(const std::vector<ProcessInfo>& processes);

    /// Replace the table contents. Later duplicates of a pid win.
    void update(const std::vector<ProcessInfo>& processes);

    [[nodiscard]] std::optional<ProcessInfo> lookup(std::int32_t pid) const override;

    /// Pid with the highest read rate; ties go to the lower pid. Empty if nobody is reading.
    [[nodiscard]] std::optional<std::int32_t> topDiskReader() const;

    /// Pid with the highest write rate; ties go to the lower pid. Empty if nobody is writing.
    [[nodiscard]] std::optional<std::int32_t> topDiskWriter() const;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_Processes.size();
    }

  private:
    template<typename RateFn> [[nodiscard]] std::optional<std::int32_t> topBy(RateFn rate) const;

    std::unordered_map<std::int32_t, ProcessInfo> m_Processes;
};

} // namespace Domain
