/// @file MockProcessLookup.h
/// @brief Mock implementation of IProcessLookup for testing

#pragma once

#include "Domain/IProcessLookup.h"
#include "Domain/ProcessInfo.h"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Mocks
{

class MockProcessLookup : public Domain::IProcessLookup
{
  public:
    void addProcess(const Domain::ProcessInfo& process)
    {
        m_Processes.insert_or_assign(process.pid, process);
    }

    [[nodiscard]] std::optional<Domain::ProcessInfo> lookup(std::int32_t pid) const override
    {
        m_LookedUp.push_back(pid);
        const auto it = m_Processes.find(pid);
        if (it == m_Processes.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] const std::vector<std::int32_t>& lookedUp() const
    {
        return m_LookedUp;
    }

  private:
    std::unordered_map<std::int32_t, Domain::ProcessInfo> m_Processes;
    mutable std::vector<std::int32_t> m_LookedUp;
};

} // namespace Mocks
