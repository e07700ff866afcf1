#pragma once

#include "Domain/ProcessInfo.h"

#include <cstdint>
#include <optional>

namespace Domain
{

/// Resolves a pid against the current process table.
class IProcessLookup
{
  public:
    virtual ~IProcessLookup() = default;

    IProcessLookup() = default;
    IProcessLookup(const IProcessLookup&) = default;
    IProcessLookup& operator=(const IProcessLookup&) = default;
    IProcessLookup(IProcessLookup&&) = default;
    IProcessLookup& operator=(IProcessLookup&&) = default;

    /// std::nullopt if the process has exited or was never seen.
    [[nodiscard]] virtual std::optional<ProcessInfo> lookup(std::int32_t pid) const = 0;
};

} // namespace Domain
