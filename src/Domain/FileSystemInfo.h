#pragma once

#include "Domain/Numeric.h"

#include <algorithm>
#include <cstdint>
#include <string>

namespace Domain
{

/// Free-space percentage below which a filesystem is flagged in the selector.
inline constexpr double LOW_FREE_SPACE_PERCENT = 10.0;

/// One mounted filesystem as reported by the collector.
/// Rebuilt every polling cycle; the panel only reads it.
struct FileSystemInfo
{
    std::string name;       // Device identity, e.g. "/dev/nvme0n1p2"; keys the used-space series
    std::string mountPoint; // e.g. "/", "/home"
    std::string fileSystem; // e.g. "ext4", "btrfs"

    std::uint64_t sizeBytes = 0;
    std::uint64_t availableBytes = 0;

    /// size - available. Saturates at zero if a collector ever reports available > size.
    [[nodiscard]] std::uint64_t usedBytes() const noexcept
    {
        return Numeric::saturatingSub(sizeBytes, availableBytes);
    }

    /// available / size * 100, clamped to [0, 100]. A zero-size filesystem reports 0.
    [[nodiscard]] double percentFree() const noexcept
    {
        return std::clamp(Numeric::percentOf(availableBytes, sizeBytes), 0.0, 100.0);
    }

    [[nodiscard]] double percentUsed() const noexcept
    {
        return 100.0 - percentFree();
    }

    [[nodiscard]] bool isLowOnSpace() const noexcept
    {
        return percentFree() < LOW_FREE_SPACE_PERCENT;
    }
};

} // namespace Domain
