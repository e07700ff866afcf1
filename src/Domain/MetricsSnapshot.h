#pragma once

#include "Domain/FileSystemInfo.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace Domain
{

/// Point-in-time metrics handed to the disk panel for one frame.
struct MetricsSnapshot
{
    std::vector<FileSystemInfo> disks;

    // Aggregate current rates, reported by the collector independently of the history store
    double diskReadBytesPerSec = 0.0;
    double diskWriteBytesPerSec = 0.0;

    // Last process seen doing the most disk I/O (tracked upstream)
    std::optional<std::int32_t> topDiskReaderPid;
    std::optional<std::int32_t> topDiskWriterPid;
};

} // namespace Domain
