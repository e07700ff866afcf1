#pragma once

#include <cstdint>
#include <string>

namespace Domain
{

/// Process identity used to label disk activity.
struct ProcessInfo
{
    std::int32_t pid = 0;

    double ioReadBytesPerSec = 0.0;  // Optional (0 if not supported)
    double ioWriteBytesPerSec = 0.0; // Optional (0 if not supported)

    std::string name;
    std::string user; // Username (owner) of the process
};

} // namespace Domain
