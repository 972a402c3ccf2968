#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace BulkGen {

/**
 * Point-in-time view of the host, for display only
 */
struct SystemSnapshot {
    std::string os_name = "Unknown OS";
    std::string os_version = "Unknown";
    std::string kernel_version = "Unknown";
    size_t cpu_count = 0;
    std::string cpu_brand = "Unknown CPU";
    uint64_t total_memory_bytes = 0;
    uint64_t used_memory_bytes = 0;
};

/**
 * Queries the host. Stateless; missing sources degrade to the defaults above
 * with a warning.
 */
SystemSnapshot TakeSystemSnapshot();

// Parsers for the /proc and /etc sources, split out for testing
void ParseOsRelease(std::istream& in, SystemSnapshot& snapshot);
void ParseMemInfo(std::istream& in, SystemSnapshot& snapshot);
std::string ParseCpuBrand(std::istream& in);

} // namespace BulkGen
