#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace infergate {

inline double usage_ratio(uint64_t used, uint64_t total) {
    if (total == 0) return 0.0;
    return static_cast<double>(used) / static_cast<double>(total);
}

struct ResourceSnapshot {
    uint64_t mem_total_bytes{0};
    uint64_t mem_used_bytes{0};
    uint64_t mem_available_bytes{0};
    uint64_t disk_total_bytes{0};
    /// Blocks in use; root-reserved free blocks count as neither used nor available.
    uint64_t disk_used_bytes{0};
    uint64_t disk_available_bytes{0};
    double load_average_1m{0.0};
    unsigned int cpu_count{0};
    /// Accelerator memory, present only when a GPU could be queried.
    std::optional<uint64_t> vram_used_bytes;
    std::optional<uint64_t> vram_total_bytes;

    double memUsageRatio() const { return usage_ratio(mem_used_bytes, mem_total_bytes); }
    /// Same figure df reports: used / (used + available).
    double diskUsagePercent() const {
        return 100.0 * usage_ratio(disk_used_bytes, disk_used_bytes + disk_available_bytes);
    }
};

struct ResourceThresholds {
    uint64_t min_mem_total_bytes{4ULL * 1024 * 1024 * 1024};
    double max_disk_usage_percent{85.0};
    uint64_t min_disk_available_bytes{10ULL * 1024 * 1024 * 1024};
};

/// One-line warnings for every threshold the snapshot violates.
std::vector<std::string> assessResources(const ResourceSnapshot& snapshot,
                                         const ResourceThresholds& thresholds = {});

class ResourceMonitor {
public:
    using SnapshotProvider = std::function<ResourceSnapshot()>;

    /// Defaults to sampling this host; disk figures are for disk_path.
    explicit ResourceMonitor(std::string disk_path = "/");
    explicit ResourceMonitor(SnapshotProvider provider);

    ResourceSnapshot sample() const;

    static ResourceSnapshot sampleSystem(const std::string& disk_path);

private:
    SnapshotProvider provider_;
};

std::string formatBytes(uint64_t bytes);

}  // namespace infergate
