#include "system/resource_monitor.h"

#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

#include <sys/statvfs.h>
#include <sys/sysinfo.h>

#ifdef USE_CUDA
#include <nvml.h>
#endif

namespace infergate {
namespace {

struct MemoryInfo {
    uint64_t total{0};
    uint64_t available{0};
};

MemoryInfo sample_memory() {
    MemoryInfo result;
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        result.total = static_cast<uint64_t>(info.totalram) * static_cast<uint64_t>(info.mem_unit);
        result.available = static_cast<uint64_t>(info.freeram) * static_cast<uint64_t>(info.mem_unit);
    }

    // MemAvailable accounts for reclaimable page cache; prefer it when present
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.rfind("MemAvailable:", 0) == 0) {
            std::istringstream iss(line.substr(13));
            uint64_t kb = 0;
            if (iss >> kb) result.available = kb * 1024;
            break;
        }
    }
    return result;
}

void sample_vram(ResourceSnapshot& snapshot) {
#ifdef USE_CUDA
    if (nvmlInit() != NVML_SUCCESS) {
        return;
    }
    unsigned int device_count = 0;
    if (nvmlDeviceGetCount(&device_count) == NVML_SUCCESS && device_count > 0) {
        uint64_t used = 0;
        uint64_t total = 0;
        for (unsigned int i = 0; i < device_count; ++i) {
            nvmlDevice_t device;
            if (nvmlDeviceGetHandleByIndex(i, &device) != NVML_SUCCESS) {
                continue;
            }
            nvmlMemory_t mem_info;
            if (nvmlDeviceGetMemoryInfo(device, &mem_info) == NVML_SUCCESS) {
                used += static_cast<uint64_t>(mem_info.used);
                total += static_cast<uint64_t>(mem_info.total);
            }
        }
        snapshot.vram_used_bytes = used;
        snapshot.vram_total_bytes = total;
    }
    nvmlShutdown();
#else
    (void)snapshot;
#endif
}

}  // namespace

std::vector<std::string> assessResources(const ResourceSnapshot& snapshot, const ResourceThresholds& thresholds) {
    std::vector<std::string> warnings;
    if (snapshot.mem_total_bytes > 0 && snapshot.mem_total_bytes < thresholds.min_mem_total_bytes) {
        warnings.push_back("Low RAM: " + formatBytes(snapshot.mem_total_bytes) + " total (recommended: " +
                           formatBytes(thresholds.min_mem_total_bytes) + "+)");
    }
    if (snapshot.disk_total_bytes > 0) {
        const double pct = snapshot.diskUsagePercent();
        if (pct > thresholds.max_disk_usage_percent) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.0f%%", pct);
            warnings.push_back(std::string("High disk usage: ") + buf);
        }
        if (snapshot.disk_available_bytes < thresholds.min_disk_available_bytes) {
            warnings.push_back("Low disk space: " + formatBytes(snapshot.disk_available_bytes) + " available");
        }
    }
    return warnings;
}

ResourceMonitor::ResourceMonitor(std::string disk_path)
    : provider_([path = std::move(disk_path)]() { return sampleSystem(path); }) {}

ResourceMonitor::ResourceMonitor(SnapshotProvider provider) : provider_(std::move(provider)) {}

ResourceSnapshot ResourceMonitor::sample() const {
    return provider_ ? provider_() : ResourceSnapshot{};
}

ResourceSnapshot ResourceMonitor::sampleSystem(const std::string& disk_path) {
    ResourceSnapshot snapshot;

    const auto mem = sample_memory();
    snapshot.mem_total_bytes = mem.total;
    snapshot.mem_available_bytes = mem.available;
    snapshot.mem_used_bytes = mem.total >= mem.available ? mem.total - mem.available : 0;

    struct statvfs vfs;
    if (statvfs(disk_path.c_str(), &vfs) == 0) {
        snapshot.disk_total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
        snapshot.disk_used_bytes = static_cast<uint64_t>(vfs.f_blocks - vfs.f_bfree) * vfs.f_frsize;
        snapshot.disk_available_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    } else {
        spdlog::warn("statvfs({}) failed", disk_path);
    }

    double load[1] = {0.0};
    if (getloadavg(load, 1) == 1) {
        snapshot.load_average_1m = load[0];
    }
    snapshot.cpu_count = std::thread::hardware_concurrency();

    sample_vram(snapshot);
    return snapshot;
}

std::string formatBytes(uint64_t bytes) {
    char buf[32];
    if (bytes >= 1024ULL * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f GB", static_cast<double>(bytes) / (1024.0 * 1024 * 1024));
    } else if (bytes >= 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024));
    } else {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    }
    return buf;
}

}  // namespace infergate
