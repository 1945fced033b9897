#include <gtest/gtest.h>

#include "system/resource_monitor.h"

using namespace infergate;

namespace {
constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

ResourceSnapshot healthySnapshot() {
    ResourceSnapshot s;
    s.mem_total_bytes = 16 * kGiB;
    s.mem_used_bytes = 4 * kGiB;
    s.mem_available_bytes = 12 * kGiB;
    s.disk_total_bytes = 500 * kGiB;
    s.disk_used_bytes = 300 * kGiB;
    s.disk_available_bytes = 200 * kGiB;
    s.cpu_count = 8;
    return s;
}
}  // namespace

TEST(ResourceMonitorTest, HealthySnapshotHasNoWarnings) {
    EXPECT_TRUE(assessResources(healthySnapshot()).empty());
}

TEST(ResourceMonitorTest, FlagsLowMemory) {
    auto s = healthySnapshot();
    s.mem_total_bytes = 2 * kGiB;
    auto warnings = assessResources(s);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "Low RAM: 2.0 GB total (recommended: 4.0 GB+)");
}

TEST(ResourceMonitorTest, FlagsFullDisk) {
    auto s = healthySnapshot();
    s.disk_total_bytes = 100 * kGiB;
    s.disk_used_bytes = 95 * kGiB;
    s.disk_available_bytes = 5 * kGiB;
    auto warnings = assessResources(s);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], "High disk usage: 95%");
    EXPECT_EQ(warnings[1], "Low disk space: 5.0 GB available");
}

TEST(ResourceMonitorTest, ReservedBlocksDoNotCountAsUsed) {
    auto s = healthySnapshot();
    // 100 GiB volume: 79 used, 7 reserved for root, 14 available
    s.disk_total_bytes = 100 * kGiB;
    s.disk_used_bytes = 79 * kGiB;
    s.disk_available_bytes = 14 * kGiB;
    EXPECT_NEAR(s.diskUsagePercent(), 84.95, 0.01);
    EXPECT_TRUE(assessResources(s).empty());
}

TEST(ResourceMonitorTest, UnknownFiguresAreNotWarnings) {
    EXPECT_TRUE(assessResources(ResourceSnapshot{}).empty());
}

TEST(ResourceMonitorTest, UsesInjectedProvider) {
    ResourceMonitor monitor([] { return healthySnapshot(); });
    auto s = monitor.sample();
    EXPECT_EQ(s.cpu_count, 8u);
    EXPECT_DOUBLE_EQ(s.memUsageRatio(), 0.25);
    EXPECT_DOUBLE_EQ(s.diskUsagePercent(), 60.0);
}

TEST(ResourceMonitorTest, SamplesThisHost) {
    auto s = ResourceMonitor::sampleSystem("/");
    EXPECT_GT(s.mem_total_bytes, 0u);
    EXPECT_LE(s.mem_used_bytes, s.mem_total_bytes);
    EXPECT_GT(s.disk_total_bytes, 0u);
    EXPECT_LE(s.disk_used_bytes + s.disk_available_bytes, s.disk_total_bytes);
    EXPECT_GE(s.cpu_count, 1u);
}

TEST(ResourceMonitorTest, FormatsBytes) {
    EXPECT_EQ(formatBytes(512), "512 B");
    EXPECT_EQ(formatBytes(3 * 1024 * 1024 / 2), "1.5 MB");
    EXPECT_EQ(formatBytes(4 * kGiB), "4.0 GB");
}
