#include <gtest/gtest.h>
#include <managers/resource_monitor.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <algorithm>

namespace {

class FakeMetrics : public MetricsSource {
public:
    std::atomic<int64_t> local_disk{100000};
    std::atomic<int64_t> destination_disk{100000};
    std::atomic<int64_t> memory{8000};
    std::atomic<double> load{0.5};
    std::atomic<bool> memory_readable{true};

    std::optional<int64_t> free_disk_mb(const fs::path& path) override {
        return path == fs::path("/dest") ? destination_disk.load() : local_disk.load();
    }
    std::optional<int64_t> available_memory_mb() override {
        if (!memory_readable) return std::nullopt;
        return memory.load();
    }
    std::optional<double> load_1m() override { return load.load(); }
};

bool names(const ResourceSnapshot& s, const std::string& metric) {
    return std::find(s.failing.begin(), s.failing.end(), metric) != s.failing.end();
}

} // namespace

class ResourceMonitorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeMetrics> metrics = std::make_shared<FakeMetrics>();
    ResourceThresholds thresholds;

    void SetUp() override {
        thresholds.min_free_disk_local_mb = 1000;
        thresholds.min_free_disk_destination_mb = 5000;
        thresholds.min_free_memory_mb = 512;
        thresholds.max_load = 8.0;
    }
};

TEST_F(ResourceMonitorTest, PassesAboveThresholds) {
    ResourceMonitor monitor(metrics, "/session", "/dest");
    auto snap = monitor.check(thresholds, Checkpoint::Run);

    EXPECT_TRUE(snap.passed);
    EXPECT_TRUE(snap.failing.empty());
    EXPECT_EQ(snap.free_disk_local_mb, 100000);
    EXPECT_EQ(snap.free_disk_destination_mb, 100000);
    EXPECT_EQ(snap.checkpoint, Checkpoint::Run);
    EXPECT_FALSE(snap.timestamp.empty());
}

TEST_F(ResourceMonitorTest, LowLocalDiskNamesMetric) {
    metrics->local_disk = 200;
    ResourceMonitor monitor(metrics, "/session", "/dest");
    auto snap = monitor.check(thresholds, Checkpoint::Run);

    EXPECT_FALSE(snap.passed);
    ASSERT_EQ(snap.failing.size(), 1u);
    EXPECT_EQ(snap.failing[0], METRIC_DISK_LOCAL);
    ASSERT_EQ(snap.details.size(), 1u);
    EXPECT_NE(snap.details[0].find("200"), std::string::npos);
}

TEST_F(ResourceMonitorTest, DestinationDiskCheckedSeparately) {
    metrics->destination_disk = 4000;
    ResourceMonitor monitor(metrics, "/session", "/dest");
    auto snap = monitor.check(thresholds, Checkpoint::Transfer);

    EXPECT_FALSE(snap.passed);
    EXPECT_TRUE(names(snap, METRIC_DISK_DESTINATION));
    EXPECT_FALSE(names(snap, METRIC_DISK_LOCAL));
}

TEST_F(ResourceMonitorTest, NoDestinationSkipsMetric) {
    metrics->destination_disk = 1;
    ResourceMonitor monitor(metrics, "/session", "");
    auto snap = monitor.check(thresholds, Checkpoint::Transfer);

    EXPECT_TRUE(snap.passed);
    EXPECT_EQ(snap.free_disk_destination_mb, -1);
}

TEST_F(ResourceMonitorTest, LoadAndMemory) {
    metrics->load = 12.0;
    metrics->memory = 100;
    ResourceMonitor monitor(metrics, "/session", "/dest");
    auto snap = monitor.check(thresholds, Checkpoint::Run);

    EXPECT_FALSE(snap.passed);
    EXPECT_TRUE(names(snap, METRIC_LOAD));
    EXPECT_TRUE(names(snap, METRIC_MEMORY));
}

TEST_F(ResourceMonitorTest, ZeroThresholdDisablesMetric) {
    metrics->local_disk = 1;
    thresholds.min_free_disk_local_mb = 0;
    ResourceMonitor monitor(metrics, "/session", "/dest");
    auto snap = monitor.check(thresholds, Checkpoint::Run);

    EXPECT_TRUE(snap.passed);
    EXPECT_EQ(snap.free_disk_local_mb, -1);
}

TEST_F(ResourceMonitorTest, UnreadableEnabledMetricFails) {
    metrics->memory_readable = false;
    ResourceMonitor monitor(metrics, "/session", "/dest");
    auto snap = monitor.check(thresholds, Checkpoint::Run);

    EXPECT_FALSE(snap.passed);
    EXPECT_TRUE(names(snap, METRIC_MEMORY));
}

TEST_F(ResourceMonitorTest, BackgroundBreachFiresOnce) {
    ResourceMonitor monitor(metrics, "/session", "/dest");
    std::atomic<int> breaches{0};

    monitor.start_background(thresholds, 50, [&](const ResourceSnapshot&) { breaches++; });
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_FALSE(monitor.breach().has_value());

    metrics->local_disk = 10;
    for (int i = 0; i < 100 && breaches == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    monitor.stop_background();

    EXPECT_EQ(breaches.load(), 1);
    auto breach = monitor.breach();
    ASSERT_TRUE(breach.has_value());
    EXPECT_EQ(breach->checkpoint, Checkpoint::Background);
    EXPECT_TRUE(names(*breach, METRIC_DISK_LOCAL));
    EXPECT_GE(monitor.background_samples(), 2);
}

TEST_F(ResourceMonitorTest, StopWithoutBreach) {
    ResourceMonitor monitor(metrics, "/session", "/dest");
    monitor.start_background(thresholds, 1000, [](const ResourceSnapshot&) {});
    monitor.stop_background();
    EXPECT_FALSE(monitor.breach().has_value());
}

TEST(Checkpoint, Names) {
    EXPECT_EQ(checkpoint_name(Checkpoint::Transfer), "transfer");
    EXPECT_TRUE(checkpoint_from_name("background") == Checkpoint::Background);
    EXPECT_FALSE(checkpoint_from_name("idle").has_value());
}
