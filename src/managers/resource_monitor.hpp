#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

enum class Checkpoint { Run, Transfer, Background };

std::string checkpoint_name(Checkpoint c);
std::optional<Checkpoint> checkpoint_from_name(const std::string& name);

// Metric names used in ResourceSnapshot::failing
constexpr const char* METRIC_DISK_LOCAL       = "free_disk_local";
constexpr const char* METRIC_DISK_DESTINATION = "free_disk_destination";
constexpr const char* METRIC_MEMORY           = "free_memory";
constexpr const char* METRIC_LOAD             = "load_1m";

// One sample of host metrics and its verdict. -1 means "not read".
struct ResourceSnapshot {
    std::string timestamp;
    Checkpoint checkpoint = Checkpoint::Run;
    int64_t free_disk_local_mb = -1;
    int64_t free_disk_destination_mb = -1;
    int64_t free_memory_mb = -1;
    double load_1m = -1.0;
    bool passed = true;
    std::vector<std::string> failing;   // metric names
    std::vector<std::string> details;   // one human-readable line per failing metric
};

// Where metric readings come from. Tests inject fixed values.
class MetricsSource {
public:
    virtual ~MetricsSource() = default;
    virtual std::optional<int64_t> free_disk_mb(const fs::path& path) = 0;
    virtual std::optional<int64_t> available_memory_mb() = 0;
    virtual std::optional<double> load_1m() = 0;
};

// statvfs, /proc/meminfo, getloadavg
class HostMetricsSource : public MetricsSource {
public:
    std::optional<int64_t> free_disk_mb(const fs::path& path) override;
    std::optional<int64_t> available_memory_mb() override;
    std::optional<double> load_1m() override;
};

class ResourceMonitor {
public:
    using BreachCallback = std::function<void(const ResourceSnapshot&)>;

    // local_dir is the working volume (session directory); destination is
    // the transfer target, skipped when empty.
    ResourceMonitor(std::shared_ptr<MetricsSource> source,
                    fs::path local_dir, fs::path destination);
    ~ResourceMonitor();

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    // Read every metric with a non-zero threshold and compare.
    ResourceSnapshot check(const ResourceThresholds& thresholds, Checkpoint checkpoint) const;

    // Sample every interval_ms on a background thread. The first failing
    // sample is kept and on_breach is called once; sampling then stops.
    void start_background(const ResourceThresholds& thresholds, int interval_ms,
                          BreachCallback on_breach);
    void stop_background();

    std::optional<ResourceSnapshot> breach() const;
    int background_samples() const { return samples_.load(); }

private:
    void monitor_loop(ResourceThresholds thresholds, int interval_ms);

    std::shared_ptr<MetricsSource> source_;
    fs::path local_dir_;
    fs::path destination_;

    std::atomic<bool> running_{false};
    std::atomic<int> samples_{0};
    std::thread thread_;
    BreachCallback on_breach_;

    mutable std::mutex breach_mutex_;
    std::optional<ResourceSnapshot> breach_;
};
