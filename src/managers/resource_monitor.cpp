#include "resource_monitor.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

std::string checkpoint_name(Checkpoint c) {
    switch (c) {
        case Checkpoint::Run:        return "run";
        case Checkpoint::Transfer:   return "transfer";
        case Checkpoint::Background: return "background";
    }
    return "run";
}

std::optional<Checkpoint> checkpoint_from_name(const std::string& name) {
    if (name == "run") return Checkpoint::Run;
    if (name == "transfer") return Checkpoint::Transfer;
    if (name == "background") return Checkpoint::Background;
    return std::nullopt;
}

// ── HostMetricsSource ───────────────────────────────────────

std::optional<int64_t> HostMetricsSource::free_disk_mb(const fs::path& path) {
    return platform::free_disk_mb(path);
}

std::optional<int64_t> HostMetricsSource::available_memory_mb() {
    return platform::available_memory_mb();
}

std::optional<double> HostMetricsSource::load_1m() {
    return platform::load_average_1m();
}

// ── ResourceMonitor ─────────────────────────────────────────

ResourceMonitor::ResourceMonitor(std::shared_ptr<MetricsSource> source,
                                 fs::path local_dir, fs::path destination)
    : source_(std::move(source)),
      local_dir_(std::move(local_dir)),
      destination_(std::move(destination)) {}

ResourceMonitor::~ResourceMonitor() {
    stop_background();
}

ResourceSnapshot ResourceMonitor::check(const ResourceThresholds& thresholds,
                                        Checkpoint checkpoint) const {
    ResourceSnapshot snap;
    snap.timestamp = now_iso();
    snap.checkpoint = checkpoint;

    // An enabled metric that cannot be read counts as failing
    auto fail = [&](const char* name, const std::string& detail) {
        snap.failing.push_back(name);
        snap.details.push_back(fmt::format("{}: {}", name, detail));
    };

    auto check_min = [&](const char* name, int64_t minimum, std::optional<int64_t> reading,
                         int64_t& slot) {
        if (minimum <= 0) return;
        if (!reading) {
            fail(name, "unreadable");
            return;
        }
        slot = *reading;
        if (*reading < minimum) {
            fail(name, fmt::format("{} MB free, need {} MB", *reading, minimum));
        }
    };

    check_min(METRIC_DISK_LOCAL, thresholds.min_free_disk_local_mb,
              source_->free_disk_mb(local_dir_), snap.free_disk_local_mb);

    if (!destination_.empty()) {
        check_min(METRIC_DISK_DESTINATION, thresholds.min_free_disk_destination_mb,
                  source_->free_disk_mb(destination_), snap.free_disk_destination_mb);
    }

    check_min(METRIC_MEMORY, thresholds.min_free_memory_mb,
              source_->available_memory_mb(), snap.free_memory_mb);

    if (thresholds.max_load > 0.0) {
        auto load = source_->load_1m();
        if (!load) {
            fail(METRIC_LOAD, "unreadable");
        } else {
            snap.load_1m = *load;
            if (*load > thresholds.max_load) {
                fail(METRIC_LOAD, fmt::format("{:.2f}, max {:.2f}", *load, thresholds.max_load));
            }
        }
    }

    snap.passed = snap.failing.empty();
    return snap;
}

// ── Background sampling ─────────────────────────────────────

void ResourceMonitor::start_background(const ResourceThresholds& thresholds, int interval_ms,
                                       BreachCallback on_breach) {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(breach_mutex_);
        breach_.reset();
    }
    samples_ = 0;
    on_breach_ = std::move(on_breach);
    running_ = true;
    thread_ = std::thread(&ResourceMonitor::monitor_loop, this, thresholds,
                          std::max(interval_ms, MONITOR_MIN_INTERVAL_MS));
    expctl_log(fmt::format("resource_monitor: started, interval {}ms", interval_ms));
}

void ResourceMonitor::stop_background() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        expctl_log(fmt::format("resource_monitor: stopped after {} samples", samples_.load()));
    }
}

std::optional<ResourceSnapshot> ResourceMonitor::breach() const {
    std::lock_guard<std::mutex> lock(breach_mutex_);
    return breach_;
}

void ResourceMonitor::monitor_loop(ResourceThresholds thresholds, int interval_ms) {
    while (running_) {
        auto snap = check(thresholds, Checkpoint::Background);
        samples_++;

        if (!snap.passed) {
            {
                std::lock_guard<std::mutex> lock(breach_mutex_);
                breach_ = snap;
            }
            expctl_log(fmt::format("resource_monitor: breach {}", snap.details.front()));
            if (on_breach_) on_breach_(snap);
            return;
        }

        // Sleep in small slices so stop() is prompt
        for (int waited = 0; waited < interval_ms && running_; waited += MONITOR_MIN_INTERVAL_MS) {
            platform::sleep_ms(std::min(MONITOR_MIN_INTERVAL_MS, interval_ms - waited));
        }
    }
}
