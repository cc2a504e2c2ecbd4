#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ── Name tables ───────────────────────────────────────────────

std::string git_policy_name(GitPolicy p) {
    switch (p) {
        case GitPolicy::Strict:      return "strict";
        case GitPolicy::Force:       return "force";
        case GitPolicy::VersionOnly: return "version-only";
    }
    return "strict";
}

std::optional<GitPolicy> git_policy_from_name(const std::string& name) {
    if (name == "strict") return GitPolicy::Strict;
    if (name == "force") return GitPolicy::Force;
    if (name == "version-only" || name == "version_only") return GitPolicy::VersionOnly;
    return std::nullopt;
}

std::string fingerprint_method_name(FingerprintMethod m) {
    switch (m) {
        case FingerprintMethod::Sha256:    return "sha256";
        case FingerprintMethod::Md5:       return "md5";
        case FingerprintMethod::SizeMtime: return "size_mtime";
    }
    return "sha256";
}

std::optional<FingerprintMethod> fingerprint_method_from_name(const std::string& name) {
    if (name == "sha256") return FingerprintMethod::Sha256;
    if (name == "md5") return FingerprintMethod::Md5;
    if (name == "size_mtime" || name == "size+mtime") return FingerprintMethod::SizeMtime;
    return std::nullopt;
}

// ── Paths ─────────────────────────────────────────────────────

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".expctl";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "expctl.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# Rig-level expctl configuration
# Project settings in ./expctl.yaml override anything set here.

rig:
  id: ""                           # defaults to the hostname
  data_root: "~/data"              # sessions are created under <data_root>/<subject>/

resources:
  poll_interval_ms: 5000
  run:
    min_free_disk_local_mb: 2048
    min_free_memory_mb: 1024
  transfer:
    min_free_disk_destination_mb: 2048
  background:
    min_free_disk_local_mb: 512

transfer:
  destination: ""
  workers: 4
  fingerprint: sha256              # sha256 | md5 | size_mtime
  notify: none                     # watchdog | none
  # watchdog:
  #   flag_dir: /mnt/server/flags
  #   project_name: ""
  #   executable: /opt/watchdog/watchdog   # started if not already running

retry:
  max_attempts: 5
  base_backoff_ms: 500
  max_backoff_ms: 30000
  jitter_min_ms: 0
  jitter_max_ms: 250
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

// ── Parsing ───────────────────────────────────────────────────

static std::string resolve_path(const std::string& value, const fs::path& base_dir) {
    if (value.empty()) return value;
    if (value[0] == '~') {
        return (platform::home_dir() / value.substr(value.size() > 1 ? 2 : 1)).string();
    }
    fs::path p = value;
    if (p.is_relative()) p = base_dir / p;
    return p.lexically_normal().string();
}

static std::vector<std::string> as_string_list(const YAML::Node& node,
                                               const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    if (node.IsScalar()) return {node.as<std::string>()};
    if (node.IsSequence()) return node.as<std::vector<std::string>>();
    return fallback;
}

static void overlay_thresholds(const YAML::Node& node, ResourceThresholds& t) {
    if (!node || !node.IsMap()) return;
    t.min_free_disk_local_mb = node["min_free_disk_local_mb"].as<int64_t>(t.min_free_disk_local_mb);
    t.min_free_disk_destination_mb =
        node["min_free_disk_destination_mb"].as<int64_t>(t.min_free_disk_destination_mb);
    t.min_free_memory_mb = node["min_free_memory_mb"].as<int64_t>(t.min_free_memory_mb);
    t.max_load = node["max_load"].as<double>(t.max_load);
}

class ConfigBuilder {
public:
    // Overlay every section present in `root` onto `cfg`.
    static void apply(const YAML::Node& root, Config& cfg, const fs::path& base_dir) {
        if (const auto& n = root["rig"]) {
            cfg.rig_.id = n["id"].as<std::string>(cfg.rig_.id);
            if (n["data_root"]) {
                cfg.rig_.data_root = resolve_path(n["data_root"].as<std::string>(), base_dir);
            }
        }

        if (const auto& n = root["session"]) {
            cfg.session_.operator_name = n["operator"].as<std::string>(cfg.session_.operator_name);
            cfg.session_.subject = n["subject"].as<std::string>(cfg.session_.subject);
            cfg.session_.subjects = as_string_list(n["subjects"], cfg.session_.subjects);
        }

        if (const auto& n = root["repository"]) {
            if (n["path"]) {
                cfg.repository_.path = resolve_path(n["path"].as<std::string>(), base_dir);
            }
            if (n["policy"]) {
                auto name = n["policy"].as<std::string>();
                auto policy = git_policy_from_name(name);
                if (!policy) {
                    throw std::runtime_error(fmt::format(
                        "repository.policy: unknown policy '{}' (strict, force, version-only)", name));
                }
                cfg.repository_.policy = *policy;
            }
            cfg.repository_.version = n["version"].as<std::string>(cfg.repository_.version);
        }

        if (const auto& n = root["task"]) {
            cfg.task_.command = n["command"].as<std::string>(cfg.task_.command);
            cfg.task_.args = as_string_list(n["args"], cfg.task_.args);
            cfg.task_.timeout_secs = n["timeout_secs"].as<int>(cfg.task_.timeout_secs);
            cfg.task_.poll_interval_ms = n["poll_interval_ms"].as<int>(cfg.task_.poll_interval_ms);
            cfg.task_.output_file = n["output_file"].as<std::string>(cfg.task_.output_file);
        }

        if (const auto& n = root["resources"]) {
            overlay_thresholds(n["run"], cfg.resources_.run);
            overlay_thresholds(n["transfer"], cfg.resources_.transfer);
            overlay_thresholds(n["background"], cfg.resources_.background);
            cfg.resources_.poll_interval_ms =
                n["poll_interval_ms"].as<int>(cfg.resources_.poll_interval_ms);
        }

        if (const auto& n = root["transfer"]) {
            if (n["destination"]) {
                cfg.transfer_.destination = resolve_path(n["destination"].as<std::string>(), base_dir);
            }
            cfg.transfer_.workers = n["workers"].as<int>(cfg.transfer_.workers);
            if (n["fingerprint"]) {
                auto name = n["fingerprint"].as<std::string>();
                auto method = fingerprint_method_from_name(name);
                if (!method) {
                    throw std::runtime_error(fmt::format(
                        "transfer.fingerprint: unknown method '{}' (sha256, md5, size_mtime)", name));
                }
                cfg.transfer_.fingerprint = *method;
            }
            cfg.transfer_.exclude = as_string_list(n["exclude"], cfg.transfer_.exclude);
            cfg.transfer_.notify = n["notify"].as<std::string>(cfg.transfer_.notify);

            if (const auto& w = n["watchdog"]) {
                auto& wd = cfg.transfer_.watchdog;
                if (w["flag_dir"]) {
                    wd.flag_dir = resolve_path(w["flag_dir"].as<std::string>(), base_dir);
                }
                wd.project_name = w["project_name"].as<std::string>(wd.project_name);
                wd.platform = w["platform"].as<std::string>(wd.platform);
                wd.schedule_time = w["schedule_time"].as<std::string>(wd.schedule_time);
                wd.force_cloud_sync = w["force_cloud_sync"].as<bool>(wd.force_cloud_sync);
                if (w["executable"]) {
                    auto exe = w["executable"].as<std::string>();
                    // Bare names are looked up on PATH when the service is started
                    wd.executable = exe.find('/') == std::string::npos ? exe : resolve_path(exe, base_dir);
                }
                wd.process_name = w["process_name"].as<std::string>(wd.process_name);
                wd.start_wait_ms = std::max(0, w["start_wait_ms"].as<int>(wd.start_wait_ms));
            }
        }

        if (const auto& n = root["retry"]) {
            auto& r = cfg.retry_;
            r.max_attempts = n["max_attempts"].as<int>(r.max_attempts);
            r.base_backoff_ms = n["base_backoff_ms"].as<int>(r.base_backoff_ms);
            r.max_backoff_ms = n["max_backoff_ms"].as<int>(r.max_backoff_ms);
            r.jitter_min_ms = n["jitter_min_ms"].as<int>(r.jitter_min_ms);
            r.jitter_max_ms = n["jitter_max_ms"].as<int>(r.jitter_max_ms);
        }

        if (const auto& n = root["stages"]) {
            for (const auto& name : as_string_list(n["optional"], {})) {
                auto stage = stage_from_name(name);
                if (!stage || is_terminal(*stage) || *stage == Stage::Init) {
                    throw std::runtime_error(fmt::format(
                        "stages.optional: '{}' is not an optional pipeline stage", name));
                }
                cfg.optional_stages_.insert(*stage);
            }
        }

        if (const auto& n = root["mapping"]) {
            if (n["on_error"]) {
                auto policy = n["on_error"].as<std::string>();
                if (policy == "fail") {
                    cfg.mapping_.on_error = MappingErrorPolicy::Fail;
                } else if (policy == "remediate") {
                    cfg.mapping_.on_error = MappingErrorPolicy::Remediate;
                } else {
                    throw std::runtime_error(fmt::format(
                        "mapping.on_error: unknown policy '{}' (fail, remediate)", policy));
                }
            }
            cfg.mapping_.max_attempts = n["max_attempts"].as<int>(cfg.mapping_.max_attempts);
        }

        if (const auto& n = root["picker"]) {
            if (n["mode"]) {
                auto mode = n["mode"].as<std::string>();
                if (mode == "interactive") {
                    cfg.picker_.mode = PickerMode::Interactive;
                } else if (mode == "headless") {
                    cfg.picker_.mode = PickerMode::Headless;
                } else {
                    throw std::runtime_error(fmt::format(
                        "picker.mode: unknown mode '{}' (interactive, headless)", mode));
                }
            }
            if (n["defaults"] && n["defaults"].IsMap()) {
                for (const auto& kv : n["defaults"]) {
                    cfg.picker_.defaults[kv.first.as<std::string>()] = kv.second.as<std::string>("");
                }
            }
        }

        if (const auto& n = root["logging"]) {
            cfg.logging_.debug = n["debug"].as<bool>(cfg.logging_.debug);
        }
    }

    static void normalize(Config& cfg) {
        if (cfg.rig_.id.empty()) {
            cfg.rig_.id = platform::hostname();
        }
        cfg.transfer_.workers = std::clamp(cfg.transfer_.workers, 1, MAX_TRANSFER_WORKERS);
        cfg.retry_.max_attempts = std::max(cfg.retry_.max_attempts, 1);
        cfg.retry_.base_backoff_ms = std::max(cfg.retry_.base_backoff_ms, 0);
        cfg.retry_.max_backoff_ms = std::max(cfg.retry_.max_backoff_ms, cfg.retry_.base_backoff_ms);
        cfg.retry_.jitter_min_ms = std::max(cfg.retry_.jitter_min_ms, 0);
        cfg.retry_.jitter_max_ms = std::max(cfg.retry_.jitter_max_ms, cfg.retry_.jitter_min_ms);
        cfg.task_.poll_interval_ms = std::max(cfg.task_.poll_interval_ms, 10);
        cfg.mapping_.max_attempts = std::max(cfg.mapping_.max_attempts, 1);
        if (cfg.repository_.path.empty()) {
            cfg.repository_.path = cfg.base_dir_.string();
        }
    }

    static Result<void> overlay_file(const fs::path& path, Config& cfg) {
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            apply(root, cfg, path.parent_path());
            return Result<void>::Ok();
        } catch (const std::exception& e) {
            return Result<void>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }
};

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& base_dir) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        config.base_dir_ = base_dir;
        config.repository_.path = base_dir.string();
        ConfigBuilder::apply(root, config, base_dir);
        ConfigBuilder::normalize(config);
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    Config config;
    config.base_dir_ = fs::absolute(path).parent_path();
    config.repository_.path = config.base_dir_.string();
    auto overlay = ConfigBuilder::overlay_file(fs::absolute(path), config);
    if (overlay.is_err()) {
        return Result<Config>::Err(overlay.error);
    }
    ConfigBuilder::normalize(config);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load(const fs::path& project_file) {
    fs::path project = project_file.empty() ? get_project_config_path() : fs::absolute(project_file);

    Config config;
    config.base_dir_ = project.parent_path();
    config.repository_.path = config.base_dir_.string();

    // Global first (optional), then project overrides
    if (global_config_exists()) {
        auto global = ConfigBuilder::overlay_file(get_global_config_path(), config);
        if (global.is_err()) {
            return Result<Config>::Err(global.error);
        }
    }

    if (!fs::exists(project)) {
        if (!project_file.empty()) {
            return Result<Config>::Err("Config not found at " + project.string());
        }
        if (!global_config_exists()) {
            return Result<Config>::Err(fmt::format(
                "No configuration found ({} or {})", project.string(),
                get_global_config_path().string()));
        }
    } else {
        auto local = ConfigBuilder::overlay_file(project, config);
        if (local.is_err()) {
            return Result<Config>::Err(local.error);
        }
    }

    ConfigBuilder::normalize(config);
    return Result<Config>::Ok(config);
}
