#pragma once

#include <string>
#include <vector>
#include <set>
#include <filesystem>
#include "types.hpp"
#include "stage.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global rig config from ~/.expctl/config.yaml
    static Result<Config> load_global();

    // Load a single YAML file
    static Result<Config> load_file(const fs::path& path);

    // Load global (if present) and overlay the project file.
    // project_file defaults to ./expctl.yaml
    static Result<Config> load(const fs::path& project_file = fs::path());

    // Parse YAML text. Relative paths resolve against base_dir.
    static Result<Config> parse(const std::string& yaml_text,
                                const fs::path& base_dir = fs::current_path());

    // Accessors
    const RigConfig& rig() const { return rig_; }
    const SessionConfig& session() const { return session_; }
    const RepositoryConfig& repository() const { return repository_; }
    const TaskConfig& task() const { return task_; }
    const ResourceConfig& resources() const { return resources_; }
    const TransferConfig& transfer() const { return transfer_; }
    const RetryPolicy& retry() const { return retry_; }
    const MappingConfig& mapping() const { return mapping_; }
    const PickerConfig& picker() const { return picker_; }
    const LoggingConfig& logging() const { return logging_; }
    const fs::path& base_dir() const { return base_dir_; }

    bool is_optional(Stage s) const { return optional_stages_.count(s) > 0; }
    const std::set<Stage>& optional_stages() const { return optional_stages_; }

    // CLI overrides
    void force_headless() { picker_.mode = PickerMode::Headless; }
    void enable_debug() { logging_.debug = true; }

public:
    Config() = default;

private:
    RigConfig rig_;
    SessionConfig session_;
    RepositoryConfig repository_;
    TaskConfig task_;
    ResourceConfig resources_;
    TransferConfig transfer_;
    RetryPolicy retry_;
    MappingConfig mapping_;
    PickerConfig picker_;
    LoggingConfig logging_;
    std::set<Stage> optional_stages_;
    fs::path base_dir_;

    friend class ConfigBuilder;
};

// Policy names as written in YAML ("strict", "force", "version-only")
std::string git_policy_name(GitPolicy p);
std::optional<GitPolicy> git_policy_from_name(const std::string& name);
std::string fingerprint_method_name(FingerprintMethod m);
std::optional<FingerprintMethod> fingerprint_method_from_name(const std::string& name);

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
