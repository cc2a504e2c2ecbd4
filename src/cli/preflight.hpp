#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/credentials.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Loads the configuration (global overlaid with `config_file`, or ./expctl.yaml)
// and runs every check against it. Returns an empty vector if all is good.
std::vector<PreflightIssue> run_preflight_checks(const std::filesystem::path& config_file,
                                                 const CredentialProvider& credentials);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_global_config();
std::vector<PreflightIssue> check_rig(const Config& config);
std::vector<PreflightIssue> check_repository(const Config& config);
std::vector<PreflightIssue> check_task(const Config& config);
std::vector<PreflightIssue> check_transfer(const Config& config,
                                           const CredentialProvider& credentials);
std::vector<PreflightIssue> check_picker(const Config& config);

// True when at least one issue is an error rather than a hint.
bool has_errors(const std::vector<PreflightIssue>& issues);
