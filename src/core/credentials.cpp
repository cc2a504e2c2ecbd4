#include "credentials.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sys/stat.h>

namespace fs = std::filesystem;

// ── FileCredentialProvider ──────────────────────────────────

static std::map<std::string, std::string> read_all(const fs::path& path) {
    std::map<std::string, std::string> m;
    std::ifstream f(path);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

// Write all key=value pairs to the credentials file (chmod 600)
static bool write_all(const fs::path& path, const std::map<std::string, std::string>& m) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    std::ofstream f(path, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();

    return chmod(path.c_str(), 0600) == 0;
}

FileCredentialProvider::FileCredentialProvider()
    : path_(platform::home_dir() / ".expctl" / "credentials") {}

FileCredentialProvider::FileCredentialProvider(fs::path path)
    : path_(std::move(path)) {}

Result<std::string> FileCredentialProvider::get(const std::string& key) const {
    auto m = read_all(path_);
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err("Credential not found: " + key);
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> FileCredentialProvider::set(const std::string& key, const std::string& value) {
    auto m = read_all(path_);
    m[key] = value;
    if (!write_all(path_, m)) {
        return Result<void>::Err("Failed to write credentials file");
    }
    return Result<void>::Ok();
}

Result<void> FileCredentialProvider::remove(const std::string& key) {
    auto m = read_all(path_);
    if (m.erase(key) == 0) {
        return Result<void>::Err("Credential not found: " + key);
    }
    if (!write_all(path_, m)) {
        return Result<void>::Err("Failed to write credentials file");
    }
    return Result<void>::Ok();
}

std::vector<std::string> FileCredentialProvider::keys() const {
    std::vector<std::string> out;
    for (const auto& [k, v] : read_all(path_)) {
        out.push_back(k);
    }
    return out;
}

// ── EnvCredentialProvider ───────────────────────────────────

EnvCredentialProvider::EnvCredentialProvider(std::string prefix)
    : prefix_(std::move(prefix)) {}

Result<std::string> EnvCredentialProvider::get(const std::string& key) const {
    std::string var = prefix_ + key;
    std::transform(var.begin(), var.end(), var.begin(), [](unsigned char c) {
        return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    });
    const char* value = std::getenv(var.c_str());
    if (!value || !*value) {
        return Result<std::string>::Err("Credential not set: " + var);
    }
    return Result<std::string>::Ok(value);
}

// ── ChainedCredentialProvider ───────────────────────────────

ChainedCredentialProvider::ChainedCredentialProvider(
    std::vector<std::shared_ptr<const CredentialProvider>> providers)
    : providers_(std::move(providers)) {}

Result<std::string> ChainedCredentialProvider::get(const std::string& key) const {
    for (const auto& p : providers_) {
        auto r = p->get(key);
        if (r.is_ok()) return r;
    }
    return Result<std::string>::Err("Credential not found: " + key);
}
