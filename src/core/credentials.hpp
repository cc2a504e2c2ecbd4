#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include "types.hpp"

// Supplies authentication material to transfer backends.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    virtual Result<std::string> get(const std::string& key) const = 0;
};

// key=value lines in ~/.expctl/credentials, kept at mode 600.
class FileCredentialProvider : public CredentialProvider {
public:
    FileCredentialProvider();
    explicit FileCredentialProvider(std::filesystem::path path);

    Result<std::string> get(const std::string& key) const override;
    Result<void> set(const std::string& key, const std::string& value);
    Result<void> remove(const std::string& key);
    std::vector<std::string> keys() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// EXPCTL_<KEY> environment variables ("user" -> EXPCTL_USER).
class EnvCredentialProvider : public CredentialProvider {
public:
    explicit EnvCredentialProvider(std::string prefix = "EXPCTL_");

    Result<std::string> get(const std::string& key) const override;

private:
    std::string prefix_;
};

// Asks each provider in turn; the first hit wins.
class ChainedCredentialProvider : public CredentialProvider {
public:
    explicit ChainedCredentialProvider(
        std::vector<std::shared_ptr<const CredentialProvider>> providers);

    Result<std::string> get(const std::string& key) const override;

private:
    std::vector<std::shared_ptr<const CredentialProvider>> providers_;
};
