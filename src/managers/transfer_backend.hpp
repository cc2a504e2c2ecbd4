#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include "ledger.hpp"
#include "retry_policy.hpp"

namespace fs = std::filesystem;

// Tells the downstream transfer/processing service that a session's files
// have landed at the destination.
class TransferBackend {
public:
    virtual ~TransferBackend() = default;
    virtual std::string name() const = 0;
    virtual AttemptResult notify(const Ledger& ledger) = 0;
};

// transfer.notify: none
class NullTransferBackend : public TransferBackend {
public:
    std::string name() const override { return "none"; }
    AttemptResult notify(const Ledger&) override { return AttemptResult::Ok(); }
};

// Drops manifest_<session>.yaml into the directory the watchdog service
// watches. The service picks it up at schedule_time. With an executable
// configured, the service is started first if no process of that name runs.
class WatchdogManifestBackend : public TransferBackend {
public:
    WatchdogManifestBackend(WatchdogConfig config,
                            std::shared_ptr<const CredentialProvider> credentials);

    std::string name() const override { return "watchdog"; }
    AttemptResult notify(const Ledger& ledger) override;

    fs::path manifest_path(const Ledger& ledger) const;
    std::string render_manifest(const Ledger& ledger) const;
    std::string process_name() const;

private:
    std::string requesting_user() const;
    AttemptResult ensure_service_running();

    WatchdogConfig config_;
    std::shared_ptr<const CredentialProvider> credentials_;
};

// Backend for the configured transfer.notify value.
Result<std::shared_ptr<TransferBackend>> make_transfer_backend(
    const TransferConfig& config, std::shared_ptr<const CredentialProvider> credentials);
