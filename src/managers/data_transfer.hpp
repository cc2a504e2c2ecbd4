#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <filesystem>
#include <core/abort_token.hpp>
#include <core/types.hpp>
#include "ledger.hpp"
#include "path_filter.hpp"
#include "retry_policy.hpp"
#include "transfer_backend.hpp"

namespace fs = std::filesystem;

// Moves one file's bytes. Must never leave a partial file under `destination`.
class FileCopier {
public:
    virtual ~FileCopier() = default;
    virtual AttemptResult copy(const fs::path& source, const fs::path& destination) = 0;
};

// Copies into a hidden temp name beside the destination, fsyncs, carries
// the source mtime over, then renames into place.
class LocalFileCopier : public FileCopier {
public:
    AttemptResult copy(const fs::path& source, const fs::path& destination) override;
};

struct TransferOptions {
    int workers = 4;
    RetryPolicy retry;
};

// Scan source_root through the filter into a fresh ledger of PENDING jobs.
Result<Ledger> build_ledger(const std::string& session_id,
                            const fs::path& source_root,
                            const fs::path& destination_root,
                            const PathFilter& filter,
                            FingerprintMethod method);

class DataTransfer {
public:
    // store may be null (nothing persisted).
    DataTransfer(TransferOptions options,
                 std::shared_ptr<FileCopier> copier,
                 std::shared_ptr<TransferBackend> backend,
                 std::shared_ptr<LedgerStore> store);

    // Attempt every job that is not CONFIRMED, then notify the backend once
    // every job is CONFIRMED. Checks `abort` before each copy and each retry.
    // Fingerprints use the method recorded in the ledger.
    Ledger transfer(Ledger ledger, const fs::path& destination, AbortToken* abort = nullptr);

    // Bring a loaded ledger in line with the files on disk: changed sources
    // go back to PENDING, new files are added, vanished ones dropped.
    Ledger reconcile(Ledger ledger, const PathFilter& filter) const;

    // Last failure to persist the ledger, "" if every save succeeded.
    std::string persist_error() const;

    // Sleep hook for backoff delays; tests replace it to run instantly.
    void set_sleeper(std::function<void(int)> sleeper) { sleeper_ = std::move(sleeper); }

private:
    void run_job(Ledger& ledger, size_t index, AbortToken* abort);
    AttemptResult attempt_copy(TransferJob& job, FingerprintMethod method);
    void notify(Ledger& ledger, AbortToken* abort);
    void persist(const Ledger& ledger);
    bool wait_backoff(int retry, AbortToken* abort);

    TransferOptions options_;
    std::shared_ptr<FileCopier> copier_;
    std::shared_ptr<TransferBackend> backend_;
    std::shared_ptr<LedgerStore> store_;
    Backoff backoff_;
    std::function<void(int)> sleeper_;

    std::mutex ledger_mutex_;
    mutable std::mutex error_mutex_;
    std::string persist_error_;
};
