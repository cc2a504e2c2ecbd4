#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

enum class JobState { Pending, InFlight, Confirmed, Failed };

std::string job_state_name(JobState s);
std::optional<JobState> job_state_from_name(const std::string& name);

// One file-copy unit.
struct TransferJob {
    std::string source;             // absolute
    std::string destination;        // absolute
    std::string relative_path;      // identity within the session
    std::string fingerprint;        // of the source at last copy or scan
    int64_t size = 0;
    JobState state = JobState::Pending;
    int retry_count = 0;            // attempts beyond the first
    int attempts = 0;
    std::string last_error;
    bool permanent = false;         // last failure was not retryable
};

struct Ledger {
    std::string session_id;
    std::string source_root;
    std::string destination_root;
    FingerprintMethod fingerprint_method = FingerprintMethod::Sha256;
    std::vector<TransferJob> jobs;
    bool notified = false;
    std::string notification_error;
    std::string updated_at;

    TransferJob* find(const std::string& relative_path);
    int count(JobState s) const;
    bool all_confirmed() const;
};

// Persists the ledger as YAML at <session_dir>/.expctl/transfer_ledger.yaml.
// Every save takes the sibling .lock file and replaces the file atomically.
class LedgerStore {
public:
    explicit LedgerStore(const fs::path& session_dir);

    bool exists() const;
    Result<Ledger> load() const;
    Result<void> save(const Ledger& ledger) const;

    const fs::path& path() const { return ledger_path_; }

private:
    fs::path ledger_path_;
};

std::string ledger_to_yaml(const Ledger& ledger);
Result<Ledger> ledger_from_yaml(const std::string& text);
