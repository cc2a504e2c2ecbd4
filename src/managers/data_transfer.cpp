#include "data_transfer.hpp"
#include "fingerprint.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <set>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// ── LocalFileCopier ─────────────────────────────────────────

AttemptResult LocalFileCopier::copy(const fs::path& source, const fs::path& destination) {
    int in = ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
    if (in < 0) {
        int err = errno;
        if (err == ENOENT) {
            return AttemptResult::Permanent(fmt::format("source missing: {}", source.string()));
        }
        return attempt_from_errno(err, fmt::format("cannot open {}", source.string()));
    }

    struct stat st{};
    if (::fstat(in, &st) != 0) {
        int err = errno;
        ::close(in);
        return attempt_from_errno(err, fmt::format("cannot stat {}", source.string()));
    }

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        ::close(in);
        return attempt_from_errno(ec.value(), fmt::format("cannot create {}",
                                                          destination.parent_path().string()));
    }

    fs::path tmp = destination.parent_path() /
                   ("." + destination.filename().string() + ".expctl-part");
    int out = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (out < 0) {
        int err = errno;
        ::close(in);
        return attempt_from_errno(err, fmt::format("cannot open {}", tmp.string()));
    }

    auto fail = [&](int err, const std::string& what) {
        ::close(in);
        ::close(out);
        ::unlink(tmp.c_str());
        return attempt_from_errno(err, what);
    };

    std::vector<char> buf(COPY_BUF_SIZE);
    while (true) {
        ssize_t n = ::read(in, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail(errno, fmt::format("read {} failed", source.string()));
        }
        if (n == 0) break;

        const char* p = buf.data();
        ssize_t left = n;
        while (left > 0) {
            ssize_t w = ::write(out, p, static_cast<size_t>(left));
            if (w < 0) {
                if (errno == EINTR) continue;
                return fail(errno, fmt::format("write {} failed", tmp.string()));
            }
            p += w;
            left -= w;
        }
    }

    if (::fsync(out) != 0) {
        return fail(errno, fmt::format("fsync {} failed", tmp.string()));
    }

    // Keep the source mtime so size_mtime fingerprints compare equal
    struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::futimens(out, times) != 0) {
        return fail(errno, fmt::format("cannot set times on {}", tmp.string()));
    }

    ::close(out);
    ::close(in);

    if (::rename(tmp.c_str(), destination.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return attempt_from_errno(err, fmt::format("cannot rename into {}", destination.string()));
    }
    return AttemptResult::Ok();
}

// ── Ledger construction ─────────────────────────────────────

Result<Ledger> build_ledger(const std::string& session_id,
                            const fs::path& source_root,
                            const fs::path& destination_root,
                            const PathFilter& filter,
                            FingerprintMethod method) {
    Ledger ledger;
    ledger.session_id = session_id;
    ledger.source_root = source_root.string();
    ledger.destination_root = destination_root.string();
    ledger.fingerprint_method = method;

    for (const auto& file : filter.collect_files()) {
        TransferJob job;
        job.relative_path = filter.get_relative_path(file).generic_string();
        job.source = file.string();
        if (!destination_root.empty()) {
            job.destination = (destination_root / job.relative_path).string();
        }

        auto fp = compute_fingerprint(file, method);
        if (fp.is_err()) {
            return Result<Ledger>::Err(fp.error);
        }
        job.fingerprint = fp.value;

        std::error_code ec;
        auto size = fs::file_size(file, ec);
        job.size = ec ? 0 : static_cast<int64_t>(size);

        ledger.jobs.push_back(job);
    }

    return Result<Ledger>::Ok(ledger);
}

// ── DataTransfer ────────────────────────────────────────────

DataTransfer::DataTransfer(TransferOptions options,
                           std::shared_ptr<FileCopier> copier,
                           std::shared_ptr<TransferBackend> backend,
                           std::shared_ptr<LedgerStore> store)
    : options_(std::move(options)),
      copier_(std::move(copier)),
      backend_(std::move(backend)),
      store_(std::move(store)),
      backoff_(options_.retry) {}

std::string DataTransfer::persist_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return persist_error_;
}

void DataTransfer::persist(const Ledger& ledger) {
    if (!store_) return;
    auto r = store_->save(ledger);
    if (r.is_err()) {
        expctl_log(fmt::format("transfer: ledger save failed: {}", r.error));
        std::lock_guard<std::mutex> lock(error_mutex_);
        persist_error_ = r.error;
    }
}

bool DataTransfer::wait_backoff(int retry, AbortToken* abort) {
    int delay = backoff_.delay_ms(retry);
    if (sleeper_) {
        sleeper_(delay);
    } else {
        for (int waited = 0; waited < delay; waited += 50) {
            if (abort && abort->requested()) return false;
            platform::sleep_ms(std::min(50, delay - waited));
        }
    }
    return !(abort && abort->requested());
}

AttemptResult DataTransfer::attempt_copy(TransferJob& job, FingerprintMethod method) {
    std::error_code ec;
    if (!fs::exists(job.source, ec)) {
        return AttemptResult::Permanent(fmt::format("source missing: {}", job.source));
    }

    auto source_fp = compute_fingerprint(job.source, method);
    if (source_fp.is_err()) {
        return AttemptResult::Permanent(source_fp.error);
    }
    job.fingerprint = source_fp.value;
    auto size = fs::file_size(job.source, ec);
    if (!ec) job.size = static_cast<int64_t>(size);

    auto copied = copier_->copy(job.source, job.destination);
    if (!copied.ok) return copied;

    auto dest_fp = compute_fingerprint(job.destination, method);
    if (dest_fp.is_err()) {
        return AttemptResult::Transient(fmt::format("cannot verify copy: {}", dest_fp.error));
    }
    if (dest_fp.value != source_fp.value) {
        return AttemptResult::Permanent(fmt::format(
            "fingerprint mismatch after copy ({} != {})", dest_fp.value, source_fp.value));
    }
    return AttemptResult::Ok();
}

void DataTransfer::run_job(Ledger& ledger, size_t index, AbortToken* abort) {
    TransferJob job;
    FingerprintMethod method;
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        job = ledger.jobs[index];
        method = ledger.fingerprint_method;
    }

    auto update = [&]() {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        ledger.jobs[index] = job;
        persist(ledger);
    };

    for (int attempt = 1; ; ++attempt) {
        if (abort && abort->requested()) {
            return;
        }

        job.state = JobState::InFlight;
        job.attempts++;
        job.retry_count = job.attempts - 1;
        update();

        auto r = attempt_copy(job, method);
        if (r.ok) {
            job.state = JobState::Confirmed;
            job.last_error.clear();
            job.permanent = false;
            update();
            return;
        }

        job.last_error = r.error;
        if (r.transient && attempt < options_.retry.max_attempts) {
            expctl_log(fmt::format("transfer: {} attempt {} failed (transient): {}",
                                   job.relative_path, attempt, r.error));
            job.state = JobState::Pending;
            update();
            if (!wait_backoff(attempt, abort)) return;
            continue;
        }

        job.state = JobState::Failed;
        job.permanent = !r.transient;
        expctl_log(fmt::format("transfer: {} failed after {} attempt(s): {}",
                               job.relative_path, attempt, r.error));
        update();
        return;
    }
}

void DataTransfer::notify(Ledger& ledger, AbortToken* abort) {
    auto aborted = [&]() {
        ledger.notification_error = "aborted before notification was delivered";
        persist(ledger);
    };

    for (int attempt = 1; ; ++attempt) {
        if (abort && abort->requested()) {
            aborted();
            return;
        }

        auto r = backend_->notify(ledger);
        if (r.ok) {
            ledger.notified = true;
            ledger.notification_error.clear();
            persist(ledger);
            expctl_log(fmt::format("transfer: {} notified for {}", backend_->name(), ledger.session_id));
            return;
        }

        if (r.transient && attempt < options_.retry.max_attempts) {
            expctl_log(fmt::format("transfer: notification attempt {} failed: {}", attempt, r.error));
            if (!wait_backoff(attempt, abort)) {
                aborted();
                return;
            }
            continue;
        }

        ledger.notification_error = fmt::format("{} notification failed after {} attempt(s): {}",
                                                backend_->name(), attempt, r.error);
        persist(ledger);
        return;
    }
}

Ledger DataTransfer::transfer(Ledger ledger, const fs::path& destination, AbortToken* abort) {
    if (!destination.empty()) {
        ledger.destination_root = destination.string();
        for (auto& j : ledger.jobs) {
            j.destination = (destination / j.relative_path).string();
        }
    }

    std::vector<size_t> todo;
    for (size_t i = 0; i < ledger.jobs.size(); ++i) {
        if (ledger.jobs[i].state != JobState::Confirmed) todo.push_back(i);
    }

    if (ledger.destination_root.empty()) {
        for (auto i : todo) {
            auto& j = ledger.jobs[i];
            j.state = JobState::Failed;
            j.permanent = true;
            j.last_error = "no transfer destination configured";
        }
        persist(ledger);
        return ledger;
    }

    if (!todo.empty()) {
        ledger.notified = false;
    }
    persist(ledger);

    size_t workers = std::min<size_t>(std::max(options_.workers, 1), todo.size());
    expctl_log(fmt::format("transfer: {} of {} job(s) to attempt with {} worker(s)",
                           todo.size(), ledger.jobs.size(), workers));

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        while (true) {
            size_t k = next++;
            if (k >= todo.size()) return;
            run_job(ledger, todo[k], abort);
        }
    };

    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        for (size_t i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    if (abort && abort->requested()) {
        persist(ledger);
        return ledger;
    }

    if (ledger.all_confirmed() && !ledger.notified) {
        notify(ledger, abort);
    }
    return ledger;
}

Ledger DataTransfer::reconcile(Ledger ledger, const PathFilter& filter) const {
    std::set<std::string> present;
    for (const auto& file : filter.collect_files()) {
        present.insert(filter.get_relative_path(file).generic_string());
    }

    bool changed = false;
    std::vector<TransferJob> kept;
    std::set<std::string> known;

    for (auto job : ledger.jobs) {
        if (!present.count(job.relative_path)) {
            expctl_log(fmt::format("reconcile: {} vanished, dropped", job.relative_path));
            changed = true;
            continue;
        }
        known.insert(job.relative_path);
        job.source = (filter.root() / job.relative_path).string();

        if (job.state == JobState::Confirmed) {
            auto fp = compute_fingerprint(job.source, ledger.fingerprint_method);
            if (fp.is_err() || fp.value != job.fingerprint) {
                expctl_log(fmt::format("reconcile: {} changed since copy", job.relative_path));
                job.state = JobState::Pending;
                job.last_error = "source changed since last copy";
                changed = true;
            }
        } else if (job.state == JobState::InFlight) {
            job.state = JobState::Pending;
        }
        kept.push_back(job);
    }

    for (const auto& rel : present) {
        if (known.count(rel)) continue;
        TransferJob job;
        job.relative_path = rel;
        job.source = (filter.root() / rel).string();
        if (!ledger.destination_root.empty()) {
            job.destination = (fs::path(ledger.destination_root) / rel).string();
        }
        auto fp = compute_fingerprint(job.source, ledger.fingerprint_method);
        if (fp.is_ok()) job.fingerprint = fp.value;
        std::error_code ec;
        auto size = fs::file_size(job.source, ec);
        job.size = ec ? 0 : static_cast<int64_t>(size);
        kept.push_back(job);
        expctl_log(fmt::format("reconcile: {} is new", rel));
        changed = true;
    }

    ledger.jobs = std::move(kept);
    ledger.source_root = filter.root().string();
    if (changed) {
        ledger.notified = false;
        ledger.notification_error.clear();
    }
    return ledger;
}
