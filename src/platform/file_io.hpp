#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Exclusive advisory lock on a sibling "<target>.lock" file, held for the
// lifetime of the object. Serializes writers across threads and processes.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& target);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return fd_ >= 0; }
    const std::string& error() const { return error_; }

private:
    int fd_ = -1;
    std::string error_;
};

// Write `text` to "<path>.tmp", fsync, then rename over `path`.
// A crash mid-write leaves the previous contents intact.
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& text);

} // namespace platform
