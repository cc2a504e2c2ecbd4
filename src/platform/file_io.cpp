#include "file_io.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

namespace fs = std::filesystem;

namespace platform {

FileLock::FileLock(const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);

    std::string lock_path = target.string() + ".lock";
    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        error_ = fmt::format("cannot open {}: {}", lock_path, std::strerror(errno));
        return;
    }

    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        error_ = fmt::format("cannot lock {}: {}", lock_path, std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return;
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

Result<void> write_file_atomic(const fs::path& path, const std::string& text) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(fmt::format("cannot create {}: {}",
                                                 path.parent_path().string(), ec.message()));
        }
    }

    std::string tmp = path.string() + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<void>::Err(fmt::format("cannot open {}: {}", tmp, std::strerror(errno)));
    }

    const char* data = text.data();
    size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return Result<void>::Err(fmt::format("write to {} failed: {}", tmp, std::strerror(err)));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return Result<void>::Err(fmt::format("fsync {} failed: {}", tmp, std::strerror(err)));
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return Result<void>::Err(fmt::format("cannot publish {}: {}", path.string(), std::strerror(err)));
    }
    return Result<void>::Ok();
}

} // namespace platform
