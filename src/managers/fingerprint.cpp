#include "fingerprint.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

Result<std::string> compute_fingerprint(const std::filesystem::path& path, FingerprintMethod method) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Result<std::string>::Err(fmt::format("cannot stat {}: {}", path.string(),
                                                    std::strerror(errno)));
    }
    if (!S_ISREG(st.st_mode)) {
        return Result<std::string>::Err(fmt::format("{} is not a regular file", path.string()));
    }

    std::string digest;
    switch (method) {
        case FingerprintMethod::SizeMtime:
            return Result<std::string>::Ok(fmt::format("{}:{}",
                                                       static_cast<long long>(st.st_size),
                                                       static_cast<long long>(st.st_mtime)));
        case FingerprintMethod::Md5:
            digest = compute_file_md5(path);
            break;
        case FingerprintMethod::Sha256:
            digest = compute_file_sha256(path);
            break;
    }

    if (digest.empty()) {
        return Result<std::string>::Err(fmt::format("checksum of {} failed", path.string()));
    }
    return Result<std::string>::Ok(digest);
}
