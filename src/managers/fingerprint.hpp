#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Content fingerprint of a regular file.
//   sha256, md5   hex digest from the system checksum tool
//   size_mtime    "<bytes>:<mtime seconds>"
Result<std::string> compute_fingerprint(const std::filesystem::path& path, FingerprintMethod method);
