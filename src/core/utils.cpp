#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>
#include <filesystem>
#include <array>
#include <sys/wait.h>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string now_compact() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

CommandResult run_command(const std::string& cmd) {
    CommandResult result;
    std::string full = cmd + " 2>&1";

    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "failed to start: " + cmd;
        return result;
    }

    std::array<char, 512> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

// "hash  filename" -> "hash"
static std::string first_token(std::string output) {
    trim(output);
    size_t space_pos = output.find_first_of(" \t");
    if (space_pos != std::string::npos) {
        output = output.substr(0, space_pos);
    }
    return output;
}

static std::string digest_with(const char* tool, const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        return "";
    }
    auto result = run_command(std::string(tool) + " " + shell_quote(path.string()));
    if (result.failed()) {
        return "";
    }
    return first_token(result.output);
}

std::string compute_file_sha256(const std::filesystem::path& path) {
#ifdef __APPLE__
    return digest_with("shasum -a 256", path);
#else
    return digest_with("sha256sum", path);
#endif
}

std::string compute_file_md5(const std::filesystem::path& path) {
#ifdef __APPLE__
    return digest_with("md5 -q", path);
#else
    return digest_with("md5sum", path);
#endif
}

std::string substitute_placeholders(const std::string& text,
                                    const std::vector<std::pair<std::string, std::string>>& vars) {
    std::string result = text;
    for (const auto& [key, value] : vars) {
        const std::string placeholder = "{" + key + "}";
        std::string::size_type pos = 0;
        while ((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
    }
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}
