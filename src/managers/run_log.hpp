#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <filesystem>
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string expctl_log_path() {
    static std::string path = (platform::temp_dir() / "expctl_debug.log").string();
    return path;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

// Per-session log: <session_dir>/.expctl/launcher.log
inline std::filesystem::path session_log_path(const std::filesystem::path& session_dir) {
    return session_dir / STATE_DIR_NAME / SESSION_LOG_NAME;
}

// Append "[ISO] LEVEL msg" to the session's log. With echo set the line is
// mirrored to stderr (--debug).
inline void append_session_log(const std::filesystem::path& session_dir,
                               const std::string& level,
                               const std::string& msg,
                               bool echo = false) {
    std::string line = fmt::format("[{}] {:<5} {}", now_iso(), level, msg);
    std::lock_guard<std::mutex> lock(log_mutex());
    if (!session_dir.empty()) {
        auto path = session_log_path(session_dir);
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        std::ofstream f(path, std::ios::app);
        if (f) {
            f << line << "\n";
        }
    }
    if (echo) {
        std::cerr << line << "\n";
    }
}

inline void expctl_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(expctl_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void expctl_log_cmd(const std::string& label, const std::string& cmd,
                           const CommandResult& r) {
    expctl_log(fmt::format("{} CMD: {}", label, cmd));
    expctl_log(fmt::format("{} exit={} output({})={}", label, r.exit_code,
                           r.output.size(), r.output.substr(0, 500)));
}
