#include "platform.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <pwd.h>
#include <sys/statvfs.h>
#include <sys/sysinfo.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string hostname() {
    char name[256] = {};
    if (gethostname(name, sizeof(name)) != 0) return "unknown";
    name[sizeof(name) - 1] = '\0';
    std::string h(name);
    auto dot = h.find('.');
    if (dot != std::string::npos) h.erase(dot);
    return h.empty() ? "unknown" : h;
}

std::string username() {
    if (const char* user = std::getenv("USER")) {
        if (*user) return user;
    }
    if (const struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_name;
    }
    return "unknown";
}

static bool is_executable_file(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> find_executable(const std::string& program,
                                                     const std::filesystem::path& base_dir) {
    if (program.empty()) return std::nullopt;

    if (program.find('/') != std::string::npos) {
        std::filesystem::path p = program;
        if (p.is_relative()) p = base_dir / p;
        if (is_executable_file(p)) return p.lexically_normal();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/bin:/bin";
    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = std::filesystem::path(dir) / program;
        if (is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

std::vector<int> find_processes(const std::string& name) {
    std::vector<int> pids;
    std::string wanted = name.substr(0, 15);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const auto pid_name = entry.path().filename().string();
        if (pid_name.empty() || pid_name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        // "<pid> (<comm>) <state> ..."; comm may itself contain ')'
        std::ifstream stat(entry.path() / "stat");
        std::string line;
        if (!stat || !std::getline(stat, line)) continue;  // exited while scanning
        auto open = line.find('(');
        auto close = line.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close + 2 >= line.size()) {
            continue;
        }
        char state = line[close + 2];
        if (state == 'Z' || state == 'X') continue;
        if (line.compare(open + 1, close - open - 1, wanted) == 0) {
            pids.push_back(std::stoi(pid_name));
        }
    }
    return pids;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

std::optional<int64_t> free_disk_mb(const fs::path& path) {
    std::error_code ec;
    fs::path probe = path.empty() ? fs::current_path(ec) : fs::absolute(path, ec);
    if (ec) return std::nullopt;

    while (!probe.empty() && !fs::exists(probe, ec)) {
        if (probe == probe.parent_path()) break;
        probe = probe.parent_path();
    }

    struct statvfs st{};
    if (statvfs(probe.c_str(), &st) != 0) return std::nullopt;
    auto bytes = static_cast<unsigned long long>(st.f_bavail) * st.f_frsize;
    return static_cast<int64_t>(bytes / (1024ULL * 1024ULL));
}

std::optional<int64_t> available_memory_mb() {
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.rfind("MemAvailable:", 0) == 0) {
            std::istringstream ss(line.substr(13));
            int64_t kb = 0;
            if (ss >> kb) return kb / 1024;
        }
    }

    struct sysinfo info{};
    if (sysinfo(&info) == 0) {
        auto bytes = (static_cast<unsigned long long>(info.freeram) +
                      static_cast<unsigned long long>(info.bufferram)) * info.mem_unit;
        return static_cast<int64_t>(bytes / (1024ULL * 1024ULL));
    }
    return std::nullopt;
}

std::optional<double> load_average_1m() {
    double loads[1] = {0.0};
    if (getloadavg(loads, 1) == 1) {
        return loads[0];
    }
    return std::nullopt;
}

} // namespace platform
