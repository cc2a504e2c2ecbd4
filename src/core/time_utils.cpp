#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

// ISO timestamp parsing (YYYY-MM-DDTHH:MM:SS)
static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

bool is_iso_timestamp(const std::string& iso) {
    struct tm tm_buf = {};
    return !iso.empty() && parse_iso(iso, &tm_buf);
}

std::optional<long> seconds_between(const std::string& start_time, const std::string& end_time) {
    struct tm start_tm = {};
    struct tm end_tm = {};
    if (!parse_iso(start_time, &start_tm) || !parse_iso(end_time, &end_tm)) {
        return std::nullopt;
    }
    return static_cast<long>(std::difftime(mktime(&end_tm), mktime(&start_tm)));
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time, &start_tm)) {
        return "?";
    }
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t;
    if (!end_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(end_time, &end_tm)) {
            return "?";
        }
        end_t = mktime(&end_tm);
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    if (seconds < 0) seconds = 0;
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_clock(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) {
        return "?";
    }

    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return std::string(buf);
}
