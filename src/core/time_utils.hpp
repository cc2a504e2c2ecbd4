#pragma once

#include <string>
#include <optional>

// True if `iso` parses as YYYY-MM-DDTHH:MM:SS (trailing fraction/zone ignored).
bool is_iso_timestamp(const std::string& iso);

// Signed seconds from start to end, or nullopt if either fails to parse.
std::optional<long> seconds_between(const std::string& start_time, const std::string& end_time);

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Format an ISO timestamp as "HH:MM:SS" for stage history tables.
// Returns "-" if empty, "?" on parse failure.
std::string format_clock(const std::string& iso_time);
