#pragma once

#include <string>
#include <cstdint>

// Format a duration in seconds as "2h35m", "14m22s", "8s", or "3d4h" for long spans.
// Negative input returns "-".
std::string format_duration(int64_t seconds);

// Parse `uptime -p` output ("up 2 weeks, 6 hours, 20 minutes") to seconds.
// Returns 0 when the text is not recognisable.
int64_t parse_uptime_seconds(const std::string& uptime_pretty);

// Seconds between two ISO timestamps (YYYY-MM-DDTHH:MM:SS); end defaults to now.
// Returns -1 if start cannot be parsed.
int64_t seconds_between(const std::string& start_iso, const std::string& end_iso = "");
