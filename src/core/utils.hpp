#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Format a time_t as ISO 8601 local time.
std::string format_iso(std::time_t t);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe numeric parses: return fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
int64_t safe_stoll(const std::string& s, int64_t fallback = 0);
double safe_stod(const std::string& s, double fallback = 0.0);

// Split text into lines, dropping '\r' and (optionally) empty lines.
std::vector<std::string> split_lines(const std::string& text, bool keep_empty = false);

// Split on a single-character delimiter, keeping empty fields.
std::vector<std::string> split(const std::string& s, char delim);

// Quote a string for safe use as one POSIX shell word.
std::string shell_quote(const std::string& s);

// Generate a random hex identifier (used for session/transfer ids).
std::string random_id(int bytes = 8);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
