#include "utils.hpp"
#include "types.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <random>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "None";
        case ErrorKind::AuthError:        return "AuthError";
        case ErrorKind::ConnectionError:  return "ConnectionError";
        case ErrorKind::TimedOut:         return "TimedOut";
        case ErrorKind::SessionGone:      return "SessionGone";
        case ErrorKind::ConnectionLost:   return "ConnectionLost";
        case ErrorKind::CacheMiss:        return "CacheMiss";
        case ErrorKind::TransferError:    return "TransferError";
        case ErrorKind::NotEmpty:         return "NotEmpty";
        case ErrorKind::NotFound:         return "NotFound";
        case ErrorKind::InvalidArgument:  return "InvalidArgument";
        case ErrorKind::CapacityExceeded: return "CapacityExceeded";
        case ErrorKind::CommandFailed:    return "CommandFailed";
    }
    return "Unknown";
}

std::string now_iso() {
    return format_iso(std::time(nullptr));
}

std::string format_iso(std::time_t t) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

int64_t safe_stoll(const std::string& s, int64_t fallback) {
    try {
        return std::stoll(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

double safe_stod(const std::string& s, double fallback) {
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_lines(const std::string& text, bool keep_empty) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (keep_empty || !line.empty()) lines.push_back(line);
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return lines;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
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

std::string random_id(int bytes) {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());
    std::lock_guard<std::mutex> lock(rng_mutex);
    std::string out;
    for (int i = 0; i < bytes; ++i) {
        out += fmt::format("{:02x}", static_cast<unsigned>(rng() & 0xFF));
    }
    return out;
}
