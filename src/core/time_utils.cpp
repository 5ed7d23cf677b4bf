#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <regex>

std::string format_duration(int64_t seconds) {
    if (seconds < 0) return "-";

    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (days > 0) {
        return fmt::format("{}d{}h", days, hours);
    } else if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

int64_t parse_uptime_seconds(const std::string& uptime_pretty) {
    if (uptime_pretty.find("up") == std::string::npos) return 0;

    struct Unit { const char* name; int64_t mult; };
    static const Unit units[] = {
        {"year",   365LL * 24 * 3600},
        {"month",  30LL * 24 * 3600},
        {"week",   7LL * 24 * 3600},
        {"day",    24LL * 3600},
        {"hour",   3600},
        {"minute", 60},
        {"second", 1},
    };

    int64_t total = 0;
    for (const auto& u : units) {
        std::regex re(std::string("(\\d+)\\s+") + u.name, std::regex::icase);
        std::smatch m;
        if (std::regex_search(uptime_pretty, m, re)) {
            total += safe_stoll(m[1].str()) * u.mult;
        }
    }
    return total;
}

int64_t seconds_between(const std::string& start_iso, const std::string& end_iso) {
    std::time_t start_t = parse_iso_time(start_iso);
    if (start_t == 0) return -1;

    std::time_t end_t = end_iso.empty() ? std::time(nullptr) : parse_iso_time(end_iso);
    if (end_t == 0) return -1;

    return static_cast<int64_t>(std::difftime(end_t, start_t));
}
