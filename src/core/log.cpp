#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string fleet_log_path() {
    static const std::string path = platform::debug_log_path().string();
    return path;
}

void fleet_log(const std::string& msg) {
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

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(fleet_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void fleet_log_cmd(const std::string& label, const std::string& cmd,
                   const CommandResult& r) {
    fleet_log(fmt::format("{} CMD: {}", label, cmd));
    fleet_log(fmt::format("{} exit={} latency={:.1f}ms stdout({})={}", label, r.exit_code,
                          r.latency_ms, r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        fleet_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
