#include "platform.hpp"
#include <chrono>
#include <cstdlib>
#include <string>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace platform {

static const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

static fs::path scratch_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : tmp;
}

fs::path fleet_home() {
    if (const char* dir = env_value("FLEETLINK_HOME")) return fs::path(dir);
    if (const char* home = env_value("HOME")) return fs::path(home) / ".fleetlink";
    return scratch_dir() / "fleetlink";
}

fs::path debug_log_path() {
    if (const char* file = env_value("FLEETLINK_LOG")) return fs::path(file);
    return scratch_dir() / "fleetlink_debug.log";
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
