#pragma once

#include <filesystem>

namespace platform {

// Per-user state directory: $FLEETLINK_HOME, else ~/.fleetlink.
// Falls back to <tmp>/fleetlink when HOME is unset (daemons, CI).
std::filesystem::path fleet_home();

// $FLEETLINK_LOG, else <tmp>/fleetlink_debug.log.
std::filesystem::path debug_log_path();

// Blocks the calling thread. Negative values are treated as zero.
void sleep_ms(int ms);

} // namespace platform
