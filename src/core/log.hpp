#pragma once

#include <string>
#include <core/types.hpp>
#include <fmt/format.h>

// Debug log file, resolved once per process.
std::string fleet_log_path();

// Append a "[HH:MM:SS.mmm] msg" line to the debug log. Thread-safe.
void fleet_log(const std::string& msg);

// Log a remote command and a truncated view of its result.
void fleet_log_cmd(const std::string& label, const std::string& cmd,
                   const CommandResult& r);

// Log an infrastructure error at a layer boundary.
template <typename T>
inline void fleet_log_error(const std::string& where, const Result<T>& r) {
    fleet_log(fmt::format("{}: {} {}", where, error_kind_name(r.kind), r.error));
}
