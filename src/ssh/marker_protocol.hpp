#pragma once

#include <string>

// Marker protocol for running commands on a long-lived shell channel.
//
// Each command is bracketed by BEGIN/DONE markers on both stdout and stderr,
// tagged with a per-command id so late output of an earlier command can never
// be mistaken for the current one. The stdout DONE marker carries the exit
// code. Used by SessionMultiplexer for Exec and Batch sessions.

struct MarkerResult {
    std::string output;
    int exit_code;
    bool found;
};

// Build the wrapped command for `cmd`. The command runs with stdin from
// /dev/null so it cannot swallow the trailing marker echoes.
std::string build_marker_command(const std::string& cmd, const std::string& id);

// Parse one stream for the BEGIN/DONE markers of `id`. found is false until
// the DONE marker (and, on stdout, its exit code line) has fully arrived.
MarkerResult parse_marker_output(const std::string& raw, const std::string& id);

std::string begin_marker(const std::string& id);
std::string done_marker(const std::string& id);
