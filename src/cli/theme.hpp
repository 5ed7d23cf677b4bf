#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <fmt/format.h>
#include <unistd.h>

namespace theme {

namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string SAND      = "\033[38;2;233;196;106m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Plain output when piped or when NO_COLOR is set.
inline bool enabled() {
    static const bool on = isatty(STDOUT_FILENO) && !std::getenv("NO_COLOR");
    return on;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return enabled() ? code + s + color::RESET : s;
}

inline std::string teal(const std::string& s)  { return paint(color::TEAL, s); }
inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string banner(const std::string& version) {
    std::string line;
    for (int i = 0; i < 40; i++) line += "\xe2\x94\x80";
    return "\n" + paint(color::TEAL + color::BOLD, "  fleetlink") + "\n"
        + dim("  v" + version + "  ssh fleet access") + "\n\n"
        + dim("  " + line) + "\n";
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::SAND + color::BOLD, "  " + title) + "\n\n";
}

// Padded before coloring so escape codes do not break column widths.
inline std::string cell(const std::string& code, const std::string& s, int width) {
    return paint(code, fmt::format("{:<{}}", s, width));
}

inline std::string usage_row(const std::string& cmd, const std::string& what) {
    return cell(color::TEAL, "    fleetlink " + cmd, 48) + dim(what) + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg)   { return paint(color::GREEN, "    + ") + msg + "\n"; }
inline std::string fail(const std::string& msg) { return paint(color::RED, "    x ") + msg + "\n"; }
inline std::string info(const std::string& msg) { return paint(color::TEAL, "    ~ ") + msg + "\n"; }
inline std::string step(const std::string& msg) { return paint(color::SAND, "    > ") + msg + "\n"; }

inline std::string host_state(bool online, int width = 9) {
    return online ? cell(color::GREEN, "online", width) : cell(color::RED, "offline", width);
}

inline std::string container_state(const std::string& state, int width = 10) {
    if (state == "running") return cell(color::GREEN, state, width);
    if (state == "restarting" || state == "paused") return cell(color::YELLOW, state, width);
    return cell(color::DIM, state, width);
}

// "[#####.....]  512 / 1024 bytes"
inline std::string progress(uint64_t done, uint64_t total, int width = 24) {
    int filled = total ? static_cast<int>(done * width / total) : 0;
    if (filled > width) filled = width;
    std::string bar(filled, '#');
    bar.append(width - filled, '.');
    return fmt::format("    [{}] {} / {} bytes", bar, done, total);
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<14}", key)) + value + "\n";
}

} // namespace theme
