#include "marker_protocol.hpp"
#include <core/utils.hpp>

static const char* const MARKER_PREFIX = "__FLEET_";

std::string begin_marker(const std::string& id) {
    return MARKER_PREFIX + std::string("BEGIN_") + id + "__";
}

std::string done_marker(const std::string& id) {
    return MARKER_PREFIX + std::string("DONE_") + id + "__";
}

// ── Framing ─────────────────────────────────────────────────

// The quoted split (BEG''IN) means the script text never contains the literal
// marker, only its echo output does.
static std::string split_marker(const std::string& word, const std::string& id) {
    std::string head = word.substr(0, 3);
    return MARKER_PREFIX + head + "''" + word.substr(3) + "_" + id + "__";
}

std::string build_marker_command(const std::string& cmd, const std::string& id) {
    auto end = cmd.find_last_not_of("; \t\r\n");
    std::string body = end == std::string::npos ? ":" : cmd.substr(0, end + 1);

    std::string begin = split_marker("BEGIN", id);
    std::string done = split_marker("DONE", id);

    std::string script;
    script += "echo " + begin + "; echo " + begin + " >&2\n";
    script += "{ " + body + "\n} </dev/null\n";
    script += "__fleet_rc=$?\n";
    script += "echo " + done + " >&2; echo " + done + " $__fleet_rc\n";
    return script;
}

// ── Parsing ─────────────────────────────────────────────────

MarkerResult parse_marker_output(const std::string& raw, const std::string& id) {
    const std::string done = done_marker(id);
    MarkerResult pending{"", 0, false};

    auto done_at = raw.find(done);
    if (done_at == std::string::npos) return pending;
    auto eol = raw.find('\n', done_at);
    if (eol == std::string::npos) return pending;

    MarkerResult r{"", 0, true};
    auto tail_start = done_at + done.size();
    std::string tail = trimmed(raw.substr(tail_start, eol - tail_start));
    if (!tail.empty()) r.exit_code = safe_stoi(tail, 0);

    // Anything before BEGIN is shell noise (motd, prompt) and is dropped
    const std::string begin = begin_marker(id);
    size_t from = 0;
    auto begin_at = raw.find(begin);
    if (begin_at != std::string::npos && begin_at < done_at) {
        from = begin_at + begin.size();
        if (raw.compare(from, 2, "\r\n") == 0) from += 2;
        else if (raw.compare(from, 1, "\n") == 0) from += 1;
    }

    r.output = raw.substr(from, done_at - from);
    auto last = r.output.find_last_not_of(" \t\r\n");
    r.output.erase(last == std::string::npos ? 0 : last + 1);
    return r;
}
