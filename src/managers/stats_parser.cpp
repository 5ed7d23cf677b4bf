#include "stats_parser.hpp"
#include <core/utils.hpp>
#include <map>
#include <regex>
#include <tuple>

// ── Commands ────────────────────────────────────────────────

std::string docker_info_command() {
    return "docker info --format '{{.ServerVersion}}|{{.ContainersRunning}}|{{.Containers}}'";
}

std::string container_list_command() {
    return "docker ps -a --format "
           "'{{.ID}}|{{.Names}}|{{.Image}}|{{.Status}}|{{.State}}|{{.Ports}}|{{.CreatedAt}}'";
}

std::string container_stats_command() {
    return "docker stats --no-stream --format "
           "'{{.ID}}|{{.Name}}|{{.CPUPerc}}|{{.MemUsage}}|{{.MemPerc}}|{{.NetIO}}|{{.BlockIO}}|{{.PIDs}}'";
}

std::string cpu_usage_command() {
    return "top -bn1 | grep 'Cpu(s)' | sed 's/.*, *\\([0-9.]*\\)%* id.*/\\1/' | awk '{print 100 - $1}'";
}

std::string ram_usage_command() {
    return "free | grep Mem | awk '{print $3/$2 * 100.0}'";
}

std::string disk_usage_command() {
    return "df -P / | tail -1 | awk '{print $5}'";
}

std::string load_average_command() {
    return "cut -d' ' -f1-3 /proc/loadavg";
}

std::string uptime_command() {
    return "uptime -p";
}

std::string ping_command(const std::string& host) {
    return "ping -c 1 -W 1 " + shell_quote(host);
}

// ── Parsers ─────────────────────────────────────────────────

DockerInfo parse_docker_info(const std::string& output) {
    DockerInfo info;
    for (const auto& line : split_lines(output)) {
        auto parts = split(line, '|');
        if (parts.size() < 3) continue;
        info.version = trimmed(parts[0]);
        info.running = safe_stoi(trimmed(parts[1]), 0);
        info.total = safe_stoi(trimmed(parts[2]), 0);
        info.valid = !info.version.empty();
        break;
    }
    return info;
}

std::vector<ContainerInfo> parse_container_list(const std::string& output) {
    std::vector<ContainerInfo> containers;
    for (const auto& line : split_lines(output)) {
        auto parts = split(line, '|');
        if (parts.size() < 7) continue;

        ContainerInfo c;
        c.id = trimmed(parts[0]);
        c.name = trimmed(parts[1]);
        c.image = trimmed(parts[2]);
        c.status = trimmed(parts[3]);
        c.state = trimmed(parts[4]);
        c.ports = trimmed(parts[5]);
        // CreatedAt may itself contain '|' only in pathological cases; join the tail
        std::string created = parts[6];
        for (std::size_t i = 7; i < parts.size(); i++) created += "|" + parts[i];
        c.created_at = trimmed(created);
        if (c.id.empty()) continue;
        containers.push_back(c);
    }
    return containers;
}

// "used / limit" pairs as printed for MemUsage, NetIO and BlockIO.
static std::pair<int64_t, int64_t> parse_size_pair(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) return {parse_size_bytes(text), -1};
    return {parse_size_bytes(text.substr(0, slash)), parse_size_bytes(text.substr(slash + 1))};
}

std::vector<ContainerStatsSample> parse_docker_stats(const std::string& output) {
    std::vector<ContainerStatsSample> rows;
    for (const auto& line : split_lines(output)) {
        auto parts = split(line, '|');
        if (parts.size() < 8) continue;

        ContainerStatsSample s;
        s.container_id = trimmed(parts[0]);
        s.name = trimmed(parts[1]);
        if (s.container_id.empty() || s.container_id == "--") continue;
        s.cpu_percent = parse_percent(parts[2]);
        std::tie(s.mem_usage_bytes, s.mem_limit_bytes) = parse_size_pair(parts[3]);
        s.mem_percent = parse_percent(parts[4]);
        std::tie(s.net_rx_bytes, s.net_tx_bytes) = parse_size_pair(parts[5]);
        std::tie(s.block_read_bytes, s.block_write_bytes) = parse_size_pair(parts[6]);
        s.pids = safe_stoi(trimmed(parts[7]), 0);
        rows.push_back(s);
    }
    return rows;
}

int64_t parse_size_bytes(const std::string& text) {
    static const std::regex size_re(R"(^\s*(\d+(?:\.\d+)?)\s*([kKMGTP]?i?B)\s*$)");
    static const std::map<std::string, double> units = {
        {"B", 1.0},
        {"kB", 1e3}, {"KB", 1e3}, {"MB", 1e6}, {"GB", 1e9}, {"TB", 1e12}, {"PB", 1e15},
        {"KiB", 1024.0}, {"kiB", 1024.0}, {"MiB", 1048576.0}, {"GiB", 1073741824.0},
        {"TiB", 1099511627776.0}, {"PiB", 1125899906842624.0},
    };

    std::smatch m;
    if (!std::regex_match(text, m, size_re)) return -1;
    auto unit = units.find(m[2].str());
    if (unit == units.end()) return -1;
    double value = safe_stod(m[1].str(), -1.0);
    if (value < 0) return -1;
    return static_cast<int64_t>(value * unit->second + 0.5);
}

double parse_percent(const std::string& output) {
    static const std::regex num_re(R"((-?\d+(?:\.\d+)?))");
    std::smatch m;
    if (!std::regex_search(output, m, num_re)) return -1.0;
    return safe_stod(m[1].str(), -1.0);
}

double parse_ping_latency(const std::string& output) {
    static const std::regex time_re(R"(time[=<]\s*(\d+(?:\.\d+)?)\s*ms)");
    std::smatch m;
    if (!std::regex_search(output, m, time_re)) return -1.0;
    return safe_stod(m[1].str(), -1.0);
}

double average_latency(const std::map<std::string, double>& latencies) {
    double sum = 0.0;
    int count = 0;
    for (const auto& [target, ms] : latencies) {
        if (ms > 0) {
            sum += ms;
            count++;
        }
    }
    return count > 0 ? sum / count : 0.0;
}
