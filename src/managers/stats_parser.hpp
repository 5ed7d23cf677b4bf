#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

// Parsers for the collector's remote command battery. All of them are
// tolerant: malformed input yields defaults, never an exception.

struct DockerInfo {
    std::string version;
    int running = 0;
    int total = 0;
    bool valid = false;
};

// Remote commands (single shell lines).
std::string docker_info_command();
std::string container_list_command();
std::string container_stats_command();
std::string cpu_usage_command();
std::string ram_usage_command();
std::string disk_usage_command();
std::string load_average_command();
std::string uptime_command();
std::string ping_command(const std::string& host);

// "24.0.7|3|5"
DockerInfo parse_docker_info(const std::string& output);

// `docker ps -a` rows: ID|Names|Image|Status|State|Ports|CreatedAt
std::vector<ContainerInfo> parse_container_list(const std::string& output);

// `docker stats --no-stream` rows: ID|Name|CPUPerc|MemUsage|MemPerc|NetIO|BlockIO|PIDs
// host_id and timestamp are left for the caller.
std::vector<ContainerStatsSample> parse_docker_stats(const std::string& output);

// Docker's human sizes: "648B", "1.2kB", "12.5MiB", "1.944GiB" -> bytes; -1 if unparsable.
int64_t parse_size_bytes(const std::string& text);

// "42%", "42.5", " 17.3 \n" -> percent; -1 if no number present.
double parse_percent(const std::string& output);

// Round trip time from `ping -c 1` output ("time=12.3 ms"); -1 if absent.
double parse_ping_latency(const std::string& output);

// Average over latencies > 0; 0 when none answered.
double average_latency(const std::map<std::string, double>& latencies);
