#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Configuration structures

struct PoolConfig {
    int max_connections_per_host = POOL_MAX_CONNECTIONS_PER_HOST;
    int channels_per_connection = POOL_CHANNELS_PER_CONNECTION;
    int connect_timeout_ms = POOL_CONNECT_TIMEOUT_MS;
    int acquire_timeout_ms = POOL_ACQUIRE_TIMEOUT_MS;
    int idle_timeout_secs = POOL_IDLE_TIMEOUT_SECS;
    int retry_attempts = POOL_RETRY_ATTEMPTS;
    int retry_base_ms = POOL_RETRY_BASE_MS;
    int retry_cap_ms = POOL_RETRY_CAP_MS;
    int reaper_interval_ms = POOL_REAPER_INTERVAL_MS;
};

struct SessionConfig {
    int idle_timeout_secs = SESSION_IDLE_TIMEOUT_SECS;
    int history_size = SESSION_HISTORY_SIZE;
    int output_queue_chunks = SESSION_OUTPUT_QUEUE_CHUNKS;
    int command_timeout_secs = SSH_CMD_TIMEOUT_SECS;
    std::size_t max_output_bytes = SESSION_MAX_OUTPUT_BYTES;
};

struct CacheConfig {
    int status_ttl_secs = CACHE_STATUS_TTL_SECS;
    int containers_ttl_secs = CACHE_CONTAINERS_TTL_SECS;
};

struct PingTarget {
    std::string name;
    std::string host;
};

struct CollectorConfig {
    int interval_secs = COLLECTOR_INTERVAL_SECS;
    int concurrency = COLLECTOR_CONCURRENCY;
    int command_timeout_secs = COLLECTOR_CMD_TIMEOUT_SECS;
    int retention_days = HISTORY_RETENTION_DAYS;
    int cleanup_interval_secs = CLEANUP_INTERVAL_SECS;
    std::vector<PingTarget> ping_targets;   // empty: ping the host itself
};

struct TransferConfig {
    int max_global = TRANSFER_MAX_GLOBAL;
    int max_per_host = TRANSFER_MAX_PER_HOST;
    std::size_t chunk_size = TRANSFER_CHUNK_SIZE;
    int history_per_host = TRANSFER_HISTORY_PER_HOST;
    int retention_secs = TRANSFER_RETENTION_SECS;
    int op_timeout_secs = SFTP_OP_TIMEOUT_SECS;
};

class Config {
public:
    // Load global config from ~/.fleetlink/config.yaml
    static Result<Config> load_global();

    // Load config from an explicit YAML file
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text (missing keys keep their defaults)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const PoolConfig& pool() const { return pool_; }
    const SessionConfig& sessions() const { return sessions_; }
    const CacheConfig& cache() const { return cache_; }
    const CollectorConfig& collector() const { return collector_; }
    const TransferConfig& transfers() const { return transfers_; }
    int workers() const { return workers_; }
    const fs::path& history_file() const { return history_file_; }

    // Hosts listed in the config file (used by the CLI host directory).
    const std::vector<HostCredential>& hosts() const { return hosts_; }

    // Mutable access for programmatic construction (tests, embedding).
    PoolConfig& pool() { return pool_; }
    SessionConfig& sessions() { return sessions_; }
    CacheConfig& cache() { return cache_; }
    CollectorConfig& collector() { return collector_; }
    TransferConfig& transfers() { return transfers_; }
    void set_workers(int n) { workers_ = n; }
    void set_history_file(const fs::path& p) { history_file_ = p; }

public:
    Config() = default;

private:
    PoolConfig pool_;
    SessionConfig sessions_;
    CacheConfig cache_;
    CollectorConfig collector_;
    TransferConfig transfers_;
    int workers_ = WORKER_THREADS;
    fs::path history_file_;
    std::vector<HostCredential> hosts_;

    friend class ConfigBuilder;
};

// Parse a ping target list in either "name=host,host2" or plain "host,host2" form.
std::vector<PingTarget> parse_ping_targets(const std::string& spec);

// Helper to check if config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
