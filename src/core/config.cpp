#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Builds a Config from a parsed YAML tree. Every key is optional.
class ConfigBuilder {
public:
    static Config build(const YAML::Node& root) {
        Config config;

        if (root["pool"]) parse_pool(root["pool"], config.pool_);
        if (root["sessions"]) parse_sessions(root["sessions"], config.sessions_);
        if (root["cache"]) parse_cache(root["cache"], config.cache_);
        if (root["collector"]) parse_collector(root["collector"], config.collector_);
        if (root["transfers"]) parse_transfers(root["transfers"], config.transfers_);

        config.workers_ = root["workers"].as<int>(WORKER_THREADS);
        if (config.workers_ < 1) config.workers_ = 1;

        std::string history = root["history_file"].as<std::string>("");
        config.history_file_ = history.empty()
            ? get_global_config_dir() / "history.yaml"
            : fs::path(history);

        if (root["hosts"] && root["hosts"].IsSequence()) {
            for (const auto& n : root["hosts"]) {
                config.hosts_.push_back(parse_host(n));
            }
        }

        return config;
    }

private:
    static void parse_pool(const YAML::Node& node, PoolConfig& p) {
        p.max_connections_per_host = node["max_connections_per_host"].as<int>(p.max_connections_per_host);
        p.channels_per_connection = node["channels_per_connection"].as<int>(p.channels_per_connection);
        p.connect_timeout_ms = node["connect_timeout_ms"].as<int>(p.connect_timeout_ms);
        p.acquire_timeout_ms = node["acquire_timeout_ms"].as<int>(p.acquire_timeout_ms);
        p.idle_timeout_secs = node["idle_timeout_secs"].as<int>(p.idle_timeout_secs);
        p.retry_attempts = node["retry_attempts"].as<int>(p.retry_attempts);
        p.retry_base_ms = node["retry_base_ms"].as<int>(p.retry_base_ms);
        p.retry_cap_ms = node["retry_cap_ms"].as<int>(p.retry_cap_ms);

        if (p.max_connections_per_host < 1) p.max_connections_per_host = 1;
        if (p.channels_per_connection < 1) p.channels_per_connection = 1;
        if (p.retry_attempts < 1) p.retry_attempts = 1;
    }

    static void parse_sessions(const YAML::Node& node, SessionConfig& s) {
        s.idle_timeout_secs = node["idle_timeout_secs"].as<int>(s.idle_timeout_secs);
        s.history_size = node["history_size"].as<int>(s.history_size);
        s.output_queue_chunks = node["output_queue_chunks"].as<int>(s.output_queue_chunks);
        s.command_timeout_secs = node["command_timeout_secs"].as<int>(s.command_timeout_secs);
        s.max_output_bytes = node["max_output_bytes"].as<std::size_t>(s.max_output_bytes);
        if (s.max_output_bytes < 1024) s.max_output_bytes = 1024;
    }

    static void parse_cache(const YAML::Node& node, CacheConfig& c) {
        c.status_ttl_secs = node["status_ttl_secs"].as<int>(c.status_ttl_secs);
        c.containers_ttl_secs = node["containers_ttl_secs"].as<int>(c.containers_ttl_secs);
    }

    static void parse_collector(const YAML::Node& node, CollectorConfig& c) {
        c.interval_secs = node["interval_secs"].as<int>(c.interval_secs);
        c.concurrency = node["concurrency"].as<int>(c.concurrency);
        c.command_timeout_secs = node["command_timeout_secs"].as<int>(c.command_timeout_secs);
        c.retention_days = node["retention_days"].as<int>(c.retention_days);
        c.cleanup_interval_secs = node["cleanup_interval_secs"].as<int>(c.cleanup_interval_secs);
        if (c.concurrency < 1) c.concurrency = 1;

        // ping_targets: list of {name, host} maps or plain strings, or a
        // comma-separated string.
        const auto& targets = node["ping_targets"];
        if (targets && targets.IsSequence()) {
            for (const auto& t : targets) {
                if (t.IsMap()) {
                    PingTarget pt;
                    pt.host = t["host"].as<std::string>("");
                    pt.name = t["name"].as<std::string>(pt.host);
                    if (!pt.host.empty()) c.ping_targets.push_back(pt);
                } else if (t.IsScalar()) {
                    auto host = t.as<std::string>();
                    if (!host.empty()) c.ping_targets.push_back({host, host});
                }
            }
        } else if (targets && targets.IsScalar()) {
            c.ping_targets = parse_ping_targets(targets.as<std::string>());
        }
    }

    static void parse_transfers(const YAML::Node& node, TransferConfig& t) {
        t.max_global = node["max_global"].as<int>(t.max_global);
        t.max_per_host = node["max_per_host"].as<int>(t.max_per_host);
        t.chunk_size = node["chunk_size"].as<std::size_t>(t.chunk_size);
        t.history_per_host = node["history_per_host"].as<int>(t.history_per_host);
        t.retention_secs = node["retention_secs"].as<int>(t.retention_secs);
        t.op_timeout_secs = node["op_timeout_secs"].as<int>(t.op_timeout_secs);
        if (t.max_global < 1) t.max_global = 1;
        if (t.max_per_host < 1) t.max_per_host = 1;
        if (t.chunk_size == 0) t.chunk_size = TRANSFER_CHUNK_SIZE;
    }

    static HostCredential parse_host(const YAML::Node& node) {
        HostCredential h;
        h.address = node["address"].as<std::string>("");
        h.host_id = node["id"].as<std::string>(h.address);
        h.port = node["port"].as<int>(22);
        h.username = node["username"].as<std::string>("root");

        // Secrets are never stored in the config: they are read from an
        // environment variable or a key file at load time.
        std::string password_env = node["password_env"].as<std::string>("");
        std::string key_path = node["private_key_path"].as<std::string>("");
        if (!key_path.empty()) {
            h.auth_method = AuthMethod::PrivateKey;
            std::ifstream in(key_path);
            std::stringstream ss;
            ss << in.rdbuf();
            h.secret = ss.str();
            std::string pass_env = node["passphrase_env"].as<std::string>("");
            if (!pass_env.empty()) {
                const char* v = std::getenv(pass_env.c_str());
                if (v) h.passphrase = v;
            }
        } else if (!password_env.empty()) {
            h.auth_method = AuthMethod::Password;
            const char* v = std::getenv(password_env.c_str());
            if (v) h.secret = v;
        }
        return h;
    }
};

std::vector<PingTarget> parse_ping_targets(const std::string& spec) {
    std::vector<PingTarget> targets;
    for (auto part : split(spec, ',')) {
        trim(part);
        if (part.empty()) continue;
        auto eq = part.find('=');
        if (eq != std::string::npos) {
            PingTarget t{trimmed(part.substr(0, eq)), trimmed(part.substr(eq + 1))};
            if (t.host.empty()) continue;
            if (t.name.empty()) t.name = t.host;
            targets.push_back(t);
        } else {
            targets.push_back({part, part});
        }
    }
    return targets;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::fleet_home();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err(ErrorKind::NotFound,
                                   "Global config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::NotFound, "Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# fleetlink configuration

pool:
  max_connections_per_host: 2
  channels_per_connection: 8
  connect_timeout_ms: 10000
  idle_timeout_secs: 300
  retry_attempts: 3
  retry_base_ms: 500
  retry_cap_ms: 4000

cache:
  status_ttl_secs: 30
  containers_ttl_secs: 300

collector:
  interval_secs: 300
  concurrency: 4
  retention_days: 30
  ping_targets: []

transfers:
  max_global: 4
  max_per_host: 2

# Hosts for the command line tool. Secrets are read from the environment
# or from key files, never from this file.
hosts: []
#  - id: web1
#    address: 10.0.0.5
#    username: root
#    password_env: WEB1_PASSWORD
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
