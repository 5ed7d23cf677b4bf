#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/connection_pool.hpp>
#include <ssh/session_multiplexer.hpp>
#include <ssh/transport.hpp>
#include <util/worker_pool.hpp>
#include "container_manager.hpp"
#include "file_transfer_manager.hpp"
#include "history_store.hpp"
#include "monitoring_collector.hpp"
#include "state_cache.hpp"

// Pure data struct for UI consumption.
struct HostSummary {
    std::string host_id;
    std::string address;
    bool online = false;
    std::string error;
    std::string latency;      // "12ms" or "-"
    std::string cpu;          // "37%" or "-"
    std::string ram;
    std::string disk;
    std::string containers;   // "3/5"
    std::string uptime;       // format_duration, "-" if unknown
    std::string checked_at;
};

// HostDirectory backed by a fixed list (the config's hosts section, or
// whatever an embedding application hands in).
class StaticHostDirectory : public HostDirectory {
public:
    explicit StaticHostDirectory(std::vector<HostCredential> hosts = {});

    std::vector<HostCredential> active_hosts() override;
    std::optional<HostCredential> find(const std::string& host_id) override;

    void set_hosts(std::vector<HostCredential> hosts);

private:
    std::mutex mutex_;
    std::vector<HostCredential> hosts_;
};

// Headless service facade: owns the pool, sessions, cache, collector,
// transfers and container actions. Can be used by any frontend.
class FleetService {
public:
    // factory defaults to libssh2, hosts to the config's host list.
    explicit FleetService(Config config,
                          std::shared_ptr<TransportFactory> factory = nullptr,
                          std::shared_ptr<HostDirectory> hosts = nullptr);
    ~FleetService();

    FleetService(const FleetService&) = delete;
    FleetService& operator=(const FleetService&) = delete;

    // ── Lifecycle ─────────────────────────────────────────────

    // Load history and start the background threads. The collector loop
    // only runs when with_collector is set.
    Result<void> start(bool with_collector = true);

    // Stop the collector, cancel transfers, close sessions and connections.
    void stop();

    bool running() const { return running_; }

    // ── Convenience operations ────────────────────────────────

    Result<HostCredential> resolve(const std::string& host_id);

    // One command on a host through a one-shot Exec session.
    Result<CommandResult> exec(const std::string& host_id, const std::string& command,
                               int timeout_secs = 0);

    // One row per active host, from the cache unless refresh is set.
    std::vector<HostSummary> fleet_overview(bool refresh = false);

    // Credentials for a host changed: drop its connections, auth-failed
    // mark and cached state.
    void update_credentials(const std::string& host_id);

    // ── Component access ──────────────────────────────────────

    const Config& config() const { return config_; }
    ConnectionPool& pool() { return *pool_; }
    SessionMultiplexer& sessions() { return *mux_; }
    StateCache& cache() { return *cache_; }
    HistoryStore& history() { return *history_; }
    MonitoringCollector& collector() { return *collector_; }
    FileTransferManager& transfers() { return *transfers_; }
    ContainerManager& containers() { return *containers_; }
    HostDirectory& hosts() { return *hosts_; }

private:
    // Declaration order is teardown order in reverse.
    Config config_;
    std::shared_ptr<TransportFactory> factory_;
    std::shared_ptr<HostDirectory> hosts_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<SessionMultiplexer> mux_;
    std::unique_ptr<StateCache> cache_;
    std::unique_ptr<HistoryStore> history_;
    std::unique_ptr<WorkerPool> workers_;
    std::unique_ptr<ContainerManager> containers_;
    std::unique_ptr<FileTransferManager> transfers_;
    std::unique_ptr<MonitoringCollector> collector_;

    bool running_ = false;
};
