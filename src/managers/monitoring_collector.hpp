#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/connection_pool.hpp>
#include <ssh/session_multiplexer.hpp>
#include <util/worker_pool.hpp>
#include "history_store.hpp"
#include "state_cache.hpp"

struct CollectorStats {
    uint64_t sweeps = 0;
    uint64_t hosts_ok = 0;
    uint64_t hosts_failed = 0;
    std::string last_sweep_at;
    double last_sweep_ms = 0.0;
    std::string last_cleanup_at;
};

// MonitoringCollector: periodic background sweep over the fleet.
//
// For each host it runs a fixed battery of commands on one Batch session
// (docker info, uptime, load, CPU, RAM, disk, container list, docker stats,
// pings), writes the parsed status and container list into the StateCache
// and appends host and per-container samples to the HistoryStore. At most `concurrency` hosts are collected at
// once; one host's failure never stops the others.
//
// Cache writes use the generation captured before the fetch, so a sweep that
// races a mutating action never writes a pre-mutation listing back.
class MonitoringCollector : public CacheRefresher {
public:
    MonitoringCollector(SessionMultiplexer& mux, ConnectionPool& pool, StateCache& cache,
                        HistoryStore& history, HostDirectory& hosts, WorkerPool& workers,
                        CollectorConfig config);
    ~MonitoringCollector() override;

    // Background loop: a sweep every interval, cleanup once per cleanup interval.
    bool start();
    void stop();
    bool running() const { return running_; }

    // One sweep over every active host. Returns hosts collected successfully.
    int collect_all();

    // Full battery for one host. Unreachable hosts yield an offline status
    // (cached too) together with the error.
    Result<ServerStatus> collect_system_data(const HostCredential& cred);

    // Container listing (cached) and one `docker stats` sample per running
    // container (history). A failed stats command only loses the samples.
    Result<std::vector<ContainerInfo>> collect_container_data(const HostCredential& cred);

    // Reachability: cached status unless missing/expired or force_real_time.
    // An unreachable host is a status with online == false, not an error.
    Result<ServerStatus> check_server_connection(const std::string& host_id,
                                                 bool force_real_time = false);

    // Drop history older than retention_days and persist. Returns samples removed.
    int cleanup_old_data(int retention_days);

    Result<void> refresh_host(const std::string& host_id);

    // CacheRefresher
    std::vector<std::string> refresh_targets() override;
    int refresh_hosts(const std::vector<std::string>& host_ids) override;

    CollectorStats stats() const;

private:
    // collect_system_data for each credential, at most `concurrency` at once.
    // Waits for all; returns the number that succeeded.
    int run_bounded(const std::vector<HostCredential>& creds);

    std::vector<ContainerStatsSample> stamp_container_stats(const std::string& host_id,
                                                            const CommandResult& r,
                                                            std::time_t ts) const;

    ServerStatus offline_status(const std::string& host_id, const std::string& error) const;
    void collector_loop();

    SessionMultiplexer& mux_;
    ConnectionPool& pool_;
    StateCache& cache_;
    HistoryStore& history_;
    HostDirectory& hosts_;
    WorkerPool& workers_;
    CollectorConfig config_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex stats_mutex_;
    CollectorStats stats_;
};
