#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "transport.hpp"

// ConnectionPool: authenticated physical connections per host.
//
// Each connection carries up to channels_per_connection logical channels; a
// host never has more than max_connections_per_host connections open or
// opening. acquire() reuses a connection with spare capacity, opens a new one
// under the cap (retrying transient ConnectionErrors with backoff), or blocks
// until a channel is released. Retry policy lives here and nowhere else.
//
// Locking: hosts_mutex_ guards the host table only; every host has its own
// slot mutex so unrelated hosts never contend. Transport I/O (connect,
// disconnect, keepalive) is never done while holding a slot mutex.

enum class ConnectionState { Connecting, Idle, Busy, Degraded, Closed };

const char* connection_state_name(ConnectionState s);

// One channel's claim on a pooled connection. Returned by acquire(), handed
// back with release().
struct Lease {
    std::string host_id;
    uint64_t connection_id = 0;
    std::shared_ptr<Transport> transport;
    bool reused_idle = false;   // connection was Idle when handed out

    bool valid() const { return transport != nullptr; }
};

struct HostPoolStats {
    int open = 0;
    int idle = 0;
    int busy = 0;
    int degraded = 0;       // connections dropped after a failed channel open
    int channels = 0;       // channels currently leased
    bool auth_failed = false;
};

struct PoolStats {
    std::map<std::string, HostPoolStats> hosts;
    int total_open = 0;
};

// A channel opened through the pool, together with the lease that backs it.
struct PooledChannel {
    Lease lease;
    std::unique_ptr<Channel> channel;
};

struct PooledSftp {
    Lease lease;
    std::unique_ptr<SftpChannel> sftp;
};

class ConnectionPool {
public:
    // Called (outside any pool lock) whenever a connection leaves the live
    // set other than by idle eviction: invalidate, degradation, failed probe.
    using LossListener = std::function<void(const std::string& host_id, uint64_t connection_id)>;

    ConnectionPool(std::shared_ptr<TransportFactory> factory, PoolConfig config);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Reaper thread running evict_idle() and heartbeat_idle() every
    // reaper_interval_ms.
    void start();
    void stop();

    // timeout_ms <= 0 uses the configured acquire timeout.
    Result<Lease> acquire(const HostCredential& cred, int timeout_ms = 0);
    void release(Lease& lease);

    // Acquire and open a logical channel. A failed open on a connection that
    // was Idle marks it Degraded, closes it, and retries once on a fresh one.
    Result<PooledChannel> open_channel(const HostCredential& cred, int timeout_ms = 0);
    Result<PooledSftp> open_sftp(const HostCredential& cred, int timeout_ms = 0);

    // Close a leased connection after an I/O failure on it.
    void mark_degraded(const Lease& lease);

    // Force-close every connection of a host and clear its auth-failed mark.
    void invalidate(const std::string& host_id);

    // Close connections idle beyond idle_timeout with zero channels.
    int evict_idle();

    // Keepalive every Idle connection outside the slot lock; dead ones are
    // closed and reported to loss listeners. Returns count closed.
    int heartbeat_idle();

    // Acquire, keepalive, release. A dead connection is closed and reported.
    Result<void> probe(const HostCredential& cred, int timeout_ms = 0);

    PoolStats stats() const;

    // Returns a token for remove_loss_listener().
    int add_loss_listener(LossListener listener);
    void remove_loss_listener(int token);

    const PoolConfig& config() const { return config_; }

private:
    struct PooledConnection {
        uint64_t id = 0;
        std::string host_id;
        std::shared_ptr<Transport> transport;
        ConnectionState state = ConnectionState::Connecting;
        std::chrono::steady_clock::time_point opened_at;
        std::chrono::steady_clock::time_point last_used_at;
        int active_channels = 0;
    };

    struct HostSlot {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::shared_ptr<PooledConnection>> connections;
        int pending_opens = 0;
        int degraded_total = 0;
        bool auth_failed = false;
        std::string auth_error;
    };

    std::shared_ptr<HostSlot> slot_for(const std::string& host_id);
    std::shared_ptr<HostSlot> find_slot(const std::string& host_id) const;

    // Connect with retry/backoff. Only ConnectionError is retried.
    Result<std::unique_ptr<Transport>> open_with_retry(
        const HostCredential& cred, std::chrono::steady_clock::time_point deadline);

    // Remove a connection from the live set and disconnect it.
    void drop_connection(const std::string& host_id, uint64_t connection_id, bool degraded);

    void notify_loss(const std::string& host_id, uint64_t connection_id);
    void reaper_loop();

    std::shared_ptr<TransportFactory> factory_;
    PoolConfig config_;

    mutable std::mutex hosts_mutex_;
    std::map<std::string, std::shared_ptr<HostSlot>> hosts_;

    std::mutex listeners_mutex_;
    std::map<int, LossListener> listeners_;
    int next_listener_ = 1;

    std::atomic<uint64_t> next_id_{1};

    std::thread reaper_;
    std::atomic<bool> running_{false};
};
