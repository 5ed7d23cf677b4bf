#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

// Re-populates cache entries on demand. Implemented by MonitoringCollector.
class CacheRefresher {
public:
    virtual ~CacheRefresher() = default;

    // Host ids the refresher knows how to reach.
    virtual std::vector<std::string> refresh_targets() = 0;

    // Refresh the given hosts (bounded concurrency). Returns hosts refreshed.
    virtual int refresh_hosts(const std::vector<std::string>& host_ids) = 0;
};

template <typename T>
struct CacheEntry {
    std::string key;
    T value;
    std::chrono::steady_clock::time_point written_at;
    std::chrono::milliseconds ttl{0};

    bool expired(std::chrono::steady_clock::time_point now) const {
        return now - written_at > ttl;
    }
};

struct CacheStats {
    int hosts = 0;
    int status_entries = 0;     // live (unexpired) entries
    int container_entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t invalidations = 0;
    uint64_t stale_writes_dropped = 0;
};

// StateCache: short-TTL cache of per-host status and container listings.
//
// Reads never touch the network and never block on I/O; an absent or expired
// entry is reported as ErrorKind::CacheMiss. Expiry is evaluated at read
// time. Every entry is replaced wholesale on write.
//
// Each host has a generation counter bumped by invalidate(). Background
// writers capture generation() before fetching and write with the *_if
// variants, which drop the write if the host was invalidated meanwhile.
class StateCache {
public:
    explicit StateCache(CacheConfig config);

    Result<ServerStatus> get_server_status(const std::string& host_id) const;
    void set_server_status(const std::string& host_id, ServerStatus status);
    bool set_server_status_if(const std::string& host_id, ServerStatus status, uint64_t generation);

    Result<std::vector<ContainerInfo>> get_containers(const std::string& host_id) const;
    void set_containers(const std::string& host_id, std::vector<ContainerInfo> containers);
    bool set_containers_if(const std::string& host_id, std::vector<ContainerInfo> containers,
                           uint64_t generation);

    uint64_t generation(const std::string& host_id) const;

    // Drop both entries of a host.
    void invalidate(const std::string& host_id);

    // Drop only the container listing (mutating container actions).
    void invalidate_containers(const std::string& host_id);

    // Refresh hosts whose entries are missing or expired.
    int update_all_caches();

    // Invalidate every known host and refresh all of them.
    int force_refresh_all_caches();

    void clear();

    void set_refresher(CacheRefresher* refresher);

    CacheStats stats() const;

    const CacheConfig& config() const { return config_; }

private:
    struct HostEntries {
        mutable std::mutex mutex;
        std::optional<CacheEntry<ServerStatus>> status;
        std::optional<CacheEntry<std::vector<ContainerInfo>>> containers;
        uint64_t generation = 0;
    };

    std::shared_ptr<HostEntries> entries_for(const std::string& host_id);
    std::shared_ptr<HostEntries> find(const std::string& host_id) const;

    CacheConfig config_;

    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<HostEntries>> hosts_;

    std::mutex refresher_mutex_;
    CacheRefresher* refresher_ = nullptr;

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidations_{0};
    std::atomic<uint64_t> stale_dropped_{0};
};
