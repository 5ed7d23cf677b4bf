#include "state_cache.hpp"
#include <core/log.hpp>

using Clock = std::chrono::steady_clock;

StateCache::StateCache(CacheConfig config) : config_(config) {}

std::shared_ptr<StateCache::HostEntries> StateCache::entries_for(const std::string& host_id) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& e = hosts_[host_id];
    if (!e) e = std::make_shared<HostEntries>();
    return e;
}

std::shared_ptr<StateCache::HostEntries> StateCache::find(const std::string& host_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = hosts_.find(host_id);
    return it == hosts_.end() ? nullptr : it->second;
}

// ── Server status ───────────────────────────────────────────

Result<ServerStatus> StateCache::get_server_status(const std::string& host_id) const {
    auto e = find(host_id);
    if (e) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (e->status && !e->status->expired(Clock::now())) {
            hits_++;
            return Result<ServerStatus>::Ok(e->status->value);
        }
    }
    misses_++;
    return Result<ServerStatus>::Err(ErrorKind::CacheMiss, "No cached status for " + host_id);
}

void StateCache::set_server_status(const std::string& host_id, ServerStatus status) {
    auto e = entries_for(host_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    e->status = CacheEntry<ServerStatus>{"status:" + host_id, std::move(status), Clock::now(),
                                         std::chrono::seconds(config_.status_ttl_secs)};
}

bool StateCache::set_server_status_if(const std::string& host_id, ServerStatus status,
                                      uint64_t generation) {
    auto e = entries_for(host_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    if (e->generation != generation) {
        stale_dropped_++;
        fleet_log("cache: dropped stale status write for " + host_id);
        return false;
    }
    e->status = CacheEntry<ServerStatus>{"status:" + host_id, std::move(status), Clock::now(),
                                         std::chrono::seconds(config_.status_ttl_secs)};
    return true;
}

// ── Containers ──────────────────────────────────────────────

Result<std::vector<ContainerInfo>> StateCache::get_containers(const std::string& host_id) const {
    auto e = find(host_id);
    if (e) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (e->containers && !e->containers->expired(Clock::now())) {
            hits_++;
            return Result<std::vector<ContainerInfo>>::Ok(e->containers->value);
        }
    }
    misses_++;
    return Result<std::vector<ContainerInfo>>::Err(ErrorKind::CacheMiss,
                                                   "No cached containers for " + host_id);
}

void StateCache::set_containers(const std::string& host_id, std::vector<ContainerInfo> containers) {
    auto e = entries_for(host_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    e->containers = CacheEntry<std::vector<ContainerInfo>>{
        "containers:" + host_id, std::move(containers), Clock::now(),
        std::chrono::seconds(config_.containers_ttl_secs)};
}

bool StateCache::set_containers_if(const std::string& host_id, std::vector<ContainerInfo> containers,
                                   uint64_t generation) {
    auto e = entries_for(host_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    if (e->generation != generation) {
        stale_dropped_++;
        fleet_log("cache: dropped stale container write for " + host_id);
        return false;
    }
    e->containers = CacheEntry<std::vector<ContainerInfo>>{
        "containers:" + host_id, std::move(containers), Clock::now(),
        std::chrono::seconds(config_.containers_ttl_secs)};
    return true;
}

// ── Invalidation ────────────────────────────────────────────

uint64_t StateCache::generation(const std::string& host_id) const {
    auto e = find(host_id);
    if (!e) return 0;
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->generation;
}

void StateCache::invalidate(const std::string& host_id) {
    auto e = entries_for(host_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    e->status.reset();
    e->containers.reset();
    e->generation++;
    invalidations_++;
}

void StateCache::invalidate_containers(const std::string& host_id) {
    auto e = entries_for(host_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    e->containers.reset();
    e->generation++;
    invalidations_++;
}

void StateCache::clear() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    for (auto& [id, e] : hosts_) {
        std::lock_guard<std::mutex> entry_lock(e->mutex);
        e->status.reset();
        e->containers.reset();
        e->generation++;
    }
    fleet_log("cache: cleared");
}

// ── Refresh ─────────────────────────────────────────────────

void StateCache::set_refresher(CacheRefresher* refresher) {
    std::lock_guard<std::mutex> lock(refresher_mutex_);
    refresher_ = refresher;
}

int StateCache::update_all_caches() {
    CacheRefresher* refresher;
    {
        std::lock_guard<std::mutex> lock(refresher_mutex_);
        refresher = refresher_;
    }
    if (!refresher) return 0;

    auto now = Clock::now();
    std::vector<std::string> stale;
    for (const auto& host_id : refresher->refresh_targets()) {
        auto e = find(host_id);
        if (!e) {
            stale.push_back(host_id);
            continue;
        }
        std::lock_guard<std::mutex> lock(e->mutex);
        bool status_ok = e->status && !e->status->expired(now);
        bool containers_ok = e->containers && !e->containers->expired(now);
        if (!status_ok || !containers_ok) stale.push_back(host_id);
    }

    if (stale.empty()) return 0;
    fleet_log(fmt::format("cache: refreshing {} stale host(s)", stale.size()));
    return refresher->refresh_hosts(stale);
}

int StateCache::force_refresh_all_caches() {
    CacheRefresher* refresher;
    {
        std::lock_guard<std::mutex> lock(refresher_mutex_);
        refresher = refresher_;
    }
    if (!refresher) return 0;

    auto targets = refresher->refresh_targets();
    for (const auto& host_id : targets) {
        invalidate(host_id);
    }
    fleet_log(fmt::format("cache: force refresh of {} host(s)", targets.size()));
    return refresher->refresh_hosts(targets);
}

CacheStats StateCache::stats() const {
    std::vector<std::shared_ptr<HostEntries>> entries;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (const auto& [id, e] : hosts_) entries.push_back(e);
    }

    CacheStats st;
    auto now = Clock::now();
    st.hosts = static_cast<int>(entries.size());
    for (const auto& e : entries) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (e->status && !e->status->expired(now)) st.status_entries++;
        if (e->containers && !e->containers->expired(now)) st.container_entries++;
    }
    st.hits = hits_;
    st.misses = misses_;
    st.invalidations = invalidations_;
    st.stale_writes_dropped = stale_dropped_;
    return st;
}
