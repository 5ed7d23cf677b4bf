#include "connection_pool.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <algorithm>

using Clock = std::chrono::steady_clock;

const char* connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Idle:       return "idle";
        case ConnectionState::Busy:       return "busy";
        case ConnectionState::Degraded:   return "degraded";
        case ConnectionState::Closed:     return "closed";
    }
    return "unknown";
}

// ── Construction / Destruction ──────────────────────────────

ConnectionPool::ConnectionPool(std::shared_ptr<TransportFactory> factory, PoolConfig config)
    : factory_(std::move(factory)), config_(config) {}

ConnectionPool::~ConnectionPool() {
    stop();

    // Listeners may already be gone; close quietly.
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    for (auto& [id, slot] : hosts_) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        for (auto& c : slot->connections) {
            c->transport->disconnect();
        }
        slot->connections.clear();
    }
}

// ── Lifecycle ───────────────────────────────────────────────

void ConnectionPool::start() {
    if (running_) return;
    running_ = true;
    reaper_ = std::thread(&ConnectionPool::reaper_loop, this);
    fleet_log("pool: reaper started");
}

void ConnectionPool::stop() {
    if (!running_) return;
    running_ = false;
    if (reaper_.joinable()) {
        reaper_.join();
    }
    fleet_log("pool: reaper stopped");
}

void ConnectionPool::reaper_loop() {
    while (running_) {
        // Sleep in 100ms increments so stop() is responsive
        for (int waited = 0; waited < config_.reaper_interval_ms && running_; waited += 100) {
            platform::sleep_ms(100);
        }
        if (!running_) break;

        int evicted = evict_idle();
        if (evicted > 0) {
            fleet_log(fmt::format("pool: evicted {} idle connection(s)", evicted));
        }
        int dead = heartbeat_idle();
        if (dead > 0) {
            fleet_log(fmt::format("pool: heartbeat closed {} dead connection(s)", dead));
        }
    }
}

// ── Host slots ──────────────────────────────────────────────

std::shared_ptr<ConnectionPool::HostSlot> ConnectionPool::slot_for(const std::string& host_id) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    auto& slot = hosts_[host_id];
    if (!slot) slot = std::make_shared<HostSlot>();
    return slot;
}

std::shared_ptr<ConnectionPool::HostSlot> ConnectionPool::find_slot(const std::string& host_id) const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    auto it = hosts_.find(host_id);
    return it == hosts_.end() ? nullptr : it->second;
}

// ── Acquire / release ───────────────────────────────────────

Result<Lease> ConnectionPool::acquire(const HostCredential& cred, int timeout_ms) {
    if (cred.host_id.empty()) {
        return Result<Lease>::Err(ErrorKind::InvalidArgument, "Credential has no host id");
    }

    int effective = timeout_ms > 0 ? timeout_ms : config_.acquire_timeout_ms;
    auto deadline = Clock::now() + std::chrono::milliseconds(effective);
    auto slot = slot_for(cred.host_id);

    std::unique_lock<std::mutex> lock(slot->mutex);
    while (true) {
        if (slot->auth_failed) {
            return Result<Lease>::Err(ErrorKind::AuthError, slot->auth_error);
        }

        // Reuse the least loaded live connection with spare capacity
        std::shared_ptr<PooledConnection> best;
        for (const auto& conn : slot->connections) {
            if (conn->state != ConnectionState::Idle && conn->state != ConnectionState::Busy) continue;
            if (conn->active_channels >= config_.channels_per_connection) continue;
            if (!best || conn->active_channels < best->active_channels) best = conn;
        }
        if (best) {
            Lease lease;
            lease.host_id = cred.host_id;
            lease.connection_id = best->id;
            lease.transport = best->transport;
            lease.reused_idle = best->state == ConnectionState::Idle;
            best->active_channels++;
            best->state = ConnectionState::Busy;
            best->last_used_at = Clock::now();
            return Result<Lease>::Ok(std::move(lease));
        }

        // Open a new connection under the per-host cap
        int open_or_opening = static_cast<int>(slot->connections.size()) + slot->pending_opens;
        if (open_or_opening < config_.max_connections_per_host) {
            slot->pending_opens++;
            lock.unlock();

            auto opened = open_with_retry(cred, deadline);

            lock.lock();
            slot->pending_opens--;
            if (opened.is_err()) {
                if (opened.kind == ErrorKind::AuthError) {
                    slot->auth_failed = true;
                    slot->auth_error = opened.error;
                }
                slot->cv.notify_all();
                return Result<Lease>::From(opened);
            }

            auto conn = std::make_shared<PooledConnection>();
            conn->id = next_id_++;
            conn->host_id = cred.host_id;
            conn->transport = std::shared_ptr<Transport>(std::move(opened.value));
            conn->state = ConnectionState::Busy;
            conn->opened_at = Clock::now();
            conn->last_used_at = conn->opened_at;
            conn->active_channels = 1;
            slot->connections.push_back(conn);
            slot->cv.notify_all();

            fleet_log(fmt::format("pool: opened connection {} to {} ({} open)",
                                  conn->id, cred.host_id, slot->connections.size()));

            Lease lease;
            lease.host_id = cred.host_id;
            lease.connection_id = conn->id;
            lease.transport = conn->transport;
            return Result<Lease>::Ok(std::move(lease));
        }

        // At capacity: wait for a release, a close, or the deadline
        if (slot->cv.wait_until(lock, deadline) == std::cv_status::timeout && Clock::now() >= deadline) {
            return Result<Lease>::Err(ErrorKind::TimedOut,
                fmt::format("Timed out waiting for a connection to {} ({} connection(s) at capacity)",
                            cred.host_id, slot->connections.size()));
        }
    }
}

void ConnectionPool::release(Lease& lease) {
    if (!lease.valid()) return;

    auto slot = find_slot(lease.host_id);
    if (slot) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& conn : slot->connections) {
            if (conn->id != lease.connection_id) continue;
            if (conn->active_channels > 0) conn->active_channels--;
            conn->last_used_at = Clock::now();
            if (conn->active_channels == 0 && conn->state == ConnectionState::Busy) {
                conn->state = ConnectionState::Idle;
            }
            break;
        }
        slot->cv.notify_all();
    }

    lease.transport.reset();
    lease.connection_id = 0;
}

Result<std::unique_ptr<Transport>> ConnectionPool::open_with_retry(
        const HostCredential& cred, Clock::time_point deadline) {
    Result<std::unique_ptr<Transport>> last =
        Result<std::unique_ptr<Transport>>::Err(ErrorKind::ConnectionError, "No connection attempt made");

    for (int attempt = 0; attempt < config_.retry_attempts; attempt++) {
        if (attempt > 0) {
            long long backoff = static_cast<long long>(config_.retry_base_ms) << (attempt - 1);
            backoff = std::min<long long>(backoff, config_.retry_cap_ms);
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (remaining <= backoff) break;
            fleet_log(fmt::format("pool: retrying {} in {}ms (attempt {}/{})",
                                  cred.host_id, backoff, attempt + 1, config_.retry_attempts));
            platform::sleep_ms(static_cast<int>(backoff));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        int connect_timeout = static_cast<int>(std::min<long long>(config_.connect_timeout_ms,
                                                                   std::max<long long>(remaining, 1)));

        last = factory_->connect(cred, connect_timeout);
        if (last.is_ok()) return last;

        fleet_log_error("pool: connect " + cred.host_id, last);
        if (last.kind != ErrorKind::ConnectionError) return last;
    }
    return last;
}

// ── Channels ────────────────────────────────────────────────

Result<PooledChannel> ConnectionPool::open_channel(const HostCredential& cred, int timeout_ms) {
    for (int attempt = 0; attempt < 2; attempt++) {
        auto lease = acquire(cred, timeout_ms);
        if (lease.is_err()) return Result<PooledChannel>::From(lease);

        auto ch = lease.value.transport->open_channel();
        if (ch.is_ok()) {
            PooledChannel pc;
            pc.lease = std::move(lease.value);
            pc.channel = std::move(ch.value);
            return Result<PooledChannel>::Ok(std::move(pc));
        }

        fleet_log_error("pool: open channel on " + cred.host_id, ch);
        bool was_idle = lease.value.reused_idle;
        if (!was_idle || attempt > 0) {
            release(lease.value);
            return Result<PooledChannel>::From(ch);
        }
        mark_degraded(lease.value);
        release(lease.value);
    }
    return Result<PooledChannel>::Err(ErrorKind::ConnectionError, "Failed to open channel");
}

Result<PooledSftp> ConnectionPool::open_sftp(const HostCredential& cred, int timeout_ms) {
    for (int attempt = 0; attempt < 2; attempt++) {
        auto lease = acquire(cred, timeout_ms);
        if (lease.is_err()) return Result<PooledSftp>::From(lease);

        auto sftp = lease.value.transport->open_sftp();
        if (sftp.is_ok()) {
            PooledSftp ps;
            ps.lease = std::move(lease.value);
            ps.sftp = std::move(sftp.value);
            return Result<PooledSftp>::Ok(std::move(ps));
        }

        fleet_log_error("pool: open sftp on " + cred.host_id, sftp);
        bool was_idle = lease.value.reused_idle;
        if (!was_idle || attempt > 0) {
            release(lease.value);
            return Result<PooledSftp>::From(sftp);
        }
        mark_degraded(lease.value);
        release(lease.value);
    }
    return Result<PooledSftp>::Err(ErrorKind::ConnectionError, "Failed to open SFTP channel");
}

// ── Closing connections ─────────────────────────────────────

void ConnectionPool::drop_connection(const std::string& host_id, uint64_t connection_id, bool degraded) {
    auto slot = find_slot(host_id);
    if (!slot) return;

    std::shared_ptr<PooledConnection> dropped;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto it = std::find_if(slot->connections.begin(), slot->connections.end(),
                               [&](const auto& c) { return c->id == connection_id; });
        if (it == slot->connections.end()) return;
        dropped = *it;
        dropped->state = degraded ? ConnectionState::Degraded : ConnectionState::Closed;
        if (degraded) slot->degraded_total++;
        slot->connections.erase(it);
        slot->cv.notify_all();
    }

    dropped->transport->disconnect();
    dropped->state = ConnectionState::Closed;
    fleet_log(fmt::format("pool: closed connection {} to {}{}", connection_id, host_id,
                          degraded ? " (degraded)" : ""));
    notify_loss(host_id, connection_id);
}

void ConnectionPool::mark_degraded(const Lease& lease) {
    if (!lease.valid()) return;
    drop_connection(lease.host_id, lease.connection_id, true);
}

void ConnectionPool::invalidate(const std::string& host_id) {
    auto slot = find_slot(host_id);
    if (!slot) return;

    std::vector<std::shared_ptr<PooledConnection>> closing;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        closing.swap(slot->connections);
        slot->auth_failed = false;
        slot->auth_error.clear();
        for (auto& c : closing) c->state = ConnectionState::Closed;
        slot->cv.notify_all();
    }

    for (auto& c : closing) {
        c->transport->disconnect();
    }
    if (!closing.empty()) {
        fleet_log(fmt::format("pool: invalidated {} ({} connection(s) closed)", host_id, closing.size()));
    }
    for (auto& c : closing) {
        notify_loss(host_id, c->id);
    }
}

int ConnectionPool::evict_idle() {
    std::vector<std::shared_ptr<HostSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(hosts_mutex_);
        for (const auto& [id, slot] : hosts_) slots.push_back(slot);
    }

    auto cutoff = Clock::now() - std::chrono::seconds(config_.idle_timeout_secs);
    int evicted = 0;
    for (const auto& slot : slots) {
        std::vector<std::shared_ptr<PooledConnection>> idle;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            auto it = slot->connections.begin();
            while (it != slot->connections.end()) {
                const auto& c = *it;
                if (c->active_channels == 0 && c->last_used_at <= cutoff) {
                    c->state = ConnectionState::Closed;
                    idle.push_back(c);
                    it = slot->connections.erase(it);
                } else {
                    ++it;
                }
            }
            if (!idle.empty()) slot->cv.notify_all();
        }
        for (auto& c : idle) {
            c->transport->disconnect();
            evicted++;
        }
    }
    return evicted;
}

int ConnectionPool::heartbeat_idle() {
    std::vector<std::pair<std::string, std::shared_ptr<HostSlot>>> slots;
    {
        std::lock_guard<std::mutex> lock(hosts_mutex_);
        for (const auto& [id, slot] : hosts_) slots.emplace_back(id, slot);
    }

    int dead = 0;
    for (const auto& [host_id, slot] : slots) {
        std::vector<std::shared_ptr<PooledConnection>> idle;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            for (const auto& c : slot->connections) {
                if (c->state == ConnectionState::Idle && c->active_channels == 0) idle.push_back(c);
            }
        }
        // check_alive does network I/O; the slot stays free for acquirers
        for (const auto& c : idle) {
            if (c->transport->check_alive()) continue;
            fleet_log(fmt::format("pool: heartbeat failed on connection {} to {}", c->id, host_id));
            drop_connection(host_id, c->id, true);
            dead++;
        }
    }
    return dead;
}

Result<void> ConnectionPool::probe(const HostCredential& cred, int timeout_ms) {
    auto lease = acquire(cred, timeout_ms);
    if (lease.is_err()) return Result<void>::From(lease);

    bool alive = lease.value.transport->check_alive();
    if (!alive) {
        mark_degraded(lease.value);
        release(lease.value);
        return Result<void>::Err(ErrorKind::ConnectionError, "Connection to " + cred.host_id + " is dead");
    }
    release(lease.value);
    return Result<void>::Ok();
}

// ── Observability ───────────────────────────────────────────

PoolStats ConnectionPool::stats() const {
    std::vector<std::pair<std::string, std::shared_ptr<HostSlot>>> slots;
    {
        std::lock_guard<std::mutex> lock(hosts_mutex_);
        for (const auto& [id, slot] : hosts_) slots.emplace_back(id, slot);
    }

    PoolStats out;
    for (const auto& [id, slot] : slots) {
        HostPoolStats hs;
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& c : slot->connections) {
            hs.open++;
            hs.channels += c->active_channels;
            if (c->state == ConnectionState::Idle) hs.idle++;
            else if (c->state == ConnectionState::Busy) hs.busy++;
        }
        hs.degraded = slot->degraded_total;
        hs.auth_failed = slot->auth_failed;
        out.total_open += hs.open;
        out.hosts[id] = hs;
    }
    return out;
}

int ConnectionPool::add_loss_listener(LossListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int token = next_listener_++;
    listeners_[token] = std::move(listener);
    return token;
}

void ConnectionPool::remove_loss_listener(int token) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(token);
}

void ConnectionPool::notify_loss(const std::string& host_id, uint64_t connection_id) {
    std::vector<LossListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [token, l] : listeners_) listeners.push_back(l);
    }
    for (const auto& l : listeners) {
        l(host_id, connection_id);
    }
}
