#include "monitoring_collector.hpp"
#include "stats_parser.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <condition_variable>
#include <ctime>
#include <memory>

namespace {

// Battery layout: fixed commands first, one ping per target after.
enum BatteryIndex {
    kDockerInfo = 0,
    kUptime,
    kLoad,
    kCpu,
    kRam,
    kDisk,
    kContainers,
    kContainerStats,
    kFirstPing,
};

constexpr const char* kSelfTarget = "Self";

}  // namespace

// ── Construction / Destruction ──────────────────────────────

MonitoringCollector::MonitoringCollector(SessionMultiplexer& mux, ConnectionPool& pool,
                                         StateCache& cache, HistoryStore& history,
                                         HostDirectory& hosts, WorkerPool& workers,
                                         CollectorConfig config)
    : mux_(mux), pool_(pool), cache_(cache), history_(history), hosts_(hosts),
      workers_(workers), config_(std::move(config)) {
    if (config_.concurrency < 1) config_.concurrency = 1;
}

MonitoringCollector::~MonitoringCollector() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool MonitoringCollector::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&MonitoringCollector::collector_loop, this);
    fleet_log(fmt::format("collector: started (interval {}s, concurrency {})",
                          config_.interval_secs, config_.concurrency));
    return true;
}

void MonitoringCollector::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    fleet_log("collector: stopped");
}

void MonitoringCollector::collector_loop() {
    auto last_cleanup = std::chrono::steady_clock::now();

    while (running_) {
        collect_all();

        auto since_cleanup = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - last_cleanup).count();
        if (since_cleanup >= config_.cleanup_interval_secs) {
            cleanup_old_data(config_.retention_days);
            last_cleanup = std::chrono::steady_clock::now();
        }

        // Sleep the interval in 100ms increments for responsive shutdown
        int ticks = config_.interval_secs * 10;
        for (int i = 0; i < ticks && running_; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

// ── Sweeps ──────────────────────────────────────────────────

int MonitoringCollector::collect_all() {
    auto started = std::chrono::steady_clock::now();
    auto creds = hosts_.active_hosts();

    int ok = run_bounded(creds);

    double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.sweeps++;
        stats_.last_sweep_at = now_iso();
        stats_.last_sweep_ms = ms;
    }
    fleet_log(fmt::format("collector: sweep done, {}/{} host(s) ok in {:.0f}ms",
                          ok, creds.size(), ms));

    auto saved = history_.save();
    if (saved.is_err()) fleet_log_error("collector: history save", saved);
    return ok;
}

int MonitoringCollector::run_bounded(const std::vector<HostCredential>& creds) {
    // Shared with the jobs so it outlives a job finishing after the wait.
    struct Gate {
        std::mutex mutex;
        std::condition_variable cv;
        int in_flight = 0;
        int ok = 0;
        int failed = 0;
    };
    auto gate = std::make_shared<Gate>();

    for (const auto& cred : creds) {
        {
            std::unique_lock<std::mutex> lock(gate->mutex);
            gate->cv.wait(lock, [&] { return gate->in_flight < config_.concurrency; });
            gate->in_flight++;
        }

        auto job = [this, gate, cred]() {
            bool success = false;
            try {
                success = collect_system_data(cred).is_ok();
            } catch (const std::exception& e) {
                fleet_log(fmt::format("collector: {} threw: {}", cred.host_id, e.what()));
            }
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (success) gate->ok++; else gate->failed++;
            gate->in_flight--;
            gate->cv.notify_all();
        };

        if (!workers_.submit(job)) {
            job();
        }
    }

    std::unique_lock<std::mutex> lock(gate->mutex);
    gate->cv.wait(lock, [&] { return gate->in_flight == 0; });

    {
        std::lock_guard<std::mutex> slock(stats_mutex_);
        stats_.hosts_ok += gate->ok;
        stats_.hosts_failed += gate->failed;
    }
    return gate->ok;
}

// ── Per-host collection ─────────────────────────────────────

ServerStatus MonitoringCollector::offline_status(const std::string& host_id,
                                                 const std::string& error) const {
    ServerStatus st;
    st.host_id = host_id;
    st.online = false;
    st.error = error;
    st.checked_at = now_iso();
    return st;
}

Result<ServerStatus> MonitoringCollector::collect_system_data(const HostCredential& cred) {
    uint64_t gen = cache_.generation(cred.host_id);

    std::vector<std::string> commands = {
        docker_info_command(),
        uptime_command(),
        load_average_command(),
        cpu_usage_command(),
        ram_usage_command(),
        disk_usage_command(),
        container_list_command(),
        container_stats_command(),
    };
    for (const auto& t : config_.ping_targets) {
        commands.push_back(ping_command(t.host));
    }

    auto sid = mux_.create_session(cred, SessionKind::Batch);
    if (sid.is_err()) {
        fleet_log_error("collector: " + cred.host_id, sid);
        cache_.set_server_status_if(cred.host_id, offline_status(cred.host_id, sid.error), gen);
        return Result<ServerStatus>::From(sid);
    }

    auto batch = mux_.execute_batch_commands(sid.value, commands, config_.command_timeout_secs);
    mux_.close_session(sid.value);

    if (batch.is_err()) {
        fleet_log_error("collector: " + cred.host_id, batch);
        cache_.set_server_status_if(cred.host_id, offline_status(cred.host_id, batch.error), gen);
        return Result<ServerStatus>::From(batch);
    }
    const auto& r = batch.value;

    ServerStatus st;
    st.host_id = cred.host_id;
    st.online = true;
    st.checked_at = now_iso();

    DockerInfo docker = parse_docker_info(r[kDockerInfo].stdout_data);
    if (docker.valid) {
        st.docker_version = docker.version;
        st.containers_running = docker.running;
        st.containers_total = docker.total;
    }
    st.uptime_secs = parse_uptime_seconds(trimmed(r[kUptime].stdout_data));
    st.load_average = trimmed(r[kLoad].stdout_data);
    st.cpu_percent = parse_percent(r[kCpu].stdout_data);
    st.ram_percent = parse_percent(r[kRam].stdout_data);
    st.disk_percent = parse_percent(r[kDisk].stdout_data);

    std::vector<ContainerInfo> containers;
    if (r[kContainers].succeeded()) {
        containers = parse_container_list(r[kContainers].stdout_data);
    }

    if (config_.ping_targets.empty()) {
        // No targets: the command round trip stands in for latency
        st.latencies[kSelfTarget] = r[kUptime].latency_ms;
    } else {
        for (std::size_t i = 0; i < config_.ping_targets.size(); i++) {
            std::size_t idx = kFirstPing + i;
            double ms = idx < r.size() ? parse_ping_latency(r[idx].stdout_data) : -1.0;
            st.latencies[config_.ping_targets[i].name] = ms;
        }
    }
    st.latency_ms = average_latency(st.latencies);

    if (!cache_.set_server_status_if(cred.host_id, st, gen) ||
        !cache_.set_containers_if(cred.host_id, containers, gen)) {
        fleet_log(fmt::format("collector: {} invalidated during fetch, result not cached",
                              cred.host_id));
    }

    std::time_t ts = std::time(nullptr);
    std::vector<MonitoringSample> samples;
    for (const auto& [target, ms] : st.latencies) {
        MonitoringSample s;
        s.host_id = cred.host_id;
        s.target = target;
        s.latency_ms = ms;
        s.cpu_percent = st.cpu_percent;
        s.ram_percent = st.ram_percent;
        s.disk_percent = st.disk_percent;
        s.containers_running = st.containers_running;
        s.containers_total = st.containers_total;
        s.timestamp = ts;
        samples.push_back(s);
    }
    history_.append(samples);

    // No daemon, or no running containers: the host sample still stands
    if (r[kContainerStats].succeeded()) {
        history_.append_containers(stamp_container_stats(cred.host_id, r[kContainerStats], ts));
    }

    return Result<ServerStatus>::Ok(st);
}

std::vector<ContainerStatsSample> MonitoringCollector::stamp_container_stats(
        const std::string& host_id, const CommandResult& r, std::time_t ts) const {
    auto rows = parse_docker_stats(r.stdout_data);
    for (auto& row : rows) {
        row.host_id = host_id;
        row.timestamp = ts;
    }
    return rows;
}

Result<std::vector<ContainerInfo>> MonitoringCollector::collect_container_data(
        const HostCredential& cred) {
    using ContainersResult = Result<std::vector<ContainerInfo>>;
    uint64_t gen = cache_.generation(cred.host_id);

    auto sid = mux_.create_session(cred, SessionKind::Batch);
    if (sid.is_err()) {
        fleet_log_error("collector: containers " + cred.host_id, sid);
        return ContainersResult::From(sid);
    }
    auto batch = mux_.execute_batch_commands(sid.value,
                                             {container_list_command(), container_stats_command()},
                                             config_.command_timeout_secs);
    mux_.close_session(sid.value);

    if (batch.is_err()) {
        fleet_log_error("collector: containers " + cred.host_id, batch);
        return ContainersResult::From(batch);
    }
    const auto& list = batch.value[0];
    const auto& stats = batch.value[1];
    if (list.failed()) {
        fleet_log_cmd("collector: docker ps", container_list_command(), list);
        return ContainersResult::Err(
            ErrorKind::CommandFailed,
            fmt::format("docker ps exited {}: {}", list.exit_code, trimmed(list.stderr_data)));
    }

    auto containers = parse_container_list(list.stdout_data);
    cache_.set_containers_if(cred.host_id, containers, gen);

    if (stats.succeeded()) {
        auto rows = stamp_container_stats(cred.host_id, stats, std::time(nullptr));
        fleet_log(fmt::format("collector: {} container sample(s) from {}", rows.size(), cred.host_id));
        history_.append_containers(rows);
    } else {
        fleet_log_cmd("collector: docker stats", container_stats_command(), stats);
    }
    return ContainersResult::Ok(containers);
}

Result<ServerStatus> MonitoringCollector::check_server_connection(const std::string& host_id,
                                                                  bool force_real_time) {
    if (!force_real_time) {
        auto cached = cache_.get_server_status(host_id);
        if (cached.is_ok()) return cached;
    }

    auto cred = hosts_.find(host_id);
    if (!cred) {
        return Result<ServerStatus>::Err(ErrorKind::NotFound, "Unknown host: " + host_id);
    }

    auto probe = pool_.probe(*cred, pool_.config().connect_timeout_ms);
    if (probe.is_err()) {
        ServerStatus st = offline_status(host_id, probe.error);
        cache_.set_server_status_if(host_id, st, cache_.generation(host_id));
        return Result<ServerStatus>::Ok(st);
    }

    auto st = collect_system_data(*cred);
    if (st.is_err()) {
        return Result<ServerStatus>::Ok(offline_status(host_id, st.error));
    }
    return st;
}

int MonitoringCollector::cleanup_old_data(int retention_days) {
    int removed = history_.cleanup_old_data(retention_days);
    auto saved = history_.save();
    if (saved.is_err()) fleet_log_error("collector: history save", saved);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.last_cleanup_at = now_iso();
    return removed;
}

Result<void> MonitoringCollector::refresh_host(const std::string& host_id) {
    auto cred = hosts_.find(host_id);
    if (!cred) {
        return Result<void>::Err(ErrorKind::NotFound, "Unknown host: " + host_id);
    }
    auto r = collect_system_data(*cred);
    if (r.is_err()) return Result<void>::From(r);
    return Result<void>::Ok();
}

// ── CacheRefresher ──────────────────────────────────────────

std::vector<std::string> MonitoringCollector::refresh_targets() {
    std::vector<std::string> ids;
    for (const auto& c : hosts_.active_hosts()) ids.push_back(c.host_id);
    return ids;
}

int MonitoringCollector::refresh_hosts(const std::vector<std::string>& host_ids) {
    std::vector<HostCredential> creds;
    for (const auto& id : host_ids) {
        auto cred = hosts_.find(id);
        if (cred) {
            creds.push_back(*cred);
        } else {
            fleet_log("collector: refresh skipped unknown host " + id);
        }
    }
    return run_bounded(creds);
}

CollectorStats MonitoringCollector::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}
