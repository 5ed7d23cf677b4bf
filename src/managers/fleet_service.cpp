#include "fleet_service.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <ssh/libssh2_transport.hpp>
#include <fmt/format.h>

namespace {

std::string percent_or_dash(double v) {
    if (v < 0) return "-";
    return fmt::format("{:.0f}%", v);
}

}  // namespace

// ── StaticHostDirectory ─────────────────────────────────────

StaticHostDirectory::StaticHostDirectory(std::vector<HostCredential> hosts)
    : hosts_(std::move(hosts)) {}

std::vector<HostCredential> StaticHostDirectory::active_hosts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return hosts_;
}

std::optional<HostCredential> StaticHostDirectory::find(const std::string& host_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& h : hosts_) {
        if (h.host_id == host_id) return h;
    }
    return std::nullopt;
}

void StaticHostDirectory::set_hosts(std::vector<HostCredential> hosts) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_ = std::move(hosts);
}

// ── Construction / Destruction ──────────────────────────────

FleetService::FleetService(Config config, std::shared_ptr<TransportFactory> factory,
                           std::shared_ptr<HostDirectory> hosts)
    : config_(std::move(config)), factory_(std::move(factory)), hosts_(std::move(hosts)) {
    if (!factory_) {
        factory_ = std::make_shared<Libssh2TransportFactory>(config_.transfers().op_timeout_secs);
    }
    if (!hosts_) {
        hosts_ = std::make_shared<StaticHostDirectory>(config_.hosts());
    }

    pool_ = std::make_unique<ConnectionPool>(factory_, config_.pool());
    mux_ = std::make_unique<SessionMultiplexer>(*pool_, config_.sessions());
    cache_ = std::make_unique<StateCache>(config_.cache());
    history_ = std::make_unique<HistoryStore>(config_.history_file());
    workers_ = std::make_unique<WorkerPool>(static_cast<std::size_t>(config_.workers()), "fleet-workers");
    containers_ = std::make_unique<ContainerManager>(*mux_, *cache_,
                                                     config_.collector().command_timeout_secs);
    transfers_ = std::make_unique<FileTransferManager>(*pool_, *workers_, config_.transfers());
    collector_ = std::make_unique<MonitoringCollector>(*mux_, *pool_, *cache_, *history_, *hosts_,
                                                       *workers_, config_.collector());
    cache_->set_refresher(collector_.get());
}

FleetService::~FleetService() {
    stop();
    cache_->set_refresher(nullptr);
}

// ── Lifecycle ───────────────────────────────────────────────

Result<void> FleetService::start(bool with_collector) {
    if (running_) return Result<void>::Ok();

    auto loaded = history_->load();
    if (loaded.is_err()) {
        // Start with an empty history rather than refusing to run
        fleet_log_error("service: history load", loaded);
    }

    pool_->start();
    mux_->start();
    if (with_collector) collector_->start();
    running_ = true;
    fleet_log(fmt::format("service: started ({} host(s), {} worker(s))",
                          hosts_->active_hosts().size(), config_.workers()));
    return Result<void>::Ok();
}

void FleetService::stop() {
    if (!running_) return;
    running_ = false;

    collector_->stop();
    transfers_->shutdown();
    mux_->stop();
    pool_->stop();

    auto saved = history_->save();
    if (saved.is_err()) fleet_log_error("service: history save", saved);
    fleet_log("service: stopped");
}

// ── Convenience operations ──────────────────────────────────

Result<HostCredential> FleetService::resolve(const std::string& host_id) {
    auto cred = hosts_->find(host_id);
    if (!cred) {
        return Result<HostCredential>::Err(ErrorKind::NotFound, "Unknown host: " + host_id);
    }
    return Result<HostCredential>::Ok(*cred);
}

Result<CommandResult> FleetService::exec(const std::string& host_id, const std::string& command,
                                         int timeout_secs) {
    auto cred = resolve(host_id);
    if (cred.is_err()) return Result<CommandResult>::From(cred);
    return mux_->run_once(cred.value, command, timeout_secs);
}

std::vector<HostSummary> FleetService::fleet_overview(bool refresh) {
    if (refresh) cache_->force_refresh_all_caches();
    else cache_->update_all_caches();

    std::vector<HostSummary> rows;
    for (const auto& cred : hosts_->active_hosts()) {
        HostSummary row;
        row.host_id = cred.host_id;
        row.address = cred.address;
        row.latency = "-";
        row.cpu = row.ram = row.disk = "-";
        row.containers = "-";
        row.uptime = "-";

        auto st = cache_->get_server_status(cred.host_id);
        if (st.is_ok()) {
            const auto& s = st.value;
            row.online = s.online;
            row.error = s.error;
            row.checked_at = s.checked_at;
            if (s.online) {
                row.latency = s.latency_ms > 0 ? fmt::format("{:.0f}ms", s.latency_ms) : "-";
                row.cpu = percent_or_dash(s.cpu_percent);
                row.ram = percent_or_dash(s.ram_percent);
                row.disk = percent_or_dash(s.disk_percent);
                row.containers = fmt::format("{}/{}", s.containers_running, s.containers_total);
                if (s.uptime_secs > 0) row.uptime = format_duration(s.uptime_secs);
            }
        }
        rows.push_back(row);
    }
    return rows;
}

void FleetService::update_credentials(const std::string& host_id) {
    pool_->invalidate(host_id);
    cache_->invalidate(host_id);
    fleet_log("service: credentials changed for " + host_id);
}
