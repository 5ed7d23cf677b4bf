#include "fleet_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <ctime>
#include <iostream>

FleetCLI::FleetCLI(std::string config_path) : config_path_(std::move(config_path)) {}

Result<void> FleetCLI::ensure_service() {
    if (service_) return Result<void>::Ok();

    auto config = config_path_.empty() ? Config::load_global() : Config::load_file(config_path_);
    if (config.is_err()) return Result<void>::From(config);

    service_ = std::make_unique<FleetService>(config.value);
    // One-shot commands: no background sweep
    return service_->start(false);
}

int FleetCLI::report(const std::string& what, const std::string& error, ErrorKind kind) {
    std::cout << theme::fail(fmt::format("{}: {} ({})", what, error, error_kind_name(kind)));
    return 1;
}

// ── Dispatch ────────────────────────────────────────────────

int FleetCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& cmd = args[0];
    auto arg = [&](std::size_t i) { return i < args.size() ? args[i] : std::string(); };
    auto has_flag = [&](const std::string& flag) {
        for (std::size_t i = 1; i < args.size(); i++) {
            if (args[i] == flag) return true;
        }
        return false;
    };

    if (cmd == "init") return cmd_init();

    auto svc = ensure_service();
    if (svc.is_err()) {
        std::cout << theme::fail(svc.error);
        if (svc.kind == ErrorKind::NotFound) {
            std::cout << theme::step("Run `fleetlink init` to create a config file.");
        }
        return 1;
    }

    if (cmd == "status") return cmd_status(has_flag("--refresh"));
    if (cmd == "collect") return cmd_collect();
    if (cmd == "stats") return cmd_stats();

    if (args.size() < 2) {
        std::cout << theme::fail("Missing host for `" + cmd + "`");
        print_usage();
        return 1;
    }
    const std::string& host = args[1];

    if (cmd == "exec") {
        std::string command;
        for (std::size_t i = 2; i < args.size(); i++) {
            if (!command.empty()) command += " ";
            command += args[i];
        }
        if (command.empty()) {
            std::cout << theme::fail("Usage: fleetlink exec <host> <command...>");
            return 1;
        }
        return cmd_exec(host, command);
    }
    if (cmd == "containers") return cmd_containers(host, has_flag("--live"));
    if (cmd == "start" || cmd == "stop" || cmd == "restart" || cmd == "rm") {
        if (arg(2).empty()) {
            std::cout << theme::fail(fmt::format("Usage: fleetlink {} <host> <container>", cmd));
            return 1;
        }
        return cmd_container_action(cmd, host, arg(2));
    }
    if (cmd == "logs") {
        if (arg(2).empty()) {
            std::cout << theme::fail("Usage: fleetlink logs <host> <container> [lines]");
            return 1;
        }
        return cmd_logs(host, arg(2), arg(3).empty() ? 100 : safe_stoi(arg(3), 100));
    }
    if (cmd == "ls") return cmd_ls(host, arg(2).empty() ? "." : arg(2));
    if (cmd == "put" || cmd == "get") {
        if (arg(2).empty() || arg(3).empty()) {
            std::cout << theme::fail(fmt::format("Usage: fleetlink {} <host> <from> <to>", cmd));
            return 1;
        }
        return cmd_transfer(cmd == "put", host, arg(2), arg(3));
    }
    if (cmd == "mkdir") return cmd_mkdir(host, arg(2));
    if (cmd == "rmr") return cmd_rm(host, arg(2), true);
    if (cmd == "del") return cmd_rm(host, arg(2), false);
    if (cmd == "history") return cmd_history(host);

    std::cout << theme::fail("Unknown command: " + cmd);
    print_usage();
    return 1;
}

// ── Commands ────────────────────────────────────────────────

int FleetCLI::cmd_init() {
    auto r = create_default_global_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Config at " + get_global_config_path().string());
    return 0;
}

int FleetCLI::cmd_status(bool refresh) {
    // A fresh process has an empty cache, so every host is fetched either way
    auto rows = service_->fleet_overview(refresh);
    std::cout << theme::section("Fleet");
    if (rows.empty()) {
        std::cout << theme::info("No hosts configured");
        return 0;
    }

    std::cout << theme::dim(fmt::format("    {:<16}{:<9}{:<9}{:<7}{:<7}{:<7}{:<8}{}",
                                        "HOST", "STATE", "LATENCY", "CPU", "RAM", "DISK",
                                        "CTRS", "UPTIME")) << "\n";
    for (const auto& r : rows) {
        std::cout << fmt::format("    {:<16}", r.host_id) << theme::host_state(r.online)
                  << fmt::format("{:<9}{:<7}{:<7}{:<7}{:<8}{}", r.latency, r.cpu, r.ram,
                                 r.disk, r.containers, r.uptime) << "\n";
        if (!r.online && !r.error.empty()) {
            std::cout << theme::dim("      " + r.error) << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

int FleetCLI::cmd_exec(const std::string& host, const std::string& command) {
    auto r = service_->exec(host, command);
    if (r.is_err()) return report("exec on " + host, r.error, r.kind);

    std::cout << r.value.stdout_data;
    if (!r.value.stdout_data.empty() && r.value.stdout_data.back() != '\n') std::cout << "\n";
    if (!r.value.stderr_data.empty()) std::cerr << r.value.stderr_data << "\n";
    return r.value.exit_code;
}

int FleetCLI::cmd_containers(const std::string& host, bool live) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report("containers", cred.error, cred.kind);

    auto r = service_->containers().list_containers(cred.value, !live);
    if (r.is_err()) return report("containers on " + host, r.error, r.kind);

    std::cout << theme::section("Containers on " + host);
    if (r.value.empty()) {
        std::cout << theme::info("No containers");
        return 0;
    }
    for (const auto& c : r.value) {
        std::cout << fmt::format("    {:<14}{:<24}", c.id.substr(0, 12), c.name)
                  << theme::container_state(c.state)
                  << theme::dim(c.image) << "\n";
    }
    std::cout << "\n";
    return 0;
}

int FleetCLI::cmd_container_action(const std::string& action, const std::string& host,
                                   const std::string& id) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report(action, cred.error, cred.kind);

    auto& cm = service_->containers();
    Result<void> r = Result<void>::Ok();
    if (action == "start") r = cm.start_container(cred.value, id);
    else if (action == "stop") r = cm.stop_container(cred.value, id);
    else if (action == "restart") r = cm.restart_container(cred.value, id);
    else r = cm.remove_container(cred.value, id);

    if (r.is_err()) return report(action + " " + id, r.error, r.kind);
    std::cout << theme::ok(fmt::format("{} {} on {}", action, id, host));
    return 0;
}

int FleetCLI::cmd_logs(const std::string& host, const std::string& id, int tail) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report("logs", cred.error, cred.kind);

    auto r = service_->containers().container_logs(cred.value, id, tail);
    if (r.is_err()) return report("logs " + id, r.error, r.kind);
    std::cout << r.value;
    return 0;
}

int FleetCLI::cmd_ls(const std::string& host, const std::string& path) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report("ls", cred.error, cred.kind);

    auto r = service_->transfers().list_directory(cred.value, path);
    if (r.is_err()) return report("ls " + path, r.error, r.kind);

    for (const auto& e : r.value) {
        std::string name = e.is_dir ? theme::teal(e.name + "/") : e.name;
        std::cout << fmt::format("    {:>12}  {}  ", e.size, format_iso(static_cast<std::time_t>(e.mtime)))
                  << name << "\n";
    }
    return 0;
}

int FleetCLI::cmd_transfer(bool upload, const std::string& host, const std::string& from,
                           const std::string& to) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report(upload ? "put" : "get", cred.error, cred.kind);

    auto& tm = service_->transfers();
    auto id = upload ? tm.upload_file(cred.value, from, to)
                     : tm.download_file(cred.value, from, to);
    if (id.is_err()) return report(upload ? "put" : "get", id.error, id.kind);

    while (true) {
        auto t = tm.wait_transfer(id.value, 500);
        if (t.is_ok()) {
            std::cout << "\r";
            if (t.value.state == TransferState::Done) {
                std::cout << theme::ok(fmt::format("{} -> {} ({} bytes)", from, to, t.value.bytes_done));
                return 0;
            }
            return report(transfer_state_name(t.value.state), t.value.error, ErrorKind::TransferError);
        }
        if (t.kind != ErrorKind::TimedOut) return report("transfer", t.error, t.kind);

        auto p = tm.get_transfer_progress(id.value);
        if (p.is_ok()) {
            std::cout << "\r" << theme::dim(theme::progress(p.value.bytes_done, p.value.bytes_total))
                      << std::flush;
        }
    }
}

int FleetCLI::cmd_mkdir(const std::string& host, const std::string& path) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report("mkdir", cred.error, cred.kind);
    auto r = service_->transfers().create_directory(cred.value, path, 0755, true);
    if (r.is_err()) return report("mkdir " + path, r.error, r.kind);
    std::cout << theme::ok("Created " + path);
    return 0;
}

int FleetCLI::cmd_rm(const std::string& host, const std::string& path, bool recursive) {
    auto cred = service_->resolve(host);
    if (cred.is_err()) return report("delete", cred.error, cred.kind);
    auto r = service_->transfers().delete_remote(cred.value, path, recursive);
    if (r.is_err()) return report("delete " + path, r.error, r.kind);
    std::cout << theme::ok("Deleted " + path);
    return 0;
}

int FleetCLI::cmd_collect() {
    int ok = service_->collector().collect_all();
    int total = static_cast<int>(service_->hosts().active_hosts().size());
    std::cout << theme::ok(fmt::format("Collected {}/{} host(s)", ok, total));
    return ok == total ? 0 : 1;
}

int FleetCLI::cmd_history(const std::string& host) {
    std::time_t since = std::time(nullptr) - 24 * 3600;
    auto samples = service_->history().query(host, since);
    auto rows = service_->history().query_containers(host, since);
    std::cout << theme::section("Last 24h on " + host);
    if (samples.empty() && rows.empty()) {
        std::cout << theme::info("No samples");
        return 0;
    }
    for (const auto& s : samples) {
        std::string latency = s.latency_ms < 0 ? "-" : fmt::format("{:.1f}ms", s.latency_ms);
        std::cout << fmt::format("    {}  {:<12}{:<10}cpu {:.0f}%  ram {:.0f}%  ctrs {}/{}\n",
                                 format_iso(s.timestamp), s.target, latency, s.cpu_percent,
                                 s.ram_percent, s.containers_running, s.containers_total);
    }
    if (rows.empty()) return 0;

    std::cout << theme::section("Containers");
    for (const auto& c : rows) {
        std::string mem = c.mem_usage_bytes < 0 ? "-" : fmt::format("{:.1f}MiB", c.mem_usage_bytes / 1048576.0);
        std::cout << fmt::format("    {}  {:<20}cpu {:>6.2f}%  mem {:<12}pids {}\n",
                                 format_iso(c.timestamp), c.name, c.cpu_percent, mem, c.pids);
    }
    return 0;
}

int FleetCLI::cmd_stats() {
    auto pool = service_->pool().stats();
    auto sessions = service_->sessions().stats();
    auto cache = service_->cache().stats();
    auto transfers = service_->transfers().stats();

    std::cout << theme::section("Pool");
    std::cout << theme::kv("connections", std::to_string(pool.total_open));
    for (const auto& [host, h] : pool.hosts) {
        std::cout << theme::kv(host, fmt::format("open {} idle {} busy {} degraded {}{}",
                                                 h.open, h.idle, h.busy, h.degraded,
                                                 h.auth_failed ? " (auth failed)" : ""));
    }
    std::cout << theme::section("Sessions");
    std::cout << theme::kv("active", fmt::format("{}/{}", sessions.active, sessions.total));
    std::cout << theme::kv("commands", std::to_string(sessions.commands_run));
    std::cout << theme::section("Cache");
    std::cout << theme::kv("hosts", std::to_string(cache.hosts));
    std::cout << theme::kv("hits/misses", fmt::format("{}/{}", cache.hits, cache.misses));
    std::cout << theme::section("Transfers");
    std::cout << theme::kv("running", std::to_string(transfers.running));
    std::cout << theme::kv("done", std::to_string(transfers.done));
    std::cout << theme::kv("failed", std::to_string(transfers.failed));
    std::cout << "\n";
    return 0;
}

void print_usage() {
    std::cout << theme::banner("0.1.0");
    std::cout << theme::section("Usage");
    auto row = [](const std::string& cmd, const std::string& what) {
        std::cout << theme::usage_row(cmd, what);
    };
    row("init", "Create ~/.fleetlink/config.yaml");
    row("status [--refresh]", "Reachability and load of every host");
    row("exec <host> <command...>", "Run one command");
    row("containers <host> [--live]", "List containers");
    row("start|stop|restart|rm <host> <id>", "Container actions");
    row("logs <host> <id> [lines]", "Container logs");
    row("ls <host> [path]", "List a remote directory");
    row("put <host> <local> <remote>", "Upload a file");
    row("get <host> <remote> <local>", "Download a file");
    row("mkdir <host> <path>", "Create a remote directory");
    row("del|rmr <host> <path>", "Delete (rmr: recursively)");
    row("collect", "Run one monitoring sweep");
    row("history <host>", "Samples from the last 24 hours");
    row("stats", "Pool, session, cache and transfer counters");
    std::cout << "\n" << theme::dim("    --config <path>  Use another config file") << "\n\n";
}
