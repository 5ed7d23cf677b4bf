#include "container_manager.hpp"
#include "stats_parser.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

ContainerManager::ContainerManager(SessionMultiplexer& mux, StateCache& cache,
                                   int command_timeout_secs)
    : mux_(mux), cache_(cache), command_timeout_secs_(command_timeout_secs) {}

// ── Listing ─────────────────────────────────────────────────

Result<std::vector<ContainerInfo>> ContainerManager::list_containers(const HostCredential& cred,
                                                                     bool use_cache) {
    if (use_cache) {
        auto cached = cache_.get_containers(cred.host_id);
        if (cached.is_ok()) return cached;
    }

    uint64_t gen = cache_.generation(cred.host_id);
    auto r = run_checked(cred, container_list_command());
    if (r.is_err()) return Result<std::vector<ContainerInfo>>::From(r);

    auto containers = parse_container_list(r.value.stdout_data);
    cache_.set_containers_if(cred.host_id, containers, gen);
    return Result<std::vector<ContainerInfo>>::Ok(containers);
}

// ── Actions ─────────────────────────────────────────────────

Result<void> ContainerManager::start_container(const HostCredential& cred,
                                               const std::string& container_id) {
    return run_action(cred, "start", container_id);
}

Result<void> ContainerManager::stop_container(const HostCredential& cred,
                                              const std::string& container_id) {
    return run_action(cred, "stop", container_id);
}

Result<void> ContainerManager::restart_container(const HostCredential& cred,
                                                 const std::string& container_id) {
    return run_action(cred, "restart", container_id);
}

Result<void> ContainerManager::remove_container(const HostCredential& cred,
                                                const std::string& container_id) {
    return run_action(cred, "rm -f", container_id);
}

Result<void> ContainerManager::run_action(const HostCredential& cred, const std::string& verb,
                                          const std::string& container_id) {
    if (container_id.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Container id is empty");
    }

    cache_.invalidate_containers(cred.host_id);
    auto r = run_checked(cred, fmt::format("docker {} {}", verb, shell_quote(container_id)));
    cache_.invalidate_containers(cred.host_id);

    if (r.is_err()) return Result<void>::From(r);
    fleet_log(fmt::format("containers: {} {} on {}", verb, container_id, cred.host_id));
    return Result<void>::Ok();
}

// ── Inspection ──────────────────────────────────────────────

Result<std::string> ContainerManager::container_logs(const HostCredential& cred,
                                                     const std::string& container_id,
                                                     int tail) {
    if (container_id.empty()) {
        return Result<std::string>::Err(ErrorKind::InvalidArgument, "Container id is empty");
    }
    std::string tail_arg = tail > 0 ? std::to_string(tail) : "all";
    auto r = run_checked(cred, fmt::format("docker logs --tail {} {} 2>&1",
                                           tail_arg, shell_quote(container_id)));
    if (r.is_err()) return Result<std::string>::From(r);
    return Result<std::string>::Ok(r.value.stdout_data);
}

Result<std::string> ContainerManager::inspect_container(const HostCredential& cred,
                                                        const std::string& container_id) {
    if (container_id.empty()) {
        return Result<std::string>::Err(ErrorKind::InvalidArgument, "Container id is empty");
    }
    auto r = run_checked(cred, "docker inspect " + shell_quote(container_id));
    if (r.is_err()) return Result<std::string>::From(r);
    return Result<std::string>::Ok(r.value.stdout_data);
}

// Non-zero exit becomes an error carrying the exit code and stderr.
Result<CommandResult> ContainerManager::run_checked(const HostCredential& cred,
                                                    const std::string& cmd) {
    auto r = mux_.run_once(cred, cmd, command_timeout_secs_);
    if (r.is_err()) {
        fleet_log_error("containers: " + cred.host_id, r);
        return r;
    }
    if (r.value.failed()) {
        fleet_log_cmd("containers", cmd, r.value);
        std::string detail = trimmed(r.value.stderr_data);
        if (detail.empty()) detail = trimmed(r.value.stdout_data);
        return Result<CommandResult>::Err(
            ErrorKind::CommandFailed,
            fmt::format("`{}` exited {}: {}", cmd, r.value.exit_code, detail));
    }
    return r;
}
