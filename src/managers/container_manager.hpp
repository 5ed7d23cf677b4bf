#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/session_multiplexer.hpp>
#include "state_cache.hpp"

// Container actions on a host, run over one-shot Exec sessions.
//
// Listings go through the StateCache (cache first, then a live `docker ps`
// written back with the generation captured before the fetch). Mutating
// actions invalidate the host's container listing before and after running,
// so no read can observe the pre-action listing once the action returns.
class ContainerManager {
public:
    ContainerManager(SessionMultiplexer& mux, StateCache& cache, int command_timeout_secs);

    Result<std::vector<ContainerInfo>> list_containers(const HostCredential& cred,
                                                       bool use_cache = true);

    Result<void> start_container(const HostCredential& cred, const std::string& container_id);
    Result<void> stop_container(const HostCredential& cred, const std::string& container_id);
    Result<void> restart_container(const HostCredential& cred, const std::string& container_id);

    // `docker rm -f`
    Result<void> remove_container(const HostCredential& cred, const std::string& container_id);

    // Last `tail` lines of stdout and stderr combined (tail <= 0: everything).
    Result<std::string> container_logs(const HostCredential& cred, const std::string& container_id,
                                       int tail = 100);

    // Raw `docker inspect` JSON.
    Result<std::string> inspect_container(const HostCredential& cred,
                                          const std::string& container_id);

private:
    Result<void> run_action(const HostCredential& cred, const std::string& verb,
                            const std::string& container_id);
    Result<CommandResult> run_checked(const HostCredential& cred, const std::string& cmd);

    SessionMultiplexer& mux_;
    StateCache& cache_;
    int command_timeout_secs_;
};
