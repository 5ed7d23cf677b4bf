#pragma once

#include <memory>
#include <string>
#include <vector>
#include <managers/fleet_service.hpp>

// Command line front end over FleetService. One command per invocation.
class FleetCLI {
public:
    // config_path empty: ~/.fleetlink/config.yaml
    explicit FleetCLI(std::string config_path = "");

    // args excludes the program name and global flags. Returns the exit code.
    int run(const std::vector<std::string>& args);

private:
    Result<void> ensure_service();

    int cmd_init();
    int cmd_status(bool refresh);
    int cmd_exec(const std::string& host, const std::string& command);
    int cmd_containers(const std::string& host, bool live);
    int cmd_container_action(const std::string& action, const std::string& host,
                             const std::string& id);
    int cmd_logs(const std::string& host, const std::string& id, int tail);
    int cmd_ls(const std::string& host, const std::string& path);
    int cmd_transfer(bool upload, const std::string& host, const std::string& from,
                     const std::string& to);
    int cmd_mkdir(const std::string& host, const std::string& path);
    int cmd_rm(const std::string& host, const std::string& path, bool recursive);
    int cmd_collect();
    int cmd_history(const std::string& host);
    int cmd_stats();

    int report(const std::string& what, const std::string& error, ErrorKind kind);

    std::string config_path_;
    std::unique_ptr<FleetService> service_;
};

void print_usage();
