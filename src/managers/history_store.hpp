#pragma once

#include <ctime>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Time-series store of host MonitoringSamples and per-container
// ContainerStatsSamples, kept in memory and persisted to one YAML file.
// An empty path keeps the store memory-only.
class HistoryStore {
public:
    explicit HistoryStore(fs::path path = {});

    void append(const MonitoringSample& sample);
    void append(const std::vector<MonitoringSample>& samples);

    // Samples of a host at or after `since`, oldest first. Empty host: all hosts.
    std::vector<MonitoringSample> query(const std::string& host_id, std::time_t since = 0) const;

    // Newest sample per target for a host.
    std::vector<MonitoringSample> latest(const std::string& host_id) const;

    void append_containers(const std::vector<ContainerStatsSample>& samples);

    // Container samples of a host at or after `since`, oldest first. A
    // non-empty `container` matches either the id or the name.
    std::vector<ContainerStatsSample> query_containers(const std::string& host_id,
                                                       std::time_t since = 0,
                                                       const std::string& container = "") const;

    // Delete samples of both kinds older than retention_days. Returns the number removed.
    int cleanup_old_data(int retention_days);

    std::size_t size() const;
    std::size_t container_size() const;

    Result<void> load();
    Result<void> save() const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    mutable std::mutex mutex_;
    std::vector<MonitoringSample> samples_;
    std::vector<ContainerStatsSample> container_samples_;
};
