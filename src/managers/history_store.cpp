#include "history_store.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <map>

HistoryStore::HistoryStore(fs::path path) : path_(std::move(path)) {}

void HistoryStore::append(const MonitoringSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(sample);
}

void HistoryStore::append(const std::vector<MonitoringSample>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.insert(samples_.end(), samples.begin(), samples.end());
}

std::vector<MonitoringSample> HistoryStore::query(const std::string& host_id, std::time_t since) const {
    std::vector<MonitoringSample> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : samples_) {
        if (!host_id.empty() && s.host_id != host_id) continue;
        if (s.timestamp < since) continue;
        out.push_back(s);
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

void HistoryStore::append_containers(const std::vector<ContainerStatsSample>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    container_samples_.insert(container_samples_.end(), samples.begin(), samples.end());
}

std::vector<ContainerStatsSample> HistoryStore::query_containers(const std::string& host_id,
                                                                 std::time_t since,
                                                                 const std::string& container) const {
    std::vector<ContainerStatsSample> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : container_samples_) {
        if (!host_id.empty() && s.host_id != host_id) continue;
        if (s.timestamp < since) continue;
        if (!container.empty() && s.container_id != container && s.name != container) continue;
        out.push_back(s);
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

std::vector<MonitoringSample> HistoryStore::latest(const std::string& host_id) const {
    std::map<std::string, MonitoringSample> by_target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : samples_) {
            if (s.host_id != host_id) continue;
            auto it = by_target.find(s.target);
            if (it == by_target.end() || it->second.timestamp <= s.timestamp) {
                by_target[s.target] = s;
            }
        }
    }

    std::vector<MonitoringSample> out;
    for (auto& [target, s] : by_target) out.push_back(std::move(s));
    return out;
}

int HistoryStore::cleanup_old_data(int retention_days) {
    std::time_t cutoff = std::time(nullptr) - static_cast<std::time_t>(retention_days) * 86400;

    auto expired = [cutoff](const auto& s) { return s.timestamp < cutoff; };

    std::lock_guard<std::mutex> lock(mutex_);
    auto before = samples_.size() + container_samples_.size();
    samples_.erase(std::remove_if(samples_.begin(), samples_.end(), expired), samples_.end());
    container_samples_.erase(std::remove_if(container_samples_.begin(), container_samples_.end(), expired),
                             container_samples_.end());
    int removed = static_cast<int>(before - samples_.size() - container_samples_.size());
    if (removed > 0) {
        fleet_log(fmt::format("history: removed {} sample(s) older than {} days", removed, retention_days));
    }
    return removed;
}

std::size_t HistoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

std::size_t HistoryStore::container_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return container_samples_.size();
}

Result<void> HistoryStore::load() {
    if (path_.empty() || !fs::exists(path_)) {
        return Result<void>::Ok();
    }

    std::vector<MonitoringSample> loaded;
    std::vector<ContainerStatsSample> loaded_containers;
    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root["samples"] && root["samples"].IsSequence()) {
            for (const auto& n : root["samples"]) {
                MonitoringSample s;
                s.host_id = n["host_id"].as<std::string>("");
                s.target = n["target"].as<std::string>("");
                s.latency_ms = n["latency_ms"].as<double>(-1.0);
                s.cpu_percent = n["cpu"].as<double>(0.0);
                s.ram_percent = n["ram"].as<double>(0.0);
                s.disk_percent = n["disk"].as<double>(0.0);
                s.containers_running = n["containers_running"].as<int>(0);
                s.containers_total = n["containers_total"].as<int>(0);
                s.timestamp = static_cast<std::time_t>(n["timestamp"].as<int64_t>(0));
                loaded.push_back(s);
            }
        }
        if (root["container_samples"] && root["container_samples"].IsSequence()) {
            for (const auto& n : root["container_samples"]) {
                ContainerStatsSample s;
                s.host_id = n["host_id"].as<std::string>("");
                s.container_id = n["container_id"].as<std::string>("");
                s.name = n["name"].as<std::string>("");
                s.cpu_percent = n["cpu"].as<double>(-1.0);
                s.mem_percent = n["mem"].as<double>(-1.0);
                s.mem_usage_bytes = n["mem_usage"].as<int64_t>(-1);
                s.mem_limit_bytes = n["mem_limit"].as<int64_t>(-1);
                s.net_rx_bytes = n["net_rx"].as<int64_t>(-1);
                s.net_tx_bytes = n["net_tx"].as<int64_t>(-1);
                s.block_read_bytes = n["block_read"].as<int64_t>(-1);
                s.block_write_bytes = n["block_write"].as<int64_t>(-1);
                s.pids = n["pids"].as<int>(0);
                s.timestamp = static_cast<std::time_t>(n["timestamp"].as<int64_t>(0));
                loaded_containers.push_back(s);
            }
        }
    } catch (const std::exception& e) {
        // Corrupted history file: keep what is in memory
        fleet_log(std::string("history: failed to load ") + path_.string() + ": " + e.what());
        return Result<void>::Err(std::string("Failed to load history: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    samples_ = std::move(loaded);
    container_samples_ = std::move(loaded_containers);
    return Result<void>::Ok();
}

Result<void> HistoryStore::save() const {
    if (path_.empty()) return Result<void>::Ok();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "samples" << YAML::Value << YAML::BeginSeq;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : samples_) {
            out << YAML::BeginMap;
            out << YAML::Key << "host_id" << YAML::Value << s.host_id;
            out << YAML::Key << "target" << YAML::Value << s.target;
            out << YAML::Key << "latency_ms" << YAML::Value << s.latency_ms;
            out << YAML::Key << "cpu" << YAML::Value << s.cpu_percent;
            out << YAML::Key << "ram" << YAML::Value << s.ram_percent;
            out << YAML::Key << "disk" << YAML::Value << s.disk_percent;
            out << YAML::Key << "containers_running" << YAML::Value << s.containers_running;
            out << YAML::Key << "containers_total" << YAML::Value << s.containers_total;
            out << YAML::Key << "timestamp" << YAML::Value << static_cast<int64_t>(s.timestamp);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::Key << "container_samples" << YAML::Value << YAML::BeginSeq;
        for (const auto& s : container_samples_) {
            out << YAML::BeginMap;
            out << YAML::Key << "host_id" << YAML::Value << s.host_id;
            out << YAML::Key << "container_id" << YAML::Value << s.container_id;
            out << YAML::Key << "name" << YAML::Value << s.name;
            out << YAML::Key << "cpu" << YAML::Value << s.cpu_percent;
            out << YAML::Key << "mem" << YAML::Value << s.mem_percent;
            out << YAML::Key << "mem_usage" << YAML::Value << s.mem_usage_bytes;
            out << YAML::Key << "mem_limit" << YAML::Value << s.mem_limit_bytes;
            out << YAML::Key << "net_rx" << YAML::Value << s.net_rx_bytes;
            out << YAML::Key << "net_tx" << YAML::Value << s.net_tx_bytes;
            out << YAML::Key << "block_read" << YAML::Value << s.block_read_bytes;
            out << YAML::Key << "block_write" << YAML::Value << s.block_write_bytes;
            out << YAML::Key << "pids" << YAML::Value << s.pids;
            out << YAML::Key << "timestamp" << YAML::Value << static_cast<int64_t>(s.timestamp);
            out << YAML::EndMap;
        }
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    try {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());
        std::ofstream fout(path_.string());
        if (!fout) {
            return Result<void>::Err("Cannot write history file " + path_.string());
        }
        fout << out.c_str();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to save history: ") + e.what());
    }
    return Result<void>::Ok();
}
