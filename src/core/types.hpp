#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <ctime>

// Error categories surfaced across the pool/session/transfer boundary.
// A non-zero remote exit code is NOT an error: it is returned as data in
// CommandResult.
enum class ErrorKind {
    None,
    AuthError,          // credential rejected, never retried
    ConnectionError,    // transient network failure, retried inside the pool only
    TimedOut,           // caller timeout exceeded, channel torn down
    SessionGone,        // session is Failed/Closed or unknown
    ConnectionLost,     // underlying connection was closed under the session
    CacheMiss,          // no cached data (not a failure)
    TransferError,      // transfer failed, offset retained in history
    NotEmpty,           // non-recursive delete of a non-empty directory
    NotFound,
    InvalidArgument,
    CapacityExceeded,
    CommandFailed,      // action whose non-zero exit is a failure (container actions)
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::InvalidArgument};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Carry over the error of another result (different value type).
    template <typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::InvalidArgument};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result. exit_code != 0 is a normal outcome.
struct CommandResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    double latency_ms = 0.0;
    bool truncated = false;     // middle of a stream dropped at the output cap

    bool succeeded() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// ── Credentials ─────────────────────────────────────────────

enum class AuthMethod { Password, PrivateKey };

// Already-decrypted credentials, supplied by the caller on every call.
// Never persisted by this layer.
struct HostCredential {
    std::string host_id;
    std::string address;
    int port = 22;
    std::string username;
    AuthMethod auth_method = AuthMethod::Password;
    std::string secret;        // password, or PEM private key text
    std::string passphrase;    // private key passphrase (optional)
};

// Resolves host ids to credentials for background work (collector sweeps,
// cache refreshes). Implemented by the permission/route layer.
class HostDirectory {
public:
    virtual ~HostDirectory() = default;

    virtual std::vector<HostCredential> active_hosts() = 0;
    virtual std::optional<HostCredential> find(const std::string& host_id) = 0;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// ── Fleet state ─────────────────────────────────────────────

// One row of `docker ps -a`.
struct ContainerInfo {
    std::string id;
    std::string name;
    std::string image;
    std::string status;     // "Up 3 hours", "Exited (0) 2 days ago"
    std::string state;      // running, exited, paused, ...
    std::string ports;
    std::string created_at;
};

// Reachability and resource snapshot of one host, as cached for the UI.
struct ServerStatus {
    std::string host_id;
    bool online = false;
    std::string error;                          // why offline, if known
    double latency_ms = 0.0;                    // average over responding ping targets
    std::map<std::string, double> latencies;    // per ping target, -1 unreachable
    double cpu_percent = 0.0;
    double ram_percent = 0.0;
    double disk_percent = 0.0;
    std::string load_average;
    int64_t uptime_secs = 0;
    std::string docker_version;
    int containers_running = 0;
    int containers_total = 0;
    std::string checked_at;                     // ISO timestamp
};

// One time-series point written by the collector.
struct MonitoringSample {
    std::string host_id;
    std::string target;             // ping target name
    double latency_ms = -1.0;       // -1 when the target did not answer
    double cpu_percent = 0.0;
    double ram_percent = 0.0;
    double disk_percent = 0.0;
    int containers_running = 0;
    int containers_total = 0;
    std::time_t timestamp = 0;
};

// One row of `docker stats --no-stream`. Sizes are bytes, -1 when unparsable.
struct ContainerStatsSample {
    std::string host_id;
    std::string container_id;
    std::string name;
    double cpu_percent = -1.0;
    double mem_percent = -1.0;
    int64_t mem_usage_bytes = -1;
    int64_t mem_limit_bytes = -1;
    int64_t net_rx_bytes = -1;
    int64_t net_tx_bytes = -1;
    int64_t block_read_bytes = -1;
    int64_t block_write_bytes = -1;
    int pids = 0;
    std::time_t timestamp = 0;
};
