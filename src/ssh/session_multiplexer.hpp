#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <util/bounded_queue.hpp>
#include <util/ring_buffer.hpp>
#include "connection_pool.hpp"

// SessionMultiplexer: logical sessions over pooled connections.
//
// Every session owns one channel leased from the ConnectionPool.
//   - Exec / Batch sessions run a non-PTY shell; commands are framed with the
//     marker protocol and run strictly one at a time, in submission order.
//   - Shell sessions run a PTY shell with raw pass-through. A pump thread
//     reads their output into a per-session bounded queue and stops reading
//     a channel while its queue is full.
//
// State machine: Created -> Active -> (Closing -> Closed) | Failed.
// Failed is terminal: the session's channel is gone and every further
// operation returns SessionGone. Connection loss reported by the pool moves
// all sessions on that connection to Failed and returns their leases unless
// an operation is in flight. The pump's reaper drops Failed sessions from
// the table on its next pass.
//
// Locking: sessions_mutex_ guards the id table. Per session, op_mutex
// serializes channel use and state_mutex guards state, history and metrics.
// Order: op_mutex -> state_mutex (never the reverse).

enum class SessionKind { Shell, Exec, Batch };
enum class SessionState { Created, Active, Closing, Closed, Failed };

const char* session_kind_name(SessionKind k);
const char* session_state_name(SessionState s);

struct CommandRecord {
    std::string command;
    int exit_code = -1;         // -1 for raw shell input and failed commands
    double latency_ms = 0.0;
    std::string at;             // ISO timestamp
    std::string outcome;        // "ok", "exit", "timeout", "lost", "sent"
};

struct SessionMetrics {
    uint64_t commands_run = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    double avg_latency_ms = 0.0;
};

struct SessionInfo {
    std::string session_id;
    std::string host_id;
    SessionKind kind = SessionKind::Exec;
    SessionState state = SessionState::Created;
    uint64_t connection_id = 0;
    std::string created_at;
    int64_t idle_secs = 0;
    int cols = 0;
    int rows = 0;
    std::string failure;
    bool attached = true;       // still holds its channel and connection lease
    SessionMetrics metrics;
};

struct MultiplexerStats {
    int total = 0;
    int active = 0;
    int failed = 0;
    uint64_t commands_run = 0;
    std::map<std::string, int> per_host;
};

class SessionMultiplexer {
public:
    SessionMultiplexer(ConnectionPool& pool, SessionConfig config);
    ~SessionMultiplexer();

    SessionMultiplexer(const SessionMultiplexer&) = delete;
    SessionMultiplexer& operator=(const SessionMultiplexer&) = delete;

    // Pump thread: shell output reads and the idle-session reaper.
    void start();
    void stop();

    // ── Session lifecycle ──────────────────────────────────────

    Result<std::string> create_session(const HostCredential& cred,
                                       SessionKind kind = SessionKind::Exec,
                                       int cols = SHELL_DEFAULT_COLS,
                                       int rows = SHELL_DEFAULT_ROWS);

    // Idempotent: closing an unknown or already closed id is a no-op.
    void close_session(const std::string& session_id);

    // Close sessions idle beyond the configured timeout and drop Failed ones.
    // Sessions with an operation in flight are skipped. Returns count removed.
    int reap_idle_sessions();

    // ── Command execution (Exec / Batch) ───────────────────────

    // timeout_secs <= 0 uses the configured command timeout. A non-zero exit
    // code is data. On timeout the channel is torn down, the session becomes
    // Failed and TimedOut is returned.
    Result<CommandResult> execute_command(const std::string& session_id,
                                          const std::string& command,
                                          int timeout_secs = 0);

    // Runs in order on one channel. Non-zero exits are recorded and the batch
    // continues; a connection-level failure stops it and the error result
    // carries the results gathered so far in `value`.
    Result<std::vector<CommandResult>> execute_batch_commands(const std::string& session_id,
                                                              const std::vector<std::string>& commands,
                                                              int timeout_secs = 0);

    // Open an Exec session, run one command, close it.
    Result<CommandResult> run_once(const HostCredential& cred, const std::string& command,
                                   int timeout_secs = 0);

    // ── Interactive I/O (Shell) ────────────────────────────────

    Result<void> send_raw_data(const std::string& session_id, const std::string& data);

    // Everything queued so far; waits up to wait_ms for the first chunk.
    Result<std::string> read_output(const std::string& session_id, int wait_ms = 0);

    // Forwarded to the PTY for Shell sessions, logged no-op otherwise.
    Result<void> resize_terminal(const std::string& session_id, int cols, int rows);

    // ── Read-only views (no network) ───────────────────────────

    Result<std::vector<CommandRecord>> get_command_history(const std::string& session_id,
                                                           std::size_t limit = 0) const;
    Result<SessionMetrics> get_session_metrics(const std::string& session_id) const;
    Result<SessionInfo> get_session_info(const std::string& session_id) const;
    std::vector<SessionInfo> list_sessions(const std::string& host_id = "") const;
    MultiplexerStats stats() const;

private:
    struct Session {
        Session(std::size_t history_size, std::size_t queue_chunks)
            : history(history_size), output(queue_chunks) {}

        std::string id;
        std::string host_id;
        SessionKind kind = SessionKind::Exec;
        uint64_t connection_id = 0;
        std::string created_at;

        std::mutex op_mutex;
        PooledChannel pc;           // guarded by op_mutex

        mutable std::mutex state_mutex;
        SessionState state = SessionState::Created;
        std::string failure;
        bool attached = true;
        std::chrono::steady_clock::time_point last_activity;
        int cols = 0;
        int rows = 0;
        RingBuffer<CommandRecord> history;
        SessionMetrics metrics;

        BoundedQueue<std::string> output;   // Shell only
    };

    std::shared_ptr<Session> find(const std::string& session_id) const;

    // SessionGone unless the session is Created or Active.
    Result<void> check_usable(const Session& s) const;

    // Run one marker-framed command. Caller holds s.op_mutex.
    Result<CommandResult> run_marked(Session& s, const std::string& command, int timeout_secs);

    // Close the channel and return the lease. Caller holds s.op_mutex.
    void detach_locked(Session& s);

    // Tear down the channel and move to Failed. Caller holds s.op_mutex.
    void fail_locked(Session& s, const std::string& reason, bool connection_dead);

    void record(Session& s, CommandRecord rec, uint64_t bytes_in, uint64_t bytes_out);
    void on_connection_lost(const std::string& host_id, uint64_t connection_id);

    void pump_loop();
    void pump_shell(Session& s);

    ConnectionPool& pool_;
    SessionConfig config_;
    int listener_token_ = 0;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    std::atomic<bool> running_{false};
    std::thread pump_;
};
