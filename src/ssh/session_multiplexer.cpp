#include "session_multiplexer.hpp"
#include "marker_protocol.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <algorithm>

using Clock = std::chrono::steady_clock;

const char* session_kind_name(SessionKind k) {
    switch (k) {
        case SessionKind::Shell: return "shell";
        case SessionKind::Exec:  return "exec";
        case SessionKind::Batch: return "batch";
    }
    return "unknown";
}

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Created: return "created";
        case SessionState::Active:  return "active";
        case SessionState::Closing: return "closing";
        case SessionState::Closed:  return "closed";
        case SessionState::Failed:  return "failed";
    }
    return "unknown";
}

static double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

// Write all of data before the deadline. -1 on channel error, 0 on timeout.
static int write_all(Channel& ch, const std::string& data, Clock::time_point deadline) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = ch.write(data.data() + sent, data.size() - sent);
        if (w < 0) return -1;
        if (w == 0) {
            if (Clock::now() >= deadline) return 0;
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
            continue;
        }
        sent += static_cast<std::size_t>(w);
    }
    return 1;
}

// Keep a raw stream under `cap` by dropping its middle. The head holds the
// BEGIN marker, the tail holds whatever of the DONE line has arrived.
static bool cap_stream(std::string& raw, std::size_t cap) {
    if (raw.size() <= cap) return false;
    std::size_t tail = std::min<std::size_t>(64 * 1024, cap / 4);
    std::size_t head = cap - tail;
    raw.erase(head, raw.size() - tail - head);
    return true;
}

// ── Construction / Destruction ──────────────────────────────

SessionMultiplexer::SessionMultiplexer(ConnectionPool& pool, SessionConfig config)
    : pool_(pool), config_(config) {
    listener_token_ = pool_.add_loss_listener(
        [this](const std::string& host_id, uint64_t connection_id) {
            on_connection_lost(host_id, connection_id);
        });
}

SessionMultiplexer::~SessionMultiplexer() {
    stop();
    pool_.remove_loss_listener(listener_token_);

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, s] : sessions_) ids.push_back(id);
    }
    for (const auto& id : ids) {
        close_session(id);
    }
}

// ── Lifecycle ───────────────────────────────────────────────

void SessionMultiplexer::start() {
    if (running_) return;
    running_ = true;
    pump_ = std::thread(&SessionMultiplexer::pump_loop, this);
    fleet_log("mux: pump started");
}

void SessionMultiplexer::stop() {
    if (!running_) return;
    running_ = false;
    if (pump_.joinable()) {
        pump_.join();
    }
    fleet_log("mux: pump stopped");
}

// ── Session lifecycle ───────────────────────────────────────

Result<std::string> SessionMultiplexer::create_session(const HostCredential& cred,
                                                       SessionKind kind, int cols, int rows) {
    auto opened = pool_.open_channel(cred);
    if (opened.is_err()) {
        fleet_log_error("mux: create_session " + cred.host_id, opened);
        return Result<std::string>::From(opened);
    }

    PooledChannel pc = std::move(opened.value);
    Result<void> setup = Result<void>::Ok();
    if (kind == SessionKind::Shell) {
        setup = pc.channel->request_pty("xterm", cols, rows);
    }
    if (setup.is_ok()) {
        setup = pc.channel->start_shell();
    }
    if (setup.is_err()) {
        fleet_log_error("mux: shell setup on " + cred.host_id, setup);
        pc.channel->close();
        pool_.release(pc.lease);
        return Result<std::string>::From(setup);
    }

    auto s = std::make_shared<Session>(static_cast<std::size_t>(std::max(config_.history_size, 1)),
                                       static_cast<std::size_t>(std::max(config_.output_queue_chunks, 1)));
    s->id = random_id();
    s->host_id = cred.host_id;
    s->kind = kind;
    s->connection_id = pc.lease.connection_id;
    s->created_at = now_iso();
    s->last_activity = Clock::now();
    s->pc = std::move(pc);
    if (kind == SessionKind::Shell) {
        s->cols = cols;
        s->rows = rows;
        s->state = SessionState::Active;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[s->id] = s;
    }

    fleet_log(fmt::format("mux: session {} ({}) on {} connection {}",
                          s->id, session_kind_name(kind), cred.host_id, s->connection_id));
    return Result<std::string>::Ok(s->id);
}

void SessionMultiplexer::close_session(const std::string& session_id) {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return;
        s = it->second;
        sessions_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(s->state_mutex);
        if (s->state != SessionState::Failed) s->state = SessionState::Closing;
    }

    {
        std::lock_guard<std::mutex> op_lock(s->op_mutex);
        detach_locked(*s);
    }

    {
        std::lock_guard<std::mutex> lock(s->state_mutex);
        if (s->state != SessionState::Failed) s->state = SessionState::Closed;
    }
    s->output.close();
    fleet_log("mux: closed session " + session_id);
}

int SessionMultiplexer::reap_idle_sessions() {
    auto cutoff = Clock::now() - std::chrono::seconds(config_.idle_timeout_secs);

    std::vector<std::shared_ptr<Session>> candidates;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, s] : sessions_) {
            std::lock_guard<std::mutex> state_lock(s->state_mutex);
            if (s->state == SessionState::Failed || s->last_activity <= cutoff) candidates.push_back(s);
        }
    }

    int reaped = 0;
    for (const auto& s : candidates) {
        // A command in flight holds op_mutex; look again on the next pass
        std::unique_lock<std::mutex> op_lock(s->op_mutex, std::try_to_lock);
        if (!op_lock.owns_lock()) continue;

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(s->id);
            if (it == sessions_.end() || it->second != s) continue;
            sessions_.erase(it);
        }

        bool failed;
        {
            std::lock_guard<std::mutex> lock(s->state_mutex);
            failed = s->state == SessionState::Failed;
            if (!failed) s->state = SessionState::Closing;
        }
        detach_locked(*s);
        {
            std::lock_guard<std::mutex> lock(s->state_mutex);
            if (!failed) s->state = SessionState::Closed;
        }
        s->output.close();
        fleet_log(fmt::format("mux: reaped {} session {}", failed ? "failed" : "idle", s->id));
        reaped++;
    }
    return reaped;
}

// ── Helpers ─────────────────────────────────────────────────

std::shared_ptr<SessionMultiplexer::Session> SessionMultiplexer::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

Result<void> SessionMultiplexer::check_usable(const Session& s) const {
    std::lock_guard<std::mutex> lock(s.state_mutex);
    if (s.state == SessionState::Created || s.state == SessionState::Active) {
        return Result<void>::Ok();
    }
    std::string why = s.failure.empty() ? session_state_name(s.state) : s.failure;
    return Result<void>::Err(ErrorKind::SessionGone, "Session " + s.id + " is gone (" + why + ")");
}

void SessionMultiplexer::detach_locked(Session& s) {
    if (s.pc.channel) {
        s.pc.channel->close();
        s.pc.channel.reset();
    }
    pool_.release(s.pc.lease);
    std::lock_guard<std::mutex> lock(s.state_mutex);
    s.attached = false;
}

void SessionMultiplexer::fail_locked(Session& s, const std::string& reason, bool connection_dead) {
    fleet_log(fmt::format("mux: session {} failed: {}", s.id, reason));

    // Failed before mark_degraded: the loss callback it fires skips this session
    {
        std::lock_guard<std::mutex> lock(s.state_mutex);
        s.state = SessionState::Failed;
        if (s.failure.empty()) s.failure = reason;
    }
    if (connection_dead) {
        pool_.mark_degraded(s.pc.lease);
    }
    detach_locked(s);
    s.output.close();
}

void SessionMultiplexer::record(Session& s, CommandRecord rec, uint64_t bytes_in, uint64_t bytes_out) {
    std::lock_guard<std::mutex> lock(s.state_mutex);
    s.last_activity = Clock::now();
    s.metrics.bytes_in += bytes_in;
    s.metrics.bytes_out += bytes_out;
    if (rec.outcome != "sent") {
        // Running mean over completed commands
        s.metrics.commands_run++;
        s.metrics.avg_latency_ms +=
            (rec.latency_ms - s.metrics.avg_latency_ms) / static_cast<double>(s.metrics.commands_run);
    }
    s.history.push(std::move(rec));
}

void SessionMultiplexer::on_connection_lost(const std::string& host_id, uint64_t connection_id) {
    std::vector<std::shared_ptr<Session>> affected;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, s] : sessions_) {
            if (s->host_id == host_id && s->connection_id == connection_id) affected.push_back(s);
        }
    }

    for (const auto& s : affected) {
        {
            std::lock_guard<std::mutex> lock(s->state_mutex);
            if (s->state == SessionState::Failed || s->state == SessionState::Closed) continue;
            s->state = SessionState::Failed;
            s->failure = "connection lost";
        }
        s->output.close();
        fleet_log(fmt::format("mux: session {} lost connection {} to {}", s->id, connection_id, host_id));

        // A session mid-operation fails on its own next channel I/O
        std::unique_lock<std::mutex> op_lock(s->op_mutex, std::try_to_lock);
        if (op_lock.owns_lock()) detach_locked(*s);
    }
}

// ── Command execution ───────────────────────────────────────

Result<CommandResult> SessionMultiplexer::run_marked(Session& s, const std::string& command,
                                                     int timeout_secs) {
    int effective = timeout_secs > 0 ? timeout_secs : config_.command_timeout_secs;
    auto start = Clock::now();
    auto deadline = start + std::chrono::seconds(effective);
    Channel& ch = *s.pc.channel;

    {
        std::lock_guard<std::mutex> lock(s.state_mutex);
        if (s.state == SessionState::Created) s.state = SessionState::Active;
        s.last_activity = start;
    }

    // Drain any stale data sitting in the channel buffer
    char buf[SSH_READ_BUF_SIZE];
    while (Clock::now() < deadline && ch.read(buf, sizeof(buf), false) > 0) {}
    while (Clock::now() < deadline && ch.read(buf, sizeof(buf), true) > 0) {}

    std::string marker_id = random_id(6);
    std::string script = build_marker_command(command, marker_id);

    CommandRecord rec;
    rec.command = command;
    rec.at = now_iso();

    int w = write_all(ch, script, deadline);
    if (w <= 0) {
        bool dead = !s.pc.lease.transport->check_alive();
        rec.latency_ms = elapsed_ms(start);
        rec.outcome = w < 0 ? "lost" : "timeout";
        record(s, rec, 0, 0);
        if (w < 0) {
            fail_locked(s, "channel write failed", dead);
            return Result<CommandResult>::Err(ErrorKind::ConnectionLost,
                                              "Connection lost while sending command to " + s.host_id);
        }
        fail_locked(s, "write timed out", dead);
        return Result<CommandResult>::Err(ErrorKind::TimedOut,
            fmt::format("Command timed out after {}s (write stalled)", effective));
    }

    std::string out_raw;
    std::string err_raw;

    // Read stdout and stderr until both DONE markers have arrived
    MarkerResult out_parsed{"", 0, false};
    MarkerResult err_parsed{"", 0, false};
    uint64_t bytes_in = 0;
    bool truncated = false;
    while (true) {
        bool progress = false;

        ssize_t n = ch.read(buf, sizeof(buf), false);
        if (n > 0) {
            out_raw.append(buf, static_cast<std::size_t>(n));
            bytes_in += static_cast<uint64_t>(n);
            truncated |= cap_stream(out_raw, config_.max_output_bytes);
            progress = true;
        }
        ssize_t e = ch.read(buf, sizeof(buf), true);
        if (e > 0) {
            err_raw.append(buf, static_cast<std::size_t>(e));
            bytes_in += static_cast<uint64_t>(e);
            truncated |= cap_stream(err_raw, config_.max_output_bytes);
            progress = true;
        }

        if (n < 0 || e < 0) {
            bool dead = !s.pc.lease.transport->check_alive();
            rec.latency_ms = elapsed_ms(start);
            rec.outcome = "lost";
            record(s, rec, bytes_in, script.size());
            fail_locked(s, "channel closed during command", dead);
            return Result<CommandResult>::Err(ErrorKind::ConnectionLost,
                                              "Connection lost while running command on " + s.host_id);
        }

        if (progress) {
            if (!out_parsed.found) out_parsed = parse_marker_output(out_raw, marker_id);
            if (!err_parsed.found) err_parsed = parse_marker_output(err_raw, marker_id);
            if (out_parsed.found && err_parsed.found) break;
        }

        // Checked on every pass so a command that never stops printing still times out
        if (Clock::now() >= deadline) {
            rec.latency_ms = elapsed_ms(start);
            rec.outcome = "timeout";
            record(s, rec, bytes_in, script.size());
            fail_locked(s, fmt::format("command timed out after {}s", effective), false);
            return Result<CommandResult>::Err(ErrorKind::TimedOut,
                fmt::format("Command timed out after {}s on {}", effective, s.host_id));
        }
        if (!progress) platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    CommandResult result;
    result.exit_code = out_parsed.exit_code;
    result.stdout_data = out_parsed.output;
    result.stderr_data = err_parsed.output;
    result.latency_ms = elapsed_ms(start);
    result.truncated = truncated;
    if (truncated) {
        fleet_log(fmt::format("mux[{}]: output of '{}' cut to {} bytes per stream ({} received)",
                              s.id, command, config_.max_output_bytes, bytes_in));
    }

    rec.exit_code = result.exit_code;
    rec.latency_ms = result.latency_ms;
    rec.outcome = result.succeeded() ? "ok" : "exit";
    record(s, rec, bytes_in, script.size());

    fleet_log_cmd("mux[" + s.id + "]", command, result);
    return Result<CommandResult>::Ok(std::move(result));
}

Result<CommandResult> SessionMultiplexer::execute_command(const std::string& session_id,
                                                          const std::string& command,
                                                          int timeout_secs) {
    auto s = find(session_id);
    if (!s) {
        return Result<CommandResult>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    }
    if (s->kind == SessionKind::Shell) {
        return Result<CommandResult>::Err(ErrorKind::InvalidArgument,
                                          "Shell sessions take raw input, not commands");
    }

    std::lock_guard<std::mutex> op_lock(s->op_mutex);
    auto usable = check_usable(*s);
    if (usable.is_err()) return Result<CommandResult>::From(usable);

    return run_marked(*s, command, timeout_secs);
}

Result<std::vector<CommandResult>> SessionMultiplexer::execute_batch_commands(
        const std::string& session_id, const std::vector<std::string>& commands, int timeout_secs) {
    using BatchResult = Result<std::vector<CommandResult>>;

    auto s = find(session_id);
    if (!s) {
        return BatchResult::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    }
    if (s->kind == SessionKind::Shell) {
        return BatchResult::Err(ErrorKind::InvalidArgument,
                                "Shell sessions take raw input, not commands");
    }

    std::lock_guard<std::mutex> op_lock(s->op_mutex);
    auto usable = check_usable(*s);
    if (usable.is_err()) return BatchResult::From(usable);

    std::vector<CommandResult> results;
    results.reserve(commands.size());
    for (std::size_t i = 0; i < commands.size(); i++) {
        auto r = run_marked(*s, commands[i], timeout_secs);
        if (r.is_err()) {
            fleet_log(fmt::format("mux: batch on {} stopped at command {}/{}: {}",
                                  s->id, i + 1, commands.size(), r.error));
            return BatchResult{false, std::move(results),
                               fmt::format("Command {} failed: {}", i + 1, r.error), r.kind};
        }
        results.push_back(std::move(r.value));
    }
    return BatchResult::Ok(std::move(results));
}

Result<CommandResult> SessionMultiplexer::run_once(const HostCredential& cred,
                                                   const std::string& command, int timeout_secs) {
    auto id = create_session(cred, SessionKind::Exec);
    if (id.is_err()) return Result<CommandResult>::From(id);

    auto r = execute_command(id.value, command, timeout_secs);
    close_session(id.value);
    return r;
}

// ── Interactive I/O ─────────────────────────────────────────

Result<void> SessionMultiplexer::send_raw_data(const std::string& session_id, const std::string& data) {
    auto s = find(session_id);
    if (!s) return Result<void>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    if (s->kind != SessionKind::Shell) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Raw input requires a shell session");
    }

    std::lock_guard<std::mutex> op_lock(s->op_mutex);
    auto usable = check_usable(*s);
    if (usable.is_err()) return usable;

    auto deadline = Clock::now() + std::chrono::seconds(config_.command_timeout_secs);
    int w = write_all(*s->pc.channel, data, deadline);
    if (w <= 0) {
        bool dead = !s->pc.lease.transport->check_alive();
        fail_locked(*s, w < 0 ? "shell write failed" : "shell write timed out", dead);
        return Result<void>::Err(w < 0 ? ErrorKind::ConnectionLost : ErrorKind::TimedOut,
                                 "Failed to send input to session " + session_id);
    }

    CommandRecord rec;
    rec.command = data;
    rec.at = now_iso();
    rec.outcome = "sent";
    record(*s, std::move(rec), 0, data.size());
    return Result<void>::Ok();
}

Result<std::string> SessionMultiplexer::read_output(const std::string& session_id, int wait_ms) {
    auto s = find(session_id);
    if (!s) return Result<std::string>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    if (s->kind != SessionKind::Shell) {
        return Result<std::string>::Err(ErrorKind::InvalidArgument, "Output stream requires a shell session");
    }

    std::string out;
    auto first = s->output.pop(std::chrono::milliseconds(std::max(wait_ms, 0)));
    if (first) {
        out = std::move(*first);
        while (auto more = s->output.try_pop()) {
            out += *more;
        }
    }

    // Queued output is still delivered after a failure
    if (out.empty()) {
        auto usable = check_usable(*s);
        if (usable.is_err()) return Result<std::string>::From(usable);
    }
    return Result<std::string>::Ok(std::move(out));
}

Result<void> SessionMultiplexer::resize_terminal(const std::string& session_id, int cols, int rows) {
    auto s = find(session_id);
    if (!s) return Result<void>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    if (cols <= 0 || rows <= 0) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Terminal size must be positive");
    }

    std::lock_guard<std::mutex> op_lock(s->op_mutex);
    auto usable = check_usable(*s);
    if (usable.is_err()) return usable;

    if (s->kind != SessionKind::Shell) {
        fleet_log(fmt::format("mux: resize ignored for {} session {}", session_kind_name(s->kind), s->id));
        return Result<void>::Ok();
    }

    auto r = s->pc.channel->resize(cols, rows);
    if (r.is_err()) {
        fleet_log_error("mux: resize " + s->id, r);
        return r;
    }
    std::lock_guard<std::mutex> lock(s->state_mutex);
    s->cols = cols;
    s->rows = rows;
    s->last_activity = Clock::now();
    return Result<void>::Ok();
}

// ── Pump thread ─────────────────────────────────────────────

void SessionMultiplexer::pump_loop() {
    auto next_reap = Clock::now() + std::chrono::seconds(1);
    while (running_) {
        std::vector<std::shared_ptr<Session>> shells;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (const auto& [id, s] : sessions_) {
                if (s->kind == SessionKind::Shell) shells.push_back(s);
            }
        }
        for (const auto& s : shells) {
            if (!running_) break;
            pump_shell(*s);
        }

        if (Clock::now() >= next_reap) {
            reap_idle_sessions();
            next_reap = Clock::now() + std::chrono::seconds(1);
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
}

void SessionMultiplexer::pump_shell(Session& s) {
    // Backpressure: leave data in the channel while the consumer is behind
    if (s.output.full()) return;

    std::unique_lock<std::mutex> op_lock(s.op_mutex, std::try_to_lock);
    if (!op_lock.owns_lock() || !s.pc.channel) return;
    if (check_usable(s).is_err()) return;

    char buf[SSH_READ_BUF_SIZE];
    ssize_t n = s.pc.channel->read(buf, sizeof(buf), false);
    if (n > 0) {
        s.output.try_push(std::string(buf, static_cast<std::size_t>(n)));
        std::lock_guard<std::mutex> lock(s.state_mutex);
        s.metrics.bytes_in += static_cast<uint64_t>(n);
        s.last_activity = Clock::now();
    } else if (n < 0) {
        bool dead = !s.pc.lease.transport->check_alive();
        fail_locked(s, dead ? "connection lost" : "shell exited", dead);
    }
}

// ── Read-only views ─────────────────────────────────────────

Result<std::vector<CommandRecord>> SessionMultiplexer::get_command_history(const std::string& session_id,
                                                                           std::size_t limit) const {
    auto s = find(session_id);
    if (!s) {
        return Result<std::vector<CommandRecord>>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    }
    std::lock_guard<std::mutex> lock(s->state_mutex);
    return Result<std::vector<CommandRecord>>::Ok(limit > 0 ? s->history.last(limit) : s->history.items());
}

Result<SessionMetrics> SessionMultiplexer::get_session_metrics(const std::string& session_id) const {
    auto s = find(session_id);
    if (!s) return Result<SessionMetrics>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);
    std::lock_guard<std::mutex> lock(s->state_mutex);
    return Result<SessionMetrics>::Ok(s->metrics);
}

Result<SessionInfo> SessionMultiplexer::get_session_info(const std::string& session_id) const {
    auto s = find(session_id);
    if (!s) return Result<SessionInfo>::Err(ErrorKind::SessionGone, "Unknown session " + session_id);

    SessionInfo info;
    info.session_id = s->id;
    info.host_id = s->host_id;
    info.kind = s->kind;
    info.connection_id = s->connection_id;
    info.created_at = s->created_at;

    std::lock_guard<std::mutex> lock(s->state_mutex);
    info.state = s->state;
    info.failure = s->failure;
    info.attached = s->attached;
    info.cols = s->cols;
    info.rows = s->rows;
    info.metrics = s->metrics;
    info.idle_secs = std::chrono::duration_cast<std::chrono::seconds>(
        Clock::now() - s->last_activity).count();
    return Result<SessionInfo>::Ok(info);
}

std::vector<SessionInfo> SessionMultiplexer::list_sessions(const std::string& host_id) const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, s] : sessions_) {
            if (host_id.empty() || s->host_id == host_id) ids.push_back(id);
        }
    }

    std::vector<SessionInfo> out;
    for (const auto& id : ids) {
        auto info = get_session_info(id);
        if (info.is_ok()) out.push_back(std::move(info.value));
    }
    return out;
}

MultiplexerStats SessionMultiplexer::stats() const {
    MultiplexerStats st;
    for (const auto& info : list_sessions()) {
        st.total++;
        if (info.state == SessionState::Failed) st.failed++;
        else st.active++;
        st.commands_run += info.metrics.commands_run;
        st.per_host[info.host_id]++;
    }
    return st;
}
