#pragma once

// In-process stand-in for the SSH layer used by the unit tests.
//
// FakeWorld holds everything the fake hosts share: a command interpreter for
// marker-framed scripts, an in-memory SFTP tree per host, fault injection and
// connection counters. FakeTransportFactory hands out transports bound to it.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <ssh/marker_protocol.hpp>
#include <ssh/transport.hpp>

namespace fake {

using Clock = std::chrono::steady_clock;

struct Reply {
    std::string out;
    std::string err;
    int exit_code = 0;
    int delay_ms = 0;
    bool endless = false;   // `out` repeats on stdout forever, no DONE marker
};

// host_id, command -> reply. Return false to fall through to the built-ins.
using Handler = std::function<bool(const std::string& host, const std::string& cmd, Reply& reply)>;

struct Node {
    bool is_dir = false;
    std::string data;
    uint32_t mode = 0644;
    std::string link_to;        // non-empty: symlink to this absolute path
};

class FakeWorld;

// Liveness shared by a transport and everything it opened.
struct Link {
    std::string host_id;
    std::atomic<bool> alive{true};
};

class FakeWorld {
public:
    // ── Commands ───────────────────────────────────────────────

    void on_command(Handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(h));
    }

    // Exact-match reply for one command on any host.
    void reply(const std::string& cmd, Reply r) {
        on_command([cmd, r](const std::string&, const std::string& c, Reply& out) {
            if (c != cmd) return false;
            out = r;
            return true;
        });
    }

    Reply run(const std::string& host, const std::string& cmd) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_seen_.push_back(host + ": " + cmd);
        }
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = handlers_;
        }
        for (auto it = handlers.rbegin(); it != handlers.rend(); ++it) {
            Reply r;
            if ((*it)(host, cmd, r)) return r;
        }
        return builtin(cmd);
    }

    std::vector<std::string> commands_seen() {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_seen_;
    }

    // ── Faults ─────────────────────────────────────────────────

    void reject_auth(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_rejected_.insert(host);
    }

    void fail_next_connects(const std::string& host, int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_failures_[host] = n;
    }

    void fail_next_channel_opens(const std::string& host, int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_failures_[host] = n;
    }

    void set_connect_delay_ms(int ms) { connect_delay_ms_ = ms; }
    void set_sftp_chunk_delay_ms(int ms) { sftp_chunk_delay_ms_ = ms; }
    int sftp_chunk_delay_ms() const { return sftp_chunk_delay_ms_; }

    // Drop every live link to a host, as a network failure would.
    void kill_host(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& weak : links_) {
            auto l = weak.lock();
            if (l && l->host_id == host) l->alive = false;
        }
    }

    // ── Connections ────────────────────────────────────────────

    Result<std::shared_ptr<Link>> connect(const HostCredential& cred) {
        connects_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auth_rejected_.count(cred.host_id)) {
                return Result<std::shared_ptr<Link>>::Err(ErrorKind::AuthError,
                                                          "Authentication failed for " + cred.username);
            }
            auto it = connect_failures_.find(cred.host_id);
            if (it != connect_failures_.end() && it->second > 0) {
                it->second--;
                return Result<std::shared_ptr<Link>>::Err(ErrorKind::ConnectionError,
                                                          "Connection refused");
            }
        }
        if (connect_delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(connect_delay_ms_));
        }

        auto link = std::make_shared<Link>();
        link->host_id = cred.host_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            links_.push_back(link);
            int now_live = ++live_[cred.host_id];
            max_live_[cred.host_id] = std::max(max_live_[cred.host_id], now_live);
        }
        return Result<std::shared_ptr<Link>>::Ok(link);
    }

    void disconnected(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        live_[host]--;
    }

    bool take_channel_failure(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channel_failures_.find(host);
        if (it == channel_failures_.end() || it->second <= 0) return false;
        it->second--;
        return true;
    }

    int connects() const { return connects_; }

    int live(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_[host];
    }

    int max_live(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_live_[host];
    }

    // ── Filesystem ─────────────────────────────────────────────

    void put_file(const std::string& host, const std::string& path, const std::string& data) {
        std::lock_guard<std::mutex> lock(fs_mutex_);
        fs_[host][path] = Node{false, data, 0644};
    }

    void put_dir(const std::string& host, const std::string& path) {
        std::lock_guard<std::mutex> lock(fs_mutex_);
        fs_[host][path] = Node{true, "", 0755};
    }

    void put_symlink(const std::string& host, const std::string& path, const std::string& target) {
        std::lock_guard<std::mutex> lock(fs_mutex_);
        fs_[host][path] = Node{false, "", 0777, target};
    }

    bool exists(const std::string& host, const std::string& path) {
        std::lock_guard<std::mutex> lock(fs_mutex_);
        return fs_[host].count(path) > 0;
    }

    std::string file_data(const std::string& host, const std::string& path) {
        std::lock_guard<std::mutex> lock(fs_mutex_);
        auto it = fs_[host].find(path);
        return it == fs_[host].end() ? "" : it->second.data;
    }

    std::mutex& fs_mutex() { return fs_mutex_; }
    std::map<std::string, Node>& tree(const std::string& host) { return fs_[host]; }

private:
    static Reply builtin(const std::string& cmd) {
        static const std::regex sleep_re(R"(^sleep (\d+)$)");
        static const std::regex echo_err_re(R"(^echo (.*) >&2$)");
        static const std::regex echo_re(R"(^echo (.*)$)");
        static const std::regex exit_re(R"(^exit (\d+)$)");

        Reply r;
        std::smatch m;
        if (cmd == "true" || cmd.empty()) return r;
        if (cmd == "false") {
            r.exit_code = 1;
            return r;
        }
        if (std::regex_match(cmd, m, sleep_re)) {
            r.delay_ms = std::stoi(m[1].str()) * 1000;
            return r;
        }
        if (std::regex_match(cmd, m, exit_re)) {
            r.exit_code = std::stoi(m[1].str());
            return r;
        }
        if (std::regex_match(cmd, m, echo_err_re)) {
            r.err = m[1].str() + "\n";
            return r;
        }
        if (std::regex_match(cmd, m, echo_re)) {
            r.out = m[1].str() + "\n";
            return r;
        }
        r.err = "sh: " + cmd + ": command not found\n";
        r.exit_code = 127;
        return r;
    }

    std::mutex mutex_;
    std::vector<Handler> handlers_;
    std::vector<std::string> commands_seen_;
    std::set<std::string> auth_rejected_;
    std::map<std::string, int> connect_failures_;
    std::map<std::string, int> channel_failures_;
    std::vector<std::weak_ptr<Link>> links_;
    std::map<std::string, int> live_;
    std::map<std::string, int> max_live_;
    std::atomic<int> connects_{0};
    std::atomic<int> connect_delay_ms_{0};
    std::atomic<int> sftp_chunk_delay_ms_{0};

    std::mutex fs_mutex_;
    std::map<std::string, std::map<std::string, Node>> fs_;
};

// ── Channel ─────────────────────────────────────────────────

// Non-PTY: parses marker-framed scripts and answers them through FakeWorld.
// PTY: echoes raw input back on stdout.
class FakeChannel : public Channel {
public:
    FakeChannel(FakeWorld& world, std::shared_ptr<Link> link) : world_(world), link_(std::move(link)) {}

    Result<void> request_pty(const std::string&, int cols, int rows) override {
        pty_ = true;
        cols_ = cols;
        rows_ = rows;
        return Result<void>::Ok();
    }

    Result<void> start_shell() override { return Result<void>::Ok(); }

    ssize_t write(const char* data, std::size_t len) override {
        if (!usable()) return -1;
        std::lock_guard<std::mutex> lock(mutex_);
        if (pty_) {
            pending_.push_back({Clock::now(), std::string(data, len), ""});
            return static_cast<ssize_t>(len);
        }
        input_.append(data, len);
        consume_scripts();
        return static_cast<ssize_t>(len);
    }

    ssize_t read(char* buf, std::size_t len, bool from_stderr) override {
        if (!usable()) return -1;
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        while (!pending_.empty() && pending_.front().ready_at <= now) {
            stdout_ += pending_.front().out;
            stderr_ += pending_.front().err;
            pending_.pop_front();
        }
        if (!from_stderr && stdout_.empty() && !forever_.empty()) {
            while (stdout_.size() < len) stdout_ += forever_;
        }
        std::string& src = from_stderr ? stderr_ : stdout_;
        if (src.empty()) return 0;
        std::size_t n = std::min(len, src.size());
        std::copy(src.begin(), src.begin() + static_cast<std::ptrdiff_t>(n), buf);
        src.erase(0, n);
        return static_cast<ssize_t>(n);
    }

    bool eof() override { return !usable(); }

    Result<void> resize(int cols, int rows) override {
        cols_ = cols;
        rows_ = rows;
        return Result<void>::Ok();
    }

    void close() override { closed_ = true; }

    int cols() const { return cols_; }

private:
    struct Chunk {
        Clock::time_point ready_at;
        std::string out;
        std::string err;
    };

    bool usable() const { return !closed_ && link_->alive; }

    void consume_scripts() {
        static const std::regex id_re(R"(__FLEET_BEG''IN_([A-Za-z0-9]+)__)");
        const std::string tail = "$__fleet_rc\n";

        std::size_t end;
        while ((end = input_.find(tail)) != std::string::npos) {
            std::string script = input_.substr(0, end + tail.size());
            input_.erase(0, end + tail.size());

            std::smatch m;
            if (!std::regex_search(script, m, id_re)) continue;
            std::string id = m[1].str();

            auto body_start = script.find("{ ");
            auto body_end = script.find("\n} </dev/null");
            std::string body;
            if (body_start != std::string::npos && body_end != std::string::npos) {
                body = script.substr(body_start + 2, body_end - body_start - 2);
            }

            Reply r = world_.run(link_->host_id, body);
            if (r.endless) {
                pending_.push_back({Clock::now(), begin_marker(id) + "\n", begin_marker(id) + "\n"});
                forever_ = r.out.empty() ? "y\n" : r.out;
                continue;
            }
            std::string out = begin_marker(id) + "\n" + r.out;
            if (!r.out.empty() && r.out.back() != '\n') out += "\n";
            out += done_marker(id) + " " + std::to_string(r.exit_code) + "\n";
            std::string err = begin_marker(id) + "\n" + r.err;
            if (!r.err.empty() && r.err.back() != '\n') err += "\n";
            err += done_marker(id) + "\n";

            // Output of a slow command only shows up after its delay
            auto base = Clock::now();
            if (!pending_.empty()) base = std::max(base, pending_.back().ready_at);
            pending_.push_back({base + std::chrono::milliseconds(r.delay_ms), out, err});
        }
    }

    FakeWorld& world_;
    std::shared_ptr<Link> link_;
    std::mutex mutex_;
    std::string input_;
    std::string stdout_;
    std::string stderr_;
    std::deque<Chunk> pending_;
    std::string forever_;
    std::atomic<bool> closed_{false};
    bool pty_ = false;
    int cols_ = 0;
    int rows_ = 0;
};

// ── SFTP ────────────────────────────────────────────────────

class FakeRemoteFile : public RemoteFile {
public:
    FakeRemoteFile(FakeWorld& world, std::shared_ptr<Link> link, std::string path, bool writing)
        : world_(world), link_(std::move(link)), path_(std::move(path)), writing_(writing) {}

    ssize_t read(char* buf, std::size_t len) override {
        if (!link_->alive) return -1;
        delay();
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        auto& tree = world_.tree(link_->host_id);
        auto it = tree.find(path_);
        if (it == tree.end()) return -1;
        const std::string& data = it->second.data;
        if (offset_ >= data.size()) return 0;
        std::size_t n = std::min(len, data.size() - offset_);
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset_),
                  data.begin() + static_cast<std::ptrdiff_t>(offset_ + n), buf);
        offset_ += n;
        return static_cast<ssize_t>(n);
    }

    ssize_t write(const char* data, std::size_t len) override {
        if (!link_->alive || !writing_) return -1;
        delay();
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        world_.tree(link_->host_id)[path_].data.append(data, len);
        return static_cast<ssize_t>(len);
    }

    void close() override {}

private:
    void delay() {
        int ms = world_.sftp_chunk_delay_ms();
        if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

    FakeWorld& world_;
    std::shared_ptr<Link> link_;
    std::string path_;
    bool writing_;
    std::size_t offset_ = 0;
};

class FakeSftp : public SftpChannel {
public:
    FakeSftp(FakeWorld& world, std::shared_ptr<Link> link) : world_(world), link_(std::move(link)) {}

    Result<RemoteEntry> stat(const std::string& path) override {
        return stat_node(path, true);
    }

    Result<RemoteEntry> lstat(const std::string& path) override {
        return stat_node(path, false);
    }

    Result<std::vector<RemoteEntry>> list(const std::string& path) override {
        if (!link_->alive) return Result<std::vector<RemoteEntry>>::Err(ErrorKind::ConnectionError, "link down");
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        auto& tree = world_.tree(link_->host_id);
        std::string real = resolve(tree, path, true);
        auto it = tree.find(real);
        if (it == tree.end() || !it->second.is_dir) {
            return Result<std::vector<RemoteEntry>>::Err(ErrorKind::NotFound, "No such directory: " + path);
        }
        std::string prefix = real.back() == '/' ? real : real + "/";
        std::vector<RemoteEntry> out;
        for (const auto& [p, node] : tree) {
            if (p.size() <= prefix.size() || p.compare(0, prefix.size(), prefix) != 0) continue;
            if (p.find('/', prefix.size()) != std::string::npos) continue;
            out.push_back(entry(p, node));
        }
        return Result<std::vector<RemoteEntry>>::Ok(out);
    }

    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override {
        if (!link_->alive) return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::ConnectionError, "link down");
        std::string real;
        {
            std::lock_guard<std::mutex> lock(world_.fs_mutex());
            auto& tree = world_.tree(link_->host_id);
            real = resolve(tree, path, true);
            if (!tree.count(real)) {
                return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::NotFound, "No such file: " + path);
            }
        }
        return Result<std::unique_ptr<RemoteFile>>::Ok(
            std::make_unique<FakeRemoteFile>(world_, link_, real, false));
    }

    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path, int mode) override {
        if (!link_->alive) return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::ConnectionError, "link down");
        std::string real;
        {
            std::lock_guard<std::mutex> lock(world_.fs_mutex());
            auto& tree = world_.tree(link_->host_id);
            real = resolve(tree, path, true);
            tree[real] = Node{false, "", static_cast<uint32_t>(mode)};
        }
        return Result<std::unique_ptr<RemoteFile>>::Ok(
            std::make_unique<FakeRemoteFile>(world_, link_, real, true));
    }

    Result<void> mkdir(const std::string& path, int mode) override {
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        auto& tree = world_.tree(link_->host_id);
        std::string real = resolve(tree, path, false);
        if (tree.count(real)) return Result<void>::Err(ErrorKind::InvalidArgument, "File exists: " + path);
        auto slash = real.find_last_of('/');
        if (slash != std::string::npos && slash > 0 && !tree.count(real.substr(0, slash))) {
            return Result<void>::Err(ErrorKind::NotFound, "No such directory: " + path.substr(0, slash));
        }
        tree[real] = Node{true, "", static_cast<uint32_t>(mode)};
        return Result<void>::Ok();
    }

    // Like the real call, rmdir refuses anything that is not a directory.
    Result<void> rmdir(const std::string& path) override {
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        auto& tree = world_.tree(link_->host_id);
        std::string real = resolve(tree, path, false);
        auto it = tree.find(real);
        if (it == tree.end()) return Result<void>::Err(ErrorKind::NotFound, "No such directory: " + path);
        if (!it->second.is_dir) return Result<void>::Err(ErrorKind::InvalidArgument, "Not a directory: " + path);
        std::string prefix = real + "/";
        for (const auto& [p, node] : tree) {
            if (p.compare(0, prefix.size(), prefix) == 0) {
                return Result<void>::Err(ErrorKind::NotEmpty, "Directory not empty: " + path);
            }
        }
        tree.erase(it);
        return Result<void>::Ok();
    }

    Result<void> unlink(const std::string& path) override {
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        auto& tree = world_.tree(link_->host_id);
        std::string real = resolve(tree, path, false);
        auto it = tree.find(real);
        if (it == tree.end()) return Result<void>::Err(ErrorKind::NotFound, "No such file: " + path);
        if (it->second.is_dir) return Result<void>::Err(ErrorKind::InvalidArgument, "Is a directory: " + path);
        tree.erase(it);
        return Result<void>::Ok();
    }

    void close() override {}

private:
    Result<RemoteEntry> stat_node(const std::string& path, bool follow) {
        if (!link_->alive) return Result<RemoteEntry>::Err(ErrorKind::ConnectionError, "link down");
        std::lock_guard<std::mutex> lock(world_.fs_mutex());
        auto& tree = world_.tree(link_->host_id);
        std::string real = resolve(tree, path, follow);
        auto it = tree.find(real);
        if (it == tree.end()) return Result<RemoteEntry>::Err(ErrorKind::NotFound, "No such file: " + path);
        return Result<RemoteEntry>::Ok(entry(path, it->second));
    }

    // Substitutes symlinks in every leading component, and in the last one
    // only when follow_last is set.
    static std::string resolve(const std::map<std::string, Node>& tree, const std::string& path,
                               bool follow_last) {
        std::string out;
        std::size_t pos = 0;
        while (pos < path.size()) {
            auto next = path.find('/', pos + 1);
            bool last = next == std::string::npos;
            out += path.substr(pos, last ? std::string::npos : next - pos);
            auto it = tree.find(out);
            if (it != tree.end() && !it->second.link_to.empty() && (!last || follow_last)) {
                out = it->second.link_to;
            }
            if (last) break;
            pos = next;
        }
        return out;
    }

    static RemoteEntry entry(const std::string& path, const Node& node) {
        RemoteEntry e;
        auto slash = path.find_last_of('/');
        e.name = slash == std::string::npos ? path : path.substr(slash + 1);
        e.is_dir = node.is_dir;
        e.is_link = !node.link_to.empty();
        e.size = node.data.size();
        e.mode = node.mode;
        return e;
    }

    FakeWorld& world_;
    std::shared_ptr<Link> link_;
};

// ── Transport ───────────────────────────────────────────────

class FakeTransport : public Transport {
public:
    FakeTransport(FakeWorld& world, std::shared_ptr<Link> link) : world_(world), link_(std::move(link)) {}

    ~FakeTransport() override { disconnect(); }

    Result<std::unique_ptr<Channel>> open_channel() override {
        if (!link_->alive || world_.take_channel_failure(link_->host_id)) {
            return Result<std::unique_ptr<Channel>>::Err(ErrorKind::ConnectionError, "Channel open failed");
        }
        return Result<std::unique_ptr<Channel>>::Ok(std::make_unique<FakeChannel>(world_, link_));
    }

    Result<std::unique_ptr<SftpChannel>> open_sftp() override {
        if (!link_->alive || world_.take_channel_failure(link_->host_id)) {
            return Result<std::unique_ptr<SftpChannel>>::Err(ErrorKind::ConnectionError, "SFTP open failed");
        }
        return Result<std::unique_ptr<SftpChannel>>::Ok(std::make_unique<FakeSftp>(world_, link_));
    }

    bool check_alive() override { return link_->alive; }

    void disconnect() override {
        if (disconnected_.exchange(true)) return;
        link_->alive = false;
        world_.disconnected(link_->host_id);
    }

private:
    FakeWorld& world_;
    std::shared_ptr<Link> link_;
    std::atomic<bool> disconnected_{false};
};

class FakeTransportFactory : public TransportFactory {
public:
    explicit FakeTransportFactory(FakeWorld& world) : world_(world) {}

    Result<std::unique_ptr<Transport>> connect(const HostCredential& cred, int) override {
        auto link = world_.connect(cred);
        if (link.is_err()) return Result<std::unique_ptr<Transport>>::From(link);
        return Result<std::unique_ptr<Transport>>::Ok(std::make_unique<FakeTransport>(world_, link.value));
    }

private:
    FakeWorld& world_;
};

inline HostCredential host(const std::string& id) {
    HostCredential c;
    c.host_id = id;
    c.address = "10.0.0." + id;
    c.username = "root";
    c.secret = "secret";
    return c;
}

// Pool settings that keep the tests fast.
inline PoolConfig fast_pool() {
    PoolConfig p;
    p.connect_timeout_ms = 1000;
    p.acquire_timeout_ms = 2000;
    p.retry_base_ms = 10;
    p.retry_cap_ms = 40;
    p.reaper_interval_ms = 100;
    return p;
}

}  // namespace fake
