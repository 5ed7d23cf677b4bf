#include "libssh2_transport.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <chrono>
#include <cstring>
#include <mutex>

// ── Shared link state ──────────────────────────────────────

// Owned jointly by the transport and every channel / SFTP handle opened on it,
// so a channel outliving disconnect() sees alive == false instead of a freed
// session.
struct Libssh2Link {
    LIBSSH2_SESSION* session = nullptr;
    int sock = platform::NO_SOCKET;
    std::mutex io_mutex;
    bool alive = false;
    std::string label;
};

// Run a libssh2 call under the io mutex until it stops returning EAGAIN.
template <typename Fn>
static ssize_t call_nb(Libssh2Link& link, Fn&& fn, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        ssize_t rc;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            if (!link.alive) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = static_cast<ssize_t>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (std::chrono::steady_clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
}

// Same for calls returning a handle; nullptr + last errno EAGAIN means retry.
template <typename T, typename Fn>
static T* open_nb(Libssh2Link& link, Fn&& fn, int timeout_ms, int* err) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            if (!link.alive) {
                *err = LIBSSH2_ERROR_SOCKET_DISCONNECT;
                return nullptr;
            }
            T* handle = fn();
            if (handle) return handle;
            *err = libssh2_session_last_errno(link.session);
            if (*err != LIBSSH2_ERROR_EAGAIN) return nullptr;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            *err = LIBSSH2_ERROR_TIMEOUT;
            return nullptr;
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
}

static ErrorKind kind_for_rc(ssize_t rc) {
    if (rc == LIBSSH2_ERROR_TIMEOUT) return ErrorKind::TimedOut;
    if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
        rc == LIBSSH2_ERROR_SOCKET_RECV) {
        return ErrorKind::ConnectionLost;
    }
    return ErrorKind::ConnectionError;
}

static void teardown(Libssh2Link& link, const char* reason) {
    std::lock_guard<std::mutex> lock(link.io_mutex);
    if (!link.alive && !link.session) return;
    link.alive = false;
    if (link.session) {
        libssh2_session_disconnect(link.session, reason);
        for (int i = 0; i < 50; i++) {
            if (libssh2_session_free(link.session) != LIBSSH2_ERROR_EAGAIN) break;
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
        }
        link.session = nullptr;
    }
    platform::close_socket(link.sock);
    link.sock = platform::NO_SOCKET;
}

// ── Channel ────────────────────────────────────────────────

class Libssh2Channel : public Channel {
public:
    Libssh2Channel(std::shared_ptr<Libssh2Link> link, LIBSSH2_CHANNEL* ch, int timeout_ms)
        : link_(std::move(link)), ch_(ch), timeout_ms_(timeout_ms) {}

    ~Libssh2Channel() override { close(); }

    Result<void> request_pty(const std::string& term, int cols, int rows) override {
        auto rc = call_nb(*link_, [&] {
            if (!ch_) return LIBSSH2_ERROR_CHANNEL_CLOSED;
            return libssh2_channel_request_pty_ex(ch_, term.c_str(),
                                                  static_cast<unsigned>(term.size()),
                                                  nullptr, 0, cols, rows, 0, 0);
        }, timeout_ms_);
        if (rc != 0) {
            return Result<void>::Err(kind_for_rc(rc), "PTY request failed (rc=" + std::to_string(rc) + ")");
        }
        return Result<void>::Ok();
    }

    Result<void> start_shell() override {
        auto rc = call_nb(*link_, [&] {
            if (!ch_) return LIBSSH2_ERROR_CHANNEL_CLOSED;
            return libssh2_channel_shell(ch_);
        }, timeout_ms_);
        if (rc != 0) {
            return Result<void>::Err(kind_for_rc(rc), "Shell request failed (rc=" + std::to_string(rc) + ")");
        }
        return Result<void>::Ok();
    }

    ssize_t write(const char* data, std::size_t len) override {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        if (!link_->alive || !ch_) return -1;
        ssize_t w = libssh2_channel_write(ch_, data, len);
        if (w == LIBSSH2_ERROR_EAGAIN) return 0;
        return w < 0 ? -1 : w;
    }

    ssize_t read(char* buf, std::size_t len, bool from_stderr) override {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        if (!link_->alive || !ch_) return -1;
        ssize_t n = from_stderr ? libssh2_channel_read_stderr(ch_, buf, len)
                                : libssh2_channel_read(ch_, buf, len);
        if (n == LIBSSH2_ERROR_EAGAIN) return 0;
        if (n < 0) return -1;
        if (n == 0 && libssh2_channel_eof(ch_)) return -1;
        return n;
    }

    bool eof() override {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        if (!link_->alive || !ch_) return true;
        return libssh2_channel_eof(ch_) != 0;
    }

    Result<void> resize(int cols, int rows) override {
        auto rc = call_nb(*link_, [&] {
            if (!ch_) return LIBSSH2_ERROR_CHANNEL_CLOSED;
            return libssh2_channel_request_pty_size(ch_, cols, rows);
        }, timeout_ms_);
        if (rc != 0) {
            return Result<void>::Err(kind_for_rc(rc), "PTY resize failed (rc=" + std::to_string(rc) + ")");
        }
        return Result<void>::Ok();
    }

    void close() override {
        LIBSSH2_CHANNEL* ch;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            ch = ch_;
            ch_ = nullptr;
        }
        if (!ch) return;
        // A dead link already released its channels in libssh2_session_free.
        call_nb(*link_, [&] { return libssh2_channel_close(ch); }, 2000);
        call_nb(*link_, [&] { return libssh2_channel_free(ch); }, 2000);
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_CHANNEL* ch_;
    int timeout_ms_;
};

// ── SFTP ───────────────────────────────────────────────────

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(std::shared_ptr<Libssh2Link> link, LIBSSH2_SFTP_HANDLE* handle, int timeout_ms)
        : link_(std::move(link)), handle_(handle), timeout_ms_(timeout_ms) {}

    ~Libssh2RemoteFile() override { close(); }

    ssize_t read(char* buf, std::size_t len) override {
        if (!handle_) return -1;
        auto n = call_nb(*link_, [&] { return libssh2_sftp_read(handle_, buf, len); }, timeout_ms_);
        return n < 0 ? -1 : n;
    }

    ssize_t write(const char* data, std::size_t len) override {
        if (!handle_) return -1;
        std::size_t sent = 0;
        while (sent < len) {
            auto w = call_nb(*link_, [&] {
                return libssh2_sftp_write(handle_, data + sent, len - sent);
            }, timeout_ms_);
            if (w < 0) return -1;
            sent += static_cast<std::size_t>(w);
        }
        return static_cast<ssize_t>(sent);
    }

    void close() override {
        if (!handle_) return;
        call_nb(*link_, [&] { return libssh2_sftp_close(handle_); }, timeout_ms_);
        handle_ = nullptr;
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_SFTP_HANDLE* handle_;
    int timeout_ms_;
};

class Libssh2Sftp : public SftpChannel {
public:
    Libssh2Sftp(std::shared_ptr<Libssh2Link> link, LIBSSH2_SFTP* sftp, int timeout_ms)
        : link_(std::move(link)), sftp_(sftp), timeout_ms_(timeout_ms) {}

    ~Libssh2Sftp() override { close(); }

    Result<RemoteEntry> stat(const std::string& path) override {
        return stat_as(path, LIBSSH2_SFTP_STAT);
    }

    Result<RemoteEntry> lstat(const std::string& path) override {
        return stat_as(path, LIBSSH2_SFTP_LSTAT);
    }

    Result<std::vector<RemoteEntry>> list(const std::string& path) override {
        int err = 0;
        LIBSSH2_SFTP_HANDLE* dir = open_nb<LIBSSH2_SFTP_HANDLE>(*link_, [&] {
            return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        0, 0, LIBSSH2_SFTP_OPENDIR);
        }, timeout_ms_, &err);
        if (!dir) return Result<std::vector<RemoteEntry>>::From(error_for("opendir " + path, err));

        std::vector<RemoteEntry> entries;
        char name[512];
        char longentry[512];
        while (true) {
            LIBSSH2_SFTP_ATTRIBUTES attrs;
            std::memset(&attrs, 0, sizeof(attrs));
            auto rc = call_nb(*link_, [&] {
                return libssh2_sftp_readdir_ex(dir, name, sizeof(name),
                                               longentry, sizeof(longentry), &attrs);
            }, timeout_ms_);
            if (rc == 0) break;
            if (rc < 0) {
                call_nb(*link_, [&] { return libssh2_sftp_closedir(dir); }, timeout_ms_);
                return Result<std::vector<RemoteEntry>>::From(error_for("readdir " + path, rc));
            }
            std::string n(name, static_cast<std::size_t>(rc));
            if (n == "." || n == "..") continue;
            entries.push_back(entry_from(n, attrs));
        }
        call_nb(*link_, [&] { return libssh2_sftp_closedir(dir); }, timeout_ms_);
        return Result<std::vector<RemoteEntry>>::Ok(std::move(entries));
    }

    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override {
        return open_file(path, LIBSSH2_FXF_READ, 0);
    }

    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path, int mode) override {
        return open_file(path, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, mode);
    }

    Result<void> mkdir(const std::string& path, int mode) override {
        auto rc = call_nb(*link_, [&] {
            return libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()), mode);
        }, timeout_ms_);
        if (rc != 0) return error_for("mkdir " + path, rc);
        return Result<void>::Ok();
    }

    Result<void> rmdir(const std::string& path) override {
        auto rc = call_nb(*link_, [&] {
            return libssh2_sftp_rmdir_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()));
        }, timeout_ms_);
        if (rc != 0) return error_for("rmdir " + path, rc);
        return Result<void>::Ok();
    }

    Result<void> unlink(const std::string& path) override {
        auto rc = call_nb(*link_, [&] {
            return libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()));
        }, timeout_ms_);
        if (rc != 0) return error_for("unlink " + path, rc);
        return Result<void>::Ok();
    }

    void close() override {
        if (!sftp_) return;
        call_nb(*link_, [&] { return libssh2_sftp_shutdown(sftp_); }, timeout_ms_);
        sftp_ = nullptr;
    }

private:
    Result<RemoteEntry> stat_as(const std::string& path, int stat_type) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        auto rc = call_nb(*link_, [&] {
            return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        stat_type, &attrs);
        }, timeout_ms_);
        if (rc != 0) return Result<RemoteEntry>::From(error_for("stat " + path, rc));
        return Result<RemoteEntry>::Ok(entry_from(path, attrs));
    }

    Result<std::unique_ptr<RemoteFile>> open_file(const std::string& path, unsigned long flags, int mode) {
        int err = 0;
        LIBSSH2_SFTP_HANDLE* h = open_nb<LIBSSH2_SFTP_HANDLE>(*link_, [&] {
            return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        flags, mode, LIBSSH2_SFTP_OPENFILE);
        }, timeout_ms_, &err);
        if (!h) return Result<std::unique_ptr<RemoteFile>>::From(error_for("open " + path, err));
        std::unique_ptr<RemoteFile> file = std::make_unique<Libssh2RemoteFile>(link_, h, timeout_ms_);
        return Result<std::unique_ptr<RemoteFile>>::Ok(std::move(file));
    }

    static RemoteEntry entry_from(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
        RemoteEntry e;
        e.name = name;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            e.mode = static_cast<uint32_t>(attrs.permissions);
            auto type = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
            e.is_dir = type == LIBSSH2_SFTP_S_IFDIR;
            e.is_link = type == LIBSSH2_SFTP_S_IFLNK;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = static_cast<int64_t>(attrs.mtime);
        return e;
    }

    Result<void> error_for(const std::string& what, ssize_t rc) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long code;
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                code = sftp_ ? libssh2_sftp_last_error(sftp_) : 0;
            }
            if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
                return Result<void>::Err(ErrorKind::NotFound, what + ": no such file");
            }
            if (code == LIBSSH2_FX_DIR_NOT_EMPTY) {
                return Result<void>::Err(ErrorKind::NotEmpty, what + ": directory not empty");
            }
            if (code == LIBSSH2_FX_PERMISSION_DENIED) {
                return Result<void>::Err(ErrorKind::TransferError, what + ": permission denied");
            }
            return Result<void>::Err(ErrorKind::TransferError,
                                     what + ": sftp error " + std::to_string(code));
        }
        return Result<void>::Err(kind_for_rc(rc), what + ": rc=" + std::to_string(rc));
    }

    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_SFTP* sftp_;
    int timeout_ms_;
};

// ── Transport ──────────────────────────────────────────────

class Libssh2Transport : public Transport {
public:
    Libssh2Transport(std::shared_ptr<Libssh2Link> link, int op_timeout_ms)
        : link_(std::move(link)), op_timeout_ms_(op_timeout_ms) {}

    ~Libssh2Transport() override { disconnect(); }

    Result<std::unique_ptr<Channel>> open_channel() override {
        int err = 0;
        LIBSSH2_CHANNEL* ch = open_nb<LIBSSH2_CHANNEL>(*link_, [&] {
            return libssh2_channel_open_session(link_->session);
        }, op_timeout_ms_, &err);
        if (!ch) {
            return Result<std::unique_ptr<Channel>>::Err(
                kind_for_rc(err), "Failed to open channel on " + link_->label +
                " (rc=" + std::to_string(err) + ")");
        }
        std::unique_ptr<Channel> channel = std::make_unique<Libssh2Channel>(link_, ch, op_timeout_ms_);
        return Result<std::unique_ptr<Channel>>::Ok(std::move(channel));
    }

    Result<std::unique_ptr<SftpChannel>> open_sftp() override {
        int err = 0;
        LIBSSH2_SFTP* sftp = open_nb<LIBSSH2_SFTP>(*link_, [&] {
            return libssh2_sftp_init(link_->session);
        }, op_timeout_ms_, &err);
        if (!sftp) {
            return Result<std::unique_ptr<SftpChannel>>::Err(
                kind_for_rc(err), "Failed to start SFTP on " + link_->label +
                " (rc=" + std::to_string(err) + ")");
        }
        std::unique_ptr<SftpChannel> channel = std::make_unique<Libssh2Sftp>(link_, sftp, op_timeout_ms_);
        return Result<std::unique_ptr<SftpChannel>>::Ok(std::move(channel));
    }

    bool check_alive() override {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        if (!link_->alive || !link_->session) return false;

        int seconds_to_next = 0;
        if (libssh2_keepalive_send(link_->session, &seconds_to_next) != 0) return false;

        return !platform::socket_hung_up(link_->sock);
    }

    void disconnect() override {
        teardown(*link_, "Normal disconnection");
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    int op_timeout_ms_;
};

// ── Authentication ─────────────────────────────────────────

struct KbdAuthData {
    std::string password;
};

// Answers every keyboard-interactive prompt with the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

static Result<void> userauth(Libssh2Link& link, const HostCredential& cred, int timeout_ms) {
    const std::string& user = cred.username;

    int err = 0;
    char* auth_list = open_nb<char>(link, [&] {
        return libssh2_userauth_list(link.session, user.c_str(), static_cast<unsigned>(user.size()));
    }, timeout_ms, &err);
    std::string methods = auth_list ? auth_list : "";
    fleet_log(fmt::format("{} auth methods: {}", link.label, methods));

    if (cred.auth_method == AuthMethod::PrivateKey) {
        const char* passphrase = cred.passphrase.empty() ? nullptr : cred.passphrase.c_str();
        auto rc = call_nb(link, [&] {
            return libssh2_userauth_publickey_frommemory(
                link.session, user.c_str(), user.size(), nullptr, 0,
                cred.secret.c_str(), cred.secret.size(), passphrase);
        }, timeout_ms);
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_DISCONNECT) {
            return Result<void>::Err(ErrorKind::ConnectionError, "Connection dropped during authentication");
        }
        return Result<void>::Err(ErrorKind::AuthError,
                                 "Public key authentication failed for " + link.label);
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd{cred.secret};
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            *libssh2_session_abstract(link.session) = &kbd;
        }
        auto rc = call_nb(link, [&] {
            return libssh2_userauth_keyboard_interactive(link.session, user.c_str(), kbd_callback);
        }, timeout_ms);
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            *libssh2_session_abstract(link.session) = nullptr;
        }
        if (rc == 0) return Result<void>::Ok();
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        auto rc = call_nb(link, [&] {
            return libssh2_userauth_password(link.session, user.c_str(), cred.secret.c_str());
        }, timeout_ms);
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_DISCONNECT) {
            return Result<void>::Err(ErrorKind::ConnectionError, "Connection dropped during authentication");
        }
    }

    return Result<void>::Err(ErrorKind::AuthError,
                             "Authentication failed for " + link.label + " (check username/password)");
}

// ── Factory ────────────────────────────────────────────────

Libssh2TransportFactory::Libssh2TransportFactory(int op_timeout_secs)
    : op_timeout_secs_(op_timeout_secs) {
}

Result<std::unique_ptr<Transport>> Libssh2TransportFactory::connect(const HostCredential& cred,
                                                                    int timeout_ms) {
    static std::once_flag init_once;
    static int init_rc = 0;
    std::call_once(init_once, [] { init_rc = libssh2_init(0); });
    if (init_rc != 0) {
        return Result<std::unique_ptr<Transport>>::Err(ErrorKind::ConnectionError,
                                                       "Failed to initialize libssh2");
    }

    auto sock = platform::open_tcp(cred.address, cred.port, timeout_ms);
    if (sock.is_err()) return Result<std::unique_ptr<Transport>>::From(sock);
    platform::tune_socket(sock.value);

    auto link = std::make_shared<Libssh2Link>();
    link->sock = sock.value;
    link->label = cred.username + "@" + cred.address;
    link->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!link->session) {
        platform::close_socket(link->sock);
        return Result<std::unique_ptr<Transport>>::Err(ErrorKind::ConnectionError,
                                                       "Failed to create SSH session");
    }
    libssh2_session_set_blocking(link->session, 0);
    link->alive = true;

    auto rc = call_nb(*link, [&] {
        return libssh2_session_handshake(link->session, link->sock);
    }, timeout_ms);
    if (rc != 0) {
        teardown(*link, "Handshake failed");
        return Result<std::unique_ptr<Transport>>::Err(
            ErrorKind::ConnectionError, "SSH handshake failed with " + cred.address +
            " (rc=" + std::to_string(rc) + ")");
    }

    // Interval for libssh2_keepalive_send, which the pool's heartbeat and
    // probe() drive through check_alive()
    libssh2_keepalive_config(link->session, 1, 30);

    auto auth = userauth(*link, cred, timeout_ms);
    if (auth.is_err()) {
        teardown(*link, "Authentication failed");
        return Result<std::unique_ptr<Transport>>::From(auth);
    }

    fleet_log(fmt::format("Connected {} (port {})", link->label, cred.port));
    std::unique_ptr<Transport> transport =
        std::make_unique<Libssh2Transport>(link, op_timeout_secs_ * 1000);
    return Result<std::unique_ptr<Transport>>::Ok(std::move(transport));
}
