#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>
#include <core/types.hpp>

// Transport seam between the pool and the SSH library.
//
// A Transport is one authenticated physical connection. It hands out Channels
// (shell / command streams) and SftpChannels. Implementations must be safe to
// call from several threads at once: a shell reader thread and a writer may
// use the same Channel concurrently, and disconnect() may race with both.
// After disconnect() every channel of that transport reports -1 / errors.

class Channel {
public:
    virtual ~Channel() = default;

    virtual Result<void> request_pty(const std::string& term, int cols, int rows) = 0;
    virtual Result<void> start_shell() = 0;

    // >0 bytes written, 0 would block, -1 channel or connection error.
    virtual ssize_t write(const char* data, std::size_t len) = 0;

    // >0 bytes read, 0 no data yet, -1 channel closed or connection error.
    virtual ssize_t read(char* buf, std::size_t len, bool from_stderr = false) = 0;

    virtual bool eof() = 0;
    virtual Result<void> resize(int cols, int rows) = 0;
    virtual void close() = 0;
};

struct RemoteEntry {
    std::string name;
    bool is_dir = false;
    bool is_link = false;       // symlink itself, never its target
    uint64_t size = 0;
    uint32_t mode = 0;
    int64_t mtime = 0;
};

// An open remote file. Calls block until done or the operation timeout.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // >0 bytes read, 0 end of file, -1 error.
    virtual ssize_t read(char* buf, std::size_t len) = 0;

    // Bytes written (all of len on success), -1 error.
    virtual ssize_t write(const char* data, std::size_t len) = 0;

    virtual void close() = 0;
};

class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    // stat follows a final symlink; lstat describes the link itself.
    virtual Result<RemoteEntry> stat(const std::string& path) = 0;
    virtual Result<RemoteEntry> lstat(const std::string& path) = 0;
    // Entries carry lstat attributes.
    virtual Result<std::vector<RemoteEntry>> list(const std::string& path) = 0;
    virtual Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) = 0;
    virtual Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path, int mode) = 0;
    virtual Result<void> mkdir(const std::string& path, int mode) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;
    virtual Result<void> unlink(const std::string& path) = 0;
    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<Channel>> open_channel() = 0;
    virtual Result<std::unique_ptr<SftpChannel>> open_sftp() = 0;

    // Sends a keepalive and checks the socket. False once the link is dead.
    virtual bool check_alive() = 0;

    virtual void disconnect() = 0;
};

// Opens authenticated transports. Authentication failures are reported as
// ErrorKind::AuthError, everything network related as ConnectionError.
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual Result<std::unique_ptr<Transport>> connect(const HostCredential& cred,
                                                       int timeout_ms) = 0;
};
