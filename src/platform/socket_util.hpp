#pragma once

// TCP plumbing underneath the libssh2 transport. POSIX only.

#include <string>
#include <core/types.hpp>

namespace platform {

constexpr int NO_SOCKET = -1;

// Kernel keepalive for long-lived pooled links, so a silently dropped
// peer surfaces as a socket error instead of a hung read.
struct TcpTuning {
    int keepalive_idle_secs = 60;
    int keepalive_interval_secs = 15;
    int keepalive_probes = 4;
    bool no_delay = true;
};

// Resolves `host` and connects to the first address that answers within
// timeout_ms. The returned fd is non-blocking. Every failure (DNS, refused,
// timeout) is ErrorKind::ConnectionError with the last cause in the message.
Result<int> open_tcp(const std::string& host, int port, int timeout_ms);

void tune_socket(int fd, const TcpTuning& tuning = {});

// Non-blocking check for POLLERR / POLLHUP / POLLNVAL.
bool socket_hung_up(int fd);

void close_socket(int fd);

} // namespace platform
