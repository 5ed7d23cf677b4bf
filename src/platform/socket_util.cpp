#include "socket_util.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace platform {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { freeaddrinfo(ai); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// Empty on success, otherwise why this address did not connect.
std::string try_address(const addrinfo* ai, int timeout_ms, int* out_fd) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) return fmt::format("socket(): {}", std::strerror(errno));

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        *out_fd = fd;
        return "";
    }
    if (errno != EINPROGRESS) {
        std::string why = std::strerror(errno);
        ::close(fd);
        return why;
    }

    pollfd pfd{fd, POLLOUT, 0};
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready <= 0) {
        ::close(fd);
        return ready == 0 ? "timed out" : std::strerror(errno);
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
        ::close(fd);
        return std::strerror(so_error);
    }
    *out_fd = fd;
    return "";
}

} // namespace

Result<int> open_tcp(const std::string& host, int port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &raw);
    AddrInfoPtr addrs(raw);
    if (gai != 0 || !addrs) {
        return Result<int>::Err(ErrorKind::ConnectionError,
                                fmt::format("Cannot resolve {}: {}", host, gai_strerror(gai)));
    }

    std::string last = "no usable address";
    for (const addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
        int fd = NO_SOCKET;
        std::string why = try_address(ai, timeout_ms, &fd);
        if (why.empty()) return Result<int>::Ok(fd);
        fleet_log(fmt::format("tcp: {}:{} attempt failed: {}", host, port, why));
        last = why;
    }
    return Result<int>::Err(ErrorKind::ConnectionError,
                            fmt::format("Cannot connect to {}:{}: {}", host, port, last));
}

void tune_socket(int fd, const TcpTuning& tuning) {
    int on = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    if (tuning.no_delay) ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tuning.keepalive_idle_secs, sizeof(int));
#endif
#ifdef TCP_KEEPINTVL
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tuning.keepalive_interval_secs, sizeof(int));
#endif
#ifdef TCP_KEEPCNT
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tuning.keepalive_probes, sizeof(int));
#endif
}

bool socket_hung_up(int fd) {
    if (fd < 0) return true;
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 0) <= 0) return false;
    return (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0;
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace platform
