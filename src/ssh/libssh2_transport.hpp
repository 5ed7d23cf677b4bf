#pragma once

#include "transport.hpp"
#include <core/constants.hpp>

// libssh2-backed transport. One LIBSSH2_SESSION in non-blocking mode over a
// TCP socket; every libssh2 call on a session (and its channels and SFTP
// handles) is serialized by the session's io mutex.
class Libssh2TransportFactory : public TransportFactory {
public:
    explicit Libssh2TransportFactory(int op_timeout_secs = SFTP_OP_TIMEOUT_SECS);

    Result<std::unique_ptr<Transport>> connect(const HostCredential& cred,
                                               int timeout_ms) override;

private:
    int op_timeout_secs_;
};
