#pragma once

#include "transport.hpp"

#include <memory>

namespace hsdsync {

// SFTP through libcurl's libssh2 backend. Every connection owns a curl share
// handle holding the connection cache, so stat, listing and reads of one
// session reuse a single SSH connection.
class CurlSftpTransport final : public Transport {
public:
    CurlSftpTransport();

    [[nodiscard]] std::unique_ptr<Connection> connect(const ServerEndpoint& endpoint) override;
};

} // namespace hsdsync
