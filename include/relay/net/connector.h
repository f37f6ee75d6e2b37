#pragma once
#include <relay/core/config.h>
#include <relay/net/byte_stream.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace relay::net {

// DNS, connect or TLS handshake failure. Fatal for the connection that
// needed the target; nothing is retried.
class ConnectError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Resolve host and connect within `timeout`. Returns a connected,
// blocking descriptor owned by the caller. Throws ConnectError.
int connect_tcp(const std::string& host, uint16_t port,
                std::chrono::milliseconds timeout = core::config::kConnectTimeout);

// Yields a connected stream to host:port or throws ConnectError.
using TargetConnector =
    std::function<std::unique_ptr<ByteStream>(const std::string& host, uint16_t port)>;

TargetConnector plain_connector(
    std::chrono::milliseconds timeout = core::config::kConnectTimeout);

TargetConnector tls_connector(
    bool verify_peer = true,
    std::chrono::milliseconds timeout = core::config::kConnectTimeout);

} // namespace relay::net
