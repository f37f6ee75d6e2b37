#pragma once
#include <relay/core/config.h>
#include <relay/net/connector.h>
#include <relay/proxy/rewrite_strategy.h>
#include <relay/server/request_handler.h>
#include <cstdint>
#include <memory>
#include <string>

namespace relay::proxy {

// Relays matching requests to a fixed target. Each request opens its own
// target connection through `connector` and runs one RelayEngine exchange.
// The strategy is shared across connection threads.
class ProxyHandler : public server::RequestHandler {
public:
    // Uses DefaultRewriteStrategy(target_host) when `strategy` is null.
    ProxyHandler(std::string target_host, uint16_t target_port,
                 net::TargetConnector connector,
                 std::shared_ptr<RewriteStrategy> strategy = nullptr,
                 size_t max_header_bytes = core::config::kMaxHeaderBytes);

    void handle(net::ByteStream& client, http::Request& request,
                core::DiagnosticEmitter& diagnostics) override;

    const std::string& target_host() const { return target_host_; }
    uint16_t target_port() const { return target_port_; }

private:
    std::string target_host_;
    uint16_t target_port_;
    net::TargetConnector connector_;
    std::shared_ptr<RewriteStrategy> strategy_;
    size_t max_header_bytes_;
};

} // namespace relay::proxy
