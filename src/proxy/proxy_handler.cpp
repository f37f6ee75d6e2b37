#include <relay/proxy/proxy_handler.h>
#include <relay/proxy/relay_engine.h>

#include <stdexcept>
#include <utility>

namespace relay::proxy {

ProxyHandler::ProxyHandler(std::string target_host, uint16_t target_port,
                           net::TargetConnector connector,
                           std::shared_ptr<RewriteStrategy> strategy,
                           size_t max_header_bytes)
    : target_host_(std::move(target_host)),
      target_port_(target_port),
      connector_(std::move(connector)),
      strategy_(std::move(strategy)),
      max_header_bytes_(max_header_bytes) {
    if (!connector_) {
        throw std::invalid_argument("ProxyHandler requires a target connector");
    }
    if (!strategy_) {
        strategy_ = std::make_shared<DefaultRewriteStrategy>(target_host_);
    }
}

void ProxyHandler::handle(net::ByteStream& client, http::Request& request,
                          core::DiagnosticEmitter& diagnostics) {
    diagnostics.info("proxy", "connect",
                     "Proxy request to " + target_host_ + ":" + std::to_string(target_port_));

    // Throws net::ConnectError; nothing to clean up on this side yet.
    std::unique_ptr<net::ByteStream> target = connector_(target_host_, target_port_);

    RelayEngine engine(strategy_, &diagnostics, max_header_bytes_);
    const RelayStats stats = engine.run(client, request, std::move(target));
    if (stats.end == RelayEnd::ClientError || stats.end == RelayEnd::TargetError) {
        diagnostics.warning("proxy", "relay",
                            std::string("Relay ended on ") + relay_end_name(stats.end));
    }
}

} // namespace relay::proxy
