#include <relay/server/router.h>

namespace relay::server {

void Router::add(std::string prefix, std::shared_ptr<RequestHandler> handler) {
    routes_.emplace_back(std::move(prefix), std::move(handler));
}

RequestHandler* Router::route(const std::string& uri) const {
    for (const auto& [prefix, handler] : routes_) {
        if (uri.starts_with(prefix)) {
            return handler.get();
        }
    }
    return nullptr;
}

void Router::dispatch(net::ByteStream& client, http::Request& request,
                      core::DiagnosticEmitter& diagnostics) const {
    RequestHandler* handler = route(request.uri());
    if (handler == nullptr) {
        diagnostics.warning("router", "dispatch", "No handler for " + request.uri());
        if (!write_status(client, 404, "Not Found", "No handler for " + request.uri() + ".\n")) {
            diagnostics.warning("router", "dispatch", "Failed to write 404 reply");
        }
        return;
    }
    handler->handle(client, request, diagnostics);
}

} // namespace relay::server
