#pragma once
#include <relay/server/request_handler.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relay::server {

// Prefix routing: the first registered prefix the request URI starts with
// wins. The prefix is not stripped before the handler sees the request.
class Router {
public:
    void add(std::string prefix, std::shared_ptr<RequestHandler> handler);

    RequestHandler* route(const std::string& uri) const;

    // Route and handle. Replies 404 when nothing matches.
    void dispatch(net::ByteStream& client, http::Request& request,
                  core::DiagnosticEmitter& diagnostics) const;

    size_t size() const { return routes_.size(); }

private:
    std::vector<std::pair<std::string, std::shared_ptr<RequestHandler>>> routes_;
};

} // namespace relay::server
