#pragma once
#include <relay/core/config.h>
#include <relay/core/diagnostics.h>
#include <relay/http/request.h>
#include <relay/net/byte_stream.h>

namespace relay::server {

// Serves one parsed request on a client connection. Handlers are shared by
// every connection thread, so they keep no per-request state.
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual void handle(net::ByteStream& client, http::Request& request,
                        core::DiagnosticEmitter& diagnostics) = 0;
};

// Read from the client until the request headers are complete. Throws
// http::ParseError on malformed input and std::runtime_error when the
// client fails or closes first.
http::Request read_request(net::ByteStream& client,
                           size_t max_header_bytes = core::config::kMaxHeaderBytes);

// Minimal reply with Connection: close followed by an optional plain-text
// body. Returns false if the client could not be written to.
bool write_status(net::ByteStream& client, int status, const std::string& reason,
                  const std::string& body = {});

} // namespace relay::server
