#pragma once
#include <relay/core/config.h>
#include <relay/core/diagnostics.h>
#include <relay/http/request.h>
#include <relay/net/byte_stream.h>
#include <relay/proxy/rewrite_strategy.h>
#include <cstddef>
#include <memory>
#include <string>

namespace relay::proxy {

enum class RelayEnd {
    ClientClosed,
    TargetClosed,
    ClientError,
    TargetError,
    NothingToWaitOn,
};

const char* relay_end_name(RelayEnd end);

// Byte counters for logging; they never influence the relay.
struct RelayStats {
    size_t client_to_target_bytes = 0;
    size_t target_to_client_bytes = 0;
    RelayEnd end = RelayEnd::TargetClosed;

    std::string format() const;
};

// Relays one request/response exchange between a client and a target.
//
// The request has already been parsed from the client. It is passed
// through rewrite_request(), serialized and written to the target. Then
// both streams are pumped until either side closes or fails. Response
// bytes are held back until the response headers are complete; at that
// point rewrite_response() runs and the canonical serialized message
// (status-line, rewritten headers, body bytes received so far) replaces
// the raw bytes. After that, bytes flow unmodified in both directions.
class RelayEngine {
public:
    explicit RelayEngine(std::shared_ptr<RewriteStrategy> strategy,
                         core::DiagnosticEmitter* diagnostics = nullptr,
                         size_t max_header_bytes = core::config::kMaxHeaderBytes);

    // Takes ownership of the target and closes it on every exit path,
    // including a ParseError thrown for a malformed response. The client
    // stays open; closing it is the caller's job.
    RelayStats run(net::ByteStream& client, http::Request& request,
                   std::unique_ptr<net::ByteStream> target);

    RewriteStrategy& strategy() { return *strategy_; }

private:
    void log(core::Severity severity, const std::string& stage, const std::string& message);

    std::shared_ptr<RewriteStrategy> strategy_;
    core::DiagnosticEmitter* diagnostics_;
    size_t max_header_bytes_;
};

} // namespace relay::proxy
