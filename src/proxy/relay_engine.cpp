#include <relay/proxy/relay_engine.h>
#include <relay/http/response.h>
#include <relay/net/readiness.h>

#include <sstream>
#include <stdexcept>
#include <utility>

namespace relay::proxy {

namespace {

constexpr const char kModule[] = "relay";

} // anonymous namespace

const char* relay_end_name(RelayEnd end) {
    switch (end) {
        case RelayEnd::ClientClosed:    return "client-closed";
        case RelayEnd::TargetClosed:    return "target-closed";
        case RelayEnd::ClientError:     return "client-error";
        case RelayEnd::TargetError:     return "target-error";
        case RelayEnd::NothingToWaitOn: return "nothing-to-wait-on";
    }
    return "unknown";
}

std::string RelayStats::format() const {
    std::ostringstream oss;
    oss << "client_to_target_bytes=" << client_to_target_bytes
        << ", target_to_client_bytes=" << target_to_client_bytes
        << ", end=" << relay_end_name(end);
    return oss.str();
}

RelayEngine::RelayEngine(std::shared_ptr<RewriteStrategy> strategy,
                         core::DiagnosticEmitter* diagnostics,
                         size_t max_header_bytes)
    : strategy_(std::move(strategy)),
      diagnostics_(diagnostics),
      max_header_bytes_(max_header_bytes) {
    if (!strategy_) {
        throw std::invalid_argument("RelayEngine requires a rewrite strategy");
    }
}

void RelayEngine::log(core::Severity severity, const std::string& stage,
                      const std::string& message) {
    if (diagnostics_) {
        diagnostics_->emit(severity, kModule, stage, message);
    }
}

RelayStats RelayEngine::run(net::ByteStream& client, http::Request& request,
                            std::unique_ptr<net::ByteStream> target) {
    if (!target) {
        throw std::invalid_argument("RelayEngine::run requires a target stream");
    }

    RelayStats stats;

    strategy_->rewrite_request(request);

    // The request is already in hand: send it before pumping in either direction.
    const std::string request_data = request.serialize();
    log(core::Severity::Info, "request", request.start_line());
    if (!target->write_all(request_data)) {
        stats.end = RelayEnd::TargetError;
        log(core::Severity::Warning, "request", "Failed to write request to target");
        target->close();
        return stats;
    }
    stats.client_to_target_bytes = request_data.size();
    log(core::Severity::Debug, "client>target", std::to_string(request_data.size()) + " bytes");

    http::Response response(max_header_bytes_);

    net::ReadinessSet readiness;
    const size_t client_index = readiness.add(client);
    readiness.add(*target);

    bool done = false;
    while (!done) {
        auto ready = readiness.wait();
        if (ready.empty()) {
            stats.end = RelayEnd::NothingToWaitOn;
            break;
        }

        for (size_t index : ready) {
            if (index == client_index) {
                // local > remote
                auto data = client.read_some();
                if (!data) {
                    stats.end = RelayEnd::ClientError;
                    done = true;
                    break;
                }
                if (data->empty()) {
                    stats.end = RelayEnd::ClientClosed;
                    done = true;
                    break;
                }
                if (!target->write_all(*data)) {
                    stats.end = RelayEnd::TargetError;
                    done = true;
                    break;
                }
                stats.client_to_target_bytes += data->size();
                log(core::Severity::Debug, "client>target", std::to_string(data->size()) + " bytes");
                continue;
            }

            // remote > local
            auto data = target->read_some();
            if (!data) {
                stats.end = RelayEnd::TargetError;
                done = true;
                break;
            }
            if (data->empty()) {
                stats.end = RelayEnd::TargetClosed;
                done = true;
                break;
            }

            std::string outbound;
            if (!response.headers_read()) {
                response.feed(*data);
                // Wait for the end of the header
                if (!response.headers_read()) {
                    continue;
                }
                log(core::Severity::Info, "response", response.start_line());
                strategy_->rewrite_response(response);
                outbound = response.serialize();
            } else {
                outbound = std::move(*data);
            }

            if (!client.write_all(outbound)) {
                stats.end = RelayEnd::ClientError;
                done = true;
                break;
            }
            stats.target_to_client_bytes += outbound.size();
            log(core::Severity::Debug, "target>client", std::to_string(outbound.size()) + " bytes");
        }
    }

    target->close();
    log(core::Severity::Info, "close", "Closing proxied request. " + stats.format());
    return stats;
}

} // namespace relay::proxy
