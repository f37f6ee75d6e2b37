#pragma once
#include <relay/core/config.h>
#include <relay/core/diagnostics.h>
#include <relay/server/router.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace relay::server {

struct TargetUrl {
    std::string host;
    uint16_t port = 80;
    bool use_tls = false;
};

// "http://host[:port]" or "https://host[:port]"; a trailing "/" is allowed.
std::optional<TargetUrl> parse_target_url(const std::string& url);

struct RouteSpec {
    enum class Kind {
        Static,
        Proxy,
    };

    Kind kind = Kind::Static;
    std::string prefix;
    std::string directory;  // Static
    TargetUrl target;       // Proxy
};

struct ServerConfig {
    uint16_t port = core::config::kDefaultPort;
    std::vector<RouteSpec> routes;
    bool verify_tls = true;
    size_t max_header_bytes = core::config::kMaxHeaderBytes;
    core::Severity min_severity = core::Severity::Info;
};

void print_usage(std::ostream& stream);

// Parses the arguments after the program name. On failure returns nullopt
// and sets `err`. --help and --version are handled by the caller.
std::optional<ServerConfig> parse_command_line(const std::vector<std::string>& args,
                                               std::string& err);

// Routes in command-line order.
std::shared_ptr<Router> build_router(const ServerConfig& config);

} // namespace relay::server
