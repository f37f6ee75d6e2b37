#include <relay/server/server_config.h>
#include <relay/net/connector.h>
#include <relay/proxy/proxy_handler.h>
#include <relay/server/static_file_handler.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>

namespace relay::server {

namespace {

constexpr const char kProgramName[] = "relay_server";

bool parse_unsigned(std::string_view text, unsigned long long max, unsigned long long& value) {
    if (text.empty()) {
        return false;
    }
    unsigned long long parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed > max) {
        return false;
    }
    value = parsed;
    return true;
}

bool parse_port(std::string_view text, uint16_t& port) {
    unsigned long long parsed = 0;
    if (!parse_unsigned(text, 65535, parsed)) {
        return false;
    }
    port = static_cast<uint16_t>(parsed);
    return true;
}

// "PREFIX=VALUE" -> {PREFIX, VALUE}; both parts non-empty.
bool split_route(std::string_view text, std::string& prefix, std::string& value) {
    const size_t eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 >= text.size()) {
        return false;
    }
    prefix = std::string(text.substr(0, eq));
    value = std::string(text.substr(eq + 1));
    return true;
}

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // anonymous namespace

void print_usage(std::ostream& stream) {
    stream << "usage: " << kProgramName
           << " [--port=N] [--static=PREFIX=DIR]... [--proxy=PREFIX=URL]...\n"
           << "       [--insecure] [--max-header-bytes=N] [--verbose]\n"
           << "\n"
           << "  --static=PREFIX=DIR   serve files below DIR for URIs starting with PREFIX\n"
           << "  --proxy=PREFIX=URL    relay URIs starting with PREFIX to URL\n"
           << "                        (http://host[:port] or https://host[:port])\n"
           << "  --insecure            do not verify target TLS certificates\n"
           << "  --max-header-bytes=N  reject header blocks larger than N bytes\n"
           << "  --verbose             log every relayed chunk\n"
           << "\n"
           << "Routes are matched in the order given; the first matching prefix wins.\n";
}

std::optional<TargetUrl> parse_target_url(const std::string& url) {
    constexpr std::string_view kSchemeSep = "://";
    const auto scheme_pos = url.find(kSchemeSep);
    if (scheme_pos == std::string::npos) {
        return std::nullopt;
    }

    TargetUrl target;
    const std::string scheme = to_lower_ascii(url.substr(0, scheme_pos));
    if (scheme == "https") {
        target.use_tls = true;
        target.port = 443;
    } else if (scheme == "http") {
        target.use_tls = false;
        target.port = 80;
    } else {
        return std::nullopt;
    }

    std::string authority = url.substr(scheme_pos + kSchemeSep.size());
    if (!authority.empty() && authority.back() == '/') {
        authority.pop_back();
    }
    if (authority.empty() || authority.find('/') != std::string::npos) {
        return std::nullopt;
    }

    const auto colon = authority.find(':');
    if (colon != std::string::npos) {
        if (!parse_port(std::string_view(authority).substr(colon + 1), target.port) ||
            target.port == 0) {
            return std::nullopt;
        }
        authority.erase(colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    target.host = authority;
    return target;
}

std::optional<ServerConfig> parse_command_line(const std::vector<std::string>& args,
                                               std::string& err) {
    constexpr std::string_view kPortPrefix = "--port=";
    constexpr std::string_view kStaticPrefix = "--static=";
    constexpr std::string_view kProxyPrefix = "--proxy=";
    constexpr std::string_view kMaxHeaderPrefix = "--max-header-bytes=";

    ServerConfig config;
    err.clear();

    for (const std::string& arg : args) {
        const std::string_view argument(arg);

        if (argument.starts_with(kPortPrefix)) {
            if (!parse_port(argument.substr(kPortPrefix.size()), config.port)) {
                err = "Invalid --port: '" + arg + "'";
                return std::nullopt;
            }
        } else if (argument.starts_with(kStaticPrefix)) {
            RouteSpec route;
            route.kind = RouteSpec::Kind::Static;
            if (!split_route(argument.substr(kStaticPrefix.size()), route.prefix, route.directory)) {
                err = "Invalid --static: '" + arg + "' (expected --static=PREFIX=DIR)";
                return std::nullopt;
            }
            config.routes.push_back(std::move(route));
        } else if (argument.starts_with(kProxyPrefix)) {
            RouteSpec route;
            route.kind = RouteSpec::Kind::Proxy;
            std::string url;
            if (!split_route(argument.substr(kProxyPrefix.size()), route.prefix, url)) {
                err = "Invalid --proxy: '" + arg + "' (expected --proxy=PREFIX=URL)";
                return std::nullopt;
            }
            auto target = parse_target_url(url);
            if (!target) {
                err = "Invalid --proxy target URL: '" + url + "'";
                return std::nullopt;
            }
            route.target = *target;
            config.routes.push_back(std::move(route));
        } else if (argument.starts_with(kMaxHeaderPrefix)) {
            unsigned long long parsed = 0;
            if (!parse_unsigned(argument.substr(kMaxHeaderPrefix.size()), SIZE_MAX, parsed) ||
                parsed == 0) {
                err = "Invalid --max-header-bytes: '" + arg + "'";
                return std::nullopt;
            }
            config.max_header_bytes = static_cast<size_t>(parsed);
        } else if (argument == "--insecure") {
            config.verify_tls = false;
        } else if (argument == "--verbose") {
            config.min_severity = core::Severity::Debug;
        } else {
            err = "Unknown argument: '" + arg + "'";
            return std::nullopt;
        }
    }

    return config;
}

std::shared_ptr<Router> build_router(const ServerConfig& config) {
    auto router = std::make_shared<Router>();
    for (const auto& route : config.routes) {
        switch (route.kind) {
            case RouteSpec::Kind::Static:
                router->add(route.prefix, std::make_shared<StaticFileHandler>(route.directory));
                break;
            case RouteSpec::Kind::Proxy: {
                net::TargetConnector connector = route.target.use_tls
                                                     ? net::tls_connector(config.verify_tls)
                                                     : net::plain_connector();
                router->add(route.prefix,
                            std::make_shared<proxy::ProxyHandler>(
                                route.target.host, route.target.port, std::move(connector),
                                nullptr, config.max_header_bytes));
                break;
            }
        }
    }
    return router;
}

} // namespace relay::server
