#include <relay/core/diagnostics.h>
#include <relay/server/server.h>
#include <relay/server/server_config.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kVersionString[] = "relay_server 0.1.0";

relay::server::Server* g_server = nullptr;

void handle_signal(int /*signal*/) {
    if (g_server != nullptr) {
        g_server->stop();
    }
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc == 2 && is_help_flag(argv[1])) {
        relay::server::print_usage(std::cout);
        return 0;
    }
    if (argc == 2 && is_version_flag(argv[1])) {
        std::cout << kVersionString << "\n";
        return 0;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string err;
    auto config = relay::server::parse_command_line(args, err);
    if (!config) {
        std::cerr << err << "\n";
        relay::server::print_usage(std::cerr);
        return 1;
    }

    relay::server::ServerOptions options;
    options.port = config->port;
    options.max_header_bytes = config->max_header_bytes;
    options.min_severity = config->min_severity;

    try {
        relay::server::Server server(options, relay::server::build_router(*config));
        server.add_observer(relay::core::stderr_observer());

        g_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        // Peers that vanish mid-write surface as write errors instead.
        std::signal(SIGPIPE, SIG_IGN);

        server.run();
        g_server = nullptr;
    } catch (const std::exception& e) {
        g_server = nullptr;
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cerr << "Quitting.\n";
    return 0;
}
