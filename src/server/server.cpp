#include <relay/server/server.h>
#include <relay/net/socket_stream.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace relay::server {

namespace {

constexpr const char kModule[] = "server";
constexpr int kAcceptPollMs = 200;

std::string peer_name(int fd) {
    struct sockaddr_storage addr {};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return "unknown";
    }

    char host[INET6_ADDRSTRLEN] = {};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "local";
    }
    return std::string(host) + ":" + std::to_string(port);
}

void handle_connection(int fd, uint64_t id, const std::shared_ptr<Router>& router,
                       const std::vector<core::DiagnosticObserver>& observers,
                       const ServerOptions& options) {
    net::SocketStream client(fd);

    core::DiagnosticEmitter diagnostics;
    diagnostics.set_correlation_id(id);
    diagnostics.set_min_severity(options.min_severity);
    for (const auto& observer : observers) {
        diagnostics.add_observer(observer);
    }

    const std::string peer = peer_name(fd);
    diagnostics.info(kModule, "accept", "Reading from " + peer);

    try {
        http::Request request = read_request(client, options.max_header_bytes);
        diagnostics.info(kModule, "request", request.start_line());
        router->dispatch(client, request, diagnostics);
    } catch (const std::exception& e) {
        diagnostics.error(kModule, "connection",
                          "ERROR handling request from " + peer + ": " + e.what());
    }

    client.close();
}

} // anonymous namespace

Server::Server(ServerOptions options, std::shared_ptr<Router> router)
    : options_(options),
      router_(std::move(router)),
      active_(std::make_shared<std::atomic<size_t>>(0)) {
    if (!router_) {
        throw std::invalid_argument("Server requires a router");
    }
    diagnostics_.set_min_severity(options_.min_severity);
}

Server::~Server() {
    stop();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void Server::add_observer(core::DiagnosticObserver observer) {
    observers_.push_back(observer);
    diagnostics_.add_observer(std::move(observer));
}

void Server::listen() {
    if (listen_fd_ >= 0) {
        return;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(options_.port);

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("bind() to port " + std::to_string(options_.port) +
                                 " failed: " + reason);
    }
    if (::listen(fd, core::config::kListenBacklog) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("listen() failed: " + reason);
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("getsockname() failed: " + reason);
    }

    listen_fd_ = fd;
    port_ = ntohs(addr.sin_port);
    diagnostics_.info(kModule, "listen", "Listening on port " + std::to_string(port_));
}

void Server::run() {
    listen();

    while (!stopping_.load()) {
        struct pollfd pfd {};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int rv = ::poll(&pfd, 1, kAcceptPollMs);
        if (rv < 0) {
            if (errno == EINTR) continue;
            diagnostics_.error(kModule, "accept", std::string("poll() failed: ") + std::strerror(errno));
            break;
        }
        if (rv == 0) {
            continue;
        }

        int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN) continue;
            diagnostics_.error(kModule, "accept", std::string("accept() failed: ") + std::strerror(errno));
            break;
        }
        spawn_connection(client_fd);
    }

    ::close(listen_fd_);
    listen_fd_ = -1;
    diagnostics_.info(kModule, "stop", "Socket closed");
}

void Server::stop() {
    stopping_.store(true);
}

void Server::spawn_connection(int fd) {
    const uint64_t id = ++next_id_;
    auto active = active_;
    active->fetch_add(1);

    try {
        // Copies only: the thread may outlive this Server.
        std::thread([fd, id, router = router_, observers = observers_,
                     options = options_, active]() {
            handle_connection(fd, id, router, observers, options);
            active->fetch_sub(1);
        }).detach();
    } catch (const std::system_error& e) {
        active->fetch_sub(1);
        ::close(fd);
        diagnostics_.error(kModule, "spawn", std::string("Cannot start connection thread: ") + e.what());
    }
}

} // namespace relay::server
