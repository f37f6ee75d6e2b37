#pragma once
#include <relay/core/config.h>
#include <relay/core/diagnostics.h>
#include <relay/server/router.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace relay::server {

struct ServerOptions {
    uint16_t port = core::config::kDefaultPort;
    size_t max_header_bytes = core::config::kMaxHeaderBytes;
    core::Severity min_severity = core::Severity::Info;
};

// Accept loop. Every accepted connection gets its own detached thread,
// its own DiagnosticEmitter (correlation id = connection number) and its
// own parser state; nothing is shared between connections except the
// router and the diagnostic observers.
class Server {
public:
    Server(ServerOptions options, std::shared_ptr<Router> router);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void add_observer(core::DiagnosticObserver observer);

    // Bind and listen. Port 0 picks an ephemeral port, see port().
    // Throws std::runtime_error.
    void listen();

    // Accept until stop(). Calls listen() first if needed.
    void run();

    // Safe to call from a signal handler.
    void stop();

    uint16_t port() const { return port_; }
    size_t active_connections() const { return active_->load(); }
    uint64_t accepted_connections() const { return next_id_; }

private:
    void spawn_connection(int fd);

    ServerOptions options_;
    std::shared_ptr<Router> router_;
    std::vector<core::DiagnosticObserver> observers_;
    core::DiagnosticEmitter diagnostics_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> next_id_{0};
    std::shared_ptr<std::atomic<size_t>> active_;
};

} // namespace relay::server
