#include <relay/net/connector.h>
#include <relay/net/socket_stream.h>
#include <relay/net/tls_stream.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace relay::net {

int connect_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    const std::string port_str = std::to_string(port);

    struct addrinfo* results = nullptr;
    const int gai_rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0 || results == nullptr) {
        throw ConnectError("DNS resolution failed for host '" + host + "': " +
                           std::string(gai_strerror(gai_rc)));
    }

    int connected_fd = -1;
    std::string last_error;

    for (auto* rp = results; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) {
            last_error = "socket() failed: " + std::string(std::strerror(errno));
            continue;
        }

        // Non-blocking for the connect timeout only
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }

        int rc = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_error = "connect() failed: " + std::string(std::strerror(errno));
            ::close(fd);
            continue;
        }

        if (rc < 0) {
            struct pollfd pfd {};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int poll_rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (poll_rv == 0) {
                last_error = "connect() timed out";
                ::close(fd);
                continue;
            }
            if (poll_rv < 0) {
                last_error = "poll() failed while connecting: " + std::string(std::strerror(errno));
                ::close(fd);
                continue;
            }

            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) < 0 || sock_err != 0) {
                last_error = "connect() failed: " +
                             std::string(std::strerror(sock_err != 0 ? sock_err : errno));
                ::close(fd);
                continue;
            }
        }

        // Connected -- restore blocking mode
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags);
        }
        connected_fd = fd;
        break;
    }

    ::freeaddrinfo(results);

    if (connected_fd < 0) {
        throw ConnectError("Unable to connect to " + host + ":" + port_str + ": " +
                           (last_error.empty() ? "no usable address" : last_error));
    }
    return connected_fd;
}

TargetConnector plain_connector(std::chrono::milliseconds timeout) {
    return [timeout](const std::string& host, uint16_t port) -> std::unique_ptr<ByteStream> {
        return std::make_unique<SocketStream>(connect_tcp(host, port, timeout));
    };
}

TargetConnector tls_connector(bool verify_peer, std::chrono::milliseconds timeout) {
    return [verify_peer, timeout](const std::string& host,
                                  uint16_t port) -> std::unique_ptr<ByteStream> {
        // The stream owns the descriptor from here on, so a failed
        // handshake closes it on the way out.
        auto stream = std::make_unique<TlsStream>(connect_tcp(host, port, timeout));
        std::string err;
        if (!stream->handshake(host, verify_peer, err)) {
            throw ConnectError("TLS session with " + host + ":" + std::to_string(port) +
                               " failed: " + err);
        }
        return stream;
    };
}

} // namespace relay::net
