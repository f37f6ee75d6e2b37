#include <relay/net/socket_stream.h>

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace relay::net {

std::pair<SocketStream, SocketStream> SocketStream::create_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw std::runtime_error(
            std::string("socketpair failed: ") + std::strerror(errno));
    }

    // Large buffers so tests can write a whole exchange before the other
    // end starts reading.
    constexpr int buf_size = 256 * 1024;
    for (int fd : fds) {
        ::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buf_size, sizeof(buf_size));
        ::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buf_size, sizeof(buf_size));
    }

    return {SocketStream(fds[0]), SocketStream(fds[1])};
}

SocketStream::SocketStream(int fd, size_t chunk_size) : fd_(fd), chunk_size_(chunk_size) {}

SocketStream::~SocketStream() {
    close();
}

SocketStream::SocketStream(SocketStream&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), chunk_size_(other.chunk_size_) {}

SocketStream& SocketStream::operator=(SocketStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        chunk_size_ = other.chunk_size_;
    }
    return *this;
}

bool SocketStream::write_all(std::string_view data) {
    if (!is_open()) return false;

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> SocketStream::read_some() {
    if (!is_open()) return std::nullopt;

    std::vector<char> chunk(chunk_size_);
    while (true) {
        ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
        if (n > 0) {
            return std::string(chunk.data(), static_cast<size_t>(n));
        }
        if (n == 0) {
            // Connection closed by peer
            return std::string();
        }
        if (errno == EINTR) continue;
        return std::nullopt;
    }
}

void SocketStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SocketStream::is_open() const {
    return fd_ >= 0;
}

void SocketStream::shutdown_write() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_WR);
    }
}

int SocketStream::release() {
    return std::exchange(fd_, -1);
}

} // namespace relay::net
