#pragma once
#include <relay/core/config.h>
#include <relay/net/byte_stream.h>
#include <utility>

namespace relay::net {

// Plain TCP (or AF_UNIX) stream over an owned, connected descriptor.
class SocketStream : public ByteStream {
public:
    // Create a pair of connected streams (for in-process testing)
    static std::pair<SocketStream, SocketStream> create_pair();

    explicit SocketStream(int fd, size_t chunk_size = core::config::kReadChunkSize);
    ~SocketStream() override;

    // Move-only
    SocketStream(SocketStream&& other) noexcept;
    SocketStream& operator=(SocketStream&& other) noexcept;
    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    int fd() const override { return fd_; }
    bool write_all(std::string_view data) override;
    std::optional<std::string> read_some() override;
    void close() override;
    bool is_open() const override;

    // Half-close: the peer reads EOF but can still send to us.
    void shutdown_write();

    // Give up ownership of the descriptor without closing it.
    int release();

private:
    int fd_ = -1;
    size_t chunk_size_;
};

} // namespace relay::net
