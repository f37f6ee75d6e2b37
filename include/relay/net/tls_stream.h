#pragma once
#include <relay/core/config.h>
#include <relay/net/byte_stream.h>

#include <openssl/ssl.h>

#include <string>

namespace relay::net {

// OpenSSL client session over a connected TCP descriptor. The stream owns
// the descriptor and closes it together with the session.
//
// The handshake runs in blocking mode; afterwards the descriptor is
// non-blocking so that records without application data (session tickets,
// key updates, partial records) never stall a relay waiting on both sides.
// read_some() and write_all() still wait for the socket themselves, so they
// behave like their blocking SocketStream counterparts. SIGPIPE is blocked
// on the calling thread around every OpenSSL I/O call.
class TlsStream : public ByteStream {
public:
    explicit TlsStream(int fd, size_t chunk_size = core::config::kReadChunkSize);
    ~TlsStream() override;

    // Non-copyable, non-movable
    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;
    TlsStream(TlsStream&&) = delete;
    TlsStream& operator=(TlsStream&&) = delete;

    // Perform the client handshake. `host` is sent as SNI and, when
    // verify_peer is set, checked against the peer certificate.
    bool handshake(const std::string& host, bool verify_peer, std::string& err);

    int fd() const override { return fd_; }
    bool write_all(std::string_view data) override;
    std::optional<std::string> read_some() override;
    bool has_pending() const override;
    bool process_readable() override;
    void close() override;
    bool is_open() const override;

private:
    bool wait_for(short events);

    int fd_ = -1;
    size_t chunk_size_;
    SSL_CTX* ssl_ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    bool connected_ = false;
    // Outcomes seen ahead of read_some(): peer EOF or a fatal session error.
    bool eof_ = false;
    bool failed_ = false;
};

} // namespace relay::net
