#include <relay/net/readiness.h>
#include <relay/net/socket_stream.h>
#include <relay/net/tls_stream.h>
#include <relay/proxy/relay_engine.h>
#include <relay/proxy/rewrite_strategy.h>

#include <gtest/gtest.h>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace relay;
using namespace relay::net;

namespace {

// Server end of an in-process TLS session over one half of a socketpair.
// The descriptor stays blocking; OpenSSL's default auto-retry hides
// anything that is not application data.
class ServerSession {
public:
    ServerSession(SSL_CTX* ctx, int fd) : fd_(fd), ssl_(SSL_new(ctx)) {
        SSL_set_fd(ssl_, fd_);
    }

    ~ServerSession() { close_abruptly(); }

    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    bool accept() { return SSL_accept(ssl_) == 1; }

    // Read until the bytes received so far end with `marker`.
    std::string read_until(const std::string& marker) {
        std::string received;
        char buf[1024];
        while (received.size() < marker.size() ||
               received.compare(received.size() - marker.size(), marker.size(), marker) != 0) {
            const int rc = SSL_read(ssl_, buf, sizeof(buf));
            if (rc <= 0) break;
            received.append(buf, static_cast<size_t>(rc));
        }
        return received;
    }

    bool write(std::string_view data) {
        return SSL_write(ssl_, data.data(), static_cast<int>(data.size())) ==
               static_cast<int>(data.size());
    }

    // close_notify, then drop the descriptor.
    void close_cleanly() {
        if (ssl_) SSL_shutdown(ssl_);
        close_abruptly();
    }

    // Drop the descriptor without telling the peer.
    void close_abruptly() {
        if (ssl_) {
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
    SSL* ssl_;
};

// Joins on scope exit so a failed ASSERT cannot leave a joinable thread.
class JoiningThread {
public:
    explicit JoiningThread(std::function<void()> body) : thread_(std::move(body)) {}
    ~JoiningThread() { join(); }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

private:
    std::thread thread_;
};

std::pair<int, int> make_fd_pair() {
    auto [first, second] = SocketStream::create_pair();
    return {first.release(), second.release()};
}

http::Request parse_request(const std::string& raw) {
    http::Request request;
    request.feed(raw);
    return request;
}

std::string read_exactly(ByteStream& stream, size_t size) {
    std::string out;
    while (out.size() < size) {
        auto data = stream.read_some();
        if (!data || data->empty()) break;
        out += *data;
    }
    return out;
}

bool sigpipe_blocked_or_pending() {
    sigset_t mask;
    sigemptyset(&mask);
    pthread_sigmask(SIG_BLOCK, nullptr, &mask);
    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    return sigismember(&mask, SIGPIPE) == 1 || sigismember(&pending, SIGPIPE) == 1;
}

} // namespace

class TlsStreamTest : public ::testing::Test {
protected:
    // Self-signed P-256 certificate for "localhost", generated once.
    static void SetUpTestSuite() {
        EVP_PKEY* key = EVP_EC_gen("P-256");
        ASSERT_NE(key, nullptr);

        X509* cert = X509_new();
        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);
        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(cert, name);
        ASSERT_GT(X509_sign(cert, key, EVP_sha256()), 0);

        server_ctx_ = SSL_CTX_new(TLS_server_method());
        ASSERT_NE(server_ctx_, nullptr);
        // TLS 1.3 sends session tickets after the handshake
        SSL_CTX_set_min_proto_version(server_ctx_, TLS1_3_VERSION);
        ASSERT_EQ(SSL_CTX_use_certificate(server_ctx_, cert), 1);
        ASSERT_EQ(SSL_CTX_use_PrivateKey(server_ctx_, key), 1);

        X509_free(cert);
        EVP_PKEY_free(key);
    }

    static void TearDownTestSuite() {
        SSL_CTX_free(server_ctx_);
        server_ctx_ = nullptr;
    }

    void SetUp() override { ASSERT_NE(server_ctx_, nullptr); }

    static SSL_CTX* server_ctx_;
};

SSL_CTX* TlsStreamTest::server_ctx_ = nullptr;

// ------------------------------------------------------------------
// 1. Records without application data
// ------------------------------------------------------------------

TEST_F(TlsStreamTest, SessionTicketAloneIsNotReadable) {
    auto [client_fd, server_fd] = make_fd_pair();

    std::string received;
    JoiningThread server([&received, fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        received = session.read_until("ping");
        session.write("pong");
        session.close_cleanly();
    });

    TlsStream stream(client_fd);
    std::string err;
    ASSERT_TRUE(stream.handshake("localhost", false, err)) << err;

    // The tickets make the descriptor readable with nothing to hand out.
    struct pollfd pfd {};
    pfd.fd = stream.fd();
    pfd.events = POLLIN;
    ASSERT_EQ(::poll(&pfd, 1, 2000), 1);
    EXPECT_FALSE(stream.process_readable());
    EXPECT_FALSE(stream.has_pending());
    EXPECT_TRUE(stream.is_open());

    ASSERT_TRUE(stream.write_all("ping"));

    ReadinessSet readiness;
    readiness.add(stream);
    auto ready = readiness.wait();
    ASSERT_EQ(ready, std::vector<size_t>{0});
    EXPECT_EQ(read_exactly(stream, 4), "pong");

    auto tail = stream.read_some();
    ASSERT_TRUE(tail.has_value());
    EXPECT_TRUE(tail->empty());

    server.join();
    EXPECT_EQ(received, "ping");
}

TEST_F(TlsStreamTest, ReadSomeWaitsPastSessionTickets) {
    auto [client_fd, server_fd] = make_fd_pair();

    JoiningThread server([fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        session.write("late");
        session.close_cleanly();
    });

    TlsStream stream(client_fd);
    std::string err;
    ASSERT_TRUE(stream.handshake("localhost", false, err)) << err;

    // Called without readiness, read_some() blocks like a plain socket read.
    EXPECT_EQ(read_exactly(stream, 4), "late");
}

// ------------------------------------------------------------------
// 2. Relaying over a TLS target
// ------------------------------------------------------------------

TEST_F(TlsStreamTest, RelaysBodySentAfterHeaders) {
    auto [client_local, client_remote] = SocketStream::create_pair();
    auto [target_fd, server_fd] = make_fd_pair();

    std::string received;
    JoiningThread server([&received, fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        // Nothing is sent back until the body byte arrives.
        received = session.read_until("\r\n\r\nX");
        session.write("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
        session.close_cleanly();
    });

    auto target = std::make_unique<TlsStream>(target_fd);
    std::string err;
    ASSERT_TRUE(target->handshake("localhost", false, err)) << err;

    // The headers go out first; the body follows once the relay is waiting.
    JoiningThread body([remote = &client_remote]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        remote->write_all("X");
    });

    proxy::RelayEngine engine(std::make_shared<proxy::DefaultRewriteStrategy>("localhost"));
    auto request = parse_request(
        "POST /upload HTTP/1.1\r\nHost: localhost\r\nContent-Length: 1\r\n\r\n");
    auto stats = engine.run(client_local, request, std::move(target));
    server.join();
    body.join();

    EXPECT_EQ(stats.end, proxy::RelayEnd::TargetClosed);
    EXPECT_EQ(received.rfind("POST /upload HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(received.find("Content-Length: 1\r\n"), std::string::npos);
    ASSERT_GE(received.size(), 5u);
    EXPECT_EQ(received.substr(received.size() - 5), "\r\n\r\nX");

    const std::string expected =
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";
    EXPECT_EQ(read_exactly(client_remote, expected.size()), expected);
    EXPECT_EQ(stats.target_to_client_bytes, expected.size());
}

TEST_F(TlsStreamTest, RelayEndsWhenTargetHangsUp) {
    auto [client_local, client_remote] = SocketStream::create_pair();
    auto [target_fd, server_fd] = make_fd_pair();

    JoiningThread server([fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        session.read_until("\r\n\r\n");
        session.close_abruptly();
    });

    auto target = std::make_unique<TlsStream>(target_fd);
    std::string err;
    ASSERT_TRUE(target->handshake("localhost", false, err)) << err;

    proxy::RelayEngine engine(std::make_shared<proxy::DefaultRewriteStrategy>("localhost"));
    auto request = parse_request("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");
    auto stats = engine.run(client_local, request, std::move(target));
    server.join();

    EXPECT_EQ(stats.end, proxy::RelayEnd::TargetClosed);
    EXPECT_EQ(stats.target_to_client_bytes, 0u);
    EXPECT_TRUE(client_local.is_open());
    EXPECT_FALSE(sigpipe_blocked_or_pending());
}

// ------------------------------------------------------------------
// 3. Peer gone before us
// ------------------------------------------------------------------

TEST_F(TlsStreamTest, CloseAfterPeerVanishedKeepsProcessAlive) {
    auto [client_fd, server_fd] = make_fd_pair();

    JoiningThread server([fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        session.read_until("hello");
        session.close_abruptly();
    });

    TlsStream stream(client_fd);
    std::string err;
    ASSERT_TRUE(stream.handshake("localhost", false, err)) << err;
    ASSERT_TRUE(stream.write_all("hello"));
    server.join();

    // No EOF seen yet, so close() still tries close_notify on a dead socket.
    stream.close();
    EXPECT_FALSE(stream.is_open());
    EXPECT_FALSE(sigpipe_blocked_or_pending());
}

TEST_F(TlsStreamTest, WriteAfterPeerVanishedFails) {
    auto [client_fd, server_fd] = make_fd_pair();

    JoiningThread server([fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        session.read_until("hello");
        session.close_abruptly();
    });

    TlsStream stream(client_fd);
    std::string err;
    ASSERT_TRUE(stream.handshake("localhost", false, err)) << err;
    ASSERT_TRUE(stream.write_all("hello"));
    server.join();

    bool ok = true;
    for (int i = 0; i < 8 && ok; ++i) {
        ok = stream.write_all(std::string(1024, 'z'));
    }
    EXPECT_FALSE(ok);
    EXPECT_FALSE(stream.read_some().has_value());
    EXPECT_FALSE(sigpipe_blocked_or_pending());

    stream.close();
    EXPECT_FALSE(stream.is_open());
}

TEST_F(TlsStreamTest, ReadReportsEofAfterCloseNotify) {
    auto [client_fd, server_fd] = make_fd_pair();

    JoiningThread server([fd = server_fd]() {
        ServerSession session(server_ctx_, fd);
        if (!session.accept()) return;
        session.close_cleanly();
    });

    TlsStream stream(client_fd);
    std::string err;
    ASSERT_TRUE(stream.handshake("localhost", false, err)) << err;
    server.join();

    ReadinessSet readiness;
    readiness.add(stream);
    ASSERT_EQ(readiness.wait(), std::vector<size_t>{0});
    auto data = stream.read_some();
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(data->empty());

    // EOF sticks; the shutdown the peer already did is not answered.
    EXPECT_TRUE(stream.has_pending());
    stream.close();
    EXPECT_FALSE(sigpipe_blocked_or_pending());
}
