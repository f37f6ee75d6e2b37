#include <relay/net/tls_stream.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <limits>
#include <mutex>
#include <vector>

namespace relay::net {

namespace {

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        SSL_library_init();
        SSL_load_error_strings();
        OpenSSL_add_ssl_algorithms();
    });
}

std::string last_ssl_error(const char* what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + ": " + buf;
}

bool set_nonblocking(int fd, bool nonblocking, std::string& err) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        err = "fcntl(F_GETFL) failed: " + std::string(std::strerror(errno));
        return false;
    }

    const int target_flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd, F_SETFL, target_flags) < 0) {
        err = "fcntl(F_SETFL) failed: " + std::string(std::strerror(errno));
        return false;
    }
    return true;
}

// OpenSSL writes through plain write(2), which has no MSG_NOSIGNAL. Block
// SIGPIPE on this thread while the guard lives and discard one raised in
// the meantime, so a vanished peer shows up as a write error only.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
            // Someone else's SIGPIPE; leave it alone.
            return;
        }
        blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
    }

    ~SigpipeGuard() {
        if (!blocked_) {
            return;
        }
        const int saved_errno = errno;

        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
            struct timespec zero {};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);

        errno = saved_errno;
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool blocked_ = false;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TlsStream::TlsStream(int fd, size_t chunk_size) : fd_(fd), chunk_size_(chunk_size) {}

TlsStream::~TlsStream() {
    close();
}

// ---------------------------------------------------------------------------
// handshake
// ---------------------------------------------------------------------------

bool TlsStream::handshake(const std::string& host, bool verify_peer, std::string& err) {
    err.clear();
    if (fd_ < 0) {
        err = "TLS handshake on a closed descriptor";
        return false;
    }

    init_openssl_once();

    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ssl_ctx_) {
        err = last_ssl_error("SSL_CTX_new() failed");
        return false;
    }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Many servers close without close_notify once Connection: close is honoured.
    SSL_CTX_set_options(ssl_ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (verify_peer) {
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
            err = last_ssl_error("SSL_CTX_set_default_verify_paths() failed");
            return false;
        }
    } else {
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
    }

    ssl_ = SSL_new(ssl_ctx_);
    if (!ssl_) {
        err = last_ssl_error("SSL_new() failed");
        return false;
    }

    SSL_set_tlsext_host_name(ssl_, host.c_str());
    SSL_set_fd(ssl_, fd_);

    while (true) {
        SigpipeGuard guard;
        const int rc = SSL_connect(ssl_);
        if (rc == 1) {
            break;
        }

        const int ssl_error = SSL_get_error(ssl_, rc);
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }

        err = last_ssl_error("TLS handshake failed");
        return false;
    }

    if (verify_peer) {
        if (SSL_get_verify_result(ssl_) != X509_V_OK) {
            err = "TLS certificate verification failed: " +
                  std::string(X509_verify_cert_error_string(SSL_get_verify_result(ssl_)));
            return false;
        }

        X509* peer_cert = SSL_get_peer_certificate(ssl_);
        if (!peer_cert) {
            err = "TLS certificate verification failed: missing peer certificate";
            return false;
        }

        const int hostname_ok =
            X509_check_host(peer_cert, host.c_str(), host.size(), 0, nullptr);
        X509_free(peer_cert);
        if (hostname_ok != 1) {
            err = "TLS certificate verification failed: hostname mismatch for " + host;
            return false;
        }
    }

    // From here on a record without application data must surface as
    // WANT_READ instead of blocking inside SSL_read.
    SSL_clear_mode(ssl_, SSL_MODE_AUTO_RETRY);
    if (!set_nonblocking(fd_, true, err)) {
        return false;
    }

    connected_ = true;
    return true;
}

// ---------------------------------------------------------------------------
// I/O
// ---------------------------------------------------------------------------

bool TlsStream::wait_for(short events) {
    struct pollfd pfd {};
    pfd.fd = fd_;
    pfd.events = events;
    while (true) {
        const int rv = ::poll(&pfd, 1, -1);
        if (rv > 0) {
            return true;
        }
        if (rv < 0 && errno != EINTR) {
            return false;
        }
    }
}

bool TlsStream::write_all(std::string_view data) {
    if (!connected_ || failed_) return false;

    size_t written = 0;
    while (written < data.size()) {
        const int remaining = static_cast<int>(
            std::min<size_t>(data.size() - written, std::numeric_limits<int>::max()));

        int rc = 0;
        int ssl_error = SSL_ERROR_NONE;
        {
            SigpipeGuard guard;
            rc = SSL_write(ssl_, data.data() + written, remaining);
            if (rc <= 0) {
                ssl_error = SSL_get_error(ssl_, rc);
            }
        }
        if (rc > 0) {
            written += static_cast<size_t>(rc);
            continue;
        }

        if (ssl_error == SSL_ERROR_WANT_WRITE && wait_for(POLLOUT)) {
            continue;
        }
        if (ssl_error == SSL_ERROR_WANT_READ && wait_for(POLLIN)) {
            continue;
        }
        failed_ = true;
        return false;
    }
    return true;
}

std::optional<std::string> TlsStream::read_some() {
    if (!connected_) return std::nullopt;
    if (eof_) return std::string();
    if (failed_) return std::nullopt;

    std::vector<char> chunk(chunk_size_);
    while (true) {
        int rc = 0;
        int ssl_error = SSL_ERROR_NONE;
        {
            SigpipeGuard guard;
            errno = 0;
            rc = SSL_read(ssl_, chunk.data(), static_cast<int>(chunk.size()));
            if (rc <= 0) {
                ssl_error = SSL_get_error(ssl_, rc);
            }
        }
        if (rc > 0) {
            return std::string(chunk.data(), static_cast<size_t>(rc));
        }

        if (ssl_error == SSL_ERROR_ZERO_RETURN ||
            (ssl_error == SSL_ERROR_SYSCALL && errno == 0)) {
            // close_notify, or TCP FIN without one
            eof_ = true;
            return std::string();
        }
        if (ssl_error == SSL_ERROR_WANT_READ && wait_for(POLLIN)) {
            continue;
        }
        if (ssl_error == SSL_ERROR_WANT_WRITE && wait_for(POLLOUT)) {
            continue;
        }
        failed_ = true;
        return std::nullopt;
    }
}

bool TlsStream::has_pending() const {
    if (!connected_) return false;
    return eof_ || failed_ || SSL_pending(ssl_) > 0;
}

bool TlsStream::process_readable() {
    if (!connected_ || eof_ || failed_ || SSL_pending(ssl_) > 0) {
        return true;
    }

    char byte = 0;
    int rc = 0;
    int ssl_error = SSL_ERROR_NONE;
    {
        SigpipeGuard guard;
        errno = 0;
        rc = SSL_peek(ssl_, &byte, 1);
        if (rc <= 0) {
            ssl_error = SSL_get_error(ssl_, rc);
        }
    }
    if (rc > 0) {
        return true;
    }

    switch (ssl_error) {
        case SSL_ERROR_WANT_READ:
            // Handshake-layer record or partial record only
            return false;
        case SSL_ERROR_WANT_WRITE:
            // read_some() waits for the socket to drain
            return true;
        case SSL_ERROR_ZERO_RETURN:
            eof_ = true;
            return true;
        case SSL_ERROR_SYSCALL:
            if (errno == 0) {
                eof_ = true;
            } else {
                failed_ = true;
            }
            return true;
        default:
            failed_ = true;
            return true;
    }
}

// ---------------------------------------------------------------------------
// close
// ---------------------------------------------------------------------------

void TlsStream::close() {
    if (ssl_) {
        // No close_notify to a peer that already hung up or broke the session.
        const bool peer_closed = (SSL_get_shutdown(ssl_) & SSL_RECEIVED_SHUTDOWN) != 0;
        if (connected_ && !eof_ && !failed_ && !peer_closed) {
            SigpipeGuard guard;
            SSL_shutdown(ssl_);
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    connected_ = false;
    eof_ = false;
    failed_ = false;
}

bool TlsStream::is_open() const {
    return connected_;
}

} // namespace relay::net
