/*
 * 설명: getaddrinfo/connect로 TCP 연결을 열고, 필요하면 OpenSSL로 인증서와 호스트명을 검증하는 TLS 세션을 맺는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp
 */
#include "client/transport.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace {
const std::size_t kReadChunk = 4096;

struct SslCtxDeleter {
    void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
};
struct SslDeleter {
    void operator()(SSL *ssl) const { SSL_free(ssl); }
};
typedef std::unique_ptr<SSL_CTX, SslCtxDeleter> SslCtxPtr;
typedef std::unique_ptr<SSL, SslDeleter> SslPtr;

std::string LastSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown tls error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

bool SetBlocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

// EAGAIN 이후 소켓이 다시 준비될 때까지 기다린다.
bool WaitFor(int fd, short events, std::string &error) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    while (poll(&pfd, 1, -1) < 0) {
        if (errno != EINTR) {
            error = std::strerror(errno);
            return false;
        }
    }
    return true;
}

int ConnectTcp(const std::string &host, int port, std::string &error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::ostringstream port_text;
    port_text << port;

    struct addrinfo *res = NULL;
    int err = getaddrinfo(host.c_str(), port_text.str().c_str(), &hints, &res);
    if (err != 0) {
        error = "failed to resolve " + host + ": " + gai_strerror(err);
        return -1;
    }

    int fd = -1;
    std::string last_error = "no address";
    for (struct addrinfo *p = res; p != NULL; p = p->ai_next) {
        fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
            break;
        }
        last_error = std::strerror(errno);
        close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        error = "failed to connect to " + host + ":" + port_text.str() + ": " + last_error;
        return -1;
    }

    int yes = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    fcntl(fd, F_SETFD, FD_CLOEXEC);
    return fd;
}

class PlainTransport : public client::Transport {
   public:
    explicit PlainTransport(int fd) : fd_(fd) {}
    ~PlainTransport() { close(fd_); }

    int fd() const { return fd_; }

    client::ReadStatus Read(std::string &out, std::string &error) {
        char buf[kReadChunk];
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            return client::ReadStatus::kData;
        }
        if (n == 0) {
            return client::ReadStatus::kEof;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return client::ReadStatus::kWouldBlock;
        }
        error = std::strerror(errno);
        return client::ReadStatus::kError;
    }

    bool WriteAll(const std::string &data, std::string &error) {
        std::size_t offset = 0;
        while (offset < data.size()) {
            ssize_t n = send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n > 0) {
                offset += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!WaitFor(fd_, POLLOUT, error)) {
                    return false;
                }
                continue;
            }
            error = std::strerror(errno);
            return false;
        }
        return true;
    }

    bool HasBufferedData() const { return false; }

   private:
    int fd_;
};

class TlsTransport : public client::Transport {
   public:
    TlsTransport(int fd, SslCtxPtr ctx, SslPtr ssl)
        : fd_(fd), failed_(false), ctx_(std::move(ctx)), ssl_(std::move(ssl)) {}

    ~TlsTransport() {
        // 치명적 오류 이후에는 close_notify를 보내지 않는다.
        if (!failed_) {
            SSL_shutdown(ssl_.get());
        }
        ssl_.reset();
        close(fd_);
    }

    int fd() const { return fd_; }

    client::ReadStatus Read(std::string &out, std::string &error) {
        char buf[kReadChunk];
        errno = 0;
        ERR_clear_error();
        int n = SSL_read(ssl_.get(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            return client::ReadStatus::kData;
        }
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            return client::ReadStatus::kWouldBlock;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            return client::ReadStatus::kEof;
        }
        failed_ = true;
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            if (errno == 0) {
                // close_notify 없이 끊긴 연결
                return client::ReadStatus::kEof;
            }
            error = std::strerror(errno);
            return client::ReadStatus::kError;
        }
        error = LastSslError();
        return client::ReadStatus::kError;
    }

    bool WriteAll(const std::string &data, std::string &error) {
        std::size_t offset = 0;
        while (offset < data.size()) {
            errno = 0;
            ERR_clear_error();
            int n = SSL_write(ssl_.get(), data.data() + offset,
                              static_cast<int>(data.size() - offset));
            if (n > 0) {
                offset += static_cast<std::size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl_.get(), n);
            if (err == SSL_ERROR_WANT_WRITE) {
                if (!WaitFor(fd_, POLLOUT, error)) {
                    return false;
                }
                continue;
            }
            if (err == SSL_ERROR_WANT_READ) {
                if (!WaitFor(fd_, POLLIN, error)) {
                    return false;
                }
                continue;
            }
            failed_ = true;
            error = err == SSL_ERROR_SYSCALL && errno != 0 ? std::strerror(errno) : LastSslError();
            return false;
        }
        return true;
    }

    bool HasBufferedData() const { return SSL_pending(ssl_.get()) > 0; }

   private:
    int fd_;
    bool failed_;
    SslCtxPtr ctx_;
    SslPtr ssl_;
};

bool StartTls(int fd, const std::string &host, std::unique_ptr<client::Transport> &out,
              std::string &error) {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        error = "failed to create tls context: " + LastSslError();
        return false;
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, NULL);
    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
        error = "failed to load trust store: " + LastSslError();
        return false;
    }
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    SslPtr ssl(SSL_new(ctx.get()));
    if (!ssl) {
        error = "failed to create tls session: " + LastSslError();
        return false;
    }
    SSL_set_fd(ssl.get(), fd);
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    SSL_set1_host(ssl.get(), host.c_str());

    // 소켓이 아직 블로킹 모드이므로 핸드셰이크가 끝날 때까지 기다린다.
    ERR_clear_error();
    if (SSL_connect(ssl.get()) != 1) {
        error = "failed to establish tls stream to " + host + ": " + LastSslError();
        return false;
    }

    out.reset(new TlsTransport(fd, std::move(ctx), std::move(ssl)));
    return true;
}
}  // namespace

namespace client {

bool OpenTransport(const std::string &host, int port, bool use_tls,
                   std::unique_ptr<Transport> &out, std::string &error) {
    int fd = ConnectTcp(host, port, error);
    if (fd < 0) {
        return false;
    }

    if (use_tls) {
        if (!StartTls(fd, host, out, error)) {
            close(fd);
            return false;
        }
    } else {
        out.reset(new PlainTransport(fd));
    }

    if (!SetBlocking(fd, false)) {
        error = std::string("failed to set non-blocking mode: ") + std::strerror(errno);
        out.reset();
        return false;
    }
    return true;
}

}  // namespace client
