#include "linesock/transport/Transport.hpp"

#include "linesock/Error.hpp"
#include "linesock/ErrorSink.hpp"
#include "linesock/transport/Interface.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <climits>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <openssl/err.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace linesock::transport {

namespace {

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

int createNonBlockingSocket(int domain, int type, int protocol) {
    const int fd = ::socket(domain, type | SOCK_NONBLOCK | SOCK_CLOEXEC, protocol);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return fd;
}

void setNonBlocking(int fd, bool non_blocking) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return;
    }
    const int updated = non_blocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (updated != flags) {
        (void)::fcntl(fd, F_SETFL, updated);
    }
}

// Zero disables the timeout.
void setIoTimeout(int fd, std::chrono::milliseconds timeout) noexcept {
    const auto total_us = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
    timeval tv {};
    tv.tv_sec = static_cast<time_t>(total_us / 1'000'000);
    tv.tv_usec = static_cast<suseconds_t>(total_us % 1'000'000);
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Binding may fail when the socket is already bound; that is not an error.
void bindToSource(int fd, const std::string& source_address) noexcept {
    sockaddr_in local {};
    local.sin_family = AF_INET;
    local.sin_port = htons(0);
    if (::inet_pton(AF_INET, source_address.c_str(), &local.sin_addr) != 1) {
        return;
    }
    (void)::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local));
}

// Returns 0 on success, otherwise an errno-compatible failure code.
int waitForConnectCompletion(int fd, std::chrono::milliseconds timeout) noexcept {
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    const auto timeout_ms = std::clamp<long long>(timeout.count(), 0, INT_MAX);
    int poll_result = 0;
    do {
        poll_result = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (poll_result < 0 && errno == EINTR);

    if (poll_result == 0) {
        return ETIMEDOUT;
    }
    if (poll_result < 0) {
        return errno;
    }

    int socket_error = 0;
    socklen_t option_len = sizeof(socket_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &option_len) != 0) {
        return errno;
    }
    return socket_error;
}

// Blocks SIGPIPE on the calling thread while OpenSSL writes to the socket.
// OpenSSL's socket BIO uses write(2), which has no MSG_NOSIGNAL; a SIGPIPE
// raised meanwhile is consumed before the previous mask is restored.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() noexcept {
        ::sigemptyset(&sigpipe_mask_);
        ::sigaddset(&sigpipe_mask_, SIGPIPE);

        sigset_t pending;
        ::sigemptyset(&pending);
        already_pending_ = ::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1;
        blocked_ = ::pthread_sigmask(SIG_BLOCK, &sigpipe_mask_, &saved_mask_) == 0;
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

    ~ScopedSigpipeBlock() {
        if (!blocked_) {
            return;
        }
        if (!already_pending_) {
            const int saved_errno = errno;
            struct timespec zero {};
            while (::sigtimedwait(&sigpipe_mask_, nullptr, &zero) < 0 && errno == EINTR) {
            }
            errno = saved_errno;
        }
        (void)::pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
    }

private:
    sigset_t sigpipe_mask_ {};
    sigset_t saved_mask_ {};
    bool already_pending_ = false;
    bool blocked_ = false;
};

}  // namespace

Transport::Transport(Settings settings, ErrorSink& sink)
    : sink_(sink),
      tls_(std::move(settings.tls)),
      interface_(std::move(settings.interface)),
      keep_alive_(settings.keep_alive),
      blocking_(settings.blocking),
      timeout_(settings.timeout) {}

Transport::~Transport() {
    close();
}

void Transport::connect(const std::string& address, uint16_t port) {
    close();
    address_ = address;
    port_ = port;

    try {
        openAndConnect(address, port);
        (void)configureKeepAlive(fd_, keep_alive_);
        if (tls_) {
            handshake();
        }
    } catch (const std::exception& e) {
        const std::string context = "connect " + address + ":" + std::to_string(port);
        sink_.record(e.what(), context);
        close();
        throw ConnectError("socket connect failed: " + address + ":" + std::to_string(port));
    }

    connected_ = true;
    applyBlockingMode();
}

void Transport::reconnect() noexcept {
    if (isConnected() || address_.empty() || port_ == 0) {
        return;
    }

    try {
        connect(address_, port_);
    } catch (const ConnectError&) {
        // Already recorded by connect(); stay disconnected until the next attempt.
        connected_ = false;
    }
}

void Transport::attach(int fd) {
    attach(fd, SslPtr{});
}

void Transport::attach(int fd, SslPtr session) {
    close();
    fd_ = fd;
    ssl_ = std::move(session);
    ssl_failed_ = false;
    connected_ = fd_ >= 0;
    if (!connected_) {
        return;
    }

    (void)configureKeepAlive(fd_, keep_alive_);
    applyBlockingMode();
    recoverPeerAddress();
}

void Transport::setBlocking(bool blocking, std::optional<std::chrono::milliseconds> timeout) noexcept {
    blocking_ = blocking;
    if (blocking && timeout.has_value()) {
        timeout_ = *timeout;
    }
    applyBlockingMode();
}

void Transport::close() noexcept {
    connected_ = false;

    if (ssl_) {
        if (fd_ >= 0 && !ssl_failed_) {
            const ScopedSigpipeBlock no_sigpipe;
            (void)::SSL_shutdown(ssl_.get());
        }
        ssl_.reset();
        ::ERR_clear_error();
    }
    ssl_failed_ = false;

    if (fd_ < 0) {
        return;
    }

    (void)::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
}

IoResult Transport::recvSome(std::span<char> buffer) noexcept {
    if (fd_ < 0) {
        return {IoStatus::Error, 0, EBADF};
    }

    if (ssl_) {
        ::ERR_clear_error();
        const int length = static_cast<int>(std::min<size_t>(buffer.size(), INT_MAX));
        const ScopedSigpipeBlock no_sigpipe;
        const int n = ::SSL_read(ssl_.get(), buffer.data(), length);
        const int saved_errno = errno;
        if (n > 0) {
            return {IoStatus::Ok, static_cast<size_t>(n), 0};
        }
        return classifyTlsResult(n, saved_errno);
    }

    for (;;) {
        const ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
        if (n > 0) {
            return {IoStatus::Ok, static_cast<size_t>(n), 0};
        }
        if (n == 0) {
            return {IoStatus::Closed, 0, 0};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return retryStatus(errno);
        }
        return {IoStatus::Error, 0, errno};
    }
}

IoResult Transport::sendSome(std::span<const char> data) noexcept {
    if (fd_ < 0) {
        return {IoStatus::Error, 0, EBADF};
    }

    if (ssl_) {
        ::ERR_clear_error();
        const int length = static_cast<int>(std::min<size_t>(data.size(), INT_MAX));
        const ScopedSigpipeBlock no_sigpipe;
        const int n = ::SSL_write(ssl_.get(), data.data(), length);
        const int saved_errno = errno;
        if (n > 0) {
            return {IoStatus::Ok, static_cast<size_t>(n), 0};
        }
        return classifyTlsResult(n, saved_errno);
    }

    for (;;) {
        const ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n >= 0) {
            return {IoStatus::Ok, static_cast<size_t>(n), 0};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return retryStatus(errno);
        }
        if (errno == EPIPE || errno == ECONNRESET) {
            return {IoStatus::Closed, 0, errno};
        }
        return {IoStatus::Error, 0, errno};
    }
}

bool Transport::waitWritable(std::chrono::milliseconds timeout) const noexcept {
    if (fd_ < 0) {
        return false;
    }

    struct pollfd pfd {};
    pfd.fd = fd_;
    pfd.events = POLLOUT;

    const auto timeout_ms = std::clamp<long long>(timeout.count(), 0, INT_MAX);
    int poll_result = 0;
    do {
        poll_result = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (poll_result < 0 && errno == EINTR);

    return poll_result > 0 && (pfd.revents & POLLOUT) != 0 && (pfd.revents & (POLLERR | POLLHUP)) == 0;
}

bool Transport::isOpen() const noexcept {
    return fd_ >= 0;
}

bool Transport::isConnected() const noexcept {
    return connected_ && fd_ >= 0;
}

bool Transport::isBlocking() const noexcept {
    return blocking_;
}

bool Transport::usesTls() const noexcept {
    return tls_ != nullptr || ssl_ != nullptr;
}

std::chrono::milliseconds Transport::timeout() const noexcept {
    return timeout_;
}

const std::string& Transport::address() const noexcept {
    return address_;
}

uint16_t Transport::port() const noexcept {
    return port_;
}

const std::string& Transport::interface() const noexcept {
    return interface_;
}

int Transport::nativeHandle() const noexcept {
    return fd_;
}

void Transport::openAndConnect(const std::string& address, uint16_t port) {
    struct addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    const std::string port_str = std::to_string(port);
    struct addrinfo* result_raw = nullptr;
    const int gai_result = ::getaddrinfo(address.c_str(), port_str.c_str(), &hints, &result_raw);
    if (gai_result != 0) {
        throw std::runtime_error(std::string("getaddrinfo failed: ") + ::gai_strerror(gai_result));
    }
    AddrInfoPtr result(result_raw, ::freeaddrinfo);

    std::optional<std::string> source_address;
    if (interface_ != kDefaultInterface) {
        source_address = resolveInterfaceAddress(interface_);
    }

    int last_error = ECONNREFUSED;
    for (addrinfo* current = result.get(); current != nullptr; current = current->ai_next) {
        fd_ = createNonBlockingSocket(current->ai_family, current->ai_socktype, current->ai_protocol);
        if (source_address.has_value()) {
            bindToSource(fd_, *source_address);
        }

        int connect_error = 0;
        if (::connect(fd_, current->ai_addr, current->ai_addrlen) != 0) {
            connect_error = errno;
            if (connect_error == EINPROGRESS) {
                connect_error = waitForConnectCompletion(fd_, timeout_);
            }
        }
        if (connect_error == 0) {
            return;
        }

        last_error = connect_error;
        ::close(fd_);
        fd_ = -1;
    }

    throw std::system_error(last_error, std::generic_category(), "connect");
}

void Transport::handshake() {
    // The handshake always runs in blocking mode bounded by the timeout.
    setNonBlocking(fd_, false);
    setIoTimeout(fd_, timeout_);

    ssl_ = tls_->newSession(fd_);
    ::ERR_clear_error();
    const ScopedSigpipeBlock no_sigpipe;
    if (::SSL_connect(ssl_.get()) != 1) {
        ssl_failed_ = true;
        throw std::runtime_error(lastTlsError("TLS handshake failed"));
    }
}

void Transport::applyBlockingMode() noexcept {
    if (fd_ < 0) {
        return;
    }

    setNonBlocking(fd_, !blocking_);
    setIoTimeout(fd_, blocking_ ? timeout_ : std::chrono::milliseconds::zero());
}

void Transport::recoverPeerAddress() noexcept {
    sockaddr_storage peer {};
    socklen_t peer_len = sizeof(peer);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len) != 0) {
        connected_ = false;
        return;
    }

    char text[INET6_ADDRSTRLEN] {};
    if (peer.ss_family == AF_INET) {
        const auto* addr = reinterpret_cast<const sockaddr_in*>(&peer);
        if (::inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text)) != nullptr) {
            address_ = text;
            port_ = ntohs(addr->sin_port);
        }
    } else if (peer.ss_family == AF_INET6) {
        const auto* addr = reinterpret_cast<const sockaddr_in6*>(&peer);
        if (::inet_ntop(AF_INET6, &addr->sin6_addr, text, sizeof(text)) != nullptr) {
            address_ = text;
            port_ = ntohs(addr->sin6_port);
        }
    }
}

IoResult Transport::classifyTlsResult(int ret, int saved_errno) noexcept {
    switch (::SSL_get_error(ssl_.get(), ret)) {
        case SSL_ERROR_ZERO_RETURN:
            return {IoStatus::Closed, 0, 0};
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return retryStatus(EAGAIN);
        case SSL_ERROR_SYSCALL:
            ssl_failed_ = true;
            if (saved_errno == 0) {
                return {IoStatus::Closed, 0, 0};
            }
            return {IoStatus::Error, 0, saved_errno};
        default:
            ssl_failed_ = true;
            return {IoStatus::Error, 0, EPROTO};
    }
}

IoResult Transport::retryStatus(int error_code) const noexcept {
    return {blocking_ ? IoStatus::Timeout : IoStatus::WouldBlock, 0, error_code};
}

ScopedBlockingMode::ScopedBlockingMode(Transport& transport,
                                       bool default_blocking,
                                       std::chrono::milliseconds default_timeout,
                                       std::optional<std::chrono::milliseconds> operation_timeout) noexcept
    : transport_(transport),
      default_blocking_(default_blocking),
      default_timeout_(default_timeout) {
    if (default_blocking_ && operation_timeout.has_value()) {
        transport_.setBlocking(true, operation_timeout);
    }
}

ScopedBlockingMode::~ScopedBlockingMode() {
    transport_.setBlocking(default_blocking_, default_timeout_);
}

}  // namespace linesock::transport
