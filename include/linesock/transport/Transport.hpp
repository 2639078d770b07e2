#pragma once

#include "linesock/transport/KeepAlive.hpp"
#include "linesock/transport/TlsContext.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace linesock {
class ErrorSink;
}

namespace linesock::transport {

// Outcome class of one receive or send call on the underlying socket.
enum class IoStatus : uint8_t {
    Ok,
    Closed,      // orderly shutdown by the peer
    WouldBlock,  // non-blocking socket (or TLS record) has nothing to do right now
    Timeout,     // blocking socket hit its SO_RCVTIMEO/SO_SNDTIMEO
    Error,
};

struct IoResult {
    IoStatus status = IoStatus::Ok;
    size_t bytes = 0;
    int error_code = 0;
};

// Owns one TCP stream socket, optionally wrapped in a TLS session.
//
// Responsibilities:
// - Blocking connect (regardless of the configured mode) with optional source
//   interface binding and TLS client handshake.
// - Adoption of externally established sockets.
// - Blocking/non-blocking mode and operation timeout.
// - Keep-alive configuration and errno/TLS error classification.
//
// The peer address survives close() so reconnect() can reuse it.
class Transport {
public:
    struct Settings {
        bool blocking = false;
        std::chrono::milliseconds timeout {5000};
        std::string interface = "default";
        std::shared_ptr<TlsContext> tls;  // null => plain TCP
        KeepAliveParams keep_alive;
    };

    Transport(Settings settings, ErrorSink& sink);
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;
    Transport(Transport&&) = delete;
    Transport& operator=(Transport&&) = delete;
    ~Transport();

    // Connects and blocks until done or the timeout elapses. Records the
    // failure and throws ConnectError if the connection cannot be made.
    void connect(const std::string& address, uint16_t port);

    // Retries the last known address when disconnected. Never throws.
    void reconnect() noexcept;

    // Takes ownership of an already connected socket (and its negotiated TLS
    // session, if any). The previous socket is closed first.
    void attach(int fd);
    void attach(int fd, SslPtr session);

    // Non-blocking mode carries no timeout. A missing timeout keeps the current one.
    void setBlocking(bool blocking, std::optional<std::chrono::milliseconds> timeout) noexcept;

    // Best-effort graceful shutdown followed by unconditional release. Idempotent.
    void close() noexcept;

    IoResult recvSome(std::span<char> buffer) noexcept;
    IoResult sendSome(std::span<const char> data) noexcept;

    // Waits until the socket accepts more data. False on timeout or error.
    bool waitWritable(std::chrono::milliseconds timeout) const noexcept;

    bool isOpen() const noexcept;
    bool isConnected() const noexcept;
    bool isBlocking() const noexcept;
    bool usesTls() const noexcept;
    std::chrono::milliseconds timeout() const noexcept;
    const std::string& address() const noexcept;
    uint16_t port() const noexcept;
    const std::string& interface() const noexcept;
    int nativeHandle() const noexcept;

private:
    void openAndConnect(const std::string& address, uint16_t port);
    void handshake();
    void applyBlockingMode() noexcept;
    void recoverPeerAddress() noexcept;
    IoResult classifyTlsResult(int ret, int saved_errno) noexcept;
    IoResult retryStatus(int error_code) const noexcept;

    ErrorSink& sink_;
    std::shared_ptr<TlsContext> tls_;
    std::string interface_;
    KeepAliveParams keep_alive_;

    int fd_ = -1;
    SslPtr ssl_;
    bool ssl_failed_ = false;
    bool connected_ = false;
    bool blocking_ = false;
    std::chrono::milliseconds timeout_;
    std::string address_;
    uint16_t port_ = 0;
};

// Temporarily applies an operation timeout to a channel whose default mode is
// blocking, restoring the default mode and timeout on scope exit.
class ScopedBlockingMode {
public:
    ScopedBlockingMode(Transport& transport,
                       bool default_blocking,
                       std::chrono::milliseconds default_timeout,
                       std::optional<std::chrono::milliseconds> operation_timeout) noexcept;
    ScopedBlockingMode(const ScopedBlockingMode&) = delete;
    ScopedBlockingMode& operator=(const ScopedBlockingMode&) = delete;
    ~ScopedBlockingMode();

private:
    Transport& transport_;
    bool default_blocking_;
    std::chrono::milliseconds default_timeout_;
};

}  // namespace linesock::transport
