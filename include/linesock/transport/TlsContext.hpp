#pragma once

#include <openssl/ssl.h>

#include <memory>
#include <string>

namespace linesock::transport {

struct SslDeleter {
    void operator()(SSL* ssl) const noexcept;
};

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const noexcept;
};

using SslPtr = std::unique_ptr<SSL, SslDeleter>;

// Shared OpenSSL context from which per-connection sessions are created.
//
// Client contexts do not verify the peer certificate: overlay peers present
// self-signed certificates and authenticate at the application layer.
class TlsContext {
public:
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    static std::shared_ptr<TlsContext> createClient();

    // Server context for accept loops whose sessions are later attached to a
    // channel. Throws std::runtime_error if the PEM files cannot be loaded.
    static std::shared_ptr<TlsContext> createServer(const std::string& certificate_file,
                                                    const std::string& private_key_file);

    // New session bound to fd. Throws std::runtime_error on allocation failure.
    SslPtr newSession(int fd) const;

    SSL_CTX* native() const noexcept;

private:
    explicit TlsContext(SSL_CTX* ctx) noexcept;

    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx_;
};

// Text of the most recent OpenSSL error on this thread, or `fallback`.
std::string lastTlsError(const char* fallback);

}  // namespace linesock::transport
