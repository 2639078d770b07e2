#include "linesock/transport/TlsContext.hpp"

#include <openssl/err.h>

#include <array>
#include <stdexcept>

namespace linesock::transport {

namespace {

SSL_CTX* newContext(const SSL_METHOD* method) {
    SSL_CTX* ctx = ::SSL_CTX_new(method);
    if (ctx == nullptr) {
        throw std::runtime_error(lastTlsError("SSL_CTX_new failed"));
    }

    // Partial writes let a non-blocking send report progress like send(2).
    ::SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    ::SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Peers that drop the TCP connection without close_notify read as an orderly close.
    ::SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    return ctx;
}

}  // namespace

void SslDeleter::operator()(SSL* ssl) const noexcept {
    ::SSL_free(ssl);
}

void SslCtxDeleter::operator()(SSL_CTX* ctx) const noexcept {
    ::SSL_CTX_free(ctx);
}

TlsContext::TlsContext(SSL_CTX* ctx) noexcept
    : ctx_(ctx) {}

std::shared_ptr<TlsContext> TlsContext::createClient() {
    SSL_CTX* ctx = newContext(::TLS_client_method());
    ::SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    return std::shared_ptr<TlsContext>(new TlsContext(ctx));
}

std::shared_ptr<TlsContext> TlsContext::createServer(const std::string& certificate_file,
                                                     const std::string& private_key_file) {
    std::shared_ptr<TlsContext> context(new TlsContext(newContext(::TLS_server_method())));
    if (::SSL_CTX_use_certificate_chain_file(context->native(), certificate_file.c_str()) != 1) {
        throw std::runtime_error(lastTlsError("SSL_CTX_use_certificate_chain_file failed"));
    }
    if (::SSL_CTX_use_PrivateKey_file(context->native(), private_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        throw std::runtime_error(lastTlsError("SSL_CTX_use_PrivateKey_file failed"));
    }
    if (::SSL_CTX_check_private_key(context->native()) != 1) {
        throw std::runtime_error(lastTlsError("private key does not match certificate"));
    }
    return context;
}

SslPtr TlsContext::newSession(int fd) const {
    SslPtr session(::SSL_new(ctx_.get()));
    if (!session) {
        throw std::runtime_error(lastTlsError("SSL_new failed"));
    }
    if (::SSL_set_fd(session.get(), fd) != 1) {
        throw std::runtime_error(lastTlsError("SSL_set_fd failed"));
    }
    return session;
}

SSL_CTX* TlsContext::native() const noexcept {
    return ctx_.get();
}

std::string lastTlsError(const char* fallback) {
    const unsigned long code = ::ERR_get_error();
    if (code == 0) {
        return fallback;
    }
    std::array<char, 256> text {};
    ::ERR_error_string_n(code, text.data(), text.size());
    ::ERR_clear_error();
    return std::string(fallback) + ": " + text.data();
}

}  // namespace linesock::transport
