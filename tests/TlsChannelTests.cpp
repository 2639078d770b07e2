#include "TestSupport.hpp"

#include "linesock/Error.hpp"
#include "linesock/channel/Channel.hpp"
#include "linesock/transport/TlsContext.hpp"

#include <gtest/gtest.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using linesock::channel::ChannelOptions;
using linesock::channel::TextChannel;
using linesock::test::LoopbackListener;
using linesock::test::MemoryErrorSink;
using linesock::test::PeerSocket;
using linesock::transport::TlsContext;

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using FilePtr = std::unique_ptr<FILE, decltype(&::fclose)>;

// Self-signed certificate and key written to temporary PEM files.
class TemporaryCredentials {
public:
    TemporaryCredentials() {
        const std::string stem = "linesock-tls-" + std::to_string(::getpid());
        certificate_ = std::filesystem::temp_directory_path() / (stem + "-cert.pem");
        private_key_ = std::filesystem::temp_directory_path() / (stem + "-key.pem");

        EvpPkeyPtr key(EVP_RSA_gen(2048), ::EVP_PKEY_free);
        if (!key) {
            throw std::runtime_error("EVP_RSA_gen failed");
        }

        X509Ptr cert(::X509_new(), ::X509_free);
        if (!cert) {
            throw std::runtime_error("X509_new failed");
        }
        ::X509_set_version(cert.get(), 2);
        ::ASN1_INTEGER_set(::X509_get_serialNumber(cert.get()), 1);
        ::X509_gmtime_adj(::X509_getm_notBefore(cert.get()), 0);
        ::X509_gmtime_adj(::X509_getm_notAfter(cert.get()), 24L * 60 * 60);
        ::X509_set_pubkey(cert.get(), key.get());

        X509_NAME* name = ::X509_get_subject_name(cert.get());
        ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                     reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        ::X509_set_issuer_name(cert.get(), name);
        if (::X509_sign(cert.get(), key.get(), ::EVP_sha256()) == 0) {
            throw std::runtime_error("X509_sign failed");
        }

        FilePtr key_file(std::fopen(private_key_.c_str(), "w"), ::fclose);
        FilePtr cert_file(std::fopen(certificate_.c_str(), "w"), ::fclose);
        if (!key_file || !cert_file) {
            throw std::runtime_error("cannot create PEM files");
        }
        if (::PEM_write_PrivateKey(key_file.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1 ||
            ::PEM_write_X509(cert_file.get(), cert.get()) != 1) {
            throw std::runtime_error("PEM write failed");
        }
    }

    TemporaryCredentials(const TemporaryCredentials&) = delete;
    TemporaryCredentials& operator=(const TemporaryCredentials&) = delete;

    ~TemporaryCredentials() {
        std::error_code ignored;
        std::filesystem::remove(certificate_, ignored);
        std::filesystem::remove(private_key_, ignored);
    }

    std::string certificate() const {
        return certificate_.string();
    }

    std::string privateKey() const {
        return private_key_.string();
    }

private:
    std::filesystem::path certificate_;
    std::filesystem::path private_key_;
};

ChannelOptions blockingOptions() {
    ChannelOptions options;
    options.blocking = true;
    options.timeout = std::chrono::milliseconds(3000);
    return options;
}

TEST(TlsChannelTests, ExchangesLinesOverTls) {
    const TemporaryCredentials credentials;
    const std::shared_ptr<TlsContext> server_context =
        TlsContext::createServer(credentials.certificate(), credentials.privateKey());
    LoopbackListener listener;

    std::string server_received;
    std::string server_error;
    std::thread server([&]() {
        try {
            const int fd = listener.accept();
            linesock::transport::SslPtr session = server_context->newSession(fd);
            if (::SSL_accept(session.get()) != 1) {
                ::close(fd);
                server_error = linesock::transport::lastTlsError("SSL_accept failed");
                return;
            }

            MemoryErrorSink server_sink;
            TextChannel server_channel(blockingOptions(), server_sink);
            server_channel.attach(fd, std::move(session));
            server_received = server_channel.recvLine(std::chrono::seconds(3));
            (void)server_channel.sendLine("ECHO " + server_received);
        } catch (const std::exception& e) {
            server_error = e.what();
        }
    });

    MemoryErrorSink sink;
    ChannelOptions options = blockingOptions();
    options.address = "127.0.0.1";
    options.port = listener.port();
    options.use_tls = true;
    TextChannel client(options, sink);

    EXPECT_TRUE(client.transport().usesTls());
    EXPECT_EQ(client.sendLine("hello"), 7U);
    const std::string reply = client.recvLine(std::chrono::seconds(3));
    server.join();

    EXPECT_TRUE(server_error.empty()) << server_error;
    EXPECT_EQ(server_received, "hello");
    EXPECT_EQ(reply, "ECHO hello");
    EXPECT_TRUE(sink.records.empty());
}

TEST(TlsChannelTests, HandshakeWithPlainPeerFailsToConnect) {
    LoopbackListener listener;

    std::thread server([&]() {
        PeerSocket peer(listener.accept());
        peer.write("not a tls server\r\n");
    });

    MemoryErrorSink sink;
    ChannelOptions options = blockingOptions();
    options.use_tls = true;
    TextChannel tls_client(options, sink);

    EXPECT_THROW(tls_client.connect("127.0.0.1", listener.port()), linesock::ConnectError);
    server.join();

    EXPECT_FALSE(tls_client.isConnected());
    EXPECT_FALSE(sink.records.empty());
}

TEST(TlsChannelTests, SendAfterPeerResetDisconnectsWithoutSignal) {
    // Default SIGPIPE disposition terminates the process if a write raises it.
    const auto previous_handler = std::signal(SIGPIPE, SIG_DFL);

    const TemporaryCredentials credentials;
    const std::shared_ptr<TlsContext> server_context =
        TlsContext::createServer(credentials.certificate(), credentials.privateKey());
    LoopbackListener listener;

    std::string server_error;
    std::thread server([&]() {
        try {
            const int fd = listener.accept();
            linesock::transport::SslPtr session = server_context->newSession(fd);
            if (::SSL_accept(session.get()) != 1) {
                server_error = linesock::transport::lastTlsError("SSL_accept failed");
            }
            // Zero linger turns close() into a reset.
            struct linger reset {};
            reset.l_onoff = 1;
            reset.l_linger = 0;
            (void)::setsockopt(fd, SOL_SOCKET, SO_LINGER, &reset, sizeof(reset));
            ::close(fd);
        } catch (const std::exception& e) {
            server_error = e.what();
        }
    });

    MemoryErrorSink sink;
    ChannelOptions options = blockingOptions();
    options.address = "127.0.0.1";
    options.port = listener.port();
    options.use_tls = true;
    TextChannel client(options, sink);
    server.join();
    ASSERT_TRUE(server_error.empty()) << server_error;

    for (int attempt = 0; attempt < 50 && client.isConnected(); ++attempt) {
        (void)client.sendLine("after reset");
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(client.sendLine("closed"), 0U);
    (void)std::signal(SIGPIPE, previous_handler);
}

TEST(TlsChannelTests, ServerContextRejectsMissingFiles) {
    EXPECT_THROW(TlsContext::createServer("/nonexistent/cert.pem", "/nonexistent/key.pem"), std::runtime_error);
}

}  // namespace
