#include "linesock/Error.hpp"
#include "linesock/ErrorSink.hpp"
#include "linesock/channel/Channel.hpp"
#include "linesock/config/ChannelConfig.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

constexpr std::chrono::milliseconds kPollInterval {500};

void printUsage(const char* program) {
    std::cerr << "usage: " << program << " <config.yaml> <listen-seconds> [line ...]\n";
}

std::unique_ptr<linesock::channel::Channel> makeChannel(const linesock::config::ChannelConfig& config,
                                                        linesock::ErrorSink& sink) {
    if (config.encoding == linesock::config::Encoding::Raw) {
        return std::make_unique<linesock::channel::RawChannel>(config.options, sink);
    }
    return std::make_unique<linesock::channel::TextChannel>(config.options, sink);
}

// Polls for replies until the listen window closes or the peer disconnects.
void printReplies(linesock::channel::Channel& channel, std::chrono::seconds listen_for) {
    const auto deadline = std::chrono::steady_clock::now() + listen_for;
    while (std::chrono::steady_clock::now() < deadline) {
        for (const std::string& reply : channel.takeReplies()) {
            std::cout << reply << '\n';
        }
        if (!channel.isConnected()) {
            std::cerr << "peer closed the connection\n";
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        const linesock::config::ChannelConfig config = linesock::config::loadChannelConfig(argv[1]);
        if (config.options.address.empty() || config.options.port == 0) {
            throw std::runtime_error("config must set address and port");
        }
        const std::chrono::seconds listen_for(std::stoll(argv[2]));

        linesock::FileErrorSink sink("error.log");
        auto channel = makeChannel(config, sink);

        for (int i = 3; i < argc; ++i) {
            if (channel->sendLine(argv[i]) == 0) {
                std::cerr << "failed to send: " << argv[i] << '\n';
                return 1;
            }
        }

        printReplies(*channel, listen_for);
        channel->close();
    } catch (const linesock::ConnectError& ex) {
        std::cerr << "Probe could not connect: " << ex.what() << '\n';
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Probe failed: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
