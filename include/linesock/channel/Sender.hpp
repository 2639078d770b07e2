#pragma once

#include "linesock/channel/ChannelOptions.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace spdlog {
class logger;
}

namespace linesock {
class ErrorSink;
}

namespace linesock::transport {
class Transport;
}

namespace linesock::channel {

// Writes raw payloads and delimited lines to the transport.
//
// Blocking channels (or forced full sends) loop until every byte is written;
// otherwise a single attempt is made and its byte count returned, like
// send(2). Failures are recorded, close the transport and report 0 bytes.
class Sender {
public:
    Sender(transport::Transport& transport,
           ErrorSink& sink,
           const ChannelOptions& options,
           spdlog::logger& logger);

    // `timeout` applies to blocking channels for this call only.
    size_t sendRaw(std::string_view payload,
                   bool force_full_send,
                   std::optional<std::chrono::milliseconds> timeout);

    // Appends the delimiter and sends the whole line even on non-blocking
    // channels. `message` must not contain the delimiter.
    size_t sendLine(std::string_view message, std::optional<std::chrono::milliseconds> timeout);

private:
    transport::Transport& transport_;
    ErrorSink& sink_;
    const ChannelOptions& options_;
    spdlog::logger& logger_;
};

}  // namespace linesock::channel
