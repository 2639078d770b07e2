#include "linesock/channel/Sender.hpp"

#include "linesock/Error.hpp"
#include "linesock/ErrorSink.hpp"
#include "linesock/transport/Transport.hpp"

#include <spdlog/spdlog.h>

#include <span>
#include <string>
#include <system_error>

namespace linesock::channel {

using transport::IoResult;
using transport::IoStatus;

Sender::Sender(transport::Transport& transport,
               ErrorSink& sink,
               const ChannelOptions& options,
               spdlog::logger& logger)
    : transport_(transport),
      sink_(sink),
      options_(options),
      logger_(logger) {}

size_t Sender::sendRaw(std::string_view payload,
                       bool force_full_send,
                       std::optional<std::chrono::milliseconds> timeout) {
    transport::ScopedBlockingMode scoped_mode(transport_, options_.blocking, options_.timeout, timeout);
    if (!transport_.isConnected() || payload.empty()) {
        return 0;
    }

    const bool send_all = options_.blocking || force_full_send;
    const std::chrono::milliseconds stall_timeout = timeout.value_or(options_.timeout);
    size_t total_sent = 0;

    try {
        while (total_sent < payload.size()) {
            const std::string_view remaining = payload.substr(total_sent);
            const IoResult result = transport_.sendSome(std::span<const char>(remaining.data(), remaining.size()));

            if (result.status == IoStatus::Ok && result.bytes > 0) {
                total_sent += result.bytes;
                if (!send_all) {
                    break;
                }
                continue;
            }

            if (result.status == IoStatus::WouldBlock) {
                if (!send_all) {
                    break;
                }
                if (transport_.waitWritable(stall_timeout)) {
                    continue;
                }
                throw std::system_error(make_error_code(Errc::Timeout), "send stalled");
            }

            if (result.status == IoStatus::Timeout) {
                throw std::system_error(make_error_code(Errc::Timeout), "send timed out");
            }

            if (result.status == IoStatus::Error) {
                throw std::system_error(result.error_code, std::generic_category(), "send");
            }

            // Zero bytes written or orderly close: the connection is gone.
            logger_.debug("send: connection broken after {} of {} bytes", total_sent, payload.size());
            transport_.close();
            break;
        }
    } catch (const std::system_error& e) {
        sink_.record(e.what(), "send " + transport_.address() + ":" + std::to_string(transport_.port()));
        transport_.close();
        return 0;
    }

    return total_sent;
}

size_t Sender::sendLine(std::string_view message, std::optional<std::chrono::milliseconds> timeout) {
    if (message.find(options_.delimiter) != std::string_view::npos) {
        logger_.warn("sendLine: message contains the delimiter and will be split by the peer");
    }

    std::string line;
    line.reserve(message.size() + options_.delimiter.size());
    line.append(message).append(options_.delimiter);
    return sendRaw(line, true, timeout);
}

}  // namespace linesock::channel
