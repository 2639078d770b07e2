#include "linesock/channel/ChunkReader.hpp"

#include "linesock/channel/Sender.hpp"
#include "linesock/transport/Transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <span>
#include <string_view>
#include <thread>

namespace linesock::channel {

using transport::IoResult;
using transport::IoStatus;

ChunkReader::ChunkReader(transport::Transport& transport,
                         Sender& sender,
                         const ChunkDecoder& decoder,
                         const ChannelOptions& options,
                         spdlog::logger& logger)
    : transport_(transport),
      sender_(sender),
      decoder_(decoder),
      options_(options),
      logger_(logger),
      scratch_(std::max<size_t>(options.chunk_size, 1)),
      last_heartbeat_(Clock::now()) {}

FetchStats ChunkReader::fetch(ReceiveBuffer& buffer,
                              std::optional<size_t> fixed_limit,
                              std::optional<Clock::time_point> deadline) {
    FetchStats stats;
    if (!transport_.isConnected()) {
        return stats;
    }

    const size_t max_buffer = fixed_limit.value_or(options_.max_buffer_bytes);
    const size_t max_chunks = fixed_limit.value_or(options_.max_chunks);

    for (;;) {
        if (!readCycle(buffer, max_buffer, max_chunks, stats)) {
            return stats;
        }

        // Only blocking line reads wait for the rest of a partial message.
        if (!transport_.isBlocking() || fixed_limit.has_value()) {
            return stats;
        }
        if (buffer.data.find(options_.delimiter) != std::string::npos) {
            return stats;
        }
        if (buffer.size() >= max_buffer || !transport_.isConnected()) {
            return stats;
        }
        if (!deadline.has_value()) {
            std::this_thread::sleep_for(kRetryInterval);
            continue;
        }

        if (Clock::now() >= *deadline) {
            stats.stop = FetchStop::DeadlinePassed;
            return stats;
        }
        std::this_thread::sleep_until(std::min(Clock::now() + kRetryInterval, *deadline));

        const Clock::time_point now = Clock::now();
        if (now >= *deadline) {
            stats.stop = FetchStop::DeadlinePassed;
            return stats;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
        transport_.setBlocking(true, std::max(remaining, std::chrono::milliseconds(1)));
    }
}

ChunkReader::Clock::time_point ChunkReader::lastHeartbeat() const noexcept {
    return last_heartbeat_;
}

bool ChunkReader::readCycle(ReceiveBuffer& buffer, size_t max_buffer, size_t max_chunks, FetchStats& stats) {
    size_t cycle_chunks = 0;
    for (;;) {
        if (buffer.size() >= max_buffer) {
            stats.stop = FetchStop::BufferFull;
            return true;
        }
        if (!transport_.isBlocking() && cycle_chunks >= max_chunks) {
            stats.stop = FetchStop::ChunkLimit;
            return true;
        }

        const size_t room = std::min({options_.chunk_size, max_buffer - buffer.size(), scratch_.size()});
        const IoResult result = transport_.recvSome(std::span<char>(scratch_.data(), room));

        switch (result.status) {
            case IoStatus::Ok: {
                ++stats.chunks;
                ++cycle_chunks;
                const std::string_view chunk(scratch_.data(), result.bytes);
                if (!decoder_.decode(chunk, buffer)) {
                    logger_.debug("fetch: dropped {} byte chunk that could not be decoded", result.bytes);
                    continue;
                }
                stats.bytes += result.bytes;
                if (transport_.isBlocking()) {
                    stats.stop = FetchStop::ChunkRead;
                    return true;
                }
                continue;
            }
            case IoStatus::WouldBlock:
                sendHeartbeatIfDue();
                stats.stop = FetchStop::WouldBlock;
                return true;
            case IoStatus::Timeout:
                logger_.debug("fetch: timed out");
                stats.stop = FetchStop::Timeout;
                return false;
            case IoStatus::Closed:
                logger_.debug("fetch: peer closed the connection");
                transport_.close();
                stats.stop = FetchStop::PeerClosed;
                return false;
            case IoStatus::Error:
                logger_.debug("fetch: receive failed: {}", std::strerror(result.error_code));
                transport_.close();
                stats.stop = FetchStop::TransportError;
                return false;
        }
    }
}

void ChunkReader::sendHeartbeatIfDue() {
    const Clock::time_point now = Clock::now();
    if (now - last_heartbeat_ < options_.heartbeat_interval) {
        return;
    }

    last_heartbeat_ = now;
    logger_.debug("fetch: sending heartbeat");
    (void)sender_.sendLine(options_.heartbeat_line, options_.timeout);
}

}  // namespace linesock::channel
