#pragma once

#include "linesock/channel/ChannelOptions.hpp"
#include "linesock/channel/ChunkDecoder.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace spdlog {
class logger;
}

namespace linesock::transport {
class Transport;
}

namespace linesock::channel {

class Sender;

// Why the last fetch() returned.
enum class FetchStop : uint8_t {
    NotConnected,
    BufferFull,
    ChunkLimit,
    WouldBlock,
    Timeout,
    PeerClosed,
    TransportError,
    DeadlinePassed,  // blocking retry ran out of time
    ChunkRead,       // blocking read returned data
};

struct FetchStats {
    size_t chunks = 0;
    size_t bytes = 0;
    FetchStop stop = FetchStop::NotConnected;
};

// Pulls bytes off the transport into a ReceiveBuffer in bounded chunks.
//
// Hard limits per fetch:
// - the buffer never grows past its ceiling (max_buffer_bytes, or the fixed
//   limit of a sized read);
// - non-blocking channels read at most max_chunks chunks.
//
// Blocking channels without a fixed limit keep reading (sleeping
// kRetryInterval between cycles) until the buffer holds a delimiter, is full,
// the socket times out, the connection drops, or the optional deadline
// passes. With a deadline no sleep or socket wait runs past it.
class ChunkReader {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kRetryInterval {200};

    ChunkReader(transport::Transport& transport,
                Sender& sender,
                const ChunkDecoder& decoder,
                const ChannelOptions& options,
                spdlog::logger& logger);

    FetchStats fetch(ReceiveBuffer& buffer,
                     std::optional<size_t> fixed_limit = std::nullopt,
                     std::optional<Clock::time_point> deadline = std::nullopt);

    Clock::time_point lastHeartbeat() const noexcept;

private:
    // One pass of chunk reads. Returns false when the whole fetch must end.
    bool readCycle(ReceiveBuffer& buffer, size_t max_buffer, size_t max_chunks, FetchStats& stats);
    void sendHeartbeatIfDue();

    transport::Transport& transport_;
    Sender& sender_;
    const ChunkDecoder& decoder_;
    const ChannelOptions& options_;
    spdlog::logger& logger_;
    std::vector<char> scratch_;
    Clock::time_point last_heartbeat_;
};

}  // namespace linesock::channel
