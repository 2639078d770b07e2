#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace linesock::channel {

// Construction parameters of a channel. Limits bound the memory and CPU a
// single poll may spend regardless of what the peer sends.
struct ChannelOptions {
    // Connect immediately on construction when both are set.
    std::string address;
    uint16_t port = 0;

    bool blocking = false;
    std::chrono::milliseconds timeout {5000};

    // Local interface to send from; "default" lets the OS choose.
    std::string interface = "default";
    bool use_tls = false;
    bool debug = false;

    size_t max_buffer_bytes = 1024 * 1024;
    // Chunk reads per fetch on non-blocking channels.
    size_t max_chunks = 1024;
    size_t chunk_size = 100 * 1024;

    std::chrono::seconds heartbeat_interval {5 * 60};
    std::string heartbeat_line = "PING";

    // Payloads must not contain the delimiter; there is no escaping.
    std::string delimiter = "\r\n";
};

inline constexpr std::chrono::milliseconds kDefaultSendTimeout {5000};
inline constexpr std::chrono::milliseconds kDefaultRecvTimeout {10000};
inline constexpr std::chrono::milliseconds kDefaultRecvLineTimeout {2000};

}  // namespace linesock::channel
