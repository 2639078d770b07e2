#pragma once

#include "linesock/ErrorSink.hpp"
#include "linesock/channel/ChannelOptions.hpp"
#include "linesock/channel/ChunkDecoder.hpp"
#include "linesock/channel/ChunkReader.hpp"
#include "linesock/channel/ReplyQueue.hpp"
#include "linesock/channel/Sender.hpp"
#include "linesock/transport/Transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
}

namespace linesock::channel {

// Line-delimited message channel over one TCP (optionally TLS) connection.
//
// Single-threaded and lock-free by construction: nothing runs in the
// background. Callers drive the pipeline with update() (or takeReplies(),
// which calls it) and read complete messages from the reply queue.
//
// Quirks:
// - connect() blocks regardless of the blocking mode. For a non-blocking
//   connect, connect the socket elsewhere and attach() it.
// - sendLine() blocks until the whole line is written even on non-blocking
//   channels; use send() for partial-write semantics.
//
// Apart from connect(), public operations never throw for network failures:
// they return 0 / empty and record the failure at the ErrorSink. A lost
// connection stays lost until reconnect() succeeds.
class Channel {
public:
    using Filter = ReplyQueue::Filter;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;
    virtual ~Channel();

    // Throws ConnectError on failure.
    void connect(const std::string& address, uint16_t port);
    void reconnect() noexcept;
    void attach(int fd);
    void attach(int fd, transport::SslPtr session);
    void close() noexcept;

    // Changes the default mode used by every later operation.
    void setBlocking(bool blocking, std::chrono::milliseconds timeout);

    size_t send(std::string_view payload,
                bool force_full_send = false,
                std::optional<std::chrono::milliseconds> timeout = kDefaultSendTimeout);
    size_t sendLine(std::string_view message,
                    std::optional<std::chrono::milliseconds> timeout = kDefaultSendTimeout);

    // Reads up to `n` bytes outside the line buffer. Blocking channels wait
    // for all `n` bytes until the timeout; non-blocking channels make one
    // attempt. Empty when disconnected.
    std::string recv(size_t n, std::optional<std::chrono::milliseconds> timeout = kDefaultRecvTimeout);

    // Blocking channels wait up to `timeout` for one complete message and
    // return the oldest queued one. Non-blocking or disconnected channels
    // make one pass and return empty; messages it completed stay queued. The
    // line buffer is set aside meanwhile and restored afterwards; an
    // unterminated tail read during the call is discarded.
    std::string recvLine(std::chrono::milliseconds timeout = kDefaultRecvLineTimeout);

    // One fetch + parse pass; new messages are appended to the queue.
    FetchStats update();

    ReplyQueue& replies() noexcept;
    const ReplyQueue& replies() const noexcept;

    // Oldest queued message without polling.
    std::optional<std::string> popReply();

    // update(), then drain the queue through the reply filter.
    std::vector<std::string> takeReplies();
    std::vector<std::string> takeRepliesReversed();

    // Empty filter accepts everything.
    void setReplyFilter(Filter filter);

    bool isConnected() const noexcept;
    bool isBlocking() const noexcept;
    const ChannelOptions& options() const noexcept;
    size_t bufferedBytes() const noexcept;
    std::chrono::steady_clock::time_point lastHeartbeat() const noexcept;
    transport::Transport& transport() noexcept;
    const transport::Transport& transport() const noexcept;

protected:
    // Connects immediately when options carry both address and port.
    Channel(ChannelOptions options, std::unique_ptr<ChunkDecoder> decoder, ErrorSink& sink);

private:
    // update() whose blocking retry gives up at `deadline`.
    FetchStats pollUntil(std::optional<std::chrono::steady_clock::time_point> deadline);

    // Sets the live buffer aside for the lifetime of the scope.
    class ScopedBufferSwap {
    public:
        explicit ScopedBufferSwap(ReceiveBuffer& live) noexcept;
        ScopedBufferSwap(const ScopedBufferSwap&) = delete;
        ScopedBufferSwap& operator=(const ScopedBufferSwap&) = delete;
        ~ScopedBufferSwap();

    private:
        ReceiveBuffer& live_;
        ReceiveBuffer saved_;
    };

    ChannelOptions options_;
    ErrorSink& sink_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<ChunkDecoder> decoder_;
    transport::Transport transport_;
    Sender sender_;
    ChunkReader reader_;
    ReceiveBuffer buffer_;
    ReplyQueue replies_;
    Filter reply_filter_;
};

// Channel whose buffer holds validated UTF-8 text.
class TextChannel final : public Channel {
public:
    explicit TextChannel(ChannelOptions options = {}, ErrorSink& sink = defaultErrorSink());
};

// Channel whose buffer holds bytes verbatim.
class RawChannel final : public Channel {
public:
    explicit RawChannel(ChannelOptions options = {}, ErrorSink& sink = defaultErrorSink());
};

}  // namespace linesock::channel
