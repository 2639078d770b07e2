#include "linesock/channel/Channel.hpp"

#include "linesock/Logging.hpp"
#include "linesock/channel/FrameParser.hpp"
#include "linesock/transport/TlsContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace linesock::channel {

namespace {

using Clock = std::chrono::steady_clock;

ChannelOptions validateOptions(ChannelOptions options) {
    if (options.delimiter.empty()) {
        throw std::invalid_argument("delimiter must not be empty");
    }
    if (options.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (options.max_buffer_bytes == 0) {
        throw std::invalid_argument("max_buffer_bytes must be positive");
    }
    return options;
}

transport::Transport::Settings makeTransportSettings(const ChannelOptions& options) {
    transport::Transport::Settings settings;
    settings.blocking = options.blocking;
    settings.timeout = options.timeout;
    settings.interface = options.interface;
    if (options.use_tls) {
        settings.tls = transport::TlsContext::createClient();
    }
    return settings;
}

}  // namespace

Channel::ScopedBufferSwap::ScopedBufferSwap(ReceiveBuffer& live) noexcept
    : live_(live) {
    std::swap(live_, saved_);
}

Channel::ScopedBufferSwap::~ScopedBufferSwap() {
    std::swap(live_, saved_);
}

Channel::Channel(ChannelOptions options, std::unique_ptr<ChunkDecoder> decoder, ErrorSink& sink)
    : options_(validateOptions(std::move(options))),
      sink_(sink),
      logger_(makeChannelLogger("linesock", options_.debug)),
      decoder_(std::move(decoder)),
      transport_(makeTransportSettings(options_), sink_),
      sender_(transport_, sink_, options_, *logger_),
      reader_(transport_, sender_, *decoder_, options_, *logger_) {
    if (!options_.address.empty() && options_.port != 0) {
        connect(options_.address, options_.port);
    }
}

Channel::~Channel() = default;

void Channel::connect(const std::string& address, uint16_t port) {
    logger_->debug("connecting to {}:{}", address, port);
    transport_.connect(address, port);
}

void Channel::reconnect() noexcept {
    transport_.reconnect();
}

void Channel::attach(int fd) {
    transport_.attach(fd);
}

void Channel::attach(int fd, transport::SslPtr session) {
    transport_.attach(fd, std::move(session));
}

void Channel::close() noexcept {
    transport_.close();
}

void Channel::setBlocking(bool blocking, std::chrono::milliseconds timeout) {
    options_.blocking = blocking;
    if (blocking) {
        options_.timeout = timeout;
    }
    transport_.setBlocking(blocking, timeout);
}

size_t Channel::send(std::string_view payload,
                     bool force_full_send,
                     std::optional<std::chrono::milliseconds> timeout) {
    return sender_.sendRaw(payload, force_full_send, timeout);
}

size_t Channel::sendLine(std::string_view message, std::optional<std::chrono::milliseconds> timeout) {
    return sender_.sendLine(message, timeout);
}

std::string Channel::recv(size_t n, std::optional<std::chrono::milliseconds> timeout) {
    transport::ScopedBlockingMode scoped_mode(transport_, options_.blocking, options_.timeout, timeout);
    if (!transport_.isConnected() || n == 0) {
        return {};
    }

    ScopedBufferSwap swap(buffer_);
    const Clock::time_point deadline = Clock::now() + timeout.value_or(options_.timeout);
    for (;;) {
        (void)reader_.fetch(buffer_, n);
        if (buffer_.size() >= n || !transport_.isConnected() || !options_.blocking) {
            break;
        }
        if (Clock::now() >= deadline) {
            break;
        }
    }
    return std::move(buffer_.data);
}

std::string Channel::recvLine(std::chrono::milliseconds timeout) {
    transport::ScopedBlockingMode scoped_mode(transport_, options_.blocking, options_.timeout, timeout);
    ScopedBufferSwap swap(buffer_);

    const Clock::time_point deadline = Clock::now() + timeout;
    for (;;) {
        (void)pollUntil(deadline);
        if (!transport_.isConnected() || !options_.blocking) {
            return {};
        }
        if (!replies_.empty() || buffer_.size() >= options_.max_buffer_bytes) {
            break;
        }

        const Clock::time_point now = Clock::now();
        if (now >= deadline) {
            break;
        }
        // Never let one socket wait run past the deadline.
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        transport_.setBlocking(true, std::max(remaining, std::chrono::milliseconds(1)));
    }

    return replies_.popOldest().value_or(std::string{});
}

FetchStats Channel::update() {
    return pollUntil(std::nullopt);
}

FetchStats Channel::pollUntil(std::optional<Clock::time_point> deadline) {
    const FetchStats stats = reader_.fetch(buffer_, std::nullopt, deadline);
    replies_.append(extractMessages(buffer_.data, options_.delimiter));
    return stats;
}

ReplyQueue& Channel::replies() noexcept {
    return replies_;
}

const ReplyQueue& Channel::replies() const noexcept {
    return replies_;
}

std::optional<std::string> Channel::popReply() {
    return replies_.popOldest();
}

std::vector<std::string> Channel::takeReplies() {
    (void)update();
    return replies_.drain(reply_filter_);
}

std::vector<std::string> Channel::takeRepliesReversed() {
    (void)update();
    return replies_.drainReversed(reply_filter_);
}

void Channel::setReplyFilter(Filter filter) {
    reply_filter_ = std::move(filter);
}

bool Channel::isConnected() const noexcept {
    return transport_.isConnected();
}

bool Channel::isBlocking() const noexcept {
    return options_.blocking;
}

const ChannelOptions& Channel::options() const noexcept {
    return options_;
}

size_t Channel::bufferedBytes() const noexcept {
    return buffer_.size();
}

std::chrono::steady_clock::time_point Channel::lastHeartbeat() const noexcept {
    return reader_.lastHeartbeat();
}

transport::Transport& Channel::transport() noexcept {
    return transport_;
}

const transport::Transport& Channel::transport() const noexcept {
    return transport_;
}

TextChannel::TextChannel(ChannelOptions options, ErrorSink& sink)
    : Channel(std::move(options), std::make_unique<TextDecoder>(), sink) {}

RawChannel::RawChannel(ChannelOptions options, ErrorSink& sink)
    : Channel(std::move(options), std::make_unique<RawDecoder>(), sink) {}

}  // namespace linesock::channel
