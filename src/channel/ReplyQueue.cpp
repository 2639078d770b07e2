#include "linesock/channel/ReplyQueue.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace linesock::channel {

void ReplyQueue::push(std::string message) {
    messages_.push_back(std::move(message));
}

void ReplyQueue::append(std::vector<std::string>&& messages) {
    std::move(messages.begin(), messages.end(), std::back_inserter(messages_));
    messages.clear();
}

std::optional<std::string> ReplyQueue::popOldest() {
    if (messages_.empty()) {
        return std::nullopt;
    }

    std::string oldest = std::move(messages_.front());
    messages_.pop_front();
    return oldest;
}

size_t ReplyQueue::size() const noexcept {
    return messages_.size();
}

bool ReplyQueue::empty() const noexcept {
    return messages_.empty();
}

std::string& ReplyQueue::at(size_t index) {
    return messages_.at(index);
}

const std::string& ReplyQueue::at(size_t index) const {
    return messages_.at(index);
}

void ReplyQueue::erase(size_t index) {
    if (index >= messages_.size()) {
        throw std::out_of_range("reply index out of range");
    }
    messages_.erase(messages_.begin() + static_cast<std::ptrdiff_t>(index));
}

std::string& ReplyQueue::operator[](size_t index) {
    return messages_[index];
}

const std::string& ReplyQueue::operator[](size_t index) const {
    return messages_[index];
}

ReplyQueue::const_iterator ReplyQueue::begin() const noexcept {
    return messages_.begin();
}

ReplyQueue::const_iterator ReplyQueue::end() const noexcept {
    return messages_.end();
}

std::vector<std::string> ReplyQueue::drain(const Filter& filter) {
    std::vector<std::string> drained;
    drained.reserve(messages_.size());
    for (std::string& message : messages_) {
        if (!filter || filter(message)) {
            drained.push_back(std::move(message));
        }
    }
    messages_.clear();
    return drained;
}

std::vector<std::string> ReplyQueue::drainReversed(const Filter& filter) {
    std::vector<std::string> drained = drain(filter);
    std::reverse(drained.begin(), drained.end());
    return drained;
}

}  // namespace linesock::channel
