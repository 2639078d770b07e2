#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace linesock::channel {

// Complete messages in arrival order.
//
// Plain container: nothing here polls the socket. Callers run
// Channel::update() first when they want fresh replies.
class ReplyQueue {
public:
    using Filter = std::function<bool(const std::string&)>;
    using const_iterator = std::deque<std::string>::const_iterator;

    void push(std::string message);
    void append(std::vector<std::string>&& messages);

    // Removes and returns the oldest message.
    std::optional<std::string> popOldest();

    size_t size() const noexcept;
    bool empty() const noexcept;

    // Bounds-checked; throw std::out_of_range.
    std::string& at(size_t index);
    const std::string& at(size_t index) const;
    void erase(size_t index);

    std::string& operator[](size_t index);
    const std::string& operator[](size_t index) const;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    // Returns the messages accepted by `filter` (all when empty), oldest
    // first, and always leaves the queue empty.
    std::vector<std::string> drain(const Filter& filter = {});

    // Same as drain() but newest first.
    std::vector<std::string> drainReversed(const Filter& filter = {});

private:
    std::deque<std::string> messages_;
};

}  // namespace linesock::channel
