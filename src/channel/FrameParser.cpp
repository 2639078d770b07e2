#include "linesock/channel/FrameParser.hpp"

namespace linesock::channel {

std::vector<std::string> extractMessages(std::string& buffer, std::string_view delimiter) {
    std::vector<std::string> messages;
    if (delimiter.empty()) {
        return messages;
    }

    size_t start = 0;
    for (;;) {
        const size_t end = buffer.find(delimiter, start);
        if (end == std::string::npos) {
            break;
        }
        if (end > start) {
            messages.emplace_back(buffer, start, end - start);
        }
        start = end + delimiter.size();
    }

    if (start > 0) {
        buffer.erase(0, start);
    }
    return messages;
}

}  // namespace linesock::channel
