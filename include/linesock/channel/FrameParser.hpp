#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace linesock::channel {

// Splits every delimiter-terminated message off the front of `buffer`.
//
// Empty segments are dropped. Text after the last delimiter stays in `buffer`
// for the next call; `buffer` is untouched when it holds no delimiter. One
// linear pass, no backtracking. An empty delimiter yields no messages.
std::vector<std::string> extractMessages(std::string& buffer, std::string_view delimiter);

}  // namespace linesock::channel
