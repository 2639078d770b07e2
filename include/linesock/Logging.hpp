#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace linesock {

// Creates an unregistered stderr logger for one channel. Debug traces are
// enabled only when `debug` is set; otherwise warnings and above are shown.
std::shared_ptr<spdlog::logger> makeChannelLogger(const std::string& name, bool debug);

}  // namespace linesock
