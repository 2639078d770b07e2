#include "linesock/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace linesock {

std::shared_ptr<spdlog::logger> makeChannelLogger(const std::string& name, bool debug) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
    return logger;
}

}  // namespace linesock
