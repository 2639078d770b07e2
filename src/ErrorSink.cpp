#include "linesock/ErrorSink.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace linesock {

namespace {

constexpr const char* kDefaultErrorLogPath = "error.log";

}  // namespace

FileErrorSink::FileErrorSink(std::string path)
    : path_(std::move(path)) {}

FileErrorSink::~FileErrorSink() {
    if (logger_) {
        logger_->flush();
    }
}

void FileErrorSink::record(std::string_view message, std::string_view context) noexcept {
    std::call_once(open_once_, [this]() {
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_);
            logger_ = std::make_shared<spdlog::logger>("linesock.errors", std::move(sink));
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
            logger_->flush_on(spdlog::level::err);
        } catch (const std::exception& e) {
            // File cannot be opened; fall back to the default stderr logger.
            spdlog::warn("error log '{}' unavailable: {}", path_, e.what());
        }
    });

    if (logger_) {
        logger_->error("{}: {}", context, message);
        return;
    }
    spdlog::error("{}: {}", context, message);
}

const std::string& FileErrorSink::path() const noexcept {
    return path_;
}

ErrorSink& defaultErrorSink() {
    static FileErrorSink sink(kDefaultErrorLogPath);
    return sink;
}

}  // namespace linesock
