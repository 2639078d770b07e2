#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace linesock {

// Destination for structured error records (message + context).
//
// Records are diagnostics only: a sink never influences control flow and
// record() never throws.
class ErrorSink {
public:
    ErrorSink() = default;
    virtual ~ErrorSink() = default;

    virtual void record(std::string_view message, std::string_view context) noexcept = 0;
};

// Discards every record.
class NullErrorSink final : public ErrorSink {
public:
    void record(std::string_view, std::string_view) noexcept override {}
};

// Appends one line per record to a log file. The file is opened on the first
// record so constructing the sink never touches the filesystem.
class FileErrorSink final : public ErrorSink {
public:
    explicit FileErrorSink(std::string path);
    ~FileErrorSink() override;

    void record(std::string_view message, std::string_view context) noexcept override;

    const std::string& path() const noexcept;

private:
    std::string path_;
    std::once_flag open_once_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Process-wide sink writing to "error.log" in the working directory.
ErrorSink& defaultErrorSink();

}  // namespace linesock
