#include "linesock/Error.hpp"

namespace linesock {

namespace {

class LinesockCategory final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "linesock";
    }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::ConnectFailed:
                return "socket connect failed";
            case Errc::Disconnected:
                return "socket is disconnected";
            case Errc::Timeout:
                return "operation timed out";
            case Errc::WouldBlock:
                return "operation would block";
            case Errc::DecodeError:
                return "received chunk could not be decoded";
            case Errc::FatalTransportError:
                return "fatal transport error";
        }
        return "unknown linesock error";
    }
};

}  // namespace

const std::error_category& category() noexcept {
    static const LinesockCategory instance;
    return instance;
}

std::error_code make_error_code(Errc code) noexcept {
    return {static_cast<int>(code), category()};
}

ConnectError::ConnectError(const std::string& what)
    : std::system_error(make_error_code(Errc::ConnectFailed), what) {}

}  // namespace linesock
