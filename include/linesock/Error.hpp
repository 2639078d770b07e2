#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace linesock {

// Failure classes surfaced by channels and transports.
//
// Only ConnectFailed escapes a public operation (as ConnectError). The other
// codes are soft: the operation degrades to an empty result and the failure
// is recorded at the ErrorSink.
enum class Errc : int {
    ConnectFailed = 1,
    Disconnected,
    Timeout,
    WouldBlock,
    DecodeError,
    FatalTransportError,
};

const std::error_category& category() noexcept;

std::error_code make_error_code(Errc code) noexcept;

// Thrown by connect() when the peer is unreachable or the TLS handshake fails.
// The channel stays usable; callers may retry.
class ConnectError : public std::system_error {
public:
    explicit ConnectError(const std::string& what);
};

}  // namespace linesock

namespace std {

template <>
struct is_error_code_enum<linesock::Errc> : true_type {};

}  // namespace std
