#pragma once

namespace linesock::transport {

// TCP keep-alive probe schedule. With the defaults a silent peer is declared
// dead roughly 16 seconds after it stops answering.
struct KeepAliveParams {
    int idle_seconds = 1;
    int interval_seconds = 3;
    int max_failures = 5;
};

// Enables OS-level keep-alive on a connected stream socket.
//
// The implementation is chosen at build time. Platforms that do not expose
// every knob apply what they can; unsupported platforms do nothing. Returns
// false when any requested knob could not be applied.
bool configureKeepAlive(int fd, const KeepAliveParams& params) noexcept;

}  // namespace linesock::transport
