#include "linesock/transport/KeepAlive.hpp"

namespace linesock::transport {

bool configureKeepAlive(int, const KeepAliveParams&) noexcept {
    return false;
}

}  // namespace linesock::transport
