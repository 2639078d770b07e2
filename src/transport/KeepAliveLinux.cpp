#include "linesock/transport/KeepAlive.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace linesock::transport {

namespace {

bool setSocketOptionInt(int fd, int level, int option_name, int value) noexcept {
    return ::setsockopt(fd, level, option_name, &value, sizeof(value)) == 0;
}

}  // namespace

bool configureKeepAlive(int fd, const KeepAliveParams& params) noexcept {
    if (fd < 0) {
        return false;
    }

    bool applied = setSocketOptionInt(fd, SOL_SOCKET, SO_KEEPALIVE, 1);
    applied = setSocketOptionInt(fd, IPPROTO_TCP, TCP_KEEPIDLE, params.idle_seconds) && applied;
    applied = setSocketOptionInt(fd, IPPROTO_TCP, TCP_KEEPINTVL, params.interval_seconds) && applied;
    applied = setSocketOptionInt(fd, IPPROTO_TCP, TCP_KEEPCNT, params.max_failures) && applied;
    return applied;
}

}  // namespace linesock::transport
