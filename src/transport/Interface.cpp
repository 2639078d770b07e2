#include "linesock/transport/Interface.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <memory>

namespace linesock::transport {

namespace {

using IfAddrsPtr = std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)>;

}  // namespace

std::optional<std::string> resolveInterfaceAddress(std::string_view name) {
    ifaddrs* raw = nullptr;
    if (::getifaddrs(&raw) != 0) {
        return std::nullopt;
    }
    IfAddrsPtr list(raw, ::freeifaddrs);

    for (const ifaddrs* current = list.get(); current != nullptr; current = current->ifa_next) {
        if (current->ifa_addr == nullptr || current->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (current->ifa_name == nullptr || name != current->ifa_name) {
            continue;
        }

        const auto* addr = reinterpret_cast<const sockaddr_in*>(current->ifa_addr);
        char text[INET_ADDRSTRLEN] {};
        if (::inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text)) == nullptr) {
            return std::nullopt;
        }
        return std::string(text);
    }
    return std::nullopt;
}

}  // namespace linesock::transport
