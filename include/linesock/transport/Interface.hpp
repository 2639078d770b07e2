#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace linesock::transport {

// Interface name meaning "let the OS pick the source address".
inline constexpr std::string_view kDefaultInterface = "default";

// Returns the first IPv4 address assigned to the named network interface
// (e.g. "eth0"), or nullopt if the interface is unknown or has no IPv4 address.
std::optional<std::string> resolveInterfaceAddress(std::string_view name);

}  // namespace linesock::transport
