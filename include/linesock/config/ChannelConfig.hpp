#pragma once

#include "linesock/channel/ChannelOptions.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace linesock::config {

// Buffer kind of the channel to build.
enum class Encoding {
    Text,  // validated UTF-8
    Raw,   // bytes verbatim
};

// Channel options plus the buffer kind, as read from a YAML document:
//
//   address: 203.0.113.7
//   port: 8540
//   blocking: false
//   timeout: 5               # seconds
//   interface: default
//   use_tls: false
//   debug: false
//   encoding: text           # text | raw
//   max_buffer_bytes: 1048576
//   max_chunks: 1024
//   chunk_size: 102400
//   heartbeat_interval: 300  # seconds
//   heartbeat_line: PING
//   delimiter: "\r\n"
//
// Every key is optional; missing keys keep the ChannelOptions defaults.
struct ChannelConfig {
    channel::ChannelOptions options;
    Encoding encoding = Encoding::Text;
};

Encoding parseEncoding(const std::string& value);

// Throws std::runtime_error naming the offending key on invalid input.
ChannelConfig parseChannelConfig(const YAML::Node& node);

// Throws std::runtime_error if the file cannot be read or is invalid.
ChannelConfig loadChannelConfig(const std::string& path);

}  // namespace linesock::config
