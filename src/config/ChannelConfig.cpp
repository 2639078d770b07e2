#include "linesock/config/ChannelConfig.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace linesock::config {

namespace {

template <typename T>
T readScalar(const YAML::Node& node, const char* key) {
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

size_t readPositiveSize(const YAML::Node& node, const char* key) {
    const auto value = readScalar<long long>(node, key);
    if (value <= 0) {
        throw std::runtime_error(std::string("'") + key + "' must be > 0");
    }
    return static_cast<size_t>(value);
}

double readNonNegativeSeconds(const YAML::Node& node, const char* key) {
    const auto seconds = readScalar<double>(node, key);
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw std::runtime_error(std::string("'") + key + "' must be a non-negative number of seconds");
    }
    return seconds;
}

}  // namespace

Encoding parseEncoding(const std::string& value) {
    if (value == "text" || value == "unicode") {
        return Encoding::Text;
    } else if (value == "raw" || value == "latin-1") {
        return Encoding::Raw;
    } else {
        throw std::runtime_error("Invalid encoding: '" + value + "'. Valid values: text, raw");
    }
}

ChannelConfig parseChannelConfig(const YAML::Node& node) {
    ChannelConfig config;
    if (!node || node.IsNull()) {
        return config;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("Channel config must be a YAML mapping");
    }

    channel::ChannelOptions& options = config.options;

    if (node["address"]) {
        options.address = readScalar<std::string>(node, "address");
    }
    if (node["port"]) {
        const auto port = readScalar<long long>(node, "port");
        if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw std::runtime_error("'port' must be between 0 and 65535");
        }
        options.port = static_cast<uint16_t>(port);
    }
    if (node["blocking"]) {
        options.blocking = readScalar<bool>(node, "blocking");
    }
    if (node["timeout"]) {
        const double seconds = readNonNegativeSeconds(node, "timeout");
        options.timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    }
    if (node["interface"]) {
        options.interface = readScalar<std::string>(node, "interface");
        if (options.interface.empty()) {
            throw std::runtime_error("'interface' must not be empty");
        }
    }
    if (node["use_tls"]) {
        options.use_tls = readScalar<bool>(node, "use_tls");
    }
    if (node["debug"]) {
        options.debug = readScalar<bool>(node, "debug");
    }
    if (node["encoding"]) {
        config.encoding = parseEncoding(readScalar<std::string>(node, "encoding"));
    }
    if (node["max_buffer_bytes"]) {
        options.max_buffer_bytes = readPositiveSize(node, "max_buffer_bytes");
    }
    if (node["max_chunks"]) {
        options.max_chunks = readPositiveSize(node, "max_chunks");
    }
    if (node["chunk_size"]) {
        options.chunk_size = readPositiveSize(node, "chunk_size");
    }
    if (node["heartbeat_interval"]) {
        const double seconds = readNonNegativeSeconds(node, "heartbeat_interval");
        options.heartbeat_interval = std::chrono::seconds(static_cast<long long>(std::llround(seconds)));
    }
    if (node["heartbeat_line"]) {
        options.heartbeat_line = readScalar<std::string>(node, "heartbeat_line");
    }
    if (node["delimiter"]) {
        options.delimiter = readScalar<std::string>(node, "delimiter");
        if (options.delimiter.empty()) {
            throw std::runtime_error("'delimiter' must not be empty");
        }
    }

    if (options.heartbeat_line.find(options.delimiter) != std::string::npos) {
        throw std::runtime_error("'heartbeat_line' must not contain the delimiter");
    }
    return config;
}

ChannelConfig loadChannelConfig(const std::string& path) {
    YAML::Node yaml;

    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file '" + path + "': " + e.what());
    }

    return parseChannelConfig(yaml);
}

}  // namespace linesock::config
