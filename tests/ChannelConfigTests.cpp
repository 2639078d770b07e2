#include "linesock/config/ChannelConfig.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <stdexcept>
#include <string>

namespace {

using linesock::config::ChannelConfig;
using linesock::config::Encoding;
using linesock::config::loadChannelConfig;
using linesock::config::parseChannelConfig;
using linesock::config::parseEncoding;

TEST(ChannelConfigTests, ParsesEveryKey) {
    const YAML::Node node = YAML::Load(R"(
address: 203.0.113.7
port: 8540
blocking: true
timeout: 2.5
interface: eth0
use_tls: true
debug: true
encoding: raw
max_buffer_bytes: 4096
max_chunks: 8
chunk_size: 512
heartbeat_interval: 60
heartbeat_line: KEEPALIVE
delimiter: "\n"
)");

    const ChannelConfig config = parseChannelConfig(node);
    const auto& options = config.options;

    EXPECT_EQ(options.address, "203.0.113.7");
    EXPECT_EQ(options.port, 8540);
    EXPECT_TRUE(options.blocking);
    EXPECT_EQ(options.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(options.interface, "eth0");
    EXPECT_TRUE(options.use_tls);
    EXPECT_TRUE(options.debug);
    EXPECT_EQ(config.encoding, Encoding::Raw);
    EXPECT_EQ(options.max_buffer_bytes, 4096U);
    EXPECT_EQ(options.max_chunks, 8U);
    EXPECT_EQ(options.chunk_size, 512U);
    EXPECT_EQ(options.heartbeat_interval, std::chrono::seconds(60));
    EXPECT_EQ(options.heartbeat_line, "KEEPALIVE");
    EXPECT_EQ(options.delimiter, "\n");
}

TEST(ChannelConfigTests, MissingKeysKeepDefaults) {
    const ChannelConfig config = parseChannelConfig(YAML::Load("port: 7000"));
    const auto& options = config.options;

    EXPECT_TRUE(options.address.empty());
    EXPECT_EQ(options.port, 7000);
    EXPECT_FALSE(options.blocking);
    EXPECT_EQ(options.timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(options.interface, "default");
    EXPECT_EQ(options.max_buffer_bytes, 1024U * 1024U);
    EXPECT_EQ(options.max_chunks, 1024U);
    EXPECT_EQ(options.chunk_size, 100U * 1024U);
    EXPECT_EQ(options.heartbeat_interval, std::chrono::seconds(300));
    EXPECT_EQ(options.heartbeat_line, "PING");
    EXPECT_EQ(options.delimiter, "\r\n");
    EXPECT_EQ(config.encoding, Encoding::Text);
}

TEST(ChannelConfigTests, EmptyDocumentYieldsDefaults) {
    const ChannelConfig config = parseChannelConfig(YAML::Node());
    EXPECT_EQ(config.options.port, 0);
    EXPECT_EQ(config.encoding, Encoding::Text);
}

TEST(ChannelConfigTests, ParsesEncodingAliases) {
    EXPECT_EQ(parseEncoding("text"), Encoding::Text);
    EXPECT_EQ(parseEncoding("unicode"), Encoding::Text);
    EXPECT_EQ(parseEncoding("raw"), Encoding::Raw);
    EXPECT_EQ(parseEncoding("latin-1"), Encoding::Raw);
    EXPECT_THROW(parseEncoding("utf-16"), std::runtime_error);
}

TEST(ChannelConfigTests, RejectsInvalidValues) {
    EXPECT_THROW(parseChannelConfig(YAML::Load("- a\n- b")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("encoding: ebcdic")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("max_chunks: 0")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("chunk_size: -4")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("delimiter: ''")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("port: 70000")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("port: http")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("timeout: -1")), std::runtime_error);
    EXPECT_THROW(parseChannelConfig(YAML::Load("heartbeat_line: \"PI\\r\\nNG\"")), std::runtime_error);
}

TEST(ChannelConfigTests, ErrorNamesOffendingKey) {
    try {
        (void)parseChannelConfig(YAML::Load("max_buffer_bytes: 0"));
        FAIL() << "zero max_buffer_bytes accepted";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("max_buffer_bytes"), std::string::npos);
    }
}

TEST(ChannelConfigTests, MissingFileThrows) {
    EXPECT_THROW(loadChannelConfig("/nonexistent/linesock/channel.yaml"), std::runtime_error);
}

}  // namespace
