#include "linesock/channel/ChunkDecoder.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

using linesock::channel::RawDecoder;
using linesock::channel::ReceiveBuffer;
using linesock::channel::TextDecoder;

TEST(ChunkDecoderTests, RawDecoderKeepsEveryByte) {
    const RawDecoder decoder;
    ReceiveBuffer buffer;
    const std::string chunk("\xff\x00\xfe\r\n", 5);

    ASSERT_TRUE(decoder.decode(chunk, buffer));
    EXPECT_EQ(buffer.data, chunk);
    EXPECT_TRUE(buffer.undecoded.empty());
}

TEST(ChunkDecoderTests, TextDecoderAcceptsValidUtf8) {
    const TextDecoder decoder;
    ReceiveBuffer buffer;

    ASSERT_TRUE(decoder.decode("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\r\n", buffer));
    EXPECT_EQ(buffer.data, "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\r\n");
    EXPECT_TRUE(buffer.undecoded.empty());
}

TEST(ChunkDecoderTests, TextDecoderDropsUndecodableChunk) {
    const TextDecoder decoder;
    ReceiveBuffer buffer;
    buffer.data = "kept";

    EXPECT_FALSE(decoder.decode("bad \xff byte", buffer));
    EXPECT_EQ(buffer.data, "kept");
    EXPECT_TRUE(buffer.undecoded.empty());
}

TEST(ChunkDecoderTests, TextDecoderCarriesCharacterSplitAcrossChunks) {
    const TextDecoder decoder;
    ReceiveBuffer buffer;

    ASSERT_TRUE(decoder.decode("caf\xc3", buffer));
    EXPECT_EQ(buffer.data, "caf");
    EXPECT_EQ(buffer.undecoded, "\xc3");
    EXPECT_EQ(buffer.size(), 4U);

    ASSERT_TRUE(decoder.decode("\xa9!", buffer));
    EXPECT_EQ(buffer.data, "caf\xc3\xa9!");
    EXPECT_TRUE(buffer.undecoded.empty());
}

TEST(ChunkDecoderTests, TextDecoderRejectsOverlongAndSurrogateForms) {
    const TextDecoder decoder;

    ReceiveBuffer overlong;
    EXPECT_FALSE(decoder.decode("\xc0\xaf", overlong));

    ReceiveBuffer surrogate;
    EXPECT_FALSE(decoder.decode("\xed\xa0\x80", surrogate));

    ReceiveBuffer beyond_unicode;
    EXPECT_FALSE(decoder.decode("\xf4\x90\x80\x80", beyond_unicode));
}

TEST(ChunkDecoderTests, TextDecoderDiscardsCarriedBytesWhenNextChunkIsInvalid) {
    const TextDecoder decoder;
    ReceiveBuffer buffer;

    ASSERT_TRUE(decoder.decode("\xe2\x82", buffer));
    EXPECT_EQ(buffer.undecoded.size(), 2U);

    EXPECT_FALSE(decoder.decode("x", buffer));
    EXPECT_TRUE(buffer.empty());
}

}  // namespace
