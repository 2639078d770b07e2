#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace linesock::channel {

// Bytes received but not yet framed into messages.
//
// `data` holds decoded content. `undecoded` holds the start of a character
// whose remaining bytes have not arrived yet. Both count toward the buffer
// ceiling.
struct ReceiveBuffer {
    std::string data;
    std::string undecoded;

    size_t size() const noexcept {
        return data.size() + undecoded.size();
    }

    bool empty() const noexcept {
        return data.empty() && undecoded.empty();
    }
};

// Converts received chunks into the buffer representation of a channel kind.
class ChunkDecoder {
public:
    ChunkDecoder() = default;
    virtual ~ChunkDecoder() = default;

    // Appends the decoded chunk to `buffer`. Returns false, leaving `buffer`
    // without the chunk, if it cannot be decoded.
    virtual bool decode(std::string_view chunk, ReceiveBuffer& buffer) const = 0;
};

// Strict UTF-8. Overlong forms, surrogates and code points above U+10FFFF are
// rejected. A sequence cut at the chunk boundary is carried to the next chunk.
class TextDecoder final : public ChunkDecoder {
public:
    bool decode(std::string_view chunk, ReceiveBuffer& buffer) const override;
};

// Byte-transparent; every chunk decodes.
class RawDecoder final : public ChunkDecoder {
public:
    bool decode(std::string_view chunk, ReceiveBuffer& buffer) const override;
};

}  // namespace linesock::channel
