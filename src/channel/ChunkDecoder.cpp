#include "linesock/channel/ChunkDecoder.hpp"

#include <cstdint>

namespace linesock::channel {

namespace {

enum class Sequence : uint8_t {
    Valid,
    Invalid,
    Truncated,
};

// Checks the UTF-8 sequence starting at `pos` and stores its length.
Sequence checkSequence(std::string_view text, size_t pos, size_t& length) noexcept {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        length = 1;
        return Sequence::Valid;
    }

    // Bounds of the first continuation byte exclude overlongs and surrogates.
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            lower = 0xA0;
        } else if (lead == 0xED) {
            upper = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            lower = 0x90;
        } else if (lead == 0xF4) {
            upper = 0x8F;
        }
    } else {
        return Sequence::Invalid;
    }

    for (size_t offset = 1; offset < length; ++offset) {
        if (pos + offset >= text.size()) {
            return Sequence::Truncated;
        }
        const auto byte = static_cast<unsigned char>(text[pos + offset]);
        const unsigned char min = (offset == 1) ? lower : 0x80;
        const unsigned char max = (offset == 1) ? upper : 0xBF;
        if (byte < min || byte > max) {
            return Sequence::Invalid;
        }
    }
    return Sequence::Valid;
}

}  // namespace

bool TextDecoder::decode(std::string_view chunk, ReceiveBuffer& buffer) const {
    std::string joined;
    joined.reserve(buffer.undecoded.size() + chunk.size());
    joined.append(buffer.undecoded).append(chunk);

    size_t pos = 0;
    while (pos < joined.size()) {
        size_t length = 0;
        const Sequence sequence = checkSequence(joined, pos, length);
        if (sequence == Sequence::Invalid) {
            buffer.undecoded.clear();
            return false;
        }
        if (sequence == Sequence::Truncated) {
            break;
        }
        pos += length;
    }

    buffer.data.append(joined, 0, pos);
    buffer.undecoded.assign(joined, pos, std::string::npos);
    return true;
}

bool RawDecoder::decode(std::string_view chunk, ReceiveBuffer& buffer) const {
    buffer.data.append(chunk);
    return true;
}

}  // namespace linesock::channel
