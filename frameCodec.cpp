#include "frameCodec.hpp"
#include "logger.hpp"

namespace AndroidTV {
namespace Codec {

namespace {

enum class VarintResult { Complete, NeedMore };

VarintResult readVarint(const uint8_t *data, size_t len, uint32_t &value,
                        size_t &consumed) {
    uint64_t result = 0;
    for (size_t i = 0; i < kMaxVarintBytes; ++i) {
        if (i == len) {
            return VarintResult::NeedMore;
        }
        uint8_t byte = data[i];
        result |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            if (result > UINT32_MAX) {
                throw FramingError("frame length overflows 32 bits");
            }
            value = static_cast<uint32_t>(result);
            consumed = i + 1;
            return VarintResult::Complete;
        }
    }
    throw FramingError("frame length prefix longer than 5 bytes");
}

} // namespace

void appendVarint(std::vector<uint8_t> &out, uint32_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

std::vector<uint8_t> encodeFrame(const std::vector<uint8_t> &payload) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + kMaxVarintBytes);
    appendVarint(frame, static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<uint8_t> encodeFrame(const google::protobuf::MessageLite &message) {
    std::vector<uint8_t> payload(message.ByteSizeLong());
    if (!payload.empty() &&
        !message.SerializeToArray(payload.data(), static_cast<int>(payload.size()))) {
        throw FramingError("cannot serialize " + message.GetTypeName());
    }
    return encodeFrame(payload);
}

FrameDecoder::FrameDecoder(size_t maxFrameSize) : maxFrameSize_(maxFrameSize) {}

void FrameDecoder::feed(const uint8_t *data, size_t len) {
    compact();
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<std::vector<uint8_t>> FrameDecoder::next() {
    const uint8_t *start = buffer_.data() + readPos_;
    size_t available = buffer_.size() - readPos_;

    uint32_t length = 0;
    size_t prefixLen = 0;
    if (readVarint(start, available, length, prefixLen) == VarintResult::NeedMore) {
        return std::nullopt;
    }
    if (length > maxFrameSize_) {
        throw FramingError(fmt::format("frame of {} bytes exceeds limit of {}", length,
                                       maxFrameSize_));
    }
    if (available - prefixLen < length) {
        return std::nullopt;
    }

    std::vector<uint8_t> payload(start + prefixLen, start + prefixLen + length);
    readPos_ += prefixLen + length;
    return payload;
}

void FrameDecoder::finish() const {
    if (hasPartialFrame()) {
        throw FramingError(fmt::format("stream ended inside a frame ({} bytes buffered)",
                                       bufferedBytes()));
    }
}

void FrameDecoder::compact() {
    if (readPos_ == 0) {
        return;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_));
    readPos_ = 0;
}

std::vector<uint8_t> decodeFrame(const std::vector<uint8_t> &bytes, size_t maxFrameSize) {
    FrameDecoder decoder(maxFrameSize);
    decoder.feed(bytes);
    auto payload = decoder.next();
    if (!payload) {
        throw FramingError(fmt::format("truncated frame ({} bytes)", bytes.size()));
    }
    if (decoder.hasPartialFrame()) {
        throw FramingError(fmt::format("{} trailing bytes after frame",
                                       decoder.bufferedBytes()));
    }
    return *payload;
}

} // namespace Codec
} // namespace AndroidTV
