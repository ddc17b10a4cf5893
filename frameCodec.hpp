#ifndef ATV_FRAME_CODEC_HPP
#define ATV_FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/message_lite.h>

#include "ATVErrors.hpp"

namespace AndroidTV {
namespace Codec {

// Every frame is <varint byte length><payload>. The length is a protobuf
// base-128 varint: 7-bit little-endian groups, top bit = continuation.
static constexpr size_t kMaxVarintBytes = 5;
static constexpr size_t kDefaultMaxFrameSize = 64 * 1024;

void appendVarint(std::vector<uint8_t> &out, uint32_t value);

std::vector<uint8_t> encodeFrame(const std::vector<uint8_t> &payload);
std::vector<uint8_t> encodeFrame(const google::protobuf::MessageLite &message);

// Incremental decoder for a byte stream. Bytes may arrive in any split:
// one feed() can complete zero, one or several frames.
class FrameDecoder {
  public:
    explicit FrameDecoder(size_t maxFrameSize = kDefaultMaxFrameSize);

    void feed(const uint8_t *data, size_t len);
    void feed(const std::vector<uint8_t> &data) { feed(data.data(), data.size()); }

    // Next complete payload, nullopt if more bytes are needed.
    // Throws FramingError on a prefix longer than kMaxVarintBytes or a
    // length above the frame limit.
    std::optional<std::vector<uint8_t>> next();

    // Called at end of stream. Throws FramingError if a frame is incomplete.
    void finish() const;

    bool hasPartialFrame() const { return readPos_ < buffer_.size(); }
    size_t bufferedBytes() const { return buffer_.size() - readPos_; }

  private:
    void compact();

    std::vector<uint8_t> buffer_;
    size_t readPos_ = 0;
    size_t maxFrameSize_;
};

// Exactly one frame spanning all of bytes. Truncation, trailing bytes or a
// bad prefix raise FramingError.
std::vector<uint8_t> decodeFrame(const std::vector<uint8_t> &bytes,
                                 size_t maxFrameSize = kDefaultMaxFrameSize);

template <typename T> T decodeMessage(const std::vector<uint8_t> &payload) {
    T message;
    if (!message.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        throw FramingError("cannot parse " + message.GetTypeName());
    }
    return message;
}

} // namespace Codec
} // namespace AndroidTV

#endif // ATV_FRAME_CODEC_HPP
