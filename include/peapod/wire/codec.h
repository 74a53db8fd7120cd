#ifndef PEAPOD_WIRE_CODEC_H
#define PEAPOD_WIRE_CODEC_H

#include "peapod/base/bytes.h"
#include "peapod/base/result.h"
#include "peapod/wire/message.h"
#include <cstdint>

namespace peapod {

// Framing: 4-byte little-endian length, then the payload
static constexpr size_t FRAME_HEADER_SIZE = 4;
static constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;  // 16 MiB

// Payload encoding (bincode-1 compatible layout):
//   u32 LE tag, then fields in declaration order.
//   u8/u16/u64 little-endian; device_id and public_key as u64 length + bytes;
//   transfer_id and hash as raw fixed arrays; payload as u64 length + bytes.
Bytes encode_payload(const Message& message);

// Malformed on unknown tag, truncation, bad field length or trailing bytes.
// UnsupportedVersion on a Beacon/DiscoveryResponse version mismatch, checked
// before any other field is read.
Result<Message> decode_payload(const uint8_t* data, size_t size);
Result<Message> decode_payload(const Bytes& payload);

// A frame located inside a caller buffer; payload points into that buffer
struct FrameView {
    const uint8_t* payload = nullptr;
    size_t payload_size = 0;
    size_t consumed = 0;
};

// FrameTooLarge if payload exceeds MAX_FRAME_SIZE
Result<Bytes> wrap_frame(const Bytes& payload);

// Incomplete if fewer than 4 bytes or fewer than the declared length are
// available; FrameTooLarge if the declared length exceeds MAX_FRAME_SIZE.
// Never allocates.
Result<FrameView> unwrap_frame(const uint8_t* data, size_t size);

struct DecodedFrame {
    Message message;
    size_t consumed = 0;
};

Result<Bytes> encode_frame(const Message& message);

// Decode one frame from the front of the buffer
Result<DecodedFrame> decode_frame(const uint8_t* data, size_t size);
Result<DecodedFrame> decode_frame(const Bytes& buffer);

} // namespace peapod

#endif // PEAPOD_WIRE_CODEC_H
