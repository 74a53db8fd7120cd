#ifndef PEAPOD_WIRE_MESSAGE_H
#define PEAPOD_WIRE_MESSAGE_H

#include "peapod/base/bytes.h"
#include "peapod/crypto/identity.h"
#include "peapod/crypto/integrity.h"
#include <array>
#include <cstdint>
#include <variant>

namespace peapod {

// Current protocol version. The whole byte is the major version.
static constexpr uint8_t PROTOCOL_VERSION = 1;

static constexpr size_t TRANSFER_ID_SIZE = 16;
using TransferId = std::array<uint8_t, TRANSFER_ID_SIZE>;

// Wire tags (u32 LE at the start of every payload)
enum class MessageType : uint32_t {
    Beacon = 0,
    DiscoveryResponse = 1,
    Join = 2,
    Leave = 3,
    Heartbeat = 4,
    ChunkRequest = 5,
    ChunkData = 6,
    Nack = 7
};

// Discovery: advertise presence and public identity
struct Beacon {
    uint8_t version = PROTOCOL_VERSION;
    DeviceId device_id{};
    PublicKey public_key{};
    uint16_t listen_port = 0;

    bool operator==(const Beacon&) const = default;
};

// Answer to a beacon, advertising self
struct DiscoveryResponse {
    uint8_t version = PROTOCOL_VERSION;
    DeviceId device_id{};
    PublicKey public_key{};
    uint16_t listen_port = 0;

    bool operator==(const DiscoveryResponse&) const = default;
};

struct Join {
    DeviceId device_id{};
    bool operator==(const Join&) const = default;
};

struct Leave {
    DeviceId device_id{};
    bool operator==(const Leave&) const = default;
};

struct Heartbeat {
    DeviceId device_id{};
    bool operator==(const Heartbeat&) const = default;
};

// Ask a peer to fetch [start, end) of a transfer
struct ChunkRequest {
    TransferId transfer_id{};
    uint64_t start = 0;
    uint64_t end = 0;

    bool operator==(const ChunkRequest&) const = default;
};

// Plaintext chunk payload plus its SHA-256
struct ChunkData {
    TransferId transfer_id{};
    uint64_t start = 0;
    uint64_t end = 0;
    ChunkHash hash{};
    Bytes payload;

    bool operator==(const ChunkData&) const = default;
};

// The peer cannot serve [start, end); reassign it
struct Nack {
    TransferId transfer_id{};
    uint64_t start = 0;
    uint64_t end = 0;

    bool operator==(const Nack&) const = default;
};

// Alternative order matches MessageType
using Message = std::variant<Beacon, DiscoveryResponse, Join, Leave, Heartbeat,
                             ChunkRequest, ChunkData, Nack>;

MessageType message_type(const Message& message);
const char* to_string(MessageType type);

} // namespace peapod

#endif // PEAPOD_WIRE_MESSAGE_H
