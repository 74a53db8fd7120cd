#ifndef PEAPOD_WIRE_HANDSHAKE_H
#define PEAPOD_WIRE_HANDSHAKE_H

#include "peapod/base/bytes.h"
#include "peapod/base/result.h"
#include "peapod/crypto/identity.h"
#include "peapod/wire/message.h"
#include <array>
#include <cstdint>

namespace peapod {

// Plaintext hello exchanged before any encrypted frame:
// version(1) + device_id(16) + public_key(32)
static constexpr size_t HANDSHAKE_SIZE = 1 + DEVICE_ID_SIZE + PUBLIC_KEY_SIZE;

using HandshakeBytes = std::array<uint8_t, HANDSHAKE_SIZE>;

struct Handshake {
    uint8_t version = PROTOCOL_VERSION;
    DeviceId device_id{};
    PublicKey public_key{};
};

HandshakeBytes handshake_bytes(const Keypair& keypair);

// Incomplete below HANDSHAKE_SIZE, UnsupportedVersion on a version mismatch,
// Malformed if device_id is not derived from public_key. Extra bytes are ignored.
Result<Handshake> parse_handshake(const uint8_t* data, size_t size);

// What a discovery datagram tells us about its sender
struct DiscoveryInfo {
    bool is_response = false;
    DeviceId device_id{};
    PublicKey public_key{};
    uint16_t listen_port = 0;
};

// Framed Beacon / DiscoveryResponse advertising the keypair
Bytes beacon_frame(const Keypair& keypair, uint16_t listen_port);
Bytes discovery_response_frame(const Keypair& keypair, uint16_t listen_port);

// Accepts only Beacon and DiscoveryResponse frames; anything else is Malformed,
// as is an advertised device_id that does not match its public key.
Result<DiscoveryInfo> decode_discovery_frame(const uint8_t* data, size_t size);

} // namespace peapod

#endif // PEAPOD_WIRE_HANDSHAKE_H
