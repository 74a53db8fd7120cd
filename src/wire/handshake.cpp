#include "peapod/wire/handshake.h"
#include "peapod/wire/codec.h"
#include <algorithm>

namespace peapod {

namespace {

template <typename T>
T make_announce(const Keypair& keypair, uint16_t listen_port) {
    T msg;
    msg.version = PROTOCOL_VERSION;
    msg.device_id = keypair.device_id();
    msg.public_key = keypair.public_key();
    msg.listen_port = listen_port;
    return msg;
}

Bytes frame_or_throw(const Message& message) {
    // Discovery messages are a few dozen bytes; the size limit cannot trip here
    auto frame = encode_frame(message);
    if (!frame) {
        throw PeaPodError(frame.error(), "failed to frame discovery message");
    }
    return std::move(frame).value();
}

template <typename T>
DiscoveryInfo info_from(const T& msg, bool is_response) {
    DiscoveryInfo info;
    info.is_response = is_response;
    info.device_id = msg.device_id;
    info.public_key = msg.public_key;
    info.listen_port = msg.listen_port;
    return info;
}

} // anonymous namespace

HandshakeBytes handshake_bytes(const Keypair& keypair) {
    HandshakeBytes out{};
    out[0] = PROTOCOL_VERSION;
    const auto& id = keypair.device_id();
    const auto& pk = keypair.public_key();
    std::copy(id.begin(), id.end(), out.begin() + 1);
    std::copy(pk.begin(), pk.end(), out.begin() + 1 + DEVICE_ID_SIZE);
    return out;
}

Result<Handshake> parse_handshake(const uint8_t* data, size_t size) {
    if (data == nullptr || size < HANDSHAKE_SIZE) {
        return ErrorCode::Incomplete;
    }
    if (data[0] != PROTOCOL_VERSION) {
        return ErrorCode::UnsupportedVersion;
    }

    Handshake hs;
    hs.version = data[0];
    std::copy(data + 1, data + 1 + DEVICE_ID_SIZE, hs.device_id.begin());
    std::copy(data + 1 + DEVICE_ID_SIZE, data + HANDSHAKE_SIZE, hs.public_key.begin());

    if (device_id(hs.public_key) != hs.device_id) {
        return ErrorCode::Malformed;
    }
    return hs;
}

Bytes beacon_frame(const Keypair& keypair, uint16_t listen_port) {
    return frame_or_throw(make_announce<Beacon>(keypair, listen_port));
}

Bytes discovery_response_frame(const Keypair& keypair, uint16_t listen_port) {
    return frame_or_throw(make_announce<DiscoveryResponse>(keypair, listen_port));
}

Result<DiscoveryInfo> decode_discovery_frame(const uint8_t* data, size_t size) {
    auto decoded = decode_frame(data, size);
    if (!decoded) {
        return decoded.error();
    }

    const Message& message = decoded->message;
    DiscoveryInfo info;
    if (const auto* beacon = std::get_if<Beacon>(&message)) {
        info = info_from(*beacon, false);
    } else if (const auto* response = std::get_if<DiscoveryResponse>(&message)) {
        info = info_from(*response, true);
    } else {
        return ErrorCode::Malformed;
    }

    if (device_id(info.public_key) != info.device_id) {
        return ErrorCode::Malformed;
    }
    return info;
}

} // namespace peapod
