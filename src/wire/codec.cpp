#include "peapod/wire/codec.h"
#include <endian.h>
#include <cstring>
#include <type_traits>

namespace peapod {

namespace {

// Appends little-endian fields to a payload buffer
class Writer {
public:
    explicit Writer(size_t reserve) { data_.reserve(reserve); }

    void u8(uint8_t v) { data_.push_back(v); }

    void u16(uint16_t v) {
        uint16_t le = htole16(v);
        append(&le, 2);
    }

    void u32(uint32_t v) {
        uint32_t le = htole32(v);
        append(&le, 4);
    }

    void u64(uint64_t v) {
        uint64_t le = htole64(v);
        append(&le, 8);
    }

    // Length-prefixed byte sequence
    void seq(const uint8_t* data, size_t size) {
        u64(static_cast<uint64_t>(size));
        append(data, size);
    }

    // Fixed-size array, no prefix
    template <size_t N>
    void raw(const std::array<uint8_t, N>& bytes) {
        append(bytes.data(), N);
    }

    Bytes take() { return std::move(data_); }

private:
    void append(const void* src, size_t size) {
        const auto* p = static_cast<const uint8_t*>(src);
        data_.insert(data_.end(), p, p + size);
    }

    Bytes data_;
};

// Bounds-checked reader; every failure is Malformed
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool u8(uint8_t& out) {
        if (remaining() < 1) return false;
        out = data_[offset_++];
        return true;
    }

    bool u16(uint16_t& out) {
        uint16_t le = 0;
        if (!copy(&le, 2)) return false;
        out = le16toh(le);
        return true;
    }

    bool u32(uint32_t& out) {
        uint32_t le = 0;
        if (!copy(&le, 4)) return false;
        out = le32toh(le);
        return true;
    }

    bool u64(uint64_t& out) {
        uint64_t le = 0;
        if (!copy(&le, 8)) return false;
        out = le64toh(le);
        return true;
    }

    // Length-prefixed sequence whose length must equal N
    template <size_t N>
    bool fixed_seq(std::array<uint8_t, N>& out) {
        uint64_t len = 0;
        if (!u64(len) || len != N) return false;
        return copy(out.data(), N);
    }

    template <size_t N>
    bool raw(std::array<uint8_t, N>& out) {
        return copy(out.data(), N);
    }

    bool seq(Bytes& out) {
        uint64_t len = 0;
        if (!u64(len) || len > remaining()) return false;
        out.assign(data_ + offset_, data_ + offset_ + len);
        offset_ += static_cast<size_t>(len);
        return true;
    }

    bool at_end() const { return offset_ == size_; }

private:
    size_t remaining() const { return size_ - offset_; }

    bool copy(void* dst, size_t n) {
        if (remaining() < n) return false;
        std::memcpy(dst, data_ + offset_, n);
        offset_ += n;
        return true;
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

template <typename T>
void write_announce(Writer& w, const T& msg) {
    w.u8(msg.version);
    w.seq(msg.device_id.data(), msg.device_id.size());
    w.seq(msg.public_key.data(), msg.public_key.size());
    w.u16(msg.listen_port);
}

void write_range(Writer& w, const TransferId& id, uint64_t start, uint64_t end) {
    w.raw(id);
    w.u64(start);
    w.u64(end);
}

template <typename T>
Result<Message> read_announce(Reader& r) {
    T msg;
    if (!r.u8(msg.version)) return ErrorCode::Malformed;
    if (msg.version != PROTOCOL_VERSION) return ErrorCode::UnsupportedVersion;
    if (!r.fixed_seq(msg.device_id) || !r.fixed_seq(msg.public_key) || !r.u16(msg.listen_port)) {
        return ErrorCode::Malformed;
    }
    return Message(std::move(msg));
}

template <typename T>
Result<Message> read_device(Reader& r) {
    T msg;
    if (!r.fixed_seq(msg.device_id)) return ErrorCode::Malformed;
    return Message(std::move(msg));
}

template <typename T>
Result<Message> read_range(Reader& r) {
    T msg;
    if (!r.raw(msg.transfer_id) || !r.u64(msg.start) || !r.u64(msg.end)) {
        return ErrorCode::Malformed;
    }
    return Message(std::move(msg));
}

Result<Message> read_chunk_data(Reader& r) {
    ChunkData msg;
    if (!r.raw(msg.transfer_id) || !r.u64(msg.start) || !r.u64(msg.end) ||
        !r.raw(msg.hash) || !r.seq(msg.payload)) {
        return ErrorCode::Malformed;
    }
    return Message(std::move(msg));
}

} // anonymous namespace

MessageType message_type(const Message& message) {
    return static_cast<MessageType>(message.index());
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Beacon: return "Beacon";
        case MessageType::DiscoveryResponse: return "DiscoveryResponse";
        case MessageType::Join: return "Join";
        case MessageType::Leave: return "Leave";
        case MessageType::Heartbeat: return "Heartbeat";
        case MessageType::ChunkRequest: return "ChunkRequest";
        case MessageType::ChunkData: return "ChunkData";
        case MessageType::Nack: return "Nack";
    }
    return "Unknown";
}

Bytes encode_payload(const Message& message) {
    size_t reserve = 96;
    if (const auto* data = std::get_if<ChunkData>(&message)) {
        reserve += data->payload.size();
    }
    Writer w(reserve);
    w.u32(static_cast<uint32_t>(message_type(message)));

    std::visit([&w](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Beacon> || std::is_same_v<T, DiscoveryResponse>) {
            write_announce(w, msg);
        } else if constexpr (std::is_same_v<T, Join> || std::is_same_v<T, Leave> ||
                             std::is_same_v<T, Heartbeat>) {
            w.seq(msg.device_id.data(), msg.device_id.size());
        } else if constexpr (std::is_same_v<T, ChunkData>) {
            write_range(w, msg.transfer_id, msg.start, msg.end);
            w.raw(msg.hash);
            w.seq(msg.payload.data(), msg.payload.size());
        } else {
            write_range(w, msg.transfer_id, msg.start, msg.end);
        }
    }, message);

    return w.take();
}

Result<Message> decode_payload(const uint8_t* data, size_t size) {
    if (data == nullptr && size > 0) {
        return ErrorCode::Malformed;
    }
    Reader r(data, size);

    uint32_t tag = 0;
    if (!r.u32(tag)) {
        return ErrorCode::Malformed;
    }

    Result<Message> decoded = ErrorCode::Malformed;
    switch (static_cast<MessageType>(tag)) {
        case MessageType::Beacon: decoded = read_announce<Beacon>(r); break;
        case MessageType::DiscoveryResponse: decoded = read_announce<DiscoveryResponse>(r); break;
        case MessageType::Join: decoded = read_device<Join>(r); break;
        case MessageType::Leave: decoded = read_device<Leave>(r); break;
        case MessageType::Heartbeat: decoded = read_device<Heartbeat>(r); break;
        case MessageType::ChunkRequest: decoded = read_range<ChunkRequest>(r); break;
        case MessageType::ChunkData: decoded = read_chunk_data(r); break;
        case MessageType::Nack: decoded = read_range<Nack>(r); break;
        default: return ErrorCode::Malformed;
    }

    if (decoded.ok() && !r.at_end()) {
        return ErrorCode::Malformed;
    }
    return decoded;
}

Result<Message> decode_payload(const Bytes& payload) {
    return decode_payload(payload.data(), payload.size());
}

Result<Bytes> wrap_frame(const Bytes& payload) {
    if (payload.size() > MAX_FRAME_SIZE) {
        return ErrorCode::FrameTooLarge;
    }
    Bytes frame(FRAME_HEADER_SIZE + payload.size());
    uint32_t len = htole32(static_cast<uint32_t>(payload.size()));
    std::memcpy(frame.data(), &len, FRAME_HEADER_SIZE);
    if (!payload.empty()) {
        std::memcpy(frame.data() + FRAME_HEADER_SIZE, payload.data(), payload.size());
    }
    return frame;
}

Result<FrameView> unwrap_frame(const uint8_t* data, size_t size) {
    if (data == nullptr || size < FRAME_HEADER_SIZE) {
        return ErrorCode::Incomplete;
    }
    uint32_t len = 0;
    std::memcpy(&len, data, FRAME_HEADER_SIZE);
    len = le32toh(len);

    if (len > MAX_FRAME_SIZE) {
        return ErrorCode::FrameTooLarge;
    }
    if (size - FRAME_HEADER_SIZE < len) {
        return ErrorCode::Incomplete;
    }

    FrameView view;
    view.payload = data + FRAME_HEADER_SIZE;
    view.payload_size = len;
    view.consumed = FRAME_HEADER_SIZE + len;
    return view;
}

Result<Bytes> encode_frame(const Message& message) {
    return wrap_frame(encode_payload(message));
}

Result<DecodedFrame> decode_frame(const uint8_t* data, size_t size) {
    auto view = unwrap_frame(data, size);
    if (!view) {
        return view.error();
    }
    auto message = decode_payload(view->payload, view->payload_size);
    if (!message) {
        return message.error();
    }
    return DecodedFrame{std::move(message).value(), view->consumed};
}

Result<DecodedFrame> decode_frame(const Bytes& buffer) {
    return decode_frame(buffer.data(), buffer.size());
}

} // namespace peapod
