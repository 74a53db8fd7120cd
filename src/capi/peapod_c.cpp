#include "peapod/peapod_c.h"
#include "peapod/base/config.h"
#include "peapod/base/logger.h"
#include "peapod/core/coordinator.h"
#include "peapod/wire/handshake.h"
#include <endian.h>
#include <algorithm>
#include <climits>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>

using namespace peapod;

struct peapod_handle {
    std::mutex mutex;
    std::unique_ptr<Coordinator> core;
    // Output of a call whose buffer was too small, waiting for peapod_take_output
    Bytes pending;
};

namespace {

template <size_t N>
std::array<uint8_t, N> read_array(const uint8_t* src) {
    std::array<uint8_t, N> out{};
    std::memcpy(out.data(), src, N);
    return out;
}

// Little-endian serializer for output buffers
class Out {
public:
    void u8(uint8_t v) { data_.push_back(v); }

    void u32(uint32_t v) {
        uint32_t le = htole32(v);
        raw(&le, 4);
    }

    void u64(uint64_t v) {
        uint64_t le = htole64(v);
        raw(&le, 8);
    }

    void raw(const void* src, size_t size) {
        const auto* p = static_cast<const uint8_t*>(src);
        data_.insert(data_.end(), p, p + size);
    }

    template <size_t N>
    void raw(const std::array<uint8_t, N>& bytes) {
        raw(bytes.data(), N);
    }

    void bytes(const Bytes& b) { raw(b.data(), b.size()); }

    size_t size() const { return data_.size(); }

    // Copy to the caller; -1 if it does not fit or cannot be reported as int
    int flush(uint8_t* out_buf, size_t out_len) const {
        return copy_out(data_, out_buf, out_len);
    }

    // Copy to the caller, or park the output on the handle when it does not fit
    int flush_or_keep(peapod_handle& h, uint8_t* out_buf, size_t out_len) {
        int n = flush(out_buf, out_len);
        if (n >= 0) {
            return n;
        }
        Logger::instance().debug("Output of {} bytes kept until taken", data_.size());
        h.pending = std::move(data_);
        data_.clear();
        return PEAPOD_ERR_BUFFER_TOO_SMALL;
    }

    static int copy_out(const Bytes& data, uint8_t* out_buf, size_t out_len) {
        if (out_buf == nullptr || data.size() > out_len || data.size() > static_cast<size_t>(INT_MAX)) {
            return -1;
        }
        if (!data.empty()) {
            std::memcpy(out_buf, data.data(), data.size());
        }
        return static_cast<int>(data.size());
    }

private:
    Bytes data_;
};

void write_actions(Out& out, const Actions& actions) {
    out.u32(static_cast<uint32_t>(actions.size()));
    for (const auto& action : actions) {
        if (const auto* send = std::get_if<SendMessage>(&action)) {
            out.u8(0);
            out.raw(send->peer);
            out.u32(static_cast<uint32_t>(send->frame.size()));
            out.bytes(send->frame);
        } else if (const auto* fetch = std::get_if<FetchChunk>(&action)) {
            out.u8(1);
            out.raw(fetch->transfer_id);
            out.u64(fetch->start);
            out.u64(fetch->end);
            out.u8(fetch->for_peer ? 1 : 0);
            out.raw(fetch->for_peer.value_or(DeviceId{}));
            out.u32(static_cast<uint32_t>(fetch->url.size()));
            out.raw(fetch->url.data(), fetch->url.size());
        } else if (const auto* abandoned = std::get_if<TransferAbandoned>(&action)) {
            out.u8(2);
            out.raw(abandoned->transfer_id);
        }
    }
}

int write_frame(const Bytes& frame, uint8_t* out_buf, size_t out_len) {
    Out out;
    out.bytes(frame);
    return out.flush(out_buf, out_len);
}

// Runs fn under the handle lock; exceptions become -1 after logging
template <typename Fn>
int guarded(peapod_handle* h, const char* what, Fn&& fn) {
    if (h == nullptr || !h->core) {
        return -1;
    }
    try {
        std::lock_guard<std::mutex> lock(h->mutex);
        return fn(*h->core);
    } catch (const std::exception& e) {
        Logger::instance().error("{} failed: {}", what, e.what());
        return -1;
    }
}

// Like guarded, for calls that change engine state. Refused without side
// effects while earlier output is still waiting to be taken.
template <typename Fn>
int stateful(peapod_handle* h, const char* what, Fn&& fn) {
    if (h == nullptr || !h->core) {
        return -1;
    }
    try {
        std::lock_guard<std::mutex> lock(h->mutex);
        if (!h->pending.empty()) {
            Logger::instance().warning("{} refused: {} bytes of earlier output not taken", what, h->pending.size());
            return PEAPOD_ERR_PENDING_OUTPUT;
        }
        return fn(*h);
    } catch (const std::exception& e) {
        Logger::instance().error("{} failed: {}", what, e.what());
        return -1;
    }
}

int frame_or_keep(peapod_handle& h, const Bytes& frame, uint8_t* out_buf, size_t out_len) {
    Out out;
    out.bytes(frame);
    return out.flush_or_keep(h, out_buf, out_len);
}

peapod_handle* create_handle(std::optional<Keypair> keypair) {
    try {
        auto handle = std::make_unique<peapod_handle>();
        handle->core = std::make_unique<Coordinator>(Config::instance().get().core, std::move(keypair));
        return handle.release();
    } catch (const std::exception& e) {
        Logger::instance().error("peapod_create failed: {}", e.what());
        return nullptr;
    }
}

} // anonymous namespace

extern "C" {

uint8_t peapod_version(void) {
    return PROTOCOL_VERSION;
}

peapod_handle* peapod_create(void) {
    return create_handle(std::nullopt);
}

peapod_handle* peapod_create_with_key(const uint8_t* private_key_32) {
    auto keypair = Keypair::from_private_bytes(private_key_32, PRIVATE_KEY_SIZE);
    if (!keypair) {
        return nullptr;
    }
    return create_handle(std::move(keypair).value());
}

void peapod_destroy(peapod_handle* h) {
    delete h;
}

int peapod_device_id(peapod_handle* h, uint8_t* out_buf, size_t out_len) {
    if (out_buf == nullptr || out_len < DEVICE_ID_SIZE) {
        return -1;
    }
    return guarded(h, "peapod_device_id", [&](Coordinator& core) {
        std::memcpy(out_buf, core.device_id().data(), DEVICE_ID_SIZE);
        return 0;
    });
}

int peapod_beacon_frame(peapod_handle* h, uint16_t listen_port, uint8_t* out_buf, size_t out_len) {
    return guarded(h, "peapod_beacon_frame", [&](Coordinator& core) {
        return write_frame(core.beacon_frame(listen_port), out_buf, out_len);
    });
}

int peapod_discovery_response_frame(peapod_handle* h, uint16_t listen_port, uint8_t* out_buf, size_t out_len) {
    return guarded(h, "peapod_discovery_response_frame", [&](Coordinator& core) {
        return write_frame(core.discovery_response_frame(listen_port), out_buf, out_len);
    });
}

int peapod_decode_discovery_frame(const uint8_t* bytes, size_t len, uint8_t* out_device_id_16,
                                  uint8_t* out_public_key_32, uint16_t* out_listen_port) {
    if (bytes == nullptr || out_device_id_16 == nullptr || out_public_key_32 == nullptr ||
        out_listen_port == nullptr) {
        return -1;
    }
    auto info = decode_discovery_frame(bytes, len);
    if (!info) {
        return -1;
    }
    std::memcpy(out_device_id_16, info->device_id.data(), DEVICE_ID_SIZE);
    std::memcpy(out_public_key_32, info->public_key.data(), PUBLIC_KEY_SIZE);
    *out_listen_port = info->listen_port;
    return 0;
}

int peapod_handshake_bytes(peapod_handle* h, uint8_t* out_buf, size_t out_len) {
    if (out_buf == nullptr || out_len < HANDSHAKE_SIZE) {
        return -1;
    }
    return guarded(h, "peapod_handshake_bytes", [&](Coordinator& core) {
        auto hs = core.handshake_bytes();
        std::memcpy(out_buf, hs.data(), hs.size());
        return 0;
    });
}

int peapod_session_key(peapod_handle* h, const uint8_t* peer_public_key_32, uint8_t* out_session_key_32) {
    if (peer_public_key_32 == nullptr || out_session_key_32 == nullptr) {
        return -1;
    }
    return guarded(h, "peapod_session_key", [&](Coordinator& core) {
        auto key = core.session_key(read_array<PUBLIC_KEY_SIZE>(peer_public_key_32));
        if (!key) {
            return -1;
        }
        std::memcpy(out_session_key_32, key->data(), SESSION_KEY_SIZE);
        return 0;
    });
}

int peapod_encrypt(const uint8_t* session_key_32, uint64_t nonce, const uint8_t* plain, size_t plain_len,
                   uint8_t* out_buf, size_t out_len) {
    if (session_key_32 == nullptr || (plain == nullptr && plain_len > 0)) {
        return -1;
    }
    try {
        return write_frame(encrypt(read_array<SESSION_KEY_SIZE>(session_key_32), nonce, plain, plain_len),
                           out_buf, out_len);
    } catch (const std::exception& e) {
        Logger::instance().error("peapod_encrypt failed: {}", e.what());
        return -1;
    }
}

int peapod_decrypt(const uint8_t* session_key_32, uint64_t nonce, const uint8_t* cipher, size_t cipher_len,
                   uint8_t* out_buf, size_t out_len) {
    if (session_key_32 == nullptr || cipher == nullptr) {
        return -1;
    }
    auto plain = decrypt(read_array<SESSION_KEY_SIZE>(session_key_32), nonce, cipher, cipher_len);
    if (!plain) {
        return -1;
    }
    return write_frame(*plain, out_buf, out_len);
}

int peapod_on_request(peapod_handle* h, const uint8_t* url, size_t url_len, uint64_t range_start,
                      uint64_t range_end, int eligible, uint8_t* out_buf, size_t out_len) {
    if (url == nullptr && url_len > 0) {
        return -1;
    }
    return stateful(h, "peapod_on_request", [&](peapod_handle& handle) {
        IncomingRequest request;
        if (url_len > 0) {
            request.url.assign(reinterpret_cast<const char*>(url), url_len);
        }
        request.eligible = eligible != 0;
        if (range_end > range_start) {
            request.range = HttpRange{range_start, range_end};
        }

        auto decision = handle.core->on_incoming_request(request);
        const auto* accelerate = std::get_if<Accelerate>(&decision);
        if (accelerate == nullptr) {
            return 0;
        }

        Out out;
        out.raw(accelerate->transfer_id);
        out.u64(accelerate->total_length);
        out.u32(static_cast<uint32_t>(accelerate->plan.size()));
        for (const auto& a : accelerate->plan) {
            out.raw(a.fetcher);
            out.u64(a.range.start);
            out.u64(a.range.end);
        }
        write_actions(out, accelerate->actions);
        int n = out.flush_or_keep(handle, out_buf, out_len);
        return n < 0 ? n : 1;
    });
}

int peapod_peer_joined(peapod_handle* h, const uint8_t* device_id_16, const uint8_t* public_key_32) {
    if (device_id_16 == nullptr || public_key_32 == nullptr) {
        return -1;
    }
    return guarded(h, "peapod_peer_joined", [&](Coordinator& core) {
        auto ec = core.on_peer_joined(read_array<DEVICE_ID_SIZE>(device_id_16),
                                      read_array<PUBLIC_KEY_SIZE>(public_key_32));
        return ec ? -1 : 0;
    });
}

int peapod_peer_left(peapod_handle* h, const uint8_t* device_id_16, uint8_t* out_buf, size_t out_len) {
    if (device_id_16 == nullptr) {
        return -1;
    }
    return stateful(h, "peapod_peer_left", [&](peapod_handle& handle) {
        auto actions = handle.core->on_peer_left(read_array<DEVICE_ID_SIZE>(device_id_16));
        if (actions.empty()) {
            return 0;
        }
        Out out;
        write_actions(out, actions);
        return out.flush_or_keep(handle, out_buf, out_len);
    });
}

int peapod_on_message_received(peapod_handle* h, const uint8_t* peer_id_16, const uint8_t* msg, size_t msg_len,
                               uint8_t* out_buf, size_t out_len) {
    if (peer_id_16 == nullptr || msg == nullptr) {
        return -1;
    }
    return stateful(h, "peapod_on_message_received", [&](peapod_handle& handle) {
        auto outcome = handle.core->on_message_received(read_array<DEVICE_ID_SIZE>(peer_id_16), msg, msg_len);
        if (!outcome) {
            return -1;
        }
        Out out;
        if (outcome->completed) {
            out.u32(static_cast<uint32_t>(outcome->completed->body.size()));
            out.raw(outcome->completed->transfer_id);
            out.bytes(outcome->completed->body);
        } else {
            out.u32(0);
            out.raw(TransferId{});
        }
        write_actions(out, outcome->actions);
        return out.flush_or_keep(handle, out_buf, out_len);
    });
}

int peapod_on_chunk_received(peapod_handle* h, const uint8_t* transfer_id_16, uint64_t start, uint64_t end,
                             const uint8_t* hash_32, const uint8_t* payload, size_t payload_len,
                             uint8_t* out_buf, size_t out_len) {
    if (transfer_id_16 == nullptr || hash_32 == nullptr || (payload == nullptr && payload_len > 0)) {
        return -1;
    }
    return stateful(h, "peapod_on_chunk_received", [&](peapod_handle& handle) {
        Bytes data = payload_len > 0 ? Bytes(payload, payload + payload_len) : Bytes();
        auto result = handle.core->on_chunk_received(read_array<TRANSFER_ID_SIZE>(transfer_id_16), start, end,
                                             read_array<CHUNK_HASH_SIZE>(hash_32), data);
        if (!result) {
            return -1;
        }
        if (!result->has_value()) {
            return 0;
        }
        int n = frame_or_keep(handle, **result, out_buf, out_len);
        return n < 0 ? n : 1;
    });
}

int peapod_serve_chunk(peapod_handle* h, const uint8_t* peer_id_16, const uint8_t* transfer_id_16,
                       uint64_t start, uint64_t end, const uint8_t* payload, size_t payload_len,
                       uint8_t* out_buf, size_t out_len) {
    if (peer_id_16 == nullptr || transfer_id_16 == nullptr || (payload == nullptr && payload_len > 0)) {
        return -1;
    }
    return stateful(h, "peapod_serve_chunk", [&](peapod_handle& handle) {
        Bytes data = payload_len > 0 ? Bytes(payload, payload + payload_len) : Bytes();
        auto sent = handle.core->serve_chunk(read_array<DEVICE_ID_SIZE>(peer_id_16),
                                     read_array<TRANSFER_ID_SIZE>(transfer_id_16), start, end, data);
        if (!sent) {
            return -1;
        }
        return frame_or_keep(handle, sent->frame, out_buf, out_len);
    });
}

int peapod_decline_chunk(peapod_handle* h, const uint8_t* peer_id_16, const uint8_t* transfer_id_16,
                         uint64_t start, uint64_t end, uint8_t* out_buf, size_t out_len) {
    if (peer_id_16 == nullptr || transfer_id_16 == nullptr) {
        return -1;
    }
    return stateful(h, "peapod_decline_chunk", [&](peapod_handle& handle) {
        auto sent = handle.core->decline_chunk(read_array<DEVICE_ID_SIZE>(peer_id_16),
                                       read_array<TRANSFER_ID_SIZE>(transfer_id_16), start, end);
        if (!sent) {
            return -1;
        }
        return frame_or_keep(handle, sent->frame, out_buf, out_len);
    });
}

int peapod_tick(peapod_handle* h, uint8_t* out_buf, size_t out_len) {
    return stateful(h, "peapod_tick", [&](peapod_handle& handle) {
        auto actions = handle.core->tick();
        if (actions.empty()) {
            return 0;
        }
        Out out;
        write_actions(out, actions);
        return out.flush_or_keep(handle, out_buf, out_len);
    });
}

size_t peapod_pending_output(peapod_handle* h) {
    if (h == nullptr) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(h->mutex);
    return h->pending.size();
}

int peapod_take_output(peapod_handle* h, uint8_t* out_buf, size_t out_len) {
    if (h == nullptr) {
        return -1;
    }
    std::lock_guard<std::mutex> lock(h->mutex);
    int n = Out::copy_out(h->pending, out_buf, out_len);
    if (n >= 0) {
        h->pending.clear();
    }
    return n;
}

} // extern "C"
