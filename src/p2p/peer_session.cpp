#include "peapod/p2p/peer_session.h"
#include "peapod/base/logger.h"
#include <openssl/crypto.h>
#include <algorithm>
#include <vector>

namespace peapod {

const char* to_string(Liveness liveness) {
    switch (liveness) {
        case Liveness::Joining: return "Joining";
        case Liveness::Alive: return "Alive";
        case Liveness::Suspect: return "Suspect";
        case Liveness::Left: return "Left";
    }
    return "Unknown";
}

namespace {

constexpr uint64_t LAST_EPOCH = 0xffffffffULL;

constexpr uint64_t epoch_start(uint64_t epoch, uint64_t parity) {
    return (epoch << 32) | parity;
}

} // anonymous namespace

PeerSession::PeerSession(const DeviceId& local_id, const DeviceId& peer_id, const PublicKey& peer_key,
                         const SessionKey& session_key, uint64_t now_tick,
                         const std::optional<NonceMarks>& previous)
    : peer_id_(peer_id),
      peer_key_(peer_key),
      session_key_(session_key),
      last_seen_tick_(now_tick),
      send_parity_(local_id < peer_id ? 0 : 1),
      recv_parity_(local_id < peer_id ? 1 : 0),
      send_nonce_(send_parity_),
      recv_nonce_(recv_parity_) {
    if (!previous) {
        return;
    }
    uint64_t epoch = epoch_of(std::max(previous->send, previous->recv));
    if (epoch >= LAST_EPOCH) {
        throw PeaPodError(ErrorCode::InvariantViolation, "nonce space exhausted for peer " + to_hex(peer_id));
    }
    send_nonce_ = epoch_start(epoch + 1, send_parity_);
    recv_nonce_ = epoch_start(epoch + 1, recv_parity_);
    Logger::instance().debug("Session with {} resumes at nonce epoch {}", short_hex(peer_id_), epoch + 1);
}

Bytes PeerSession::seal(const Bytes& plaintext) {
    Bytes out = encrypt(session_key_, send_nonce_, plaintext);
    send_nonce_ += 2;
    return out;
}

Result<Bytes> PeerSession::open(const uint8_t* ciphertext, size_t size) {
    // Where the peer may be sending: here, or just after a later epoch start
    std::vector<uint64_t> bases{recv_nonce_};
    uint64_t current = epoch_of(recv_nonce_);
    for (uint64_t k = 1; k <= EPOCH_LOOKAHEAD && current + k <= LAST_EPOCH; ++k) {
        bases.push_back(epoch_start(current + k, recv_parity_));
    }

    for (uint64_t base : bases) {
        for (uint64_t i = 0; i < RECV_WINDOW; ++i) {
            uint64_t nonce = base + 2 * i;
            if (nonce < base) {
                break;
            }
            auto plaintext = decrypt(session_key_, nonce, ciphertext, size);
            if (!plaintext) {
                continue;
            }
            if (nonce != recv_nonce_) {
                Logger::instance().debug("Frame from {} opened at nonce {} (expected {})",
                                         short_hex(peer_id_), nonce, recv_nonce_);
            }
            recv_nonce_ = nonce + 2;
            uint64_t epoch = epoch_of(nonce);
            if (epoch > epoch_of(send_nonce_)) {
                // The peer is in a later epoch than we remember, e.g. after we restarted
                send_nonce_ = epoch_start(epoch, send_parity_);
                Logger::instance().debug("Session with {} follows the peer to nonce epoch {}",
                                         short_hex(peer_id_), epoch);
            }
            return plaintext;
        }
    }
    return ErrorCode::AuthFailed;
}

void PeerSession::touch(uint64_t now_tick) {
    last_seen_tick_ = now_tick;
    if (liveness_ == Liveness::Joining) {
        liveness_ = Liveness::Alive;
        Logger::instance().debug("Peer {} is alive", short_hex(peer_id_));
    }
}

void PeerSession::mark_suspect() {
    if (liveness_ == Liveness::Alive || liveness_ == Liveness::Joining) {
        liveness_ = Liveness::Suspect;
        Logger::instance().debug("Peer {} is suspect (last seen tick {})", short_hex(peer_id_), last_seen_tick_);
    }
}

void PeerSession::mark_left() {
    liveness_ = Liveness::Left;
    OPENSSL_cleanse(session_key_.data(), session_key_.size());
}

} // namespace peapod
