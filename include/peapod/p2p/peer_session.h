#ifndef PEAPOD_P2P_PEER_SESSION_H
#define PEAPOD_P2P_PEER_SESSION_H

#include "peapod/base/bytes.h"
#include "peapod/base/result.h"
#include "peapod/crypto/identity.h"
#include <cstdint>
#include <optional>

namespace peapod {

// Joining -> Alive -> Suspect -> Left; never backwards
enum class Liveness {
    Joining,
    Alive,
    Suspect,
    Left
};

const char* to_string(Liveness liveness);

// Next nonces of an ended session, kept so a later session under the same
// key never starts below them
struct NonceMarks {
    uint64_t send = 0;
    uint64_t recv = 0;
};

// Nonces tried from each starting point, so lost or rejected frames can be skipped
constexpr uint64_t RECV_WINDOW = 8;

// Later epochs tried when a frame does not open in the current one
constexpr uint64_t EPOCH_LOOKAHEAD = 2;

constexpr uint64_t epoch_of(uint64_t nonce) { return nonce >> 32; }

// Encrypted channel state for one remote device.
//
// Both directions share the session key, so the counters are split by parity:
// the side with the smaller DeviceId sends on even nonces, the other on odd
// ones, each stepping by 2.
//
// The key depends only on the two static identities, so a rejoin reuses it.
// A session built from the previous session's marks starts both counters at
// the first nonce of the next 2^32 epoch. Both ends reach the same epoch even
// when frames were lost in flight.
class PeerSession {
public:
    // Throws PeaPodError(InvariantViolation) when the nonce space is used up
    PeerSession(const DeviceId& local_id, const DeviceId& peer_id, const PublicKey& peer_key,
                const SessionKey& session_key, uint64_t now_tick,
                const std::optional<NonceMarks>& previous = std::nullopt);

    const DeviceId& device_id() const { return peer_id_; }
    const PublicKey& public_key() const { return peer_key_; }
    Liveness liveness() const { return liveness_; }
    uint64_t last_seen_tick() const { return last_seen_tick_; }
    uint64_t next_send_nonce() const { return send_nonce_; }
    uint64_t next_recv_nonce() const { return recv_nonce_; }
    NonceMarks marks() const { return {send_nonce_, recv_nonce_}; }

    // Alive and not Suspect: may take new chunk assignments
    bool is_usable() const { return liveness_ == Liveness::Alive; }

    // Encrypt with the next send nonce
    Bytes seal(const Bytes& plaintext);

    // Decrypt with the next receive nonce or one of the RECV_WINDOW nonces
    // from there, or from the start of one of the next EPOCH_LOOKAHEAD epochs.
    // Nonces never move backwards and a failed open leaves the counter alone.
    // Opening in a later epoch than our send counter lifts the send counter.
    Result<Bytes> open(const uint8_t* ciphertext, size_t size);

    // Record authenticated traffic; promotes Joining to Alive
    void touch(uint64_t now_tick);

    void mark_suspect();
    void mark_left();

private:
    DeviceId peer_id_;
    PublicKey peer_key_;
    SessionKey session_key_;
    Liveness liveness_ = Liveness::Joining;
    uint64_t last_seen_tick_;
    uint64_t send_parity_;
    uint64_t recv_parity_;
    uint64_t send_nonce_;
    uint64_t recv_nonce_;
};

} // namespace peapod

#endif // PEAPOD_P2P_PEER_SESSION_H
