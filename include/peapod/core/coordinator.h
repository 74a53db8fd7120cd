#ifndef PEAPOD_CORE_COORDINATOR_H
#define PEAPOD_CORE_COORDINATOR_H

#include "peapod/base/config.h"
#include "peapod/base/result.h"
#include "peapod/core/action.h"
#include "peapod/crypto/identity.h"
#include "peapod/crypto/integrity.h"
#include "peapod/p2p/peer_session.h"
#include "peapod/transfer/chunk_manager.h"
#include "peapod/transfer/scheduler.h"
#include "peapod/wire/handshake.h"
#include <memory>
#include <optional>
#include <system_error>

namespace peapod {

// Host-driven protocol engine. The host feeds events in and executes the
// returned actions; the coordinator never performs I/O and never reads a clock.
//
// Not internally synchronized: call from one thread or under an external lock.
class Coordinator {
public:
    // Generates a fresh identity when keypair is empty (throws RngFailure if
    // the system RNG fails).
    explicit Coordinator(const CoreConfig& config = CoreConfig{}, std::optional<Keypair> keypair = std::nullopt);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    const DeviceId& device_id() const;
    const PublicKey& public_key() const;

    // Fallback when ineligible, without a usable length, or without alive peers
    RequestDecision on_incoming_request(const IncomingRequest& request);

    // InvalidPeerKey if peer_id does not match public_key or key agreement fails
    std::error_code on_peer_joined(const DeviceId& peer_id, const PublicKey& public_key);

    // Redistributes the peer's outstanding chunks
    Actions on_peer_left(const DeviceId& peer_id);

    // One encrypted frame from a peer. UnknownPeer, decode and crypto errors
    // are returned typed. A frame that fails authentication consumes no nonce.
    Result<MessageOutcome> on_message_received(const DeviceId& peer_id, const uint8_t* frame, size_t size);
    Result<MessageOutcome> on_message_received(const DeviceId& peer_id, const Bytes& frame);

    // Bytes the host fetched for one of our own chunks
    Result<std::optional<Bytes>> on_chunk_received(const TransferId& transfer_id, uint64_t start, uint64_t end,
                                                   const ChunkHash& hash, const Bytes& payload);

    // Answer a peer's ChunkRequest with data, or refuse it
    Result<SendMessage> serve_chunk(const DeviceId& peer_id, const TransferId& transfer_id, uint64_t start,
                                    uint64_t end, const Bytes& payload);
    Result<SendMessage> decline_chunk(const DeviceId& peer_id, const TransferId& transfer_id, uint64_t start,
                                      uint64_t end);

    // Advance time: liveness sweep, pending assignments, idle expiry, heartbeats
    Actions tick();

    void set_peer_metrics(const DeviceId& peer_id, const PeerMetrics& metrics);

    // Chunks of the transfer that currently have an assignee
    std::optional<std::vector<Assignment>> assignment(const TransferId& transfer_id) const;
    std::optional<TransferState> transfer_state(const TransferId& transfer_id) const;

    Bytes beacon_frame(uint16_t listen_port) const;
    Bytes discovery_response_frame(uint16_t listen_port) const;
    HandshakeBytes handshake_bytes() const;
    Result<SessionKey> session_key(const PublicKey& peer_public) const;

    size_t peer_count() const;
    std::optional<Liveness> peer_liveness(const DeviceId& peer_id) const;
    // Next nonces of the live session, or of the last one if the peer left
    std::optional<NonceMarks> peer_nonces(const DeviceId& peer_id) const;
    bool is_isolated(const DeviceId& peer_id) const;
    uint64_t tick_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace peapod

#endif // PEAPOD_CORE_COORDINATOR_H
