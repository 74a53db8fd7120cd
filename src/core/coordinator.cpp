#include "peapod/core/coordinator.h"
#include "peapod/base/logger.h"
#include "peapod/p2p/heartbeat_monitor.h"
#include "peapod/wire/codec.h"
#include <openssl/rand.h>
#include <map>

namespace peapod {

namespace {

TransferId random_transfer_id() {
    TransferId id{};
    if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
        Logger::instance().fatal("System RNG failed while generating a transfer id");
        throw PeaPodError(ErrorCode::RngFailure, "RAND_bytes failed");
    }
    return id;
}

Keypair identity_or_generate(std::optional<Keypair>& keypair) {
    if (keypair) {
        return std::move(*keypair);
    }
    return Keypair::generate();
}

} // anonymous namespace

struct Coordinator::Impl {
    CoreConfig config;
    Keypair keypair;
    ChunkManager chunks;
    Scheduler scheduler;
    HeartbeatMonitor monitor;
    std::map<DeviceId, PeerSession> sessions;
    // Outlive their sessions: the same two identities always share one key
    std::map<DeviceId, NonceMarks> nonce_marks;

    Impl(const CoreConfig& cfg, std::optional<Keypair> kp)
        : config(cfg),
          keypair(identity_or_generate(kp)),
          scheduler(cfg.max_integrity_failures),
          monitor(cfg.suspect_after_ticks, cfg.heartbeat_timeout_ticks) {
        if (config.chunk_size == 0) {
            config.chunk_size = DEFAULT_CHUNK_SIZE;
        }
    }

    const DeviceId& self() const { return keypair.device_id(); }

    // Alive, non-isolated peers in ascending id order
    std::vector<DeviceId> eligible_peers() const {
        std::vector<DeviceId> peers;
        for (const auto& [id, session] : sessions) {
            if (session.is_usable() && !scheduler.is_isolated(id)) {
                peers.push_back(id);
            }
        }
        return peers;
    }

    std::vector<DeviceId> workers() const {
        std::vector<DeviceId> list;
        if (config.allow_self_fetch) {
            list.push_back(self());
        }
        for (const auto& peer : eligible_peers()) {
            list.push_back(peer);
        }
        return list;
    }

    // Encode, encrypt and frame. The size check runs before sealing so a
    // rejected frame never consumes a nonce.
    Result<Bytes> seal_frame(PeerSession& session, const Message& message) {
        Bytes payload = encode_payload(message);
        if (payload.size() + AEAD_TAG_SIZE > MAX_FRAME_SIZE) {
            return ErrorCode::FrameTooLarge;
        }
        return wrap_frame(session.seal(payload));
    }

    Result<SendMessage> send_to(const DeviceId& peer, const Message& message) {
        auto it = sessions.find(peer);
        if (it == sessions.end()) {
            return ErrorCode::UnknownPeer;
        }
        auto frame = seal_frame(it->second, message);
        if (!frame) {
            return frame.error();
        }
        return SendMessage{peer, std::move(frame).value()};
    }

    // Turn assignments into ChunkRequest frames or local fetches
    void request_actions(const TransferId& id, const std::vector<Assignment>& assignments, Actions& out) {
        const Transfer* transfer = chunks.find(id);
        for (const auto& a : assignments) {
            if (a.fetcher == self()) {
                FetchChunk fetch;
                fetch.transfer_id = id;
                fetch.start = a.range.start;
                fetch.end = a.range.end;
                fetch.url = transfer ? transfer->url : std::string();
                out.emplace_back(std::move(fetch));
                continue;
            }
            auto sent = send_to(a.fetcher, ChunkRequest{id, a.range.start, a.range.end});
            if (!sent) {
                Logger::instance().warning("Cannot request chunk [{}, {}) from {}: {}",
                                           a.range.start, a.range.end, short_hex(a.fetcher),
                                           to_string(sent.error()));
                continue;
            }
            out.emplace_back(std::move(sent).value());
        }
    }

    Actions leave(const DeviceId& peer) {
        Actions actions;
        auto it = sessions.find(peer);
        if (it == sessions.end()) {
            Logger::instance().debug("Leave for unknown peer {}", short_hex(peer));
            return actions;
        }
        nonce_marks[peer] = it->second.marks();
        it->second.mark_left();
        sessions.erase(it);
        scheduler.remove_metrics(peer);
        Logger::instance().info("Peer {} left the pod", short_hex(peer));

        for (const auto& [transfer_id, assignment] : scheduler.on_peer_left(chunks, peer, workers())) {
            request_actions(transfer_id, {assignment}, actions);
        }
        return actions;
    }

    // Reassign one chunk away from a failing or refusing peer
    void retry_chunk(const TransferId& id, size_t index, const DeviceId& avoid, Actions& out) {
        auto assignment = scheduler.reassign(chunks, id, index, workers(), avoid);
        if (!assignment) {
            Logger::instance().debug("Chunk {} of transfer {} waits for a worker", index, short_hex(id));
            return;
        }
        request_actions(id, {*assignment}, out);
    }

    Result<MessageOutcome> handle_chunk_data(const DeviceId& peer, ChunkData& data) {
        auto index = chunks.locate(data.transfer_id, data.start, data.end);
        if (!index) {
            Logger::instance().warning("ChunkData from {} for unknown range [{}, {})",
                                       short_hex(peer), data.start, data.end);
            return index.error();
        }

        auto received = chunks.receive(data.transfer_id, *index, data.payload, data.hash, monitor.now(), peer);
        MessageOutcome outcome;
        if (!received) {
            if (received.error() != ErrorCode::IntegrityFailure) {
                return received.error();
            }
            scheduler.record_integrity_failure(peer);
            // Bad data from a peer that does not hold the chunk leaves the assignment alone
            const Transfer* transfer = chunks.find(data.transfer_id);
            if (transfer != nullptr && !transfer->chunks[*index].assignee) {
                retry_chunk(data.transfer_id, *index, peer, outcome.actions);
            }
            outcome.error = make_error_code(ErrorCode::IntegrityFailure);
            return outcome;
        }

        scheduler.record_success(peer);
        if (received->has_value()) {
            outcome.completed = CompletedTransfer{data.transfer_id, std::move(**received)};
        }
        return outcome;
    }

    Result<MessageOutcome> handle_nack(const DeviceId& peer, const Nack& nack) {
        auto index = chunks.locate(nack.transfer_id, nack.start, nack.end);
        if (!index) {
            return index.error();
        }
        MessageOutcome outcome;
        const Transfer* transfer = chunks.find(nack.transfer_id);
        if (transfer == nullptr || transfer->chunks[*index].assignee != peer) {
            Logger::instance().debug("Ignoring Nack from {} for chunk {} it does not hold", short_hex(peer), *index);
            return outcome;
        }
        if (auto ec = chunks.release(nack.transfer_id, *index)) {
            // Already received; nothing to redo
            Logger::instance().debug("Ignoring Nack for settled chunk {}: {}", *index, ec.message());
            return outcome;
        }
        Logger::instance().debug("Peer {} declined chunk {} of transfer {}",
                                 short_hex(peer), *index, short_hex(nack.transfer_id));
        retry_chunk(nack.transfer_id, *index, peer, outcome.actions);
        return outcome;
    }

    Result<MessageOutcome> dispatch(const DeviceId& peer, Message& message) {
        MessageOutcome outcome;
        switch (message_type(message)) {
            case MessageType::Heartbeat:
                break;
            case MessageType::Join:
                scheduler.clear(peer);
                break;
            case MessageType::Leave:
                outcome.actions = leave(peer);
                break;
            case MessageType::ChunkRequest: {
                const auto& request = std::get<ChunkRequest>(message);
                FetchChunk fetch;
                fetch.transfer_id = request.transfer_id;
                fetch.start = request.start;
                fetch.end = request.end;
                fetch.for_peer = peer;
                outcome.actions.emplace_back(std::move(fetch));
                break;
            }
            case MessageType::ChunkData:
                return handle_chunk_data(peer, std::get<ChunkData>(message));
            case MessageType::Nack:
                return handle_nack(peer, std::get<Nack>(message));
            case MessageType::Beacon:
            case MessageType::DiscoveryResponse:
                Logger::instance().debug("Ignoring {} on session with {}",
                                         to_string(message_type(message)), short_hex(peer));
                break;
        }
        return outcome;
    }
};

Coordinator::Coordinator(const CoreConfig& config, std::optional<Keypair> keypair)
    : impl_(std::make_unique<Impl>(config, std::move(keypair))) {
    Logger::instance().info("PeaPod core started as {}", to_hex(impl_->self()));
}

Coordinator::~Coordinator() = default;

const DeviceId& Coordinator::device_id() const {
    return impl_->self();
}

const PublicKey& Coordinator::public_key() const {
    return impl_->keypair.public_key();
}

RequestDecision Coordinator::on_incoming_request(const IncomingRequest& request) {
    auto& log = Logger::instance();
    if (!request.eligible) {
        log.debug("Fallback for {}: not eligible", request.url);
        return Fallback{};
    }
    if (!request.range || request.range->last < request.range->first) {
        log.debug("Fallback for {}: no usable range", request.url);
        return Fallback{};
    }
    uint64_t total = request.range->last - request.range->first + 1;
    if (total == 0) {
        log.debug("Fallback for {}: range length overflows", request.url);
        return Fallback{};
    }
    if (impl_->eligible_peers().empty()) {
        log.debug("Fallback for {}: no alive peers", request.url);
        return Fallback{};
    }

    auto workers = impl_->workers();
    TransferId id = random_transfer_id();
    impl_->chunks.create_transfer(id, request.url, total, impl_->config.chunk_size, impl_->monitor.now());

    Accelerate decision;
    decision.transfer_id = id;
    decision.total_length = total;
    decision.plan = impl_->scheduler.assign(impl_->chunks, id, workers);
    impl_->request_actions(id, decision.plan, decision.actions);

    log.info("Accelerating {} as transfer {}: {} bytes, {} chunks over {} workers",
             request.url, short_hex(id), total, decision.plan.size(), workers.size());
    return decision;
}

std::error_code Coordinator::on_peer_joined(const DeviceId& peer_id, const PublicKey& public_key) {
    auto& log = Logger::instance();
    if (peapod::device_id(public_key) != peer_id) {
        log.warning("Rejecting join from {}: device id does not match public key", short_hex(peer_id));
        return ErrorCode::InvalidPeerKey;
    }
    if (peer_id == impl_->self()) {
        return ErrorCode::InvalidArgument;
    }

    auto key = derive_session_key(impl_->keypair, public_key);
    if (!key) {
        log.warning("Rejecting join from {}: {}", short_hex(peer_id), to_string(key.error()));
        return key.error();
    }

    // A rejoin always gets a fresh session, continuing above the old nonces
    if (auto old = impl_->sessions.find(peer_id); old != impl_->sessions.end()) {
        impl_->nonce_marks[peer_id] = old->second.marks();
        old->second.mark_left();
        impl_->sessions.erase(old);
    }
    std::optional<NonceMarks> previous;
    if (auto marks = impl_->nonce_marks.find(peer_id); marks != impl_->nonce_marks.end()) {
        previous = marks->second;
    }
    uint64_t now = impl_->monitor.now();
    auto [it, inserted] = impl_->sessions.emplace(
        peer_id, PeerSession(impl_->self(), peer_id, public_key, *key, now, previous));
    it->second.touch(now);
    impl_->scheduler.clear(peer_id);

    log.info("Peer {} joined the pod ({} peers)", short_hex(peer_id), impl_->sessions.size());
    return {};
}

Actions Coordinator::on_peer_left(const DeviceId& peer_id) {
    return impl_->leave(peer_id);
}

Result<MessageOutcome> Coordinator::on_message_received(const DeviceId& peer_id, const uint8_t* frame,
                                                        size_t size) {
    auto& log = Logger::instance();
    auto it = impl_->sessions.find(peer_id);
    if (it == impl_->sessions.end()) {
        log.warning("Dropping frame from unknown peer {}", short_hex(peer_id));
        return ErrorCode::UnknownPeer;
    }
    PeerSession& session = it->second;

    auto view = unwrap_frame(frame, size);
    if (!view) {
        log.warning("Dropping frame from {}: {}", short_hex(peer_id), to_string(view.error()));
        return view.error();
    }

    auto plaintext = session.open(view->payload, view->payload_size);
    if (!plaintext) {
        log.warning("Dropping frame from {}: {}", short_hex(peer_id), to_string(plaintext.error()));
        return plaintext.error();
    }

    auto message = decode_payload(*plaintext);
    if (!message) {
        log.warning("Dropping frame from {}: {}", short_hex(peer_id), to_string(message.error()));
        return message.error();
    }

    session.touch(impl_->monitor.now());
    log.debug("{} from {}", to_string(message_type(*message)), short_hex(peer_id));
    return impl_->dispatch(peer_id, *message);
}

Result<MessageOutcome> Coordinator::on_message_received(const DeviceId& peer_id, const Bytes& frame) {
    return on_message_received(peer_id, frame.data(), frame.size());
}

Result<std::optional<Bytes>> Coordinator::on_chunk_received(const TransferId& transfer_id, uint64_t start,
                                                            uint64_t end, const ChunkHash& hash,
                                                            const Bytes& payload) {
    auto index = impl_->chunks.locate(transfer_id, start, end);
    if (!index) {
        return index.error();
    }
    // An integrity failure leaves the chunk Unassigned; the next tick reassigns it
    return impl_->chunks.receive(transfer_id, *index, payload, hash, impl_->monitor.now());
}

Result<SendMessage> Coordinator::serve_chunk(const DeviceId& peer_id, const TransferId& transfer_id,
                                             uint64_t start, uint64_t end, const Bytes& payload) {
    ChunkData data;
    data.transfer_id = transfer_id;
    data.start = start;
    data.end = end;
    data.hash = hash_chunk(payload);
    data.payload = payload;
    return impl_->send_to(peer_id, data);
}

Result<SendMessage> Coordinator::decline_chunk(const DeviceId& peer_id, const TransferId& transfer_id,
                                               uint64_t start, uint64_t end) {
    return impl_->send_to(peer_id, Nack{transfer_id, start, end});
}

Actions Coordinator::tick() {
    auto& log = Logger::instance();
    Actions actions;
    uint64_t now = impl_->monitor.advance();

    auto sweep = impl_->monitor.sweep(impl_->sessions);
    for (const auto& peer : sweep.timed_out) {
        for (auto& action : impl_->leave(peer)) {
            actions.push_back(std::move(action));
        }
    }

    auto workers = impl_->workers();
    for (Transfer* transfer : impl_->chunks.active_transfers()) {
        auto assigned = impl_->scheduler.assign(impl_->chunks, transfer->id, workers);
        impl_->request_actions(transfer->id, assigned, actions);
    }

    for (const auto& id : impl_->chunks.expire_idle(now, impl_->config.transfer_idle_timeout_ticks)) {
        actions.emplace_back(TransferAbandoned{id});
    }

    const DeviceId self = impl_->self();
    for (auto& [id, session] : impl_->sessions) {
        auto frame = impl_->seal_frame(session, Heartbeat{self});
        if (!frame) {
            log.warning("Cannot build heartbeat for {}: {}", short_hex(id), to_string(frame.error()));
            continue;
        }
        actions.emplace_back(SendMessage{id, std::move(frame).value()});
    }
    return actions;
}

void Coordinator::set_peer_metrics(const DeviceId& peer_id, const PeerMetrics& metrics) {
    impl_->scheduler.set_metrics(peer_id, metrics);
}

std::optional<std::vector<Assignment>> Coordinator::assignment(const TransferId& transfer_id) const {
    const Transfer* transfer = impl_->chunks.find(transfer_id);
    if (transfer == nullptr) {
        return std::nullopt;
    }
    std::vector<Assignment> out;
    for (size_t i = 0; i < transfer->chunks.size(); ++i) {
        const Chunk& chunk = transfer->chunks[i];
        if (chunk.assignee) {
            out.push_back({i, chunk.range, *chunk.assignee});
        }
    }
    return out;
}

std::optional<TransferState> Coordinator::transfer_state(const TransferId& transfer_id) const {
    const Transfer* transfer = impl_->chunks.find(transfer_id);
    if (transfer == nullptr) {
        return std::nullopt;
    }
    return transfer->state;
}

Bytes Coordinator::beacon_frame(uint16_t listen_port) const {
    return peapod::beacon_frame(impl_->keypair, listen_port);
}

Bytes Coordinator::discovery_response_frame(uint16_t listen_port) const {
    return peapod::discovery_response_frame(impl_->keypair, listen_port);
}

HandshakeBytes Coordinator::handshake_bytes() const {
    return peapod::handshake_bytes(impl_->keypair);
}

Result<SessionKey> Coordinator::session_key(const PublicKey& peer_public) const {
    return derive_session_key(impl_->keypair, peer_public);
}

size_t Coordinator::peer_count() const {
    return impl_->sessions.size();
}

std::optional<Liveness> Coordinator::peer_liveness(const DeviceId& peer_id) const {
    auto it = impl_->sessions.find(peer_id);
    if (it == impl_->sessions.end()) {
        return std::nullopt;
    }
    return it->second.liveness();
}

std::optional<NonceMarks> Coordinator::peer_nonces(const DeviceId& peer_id) const {
    if (auto it = impl_->sessions.find(peer_id); it != impl_->sessions.end()) {
        return it->second.marks();
    }
    if (auto it = impl_->nonce_marks.find(peer_id); it != impl_->nonce_marks.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Coordinator::is_isolated(const DeviceId& peer_id) const {
    return impl_->scheduler.is_isolated(peer_id);
}

uint64_t Coordinator::tick_count() const {
    return impl_->monitor.now();
}

} // namespace peapod
