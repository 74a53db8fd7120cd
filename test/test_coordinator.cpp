#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <set>
#include "peapod/core/coordinator.h"
#include "peapod/wire/codec.h"

using namespace peapod;

namespace {

CoreConfig small_chunks(uint64_t chunk_size = 40) {
    CoreConfig config;
    config.chunk_size = chunk_size;
    return config;
}

// Peers that stay alive without traffic for a while
CoreConfig patient() {
    CoreConfig config;
    config.suspect_after_ticks = 9;
    config.heartbeat_timeout_ticks = 10;
    return config;
}

void link(Coordinator& a, Coordinator& b) {
    REQUIRE_FALSE(a.on_peer_joined(b.device_id(), b.public_key()));
    REQUIRE_FALSE(b.on_peer_joined(a.device_id(), a.public_key()));
}

Bytes make_body(uint64_t size) {
    Bytes body(static_cast<size_t>(size));
    for (size_t i = 0; i < body.size(); ++i) body[i] = static_cast<uint8_t>((i * 13 + 1) & 0xff);
    return body;
}

Bytes slice(const Bytes& body, uint64_t start, uint64_t end) {
    return Bytes(body.begin() + static_cast<std::ptrdiff_t>(start), body.begin() + static_cast<std::ptrdiff_t>(end));
}

template <typename T>
std::vector<T> actions_of(const Actions& actions) {
    std::vector<T> out;
    for (const auto& action : actions) {
        if (const auto* a = std::get_if<T>(&action)) out.push_back(*a);
    }
    return out;
}

// Fully connected set of coordinators with FIFO frame delivery
struct Pod {
    std::vector<std::unique_ptr<Coordinator>> nodes;
    std::deque<std::pair<size_t, Action>> queue;
    std::set<size_t> down;
    Bytes body;
    std::optional<Bytes> completed;
    size_t integrity_errors = 0;

    Pod(size_t count, const CoreConfig& config) {
        for (size_t i = 0; i < count; ++i) {
            nodes.push_back(std::make_unique<Coordinator>(config));
        }
        for (size_t a = 0; a < count; ++a) {
            for (size_t b = a + 1; b < count; ++b) {
                link(*nodes[a], *nodes[b]);
            }
        }
    }

    void enqueue(size_t from, Actions actions) {
        for (auto& action : actions) queue.emplace_back(from, std::move(action));
    }

    size_t index_of(const DeviceId& id) const {
        for (size_t i = 0; i < nodes.size(); ++i) {
            if (nodes[i]->device_id() == id) return i;
        }
        return nodes.size();
    }

    void pump() {
        while (!queue.empty()) {
            auto [from, action] = std::move(queue.front());
            queue.pop_front();
            if (down.count(from)) continue;

            if (auto* send = std::get_if<SendMessage>(&action)) {
                size_t to = index_of(send->peer);
                if (to >= nodes.size() || down.count(to)) continue;
                auto outcome = nodes[to]->on_message_received(nodes[from]->device_id(), send->frame);
                REQUIRE(outcome.ok());
                if (outcome->error) ++integrity_errors;
                if (outcome->completed) completed = outcome->completed->body;
                enqueue(to, std::move(outcome->actions));
            } else if (auto* fetch = std::get_if<FetchChunk>(&action)) {
                Bytes payload = slice(body, fetch->start, fetch->end);
                if (fetch->for_peer) {
                    auto sent = nodes[from]->serve_chunk(*fetch->for_peer, fetch->transfer_id, fetch->start,
                                                         fetch->end, payload);
                    REQUIRE(sent.ok());
                    queue.emplace_back(from, std::move(sent).value());
                } else {
                    auto r = nodes[from]->on_chunk_received(fetch->transfer_id, fetch->start, fetch->end,
                                                            hash_chunk(payload), payload);
                    REQUIRE(r.ok());
                    if (r->has_value()) completed = **r;
                }
            }
        }
    }

    void tick_all() {
        for (size_t i = 0; i < nodes.size(); ++i) {
            if (!down.count(i)) enqueue(i, nodes[i]->tick());
        }
    }
};

} // anonymous namespace

// ============================================================================
// Request decisions
// ============================================================================

TEST_CASE("Requests fall back without peers or a usable range", "[coordinator][request]") {
    Coordinator alone(small_chunks());
    REQUIRE(std::holds_alternative<Fallback>(alone.on_incoming_request({"http://x/a", HttpRange{0, 99}, true})));

    Coordinator peer(small_chunks());
    link(alone, peer);

    REQUIRE(std::holds_alternative<Fallback>(alone.on_incoming_request({"http://x/a", HttpRange{0, 99}, false})));
    REQUIRE(std::holds_alternative<Fallback>(alone.on_incoming_request({"http://x/a", std::nullopt, true})));
    REQUIRE(std::holds_alternative<Fallback>(alone.on_incoming_request({"http://x/a", HttpRange{10, 9}, true})));
    REQUIRE(std::holds_alternative<Fallback>(
        alone.on_incoming_request({"http://x/a", HttpRange{0, UINT64_MAX}, true})));

    REQUIRE(std::holds_alternative<Accelerate>(alone.on_incoming_request({"http://x/a", HttpRange{0, 0}, true})));
}

TEST_CASE("Hundred bytes in forty byte chunks across self and one peer", "[coordinator][e2e]") {
    Coordinator a(small_chunks());
    Coordinator b(small_chunks());
    link(a, b);
    Bytes body = make_body(100);

    auto decision = a.on_incoming_request({"http://origin/file.bin", HttpRange{0, 99}, true});
    auto* accel = std::get_if<Accelerate>(&decision);
    REQUIRE(accel != nullptr);
    REQUIRE(accel->total_length == 100);
    REQUIRE(accel->plan.size() == 3);
    REQUIRE(accel->plan[0] == Assignment{0, {0, 40}, a.device_id()});
    REQUIRE(accel->plan[1] == Assignment{1, {40, 80}, b.device_id()});
    REQUIRE(accel->plan[2] == Assignment{2, {80, 100}, a.device_id()});

    auto fetches = actions_of<FetchChunk>(accel->actions);
    auto sends = actions_of<SendMessage>(accel->actions);
    REQUIRE(fetches.size() == 2);
    REQUIRE(sends.size() == 1);
    REQUIRE(fetches[0].url == "http://origin/file.bin");
    REQUIRE_FALSE(fetches[0].for_peer.has_value());
    REQUIRE(sends[0].peer == b.device_id());

    // Peer receives the request and is asked to fetch on our behalf
    auto at_b = b.on_message_received(a.device_id(), sends[0].frame);
    REQUIRE(at_b.ok());
    auto b_fetch = actions_of<FetchChunk>(at_b->actions);
    REQUIRE(b_fetch.size() == 1);
    REQUIRE(b_fetch[0].for_peer == a.device_id());
    REQUIRE(b_fetch[0].start == 40);
    REQUIRE(b_fetch[0].end == 80);
    REQUIRE(b_fetch[0].url.empty());

    auto reply = b.serve_chunk(a.device_id(), accel->transfer_id, 40, 80, slice(body, 40, 80));
    REQUIRE(reply.ok());
    auto at_a = a.on_message_received(b.device_id(), reply->frame);
    REQUIRE(at_a.ok());
    REQUIRE_FALSE(at_a->completed.has_value());
    REQUIRE_FALSE(at_a->error);

    Bytes first = slice(body, 0, 40);
    auto r0 = a.on_chunk_received(accel->transfer_id, 0, 40, hash_chunk(first), first);
    REQUIRE(r0.ok());
    REQUIRE_FALSE(r0->has_value());

    Bytes last = slice(body, 80, 100);
    auto r2 = a.on_chunk_received(accel->transfer_id, 80, 100, hash_chunk(last), last);
    REQUIRE(r2.ok());
    REQUIRE(r2->has_value());
    REQUIRE(**r2 == body);
    REQUIRE(a.transfer_state(accel->transfer_id) == TransferState::Complete);

    REQUIRE(a.on_chunk_received(accel->transfer_id, 0, 40, hash_chunk(first), first).error() ==
            ErrorCode::AlreadyComplete);
}

TEST_CASE("Self fetch can be disabled", "[coordinator][request]") {
    CoreConfig config = small_chunks();
    config.allow_self_fetch = false;
    Coordinator a(config);
    Coordinator b(small_chunks());
    link(a, b);

    auto decision = a.on_incoming_request({"u", HttpRange{0, 99}, true});
    auto& accel = std::get<Accelerate>(decision);
    for (const auto& assignment : accel.plan) {
        REQUIRE(assignment.fetcher == b.device_id());
    }
    REQUIRE(actions_of<FetchChunk>(accel.actions).empty());
    REQUIRE(actions_of<SendMessage>(accel.actions).size() == 3);
}

// ============================================================================
// Sessions
// ============================================================================

TEST_CASE("Peers agree on session keys and exchange heartbeats", "[coordinator][session]") {
    Coordinator a(patient());
    Coordinator b(patient());
    REQUIRE(*a.session_key(b.public_key()) == *b.session_key(a.public_key()));
    link(a, b);
    REQUIRE(a.peer_liveness(b.device_id()) == Liveness::Alive);

    auto ticks = actions_of<SendMessage>(a.tick());
    REQUIRE(ticks.size() == 1);
    Bytes heartbeat = ticks[0].frame;

    auto ok = b.on_message_received(a.device_id(), heartbeat);
    REQUIRE(ok.ok());
    REQUIRE(ok->actions.empty());

    SECTION("replayed frame fails authentication") {
        REQUIRE(b.on_message_received(a.device_id(), heartbeat).error() == ErrorCode::AuthFailed);
    }

    SECTION("tampered frame fails authentication") {
        Bytes next = actions_of<SendMessage>(a.tick())[0].frame;
        next[FRAME_HEADER_SIZE + 2] ^= 0x01;
        REQUIRE(b.on_message_received(a.device_id(), next).error() == ErrorCode::AuthFailed);
        // The following frame opens further along the receive window
        Bytes after = actions_of<SendMessage>(a.tick())[0].frame;
        REQUIRE(b.on_message_received(a.device_id(), after).ok());
    }
}

TEST_CASE("Rejoined peers never reuse a nonce", "[coordinator][session][rejoin]") {
    Coordinator a(patient());
    Coordinator b(patient());
    link(a, b);

    auto exchange = [&]() {
        auto down = actions_of<SendMessage>(a.tick());
        REQUIRE(down.size() == 1);
        REQUIRE(b.on_message_received(a.device_id(), down[0].frame).ok());
        auto up = actions_of<SendMessage>(b.tick());
        REQUIRE(up.size() == 1);
        REQUIRE(a.on_message_received(b.device_id(), up[0].frame).ok());
    };
    exchange();

    std::set<uint64_t> used;
    auto record = [&]() {
        uint64_t next = a.peer_nonces(b.device_id())->send;
        REQUIRE(used.insert(next).second);
        auto nack = a.decline_chunk(b.device_id(), TransferId{}, 0, 1);
        REQUIRE(nack.ok());
        // Sealed but never delivered
    };
    record();
    uint64_t first_send = a.peer_nonces(b.device_id())->send;

    SECTION("one side rejoins") {
        a.on_peer_left(b.device_id());
        REQUIRE(a.peer_nonces(b.device_id())->send == first_send);
        REQUIRE_FALSE(a.on_peer_joined(b.device_id(), b.public_key()));
        REQUIRE(a.peer_nonces(b.device_id())->send > first_send);
        record();
        exchange();
    }

    SECTION("both sides rejoin repeatedly") {
        for (int round = 0; round < 3; ++round) {
            a.on_peer_left(b.device_id());
            b.on_peer_left(a.device_id());
            link(a, b);
            record();
            exchange();
        }
    }

    SECTION("rejoin without a leave") {
        REQUIRE_FALSE(a.on_peer_joined(b.device_id(), b.public_key()));
        record();
        exchange();
    }
}

TEST_CASE("Restarted peer with a persisted identity reconnects", "[coordinator][session][rejoin]") {
    auto saved = Keypair::generate().private_bytes();
    Coordinator a(patient());
    auto b = std::make_unique<Coordinator>(patient(), Keypair::from_private_bytes(saved.data(), saved.size()).value());
    link(a, *b);
    auto heartbeat = actions_of<SendMessage>(a.tick());
    REQUIRE(b->on_message_received(a.device_id(), heartbeat[0].frame).ok());

    // b restarts; a sees the connection drop and come back
    b = std::make_unique<Coordinator>(patient(), Keypair::from_private_bytes(saved.data(), saved.size()).value());
    a.on_peer_left(b->device_id());
    link(a, *b);

    // b's first frame is still in the nonce range a has already seen
    auto stale = actions_of<SendMessage>(b->tick());
    REQUIRE(a.on_message_received(b->device_id(), stale[0].frame).error() == ErrorCode::AuthFailed);

    auto down = actions_of<SendMessage>(a.tick());
    REQUIRE(b->on_message_received(a.device_id(), down[0].frame).ok());
    auto up = actions_of<SendMessage>(b->tick());
    REQUIRE(a.on_message_received(b->device_id(), up[0].frame).ok());
}

TEST_CASE("Bad input is reported, not thrown", "[coordinator][session]") {
    Coordinator a;
    Coordinator b;
    Coordinator stranger;
    link(a, b);

    auto frame = actions_of<SendMessage>(stranger.tick());
    REQUIRE(frame.empty());

    Bytes junk = {0x05, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    REQUIRE(a.on_message_received(stranger.device_id(), junk).error() == ErrorCode::UnknownPeer);
    REQUIRE(a.on_message_received(b.device_id(), junk.data(), 3).error() == ErrorCode::Incomplete);
    REQUIRE(a.on_message_received(b.device_id(), junk).error() == ErrorCode::AuthFailed);

    Bytes huge = {0x00, 0x00, 0x00, 0x02};
    REQUIRE(a.on_message_received(b.device_id(), huge).error() == ErrorCode::FrameTooLarge);
}

TEST_CASE("Join validation", "[coordinator][session]") {
    Coordinator a;
    Coordinator b;
    Coordinator c;

    REQUIRE(a.on_peer_joined(b.device_id(), c.public_key()) == make_error_code(ErrorCode::InvalidPeerKey));
    REQUIRE(a.on_peer_joined(a.device_id(), a.public_key()) == make_error_code(ErrorCode::InvalidArgument));
    REQUIRE(a.peer_count() == 0);

    REQUIRE_FALSE(a.on_peer_joined(b.device_id(), b.public_key()));
    REQUIRE_FALSE(a.on_peer_joined(b.device_id(), b.public_key()));
    REQUIRE(a.peer_count() == 1);

    REQUIRE(a.on_peer_left(c.device_id()).empty());
    REQUIRE(a.on_peer_left(b.device_id()).empty());
    REQUIRE(a.peer_count() == 0);
    REQUIRE_FALSE(a.peer_liveness(b.device_id()).has_value());
}

// ============================================================================
// Liveness
// ============================================================================

TEST_CASE("Silent peer times out on the third tick", "[coordinator][heartbeat]") {
    Coordinator a(small_chunks());
    Coordinator b(small_chunks());
    link(a, b);

    a.tick();
    REQUIRE(a.peer_liveness(b.device_id()) == Liveness::Alive);
    a.tick();
    REQUIRE(a.peer_liveness(b.device_id()) == Liveness::Suspect);
    // Suspect peers take no new work
    REQUIRE(std::holds_alternative<Fallback>(a.on_incoming_request({"u", HttpRange{0, 99}, true})));
    a.tick();
    REQUIRE_FALSE(a.peer_liveness(b.device_id()).has_value());
    REQUIRE(a.peer_count() == 0);
    REQUIRE(a.tick_count() == 3);
}

TEST_CASE("Timed out peer's chunks move to the remaining workers", "[coordinator][heartbeat]") {
    Coordinator a(small_chunks());
    Coordinator b(small_chunks());
    link(a, b);
    auto decision = a.on_incoming_request({"u", HttpRange{0, 99}, true});
    auto id = std::get<Accelerate>(decision).transfer_id;

    a.tick();
    a.tick();
    Actions third = a.tick();
    auto moved = actions_of<FetchChunk>(third);
    REQUIRE(moved.size() == 1);
    REQUIRE(moved[0].start == 40);

    for (const auto& assignment : *a.assignment(id)) {
        REQUIRE(assignment.fetcher == a.device_id());
    }
}

// ============================================================================
// Recovery
// ============================================================================

TEST_CASE("Peer loss reassigns only the lost peer's chunks", "[coordinator][peer_left]") {
    Coordinator a(small_chunks());
    std::vector<std::unique_ptr<Coordinator>> peers;
    for (int i = 0; i < 3; ++i) {
        peers.push_back(std::make_unique<Coordinator>(small_chunks()));
        link(a, *peers.back());
    }
    std::vector<DeviceId> order;
    for (const auto& p : peers) order.push_back(p->device_id());
    std::sort(order.begin(), order.end());

    auto decision = a.on_incoming_request({"u", HttpRange{0, 319}, true});
    auto& accel = std::get<Accelerate>(decision);
    REQUIRE(accel.plan.size() == 8);
    for (size_t i = 0; i < 8; ++i) {
        REQUIRE(accel.plan[i].fetcher == (i % 4 == 0 ? a.device_id() : order[i % 4 - 1]));
    }

    const DeviceId lost = order[0];
    Actions actions = a.on_peer_left(lost);
    REQUIRE(actions.size() == 2);
    REQUIRE(actions_of<FetchChunk>(actions).size() == 1);
    REQUIRE(actions_of<FetchChunk>(actions)[0].start == 40);
    REQUIRE(actions_of<SendMessage>(actions).size() == 1);
    REQUIRE(actions_of<SendMessage>(actions)[0].peer == order[1]);

    auto after = *a.assignment(accel.transfer_id);
    REQUIRE(after.size() == 8);
    for (size_t i = 0; i < 8; ++i) {
        REQUIRE(after[i].fetcher != lost);
        if (i != 1 && i != 5) {
            REQUIRE(after[i].fetcher == accel.plan[i].fetcher);
        }
    }
    REQUIRE(after[1].fetcher == a.device_id());
    REQUIRE(after[5].fetcher == order[1]);
}

TEST_CASE("Repeated bad chunks isolate the sender", "[coordinator][integrity]") {
    Coordinator a(small_chunks());
    Coordinator b(small_chunks());
    link(a, b);
    Bytes body = make_body(100);

    auto decision = a.on_incoming_request({"u", HttpRange{0, 99}, true});
    auto id = std::get<Accelerate>(decision).transfer_id;

    for (int attempt = 1; attempt <= 3; ++attempt) {
        // Short payload: hash matches the bytes but not the chunk length
        auto bad = b.serve_chunk(a.device_id(), id, 40, 80, slice(body, 40, 79));
        REQUIRE(bad.ok());
        auto outcome = a.on_message_received(b.device_id(), bad->frame);
        REQUIRE(outcome.ok());
        REQUIRE(outcome->error == make_error_code(ErrorCode::IntegrityFailure));
        REQUIRE_FALSE(outcome->completed.has_value());
        if (attempt == 1) {
            auto retry = actions_of<FetchChunk>(outcome->actions);
            REQUIRE(retry.size() == 1);
            REQUIRE(retry[0].start == 40);
            REQUIRE_FALSE(retry[0].for_peer.has_value());
        }
        REQUIRE(a.is_isolated(b.device_id()) == (attempt == 3));
    }

    // b is still connected but no longer trusted with work
    REQUIRE(a.peer_count() == 1);
    REQUIRE(std::holds_alternative<Fallback>(a.on_incoming_request({"u", HttpRange{0, 99}, true})));

    // Rejoining clears the record
    REQUIRE_FALSE(a.on_peer_joined(b.device_id(), b.public_key()));
    REQUIRE_FALSE(a.is_isolated(b.device_id()));
}

TEST_CASE("Declined chunk is fetched by someone else", "[coordinator][nack]") {
    Coordinator a(small_chunks());
    Coordinator b(small_chunks());
    link(a, b);

    auto decision = a.on_incoming_request({"http://o/f", HttpRange{0, 99}, true});
    auto& accel = std::get<Accelerate>(decision);
    auto request = actions_of<SendMessage>(accel.actions);
    REQUIRE(b.on_message_received(a.device_id(), request[0].frame).ok());

    auto nack = b.decline_chunk(a.device_id(), accel.transfer_id, 40, 80);
    REQUIRE(nack.ok());
    auto outcome = a.on_message_received(b.device_id(), nack->frame);
    REQUIRE(outcome.ok());
    auto retry = actions_of<FetchChunk>(outcome->actions);
    REQUIRE(retry.size() == 1);
    REQUIRE(retry[0].start == 40);
    REQUIRE(retry[0].end == 80);
    REQUIRE(retry[0].url == "http://o/f");
    REQUIRE((*a.assignment(accel.transfer_id))[1].fetcher == a.device_id());
}

TEST_CASE("Only the assignee can give up a chunk", "[coordinator][nack][integrity]") {
    CoreConfig config = small_chunks();
    config.allow_self_fetch = false;
    Coordinator a(config);
    std::vector<std::unique_ptr<Coordinator>> peers;
    for (int i = 0; i < 3; ++i) {
        peers.push_back(std::make_unique<Coordinator>(small_chunks()));
        link(a, *peers.back());
    }
    std::sort(peers.begin(), peers.end(),
              [](const auto& l, const auto& r) { return l->device_id() < r->device_id(); });
    Coordinator& b = *peers[0];
    Coordinator& c = *peers[1];
    Bytes body = make_body(100);

    auto decision = a.on_incoming_request({"u", HttpRange{0, 99}, true});
    auto& accel = std::get<Accelerate>(decision);
    REQUIRE(accel.plan[0].fetcher == b.device_id());
    const auto before = *a.assignment(accel.transfer_id);

    SECTION("Nack for someone else's chunk is ignored") {
        auto nack = c.decline_chunk(a.device_id(), accel.transfer_id, 0, 40);
        REQUIRE(nack.ok());
        auto outcome = a.on_message_received(c.device_id(), nack->frame);
        REQUIRE(outcome.ok());
        REQUIRE(outcome->actions.empty());
        REQUIRE(*a.assignment(accel.transfer_id) == before);
    }

    SECTION("bad data for someone else's chunk counts against the sender only") {
        // One byte short of the chunk
        auto bad = c.serve_chunk(a.device_id(), accel.transfer_id, 0, 40, slice(body, 0, 39));
        REQUIRE(bad.ok());
        auto outcome = a.on_message_received(c.device_id(), bad->frame);
        REQUIRE(outcome.ok());
        REQUIRE(outcome->error == make_error_code(ErrorCode::IntegrityFailure));
        REQUIRE(outcome->actions.empty());
        REQUIRE(*a.assignment(accel.transfer_id) == before);

        // The real holder still delivers
        auto good = b.serve_chunk(a.device_id(), accel.transfer_id, 0, 40, slice(body, 0, 40));
        REQUIRE(good.ok());
        auto delivered = a.on_message_received(b.device_id(), good->frame);
        REQUIRE(delivered.ok());
        REQUIRE_FALSE(delivered->error);
    }

    SECTION("the assignee's own Nack still moves the chunk") {
        auto nack = b.decline_chunk(a.device_id(), accel.transfer_id, 0, 40);
        REQUIRE(nack.ok());
        auto outcome = a.on_message_received(b.device_id(), nack->frame);
        REQUIRE(outcome.ok());
        auto moved = actions_of<SendMessage>(outcome->actions);
        REQUIRE(moved.size() == 1);
        REQUIRE(moved[0].peer != b.device_id());
    }
}

TEST_CASE("Idle transfer is abandoned", "[coordinator][expire]") {
    CoreConfig config = small_chunks();
    config.transfer_idle_timeout_ticks = 2;
    config.suspect_after_ticks = 9;
    config.heartbeat_timeout_ticks = 10;
    Coordinator a(config);
    Coordinator b(config);
    link(a, b);

    auto decision = a.on_incoming_request({"u", HttpRange{0, 99}, true});
    auto id = std::get<Accelerate>(decision).transfer_id;

    REQUIRE(actions_of<TransferAbandoned>(a.tick()).empty());
    auto abandoned = actions_of<TransferAbandoned>(a.tick());
    REQUIRE(abandoned.size() == 1);
    REQUIRE(abandoned[0].transfer_id == id);
    REQUIRE(a.transfer_state(id) == TransferState::Abandoned);

    Bytes late = make_body(40);
    REQUIRE(a.on_chunk_received(id, 0, 40, hash_chunk(late), late).error() == ErrorCode::UnknownChunk);
}

// ============================================================================
// Whole pod
// ============================================================================

TEST_CASE("Four device pod completes a transfer", "[coordinator][pod]") {
    Pod pod(4, small_chunks(1000));
    pod.body = make_body(25000);

    auto decision = pod.nodes[0]->on_incoming_request({"http://o/big", HttpRange{0, 24999}, true});
    auto& accel = std::get<Accelerate>(decision);
    REQUIRE(accel.plan.size() == 25);
    pod.enqueue(0, accel.actions);

    for (int round = 0; round < 5 && !pod.completed; ++round) {
        pod.pump();
        pod.tick_all();
    }
    pod.pump();

    REQUIRE(pod.completed.has_value());
    REQUIRE(*pod.completed == pod.body);
    REQUIRE(pod.integrity_errors == 0);
}

TEST_CASE("Pod survives losing a peer mid-transfer", "[coordinator][pod]") {
    Pod pod(4, small_chunks(1000));
    pod.body = make_body(10500);

    auto decision = pod.nodes[0]->on_incoming_request({"http://o/big", HttpRange{0, 10499}, true});
    pod.enqueue(0, std::get<Accelerate>(decision).actions);

    // Device 2 vanishes before answering anything; only the timeout notices
    pod.down.insert(2);

    for (int round = 0; round < 10 && !pod.completed; ++round) {
        pod.pump();
        pod.tick_all();
    }
    pod.pump();

    REQUIRE(pod.completed.has_value());
    REQUIRE(*pod.completed == pod.body);
    REQUIRE(pod.nodes[0]->peer_count() == 2);
}
