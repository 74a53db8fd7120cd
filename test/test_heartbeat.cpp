#include <catch2/catch_test_macros.hpp>
#include <map>
#include <set>
#include <string>
#include <utility>
#include "peapod/p2p/heartbeat_monitor.h"
#include "peapod/p2p/peer_session.h"

using namespace peapod;

namespace {

struct SessionPair {
    Keypair low = Keypair::generate();
    Keypair high = Keypair::generate();
    SessionKey key{};

    SessionPair() {
        if (high.device_id() < low.device_id()) {
            std::swap(low, high);
        }
        key = *derive_session_key(low, high.public_key());
    }

    PeerSession low_side(uint64_t now = 0) const {
        return PeerSession(low.device_id(), high.device_id(), high.public_key(), key, now);
    }

    PeerSession high_side(uint64_t now = 0) const {
        return PeerSession(high.device_id(), low.device_id(), low.public_key(), key, now);
    }
};

} // anonymous namespace

// ============================================================================
// Peer session
// ============================================================================

TEST_CASE("Nonce parity follows device order", "[session][nonce]") {
    SessionPair pair;
    auto low = pair.low_side();
    auto high = pair.high_side();

    REQUIRE(low.next_send_nonce() == 0);
    REQUIRE(low.next_recv_nonce() == 1);
    REQUIRE(high.next_send_nonce() == 1);
    REQUIRE(high.next_recv_nonce() == 0);

    Bytes hello = {'h', 'i'};
    for (int i = 0; i < 3; ++i) {
        Bytes sealed = low.seal(hello);
        auto opened = high.open(sealed.data(), sealed.size());
        REQUIRE(opened.ok());
        REQUIRE(*opened == hello);

        Bytes reply = high.seal(hello);
        auto back = low.open(reply.data(), reply.size());
        REQUIRE(back.ok());
    }
    REQUIRE(low.next_send_nonce() == 6);
    REQUIRE(high.next_send_nonce() == 7);
}

TEST_CASE("Lost and rejected frames are skipped, never replayed", "[session][nonce]") {
    SessionPair pair;
    auto low = pair.low_side();
    auto high = pair.high_side();

    Bytes first = low.seal(Bytes{1, 2, 3});
    Bytes second = low.seal(Bytes{4, 5, 6});

    // first is lost; second opens further along the window
    auto opened = high.open(second.data(), second.size());
    REQUIRE(opened.ok());
    REQUIRE(*opened == Bytes{4, 5, 6});
    REQUIRE(high.next_recv_nonce() == 4);

    // first arrives late and is behind the counter
    REQUIRE(high.open(first.data(), first.size()).error() == ErrorCode::AuthFailed);
    REQUIRE(high.next_recv_nonce() == 4);

    Bytes third = low.seal(Bytes{7});
    third[0] ^= 0x01;
    REQUIRE(high.open(third.data(), third.size()).error() == ErrorCode::AuthFailed);
    REQUIRE(high.next_recv_nonce() == 4);

    Bytes fourth = low.seal(Bytes{8});
    REQUIRE(high.open(fourth.data(), fourth.size()).ok());
    REQUIRE(high.next_recv_nonce() == 8);
}

TEST_CASE("Frames past the receive window do not open", "[session][nonce]") {
    SessionPair pair;
    auto low = pair.low_side();
    auto high = pair.high_side();

    for (uint64_t i = 0; i < RECV_WINDOW; ++i) {
        low.seal(Bytes{0});
    }
    Bytes far = low.seal(Bytes{1});
    REQUIRE(high.open(far.data(), far.size()).error() == ErrorCode::AuthFailed);
    REQUIRE(high.next_recv_nonce() == 0);
}

TEST_CASE("Resumed sessions never reuse a nonce", "[session][nonce][rejoin]") {
    SessionPair pair;
    auto low = pair.low_side();
    auto high = pair.high_side();

    std::set<uint64_t> used;
    for (int i = 0; i < 3; ++i) {
        used.insert(low.next_send_nonce());
        Bytes frame = low.seal(Bytes{1});
        REQUIRE(high.open(frame.data(), frame.size()).ok());
    }
    // Sealed but never delivered before the connection dropped
    used.insert(low.next_send_nonce());
    low.seal(Bytes{2});

    NonceMarks low_marks = low.marks();
    NonceMarks high_marks = high.marks();
    REQUIRE(low_marks.send == 8);
    REQUIRE(high_marks.recv == 6);

    for (int round = 1; round <= 3; ++round) {
        low = PeerSession(pair.low.device_id(), pair.high.device_id(), pair.high.public_key(), pair.key, 0,
                          low_marks);
        high = PeerSession(pair.high.device_id(), pair.low.device_id(), pair.low.public_key(), pair.key, 0,
                           high_marks);
        REQUIRE(epoch_of(low.next_send_nonce()) == static_cast<uint64_t>(round));
        REQUIRE(low.next_send_nonce() % 2 == 0);
        REQUIRE(high.next_send_nonce() % 2 == 1);

        REQUIRE(used.insert(low.next_send_nonce()).second);
        Bytes down = low.seal(Bytes{3});
        REQUIRE(high.open(down.data(), down.size()).ok());

        Bytes up = high.seal(Bytes{4});
        REQUIRE(low.open(up.data(), up.size()).ok());

        low_marks = low.marks();
        high_marks = high.marks();
    }
}

TEST_CASE("Restarted side follows the peer into its epoch", "[session][nonce][rejoin]") {
    SessionPair pair;
    // The low side remembers an earlier session; the high side starts over
    auto low = PeerSession(pair.low.device_id(), pair.high.device_id(), pair.high.public_key(), pair.key, 0,
                           NonceMarks{10, 11});
    auto high = pair.high_side();

    Bytes stale = high.seal(Bytes{1});
    REQUIRE(low.open(stale.data(), stale.size()).error() == ErrorCode::AuthFailed);

    Bytes down = low.seal(Bytes{2});
    REQUIRE(high.open(down.data(), down.size()).ok());
    REQUIRE(epoch_of(high.next_send_nonce()) == 1);
    REQUIRE(epoch_of(high.next_recv_nonce()) == 1);

    Bytes up = high.seal(Bytes{3});
    auto opened = low.open(up.data(), up.size());
    REQUIRE(opened.ok());
    REQUIRE(*opened == Bytes{3});
}

TEST_CASE("Liveness only moves forward", "[session][liveness]") {
    SessionPair pair;
    auto session = pair.low_side(5);
    REQUIRE(session.liveness() == Liveness::Joining);
    REQUIRE_FALSE(session.is_usable());

    session.touch(6);
    REQUIRE(session.liveness() == Liveness::Alive);
    REQUIRE(session.is_usable());
    REQUIRE(session.last_seen_tick() == 6);

    session.mark_suspect();
    REQUIRE(session.liveness() == Liveness::Suspect);
    session.touch(7);
    REQUIRE(session.liveness() == Liveness::Suspect);
    REQUIRE(session.last_seen_tick() == 7);
    REQUIRE_FALSE(session.is_usable());

    session.mark_left();
    REQUIRE(session.liveness() == Liveness::Left);
    session.mark_suspect();
    REQUIRE(session.liveness() == Liveness::Left);
    REQUIRE(std::string(to_string(Liveness::Left)) == "Left");
}

// ============================================================================
// Heartbeat monitor
// ============================================================================

TEST_CASE("Silent peer is suspect after two ticks and gone after three", "[heartbeat]") {
    SessionPair pair;
    HeartbeatMonitor monitor;
    std::map<DeviceId, PeerSession> sessions;
    sessions.emplace(pair.high.device_id(), pair.low_side(monitor.now()));
    sessions.at(pair.high.device_id()).touch(monitor.now());

    REQUIRE(monitor.advance() == 1);
    auto s1 = monitor.sweep(sessions);
    REQUIRE(s1.suspected.empty());
    REQUIRE(s1.timed_out.empty());

    monitor.advance();
    auto s2 = monitor.sweep(sessions);
    REQUIRE(s2.suspected.size() == 1);
    REQUIRE(s2.timed_out.empty());
    REQUIRE(sessions.at(pair.high.device_id()).liveness() == Liveness::Suspect);

    monitor.advance();
    auto s3 = monitor.sweep(sessions);
    REQUIRE(s3.suspected.empty());
    REQUIRE(s3.timed_out.size() == 1);
    REQUIRE(s3.timed_out[0] == pair.high.device_id());
}

TEST_CASE("Traffic keeps a peer from timing out", "[heartbeat]") {
    SessionPair pair;
    HeartbeatMonitor monitor;
    std::map<DeviceId, PeerSession> sessions;
    sessions.emplace(pair.high.device_id(), pair.low_side(0));

    for (int i = 0; i < 10; ++i) {
        uint64_t now = monitor.advance();
        sessions.at(pair.high.device_id()).touch(now);
        auto sweep = monitor.sweep(sessions);
        REQUIRE(sweep.suspected.empty());
        REQUIRE(sweep.timed_out.empty());
    }
    REQUIRE(sessions.at(pair.high.device_id()).liveness() == Liveness::Alive);
}

TEST_CASE("Custom thresholds and departed sessions", "[heartbeat]") {
    SessionPair pair;
    HeartbeatMonitor monitor(1, 5);
    std::map<DeviceId, PeerSession> sessions;
    sessions.emplace(pair.high.device_id(), pair.low_side(0));

    monitor.advance();
    REQUIRE(monitor.sweep(sessions).suspected.size() == 1);

    sessions.at(pair.high.device_id()).mark_left();
    for (int i = 0; i < 6; ++i) monitor.advance();
    auto sweep = monitor.sweep(sessions);
    REQUIRE(sweep.timed_out.empty());
    REQUIRE(monitor.now() == 7);
}
