#ifndef PEAPOD_P2P_HEARTBEAT_MONITOR_H
#define PEAPOD_P2P_HEARTBEAT_MONITOR_H

#include "peapod/crypto/identity.h"
#include "peapod/p2p/peer_session.h"
#include <cstdint>
#include <map>
#include <vector>

namespace peapod {

static constexpr uint32_t DEFAULT_SUSPECT_AFTER_TICKS = 2;
static constexpr uint32_t DEFAULT_HEARTBEAT_TIMEOUT_TICKS = 3;

// Tick clock plus liveness sweep. Time only moves when advance() is called.
class HeartbeatMonitor {
public:
    struct Sweep {
        std::vector<DeviceId> suspected;  // newly marked Suspect
        std::vector<DeviceId> timed_out;  // silent for the full timeout
    };

    HeartbeatMonitor(uint32_t suspect_after_ticks = DEFAULT_SUSPECT_AFTER_TICKS,
                     uint32_t timeout_ticks = DEFAULT_HEARTBEAT_TIMEOUT_TICKS);

    uint64_t now() const { return tick_count_; }

    // Returns the new tick count
    uint64_t advance();

    // Silence is now() - last_seen_tick. Marks Suspect in place; timed out
    // sessions are only reported, the caller runs the leave path.
    Sweep sweep(std::map<DeviceId, PeerSession>& sessions) const;

private:
    uint32_t suspect_after_ticks_;
    uint32_t timeout_ticks_;
    uint64_t tick_count_ = 0;
};

} // namespace peapod

#endif // PEAPOD_P2P_HEARTBEAT_MONITOR_H
