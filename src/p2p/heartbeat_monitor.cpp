#include "peapod/p2p/heartbeat_monitor.h"
#include "peapod/base/logger.h"

namespace peapod {

HeartbeatMonitor::HeartbeatMonitor(uint32_t suspect_after_ticks, uint32_t timeout_ticks)
    : suspect_after_ticks_(suspect_after_ticks), timeout_ticks_(timeout_ticks) {}

uint64_t HeartbeatMonitor::advance() {
    return ++tick_count_;
}

HeartbeatMonitor::Sweep HeartbeatMonitor::sweep(std::map<DeviceId, PeerSession>& sessions) const {
    Sweep result;
    for (auto& [id, session] : sessions) {
        if (session.liveness() == Liveness::Left) {
            continue;
        }
        uint64_t silent = tick_count_ - session.last_seen_tick();
        if (silent >= timeout_ticks_) {
            Logger::instance().info("Peer {} timed out after {} silent ticks", short_hex(id), silent);
            result.timed_out.push_back(id);
        } else if (silent >= suspect_after_ticks_ && session.liveness() != Liveness::Suspect) {
            session.mark_suspect();
            result.suspected.push_back(id);
        }
    }
    return result;
}

} // namespace peapod
