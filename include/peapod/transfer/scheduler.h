#ifndef PEAPOD_TRANSFER_SCHEDULER_H
#define PEAPOD_TRANSFER_SCHEDULER_H

#include "peapod/crypto/identity.h"
#include "peapod/transfer/chunk_manager.h"
#include <map>
#include <optional>
#include <vector>

namespace peapod {

static constexpr uint32_t DEFAULT_MAX_INTEGRITY_FAILURES = 3;

// Host-reported link quality for a worker
struct PeerMetrics {
    std::optional<double> bandwidth_bps;
    std::optional<double> latency_ms;
};

struct Assignment {
    size_t chunk_index = 0;
    ByteRange range;
    DeviceId fetcher{};

    bool operator==(const Assignment&) const = default;
};

// Decides which worker fetches which chunk.
//
// Workers are passed in by the caller as {self, eligible peers in ascending
// DeviceId order}. Without metrics chunks are dealt round-robin in that order.
// Once any worker reports bandwidth, chunk quotas follow bandwidth share
// (largest remainder, at least one chunk per worker when there are enough
// chunks) and are interleaved by smooth weighted round-robin.
class Scheduler {
public:
    explicit Scheduler(uint32_t max_integrity_failures = DEFAULT_MAX_INTEGRITY_FAILURES);

    // Assign every Unassigned chunk of the transfer. Returns what was assigned;
    // empty when there are no workers or nothing to assign.
    std::vector<Assignment> assign(ChunkManager& chunks, const TransferId& id,
                                   const std::vector<DeviceId>& workers);

    // Release the peer's non-Received chunks across active transfers and deal
    // them round-robin over workers. Other chunks are untouched.
    std::vector<std::pair<TransferId, Assignment>> on_peer_left(ChunkManager& chunks, const DeviceId& peer,
                                                                const std::vector<DeviceId>& workers);

    // Move one chunk to a worker other than avoid when possible
    std::optional<Assignment> reassign(ChunkManager& chunks, const TransferId& id, size_t index,
                                       const std::vector<DeviceId>& workers, const DeviceId& avoid);

    // Returns true when this failure isolates the peer
    bool record_integrity_failure(const DeviceId& peer);
    void record_success(const DeviceId& peer);
    // Forget failures and isolation (fresh join)
    void clear(const DeviceId& peer);
    bool is_isolated(const DeviceId& peer) const;
    uint32_t failure_count(const DeviceId& peer) const;

    void set_metrics(const DeviceId& peer, const PeerMetrics& metrics);
    void remove_metrics(const DeviceId& peer);

    // Worker order for n chunks; exposed for tests and diagnostics
    std::vector<size_t> distribution(size_t count, const std::vector<DeviceId>& workers) const;

private:
    struct Record {
        uint32_t consecutive_failures = 0;
        bool isolated = false;
    };

    std::vector<Assignment> deal(ChunkManager& chunks, const TransferId& id, const std::vector<size_t>& indices,
                                 const std::vector<DeviceId>& workers, bool weighted);

    uint32_t max_integrity_failures_;
    std::map<DeviceId, Record> records_;
    std::map<DeviceId, PeerMetrics> metrics_;
};

} // namespace peapod

#endif // PEAPOD_TRANSFER_SCHEDULER_H
