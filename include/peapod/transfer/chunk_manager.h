#ifndef PEAPOD_TRANSFER_CHUNK_MANAGER_H
#define PEAPOD_TRANSFER_CHUNK_MANAGER_H

#include "peapod/base/bytes.h"
#include "peapod/base/result.h"
#include "peapod/crypto/identity.h"
#include "peapod/crypto/integrity.h"
#include "peapod/wire/message.h"
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace peapod {

static constexpr uint64_t DEFAULT_CHUNK_SIZE = 256 * 1024;  // 256 KiB

// Half-open byte range [start, end)
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t size() const { return end - start; }
    bool operator==(const ByteRange&) const = default;
};

enum class ChunkState {
    Unassigned,
    InFlight,
    Received,
    Failed
};

enum class TransferState {
    Planning,
    InProgress,
    Complete,
    Abandoned
};

const char* to_string(ChunkState state);
const char* to_string(TransferState state);

struct Chunk {
    ByteRange range;
    std::optional<DeviceId> assignee;
    ChunkState state = ChunkState::Unassigned;
    std::optional<ChunkHash> expected_hash;  // as declared by the sender
    std::optional<ChunkHash> observed_hash;  // computed locally
    Bytes data;                              // held until reassembly
};

struct Transfer {
    TransferId id{};
    std::string url;
    uint64_t total_length = 0;
    std::vector<Chunk> chunks;  // ordered by range.start
    TransferState state = TransferState::Planning;
    uint64_t last_progress_tick = 0;

    // Derived from chunk state
    bool all_received() const;
    size_t received_count() const;
    size_t outstanding_count() const;
};

// Splits transfers into chunks and reassembles verified payloads.
// Transfers are keyed by TransferId in sorted order.
class ChunkManager {
public:
    ChunkManager();
    ~ChunkManager();

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    // Greedy left-to-right split; the last chunk may be shorter.
    // chunk_size 0 selects DEFAULT_CHUNK_SIZE, total_length 0 gives an empty plan.
    static std::vector<ByteRange> plan(uint64_t total_length, uint64_t chunk_size);

    // Replaces any transfer already registered under the same id
    Transfer& create_transfer(const TransferId& id, const std::string& url, uint64_t total_length,
                              uint64_t chunk_size, uint64_t now_tick);

    // Verified store of one chunk payload.
    //   UnknownChunk     - unknown transfer/index, or transfer abandoned
    //   AlreadyComplete  - transfer already reassembled
    //   IntegrityFailure - wrong length or hash; the chunk is released for
    //                      reassignment unless sender is set and is not the assignee
    //   nullopt          - stored (or duplicate of a Received chunk)
    //   bytes            - the last chunk arrived; the whole body, ordered by start
    // Throws PeaPodError(InvariantViolation) if reassembly finds a gap or overlap.
    Result<std::optional<Bytes>> receive(const TransferId& id, size_t index, const Bytes& payload,
                                         const ChunkHash& declared_hash, uint64_t now_tick,
                                         const std::optional<DeviceId>& sender = std::nullopt);

    // Chunk index whose range is exactly [start, end)
    Result<size_t> locate(const TransferId& id, uint64_t start, uint64_t end) const;

    // Set the single assignee and mark InFlight. Received chunks cannot be reassigned.
    std::error_code assign(const TransferId& id, size_t index, const DeviceId& fetcher);

    // Drop the assignee of a non-Received chunk and mark it Unassigned
    std::error_code release(const TransferId& id, size_t index);

    // Abandon active transfers idle for idle_ticks and return their ids.
    // Complete and Abandoned transfers past the same retention are removed.
    std::vector<TransferId> expire_idle(uint64_t now_tick, uint64_t idle_ticks);

    Transfer* find(const TransferId& id);
    const Transfer* find(const TransferId& id) const;

    // Planning and InProgress transfers, in id order
    std::vector<Transfer*> active_transfers();

    size_t transfer_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace peapod

#endif // PEAPOD_TRANSFER_CHUNK_MANAGER_H
