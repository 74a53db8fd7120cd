#ifndef PEAPOD_CORE_ACTION_H
#define PEAPOD_CORE_ACTION_H

#include "peapod/base/bytes.h"
#include "peapod/crypto/identity.h"
#include "peapod/transfer/scheduler.h"
#include "peapod/wire/message.h"
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace peapod {

// Write a ready-to-send frame to a peer's transport connection
struct SendMessage {
    DeviceId peer{};
    Bytes frame;
};

// Fetch [start, end) from the origin and feed it back.
// for_peer empty: our own chunk, hand the bytes to on_chunk_received.
// for_peer set: a peer asked for it, answer with serve_chunk or decline_chunk.
struct FetchChunk {
    TransferId transfer_id{};
    uint64_t start = 0;
    uint64_t end = 0;
    std::optional<DeviceId> for_peer;
    std::string url;  // known only for our own transfers
};

// The transfer went idle; the host should serve the request unaccelerated
struct TransferAbandoned {
    TransferId transfer_id{};
};

using Action = std::variant<SendMessage, FetchChunk, TransferAbandoned>;
using Actions = std::vector<Action>;

// Inclusive HTTP byte range
struct HttpRange {
    uint64_t first = 0;
    uint64_t last = 0;
};

struct IncomingRequest {
    std::string url;
    std::optional<HttpRange> range;
    bool eligible = true;  // host's verdict: cacheable GET, no auth, etc.
};

struct Fallback {};

struct Accelerate {
    TransferId transfer_id{};
    uint64_t total_length = 0;
    std::vector<Assignment> plan;
    Actions actions;
};

using RequestDecision = std::variant<Fallback, Accelerate>;

struct CompletedTransfer {
    TransferId transfer_id{};
    Bytes body;
};

struct MessageOutcome {
    Actions actions;
    std::optional<CompletedTransfer> completed;
    // Set when a chunk was rejected and recovered by reassignment
    std::error_code error;
};

} // namespace peapod

#endif // PEAPOD_CORE_ACTION_H
