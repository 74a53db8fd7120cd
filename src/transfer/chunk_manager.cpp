#include "peapod/transfer/chunk_manager.h"
#include "peapod/base/logger.h"
#include <algorithm>
#include <map>

namespace peapod {

const char* to_string(ChunkState state) {
    switch (state) {
        case ChunkState::Unassigned: return "Unassigned";
        case ChunkState::InFlight: return "InFlight";
        case ChunkState::Received: return "Received";
        case ChunkState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Planning: return "Planning";
        case TransferState::InProgress: return "InProgress";
        case TransferState::Complete: return "Complete";
        case TransferState::Abandoned: return "Abandoned";
    }
    return "Unknown";
}

bool Transfer::all_received() const {
    return std::all_of(chunks.begin(), chunks.end(),
                       [](const Chunk& c) { return c.state == ChunkState::Received; });
}

size_t Transfer::received_count() const {
    return static_cast<size_t>(std::count_if(chunks.begin(), chunks.end(),
                                             [](const Chunk& c) { return c.state == ChunkState::Received; }));
}

size_t Transfer::outstanding_count() const {
    return chunks.size() - received_count();
}

namespace {

void release_buffer(Chunk& chunk) {
    Bytes().swap(chunk.data);
}

bool is_active(TransferState state) {
    return state == TransferState::Planning || state == TransferState::InProgress;
}

// Concatenate chunk buffers; coverage of [0, total) must be exact
Bytes reassemble(const Transfer& transfer) {
    std::vector<const Chunk*> ordered;
    ordered.reserve(transfer.chunks.size());
    for (const auto& chunk : transfer.chunks) {
        ordered.push_back(&chunk);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Chunk* a, const Chunk* b) { return a->range.start < b->range.start; });

    Bytes body;
    body.reserve(static_cast<size_t>(transfer.total_length));
    uint64_t cursor = 0;
    for (const Chunk* chunk : ordered) {
        if (chunk->range.start != cursor || chunk->data.size() != chunk->range.size()) {
            Logger::instance().fatal("Reassembly of transfer {} broke coverage at offset {}",
                                     short_hex(transfer.id), cursor);
            throw PeaPodError(ErrorCode::InvariantViolation, "chunk coverage has a gap or overlap");
        }
        body.insert(body.end(), chunk->data.begin(), chunk->data.end());
        cursor = chunk->range.end;
    }
    if (cursor != transfer.total_length) {
        Logger::instance().fatal("Reassembly of transfer {} ended at {} of {}",
                                 short_hex(transfer.id), cursor, transfer.total_length);
        throw PeaPodError(ErrorCode::InvariantViolation, "chunk coverage is short of total length");
    }
    return body;
}

} // anonymous namespace

struct ChunkManager::Impl {
    std::map<TransferId, Transfer> transfers;

    Chunk* chunk_at(const TransferId& id, size_t index) {
        auto it = transfers.find(id);
        if (it == transfers.end() || index >= it->second.chunks.size()) {
            return nullptr;
        }
        return &it->second.chunks[index];
    }
};

ChunkManager::ChunkManager() : impl_(std::make_unique<Impl>()) {}

ChunkManager::~ChunkManager() = default;

std::vector<ByteRange> ChunkManager::plan(uint64_t total_length, uint64_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = DEFAULT_CHUNK_SIZE;
    }
    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<size_t>((total_length + chunk_size - 1) / chunk_size));
    for (uint64_t start = 0; start < total_length; start += chunk_size) {
        ranges.push_back({start, std::min(start + chunk_size, total_length)});
    }
    return ranges;
}

Transfer& ChunkManager::create_transfer(const TransferId& id, const std::string& url, uint64_t total_length,
                                        uint64_t chunk_size, uint64_t now_tick) {
    Transfer transfer;
    transfer.id = id;
    transfer.url = url;
    transfer.total_length = total_length;
    transfer.last_progress_tick = now_tick;
    for (const auto& range : plan(total_length, chunk_size)) {
        Chunk chunk;
        chunk.range = range;
        transfer.chunks.push_back(std::move(chunk));
    }

    Logger::instance().debug("Transfer {} planned: {} bytes in {} chunks",
                             short_hex(id), total_length, transfer.chunks.size());

    auto& slot = impl_->transfers[id];
    slot = std::move(transfer);
    return slot;
}

Result<std::optional<Bytes>> ChunkManager::receive(const TransferId& id, size_t index, const Bytes& payload,
                                                   const ChunkHash& declared_hash, uint64_t now_tick,
                                                   const std::optional<DeviceId>& sender) {
    auto it = impl_->transfers.find(id);
    if (it == impl_->transfers.end() || index >= it->second.chunks.size()) {
        return ErrorCode::UnknownChunk;
    }
    Transfer& transfer = it->second;
    if (transfer.state == TransferState::Complete) {
        return ErrorCode::AlreadyComplete;
    }
    if (transfer.state == TransferState::Abandoned) {
        return ErrorCode::UnknownChunk;
    }

    Chunk& chunk = transfer.chunks[index];
    if (chunk.state == ChunkState::Received) {
        return Result<std::optional<Bytes>>(std::optional<Bytes>());
    }

    ChunkHash observed = hash_chunk(payload);
    chunk.expected_hash = declared_hash;
    chunk.observed_hash = observed;

    if (payload.size() != chunk.range.size() || !verify(declared_hash, observed)) {
        Logger::instance().warning("Integrity failure on transfer {} chunk {} [{}, {})",
                                   short_hex(id), index, chunk.range.start, chunk.range.end);
        if (!sender || !chunk.assignee || *chunk.assignee == *sender) {
            chunk.state = ChunkState::Unassigned;
            chunk.assignee.reset();
        }
        return ErrorCode::IntegrityFailure;
    }

    chunk.state = ChunkState::Received;
    chunk.data = payload;
    transfer.last_progress_tick = now_tick;
    if (transfer.state == TransferState::Planning) {
        transfer.state = TransferState::InProgress;
    }

    if (!transfer.all_received()) {
        return Result<std::optional<Bytes>>(std::optional<Bytes>());
    }

    Bytes body = reassemble(transfer);
    for (auto& c : transfer.chunks) {
        release_buffer(c);
    }
    transfer.state = TransferState::Complete;
    Logger::instance().info("Transfer {} complete ({} bytes)", short_hex(id), body.size());
    return Result<std::optional<Bytes>>(std::optional<Bytes>(std::move(body)));
}

Result<size_t> ChunkManager::locate(const TransferId& id, uint64_t start, uint64_t end) const {
    auto it = impl_->transfers.find(id);
    if (it == impl_->transfers.end()) {
        return ErrorCode::UnknownChunk;
    }
    const auto& chunks = it->second.chunks;
    auto pos = std::lower_bound(chunks.begin(), chunks.end(), start,
                                [](const Chunk& c, uint64_t value) { return c.range.start < value; });
    if (pos == chunks.end() || pos->range.start != start || pos->range.end != end) {
        return ErrorCode::UnknownChunk;
    }
    return static_cast<size_t>(pos - chunks.begin());
}

std::error_code ChunkManager::assign(const TransferId& id, size_t index, const DeviceId& fetcher) {
    auto it = impl_->transfers.find(id);
    if (it == impl_->transfers.end() || index >= it->second.chunks.size()) {
        return ErrorCode::UnknownChunk;
    }
    Transfer& transfer = it->second;
    if (!is_active(transfer.state)) {
        return ErrorCode::InvalidArgument;
    }
    Chunk& chunk = transfer.chunks[index];
    if (chunk.state == ChunkState::Received || chunk.state == ChunkState::Failed) {
        return ErrorCode::InvalidArgument;
    }
    chunk.assignee = fetcher;
    chunk.state = ChunkState::InFlight;
    transfer.state = TransferState::InProgress;
    return {};
}

std::error_code ChunkManager::release(const TransferId& id, size_t index) {
    Chunk* chunk = impl_->chunk_at(id, index);
    if (chunk == nullptr) {
        return ErrorCode::UnknownChunk;
    }
    if (chunk->state == ChunkState::Received) {
        return ErrorCode::InvalidArgument;
    }
    chunk->assignee.reset();
    if (chunk->state == ChunkState::InFlight) {
        chunk->state = ChunkState::Unassigned;
    }
    return {};
}

std::vector<TransferId> ChunkManager::expire_idle(uint64_t now_tick, uint64_t idle_ticks) {
    std::vector<TransferId> abandoned;
    for (auto it = impl_->transfers.begin(); it != impl_->transfers.end();) {
        Transfer& transfer = it->second;
        uint64_t idle = now_tick >= transfer.last_progress_tick ? now_tick - transfer.last_progress_tick : 0;
        if (idle < idle_ticks) {
            ++it;
            continue;
        }

        if (is_active(transfer.state)) {
            for (auto& chunk : transfer.chunks) {
                if (chunk.state != ChunkState::Received) {
                    chunk.state = ChunkState::Failed;
                    chunk.assignee.reset();
                }
                release_buffer(chunk);
            }
            transfer.state = TransferState::Abandoned;
            // Retention restarts so the abandoned record outlives this sweep
            transfer.last_progress_tick = now_tick;
            Logger::instance().info("Transfer {} abandoned after {} idle ticks", short_hex(transfer.id), idle);
            abandoned.push_back(transfer.id);
            ++it;
        } else {
            Logger::instance().debug("Reaping {} transfer {}", to_string(transfer.state), short_hex(transfer.id));
            it = impl_->transfers.erase(it);
        }
    }
    return abandoned;
}

Transfer* ChunkManager::find(const TransferId& id) {
    auto it = impl_->transfers.find(id);
    return it == impl_->transfers.end() ? nullptr : &it->second;
}

const Transfer* ChunkManager::find(const TransferId& id) const {
    auto it = impl_->transfers.find(id);
    return it == impl_->transfers.end() ? nullptr : &it->second;
}

std::vector<Transfer*> ChunkManager::active_transfers() {
    std::vector<Transfer*> out;
    for (auto& [id, transfer] : impl_->transfers) {
        if (is_active(transfer.state)) {
            out.push_back(&transfer);
        }
    }
    return out;
}

size_t ChunkManager::transfer_count() const {
    return impl_->transfers.size();
}

} // namespace peapod
