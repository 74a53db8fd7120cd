#include "peapod/transfer/scheduler.h"
#include "peapod/base/logger.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace peapod {

namespace {

std::vector<size_t> round_robin(size_t count, size_t workers) {
    std::vector<size_t> order(count);
    for (size_t i = 0; i < count; ++i) {
        order[i] = i % workers;
    }
    return order;
}

// Largest-remainder apportionment of count chunks by weight
std::vector<size_t> quotas(size_t count, const std::vector<double>& weights) {
    size_t n = weights.size();
    std::vector<size_t> quota(n, 0);
    size_t to_share = count;
    if (count >= n) {
        std::fill(quota.begin(), quota.end(), 1);
        to_share = count - n;
    }

    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    std::vector<std::pair<double, size_t>> remainders;
    size_t given = 0;
    for (size_t i = 0; i < n; ++i) {
        double exact = static_cast<double>(to_share) * weights[i] / total;
        size_t base = static_cast<size_t>(std::floor(exact));
        quota[i] += base;
        given += base;
        remainders.emplace_back(exact - static_cast<double>(base), i);
    }

    std::stable_sort(remainders.begin(), remainders.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    for (size_t k = 0; given < to_share; ++k, ++given) {
        quota[remainders[k % n].second] += 1;
    }
    return quota;
}

// Smooth weighted round-robin over exact quotas; ties go to the earlier worker
std::vector<size_t> interleave(const std::vector<size_t>& quota, size_t count) {
    std::vector<long long> current(quota.size(), 0);
    std::vector<size_t> order;
    order.reserve(count);
    for (size_t step = 0; step < count; ++step) {
        size_t best = 0;
        for (size_t i = 0; i < quota.size(); ++i) {
            current[i] += static_cast<long long>(quota[i]);
            if (current[i] > current[best]) {
                best = i;
            }
        }
        current[best] -= static_cast<long long>(count);
        order.push_back(best);
    }
    return order;
}

} // anonymous namespace

Scheduler::Scheduler(uint32_t max_integrity_failures)
    : max_integrity_failures_(max_integrity_failures == 0 ? DEFAULT_MAX_INTEGRITY_FAILURES
                                                          : max_integrity_failures) {}

std::vector<size_t> Scheduler::distribution(size_t count, const std::vector<DeviceId>& workers) const {
    if (workers.empty() || count == 0) {
        return {};
    }

    std::vector<double> reported;
    std::vector<std::optional<double>> bandwidth(workers.size());
    for (size_t i = 0; i < workers.size(); ++i) {
        auto it = metrics_.find(workers[i]);
        if (it != metrics_.end() && it->second.bandwidth_bps && *it->second.bandwidth_bps > 0.0) {
            bandwidth[i] = *it->second.bandwidth_bps;
            reported.push_back(*it->second.bandwidth_bps);
        }
    }
    if (reported.empty()) {
        return round_robin(count, workers.size());
    }

    // Huge reports would overflow the sums; weigh relative to the fastest then
    double scale = 1.0;
    double sum = std::accumulate(reported.begin(), reported.end(), 0.0);
    if (!std::isfinite(sum * static_cast<double>(workers.size()))) {
        scale = *std::max_element(reported.begin(), reported.end());
    }
    double mean = 0.0;
    for (double bps : reported) {
        mean += bps / scale;
    }
    mean /= static_cast<double>(reported.size());
    std::vector<double> weights(workers.size());
    for (size_t i = 0; i < workers.size(); ++i) {
        weights[i] = bandwidth[i] ? *bandwidth[i] / scale : mean;
    }
    return interleave(quotas(count, weights), count);
}

std::vector<Assignment> Scheduler::deal(ChunkManager& chunks, const TransferId& id, const std::vector<size_t>& indices,
                                        const std::vector<DeviceId>& workers, bool weighted) {
    std::vector<Assignment> out;
    if (workers.empty() || indices.empty()) {
        return out;
    }
    const Transfer* transfer = chunks.find(id);
    if (transfer == nullptr) {
        return out;
    }

    std::vector<size_t> order = weighted ? distribution(indices.size(), workers)
                                         : round_robin(indices.size(), workers.size());
    out.reserve(indices.size());
    for (size_t k = 0; k < indices.size(); ++k) {
        const DeviceId& fetcher = workers[order[k]];
        if (chunks.assign(id, indices[k], fetcher)) {
            continue;
        }
        out.push_back({indices[k], transfer->chunks[indices[k]].range, fetcher});
    }
    return out;
}

std::vector<Assignment> Scheduler::assign(ChunkManager& chunks, const TransferId& id,
                                          const std::vector<DeviceId>& workers) {
    const Transfer* transfer = chunks.find(id);
    if (transfer == nullptr) {
        return {};
    }
    std::vector<size_t> pending;
    for (size_t i = 0; i < transfer->chunks.size(); ++i) {
        if (transfer->chunks[i].state == ChunkState::Unassigned) {
            pending.push_back(i);
        }
    }
    return deal(chunks, id, pending, workers, true);
}

std::vector<std::pair<TransferId, Assignment>> Scheduler::on_peer_left(ChunkManager& chunks, const DeviceId& peer,
                                                                       const std::vector<DeviceId>& workers) {
    std::vector<std::pair<TransferId, Assignment>> out;
    for (Transfer* transfer : chunks.active_transfers()) {
        std::vector<size_t> orphaned;
        for (size_t i = 0; i < transfer->chunks.size(); ++i) {
            const Chunk& chunk = transfer->chunks[i];
            if (chunk.assignee == peer && chunk.state != ChunkState::Received) {
                orphaned.push_back(i);
            }
        }
        for (size_t index : orphaned) {
            if (auto ec = chunks.release(transfer->id, index)) {
                Logger::instance().warning("Cannot release chunk {}: {}", index, ec.message());
            }
        }
        if (!orphaned.empty()) {
            Logger::instance().debug("Redistributing {} chunks of transfer {} from {}",
                                     orphaned.size(), short_hex(transfer->id), short_hex(peer));
        }
        for (auto& assignment : deal(chunks, transfer->id, orphaned, workers, false)) {
            out.emplace_back(transfer->id, assignment);
        }
    }
    return out;
}

std::optional<Assignment> Scheduler::reassign(ChunkManager& chunks, const TransferId& id, size_t index,
                                              const std::vector<DeviceId>& workers, const DeviceId& avoid) {
    const Transfer* transfer = chunks.find(id);
    if (transfer == nullptr || index >= transfer->chunks.size() || workers.empty()) {
        return std::nullopt;
    }

    std::vector<DeviceId> candidates;
    std::copy_if(workers.begin(), workers.end(), std::back_inserter(candidates),
                 [&avoid](const DeviceId& w) { return w != avoid; });
    if (candidates.empty()) {
        candidates = workers;
    }

    const DeviceId& fetcher = candidates[index % candidates.size()];
    if (chunks.assign(id, index, fetcher)) {
        return std::nullopt;
    }
    return Assignment{index, transfer->chunks[index].range, fetcher};
}

bool Scheduler::record_integrity_failure(const DeviceId& peer) {
    Record& record = records_[peer];
    record.consecutive_failures += 1;
    if (!record.isolated && record.consecutive_failures >= max_integrity_failures_) {
        record.isolated = true;
        Logger::instance().warning("Peer {} isolated after {} consecutive integrity failures",
                                   short_hex(peer), record.consecutive_failures);
        return true;
    }
    return false;
}

void Scheduler::record_success(const DeviceId& peer) {
    auto it = records_.find(peer);
    if (it != records_.end()) {
        it->second.consecutive_failures = 0;
    }
}

void Scheduler::clear(const DeviceId& peer) {
    records_.erase(peer);
}

bool Scheduler::is_isolated(const DeviceId& peer) const {
    auto it = records_.find(peer);
    return it != records_.end() && it->second.isolated;
}

uint32_t Scheduler::failure_count(const DeviceId& peer) const {
    auto it = records_.find(peer);
    return it == records_.end() ? 0 : it->second.consecutive_failures;
}

void Scheduler::set_metrics(const DeviceId& peer, const PeerMetrics& metrics) {
    PeerMetrics accepted = metrics;
    if (accepted.bandwidth_bps && !(std::isfinite(*accepted.bandwidth_bps) && *accepted.bandwidth_bps > 0.0)) {
        Logger::instance().warning("Ignoring bandwidth {} reported for {}", *accepted.bandwidth_bps, short_hex(peer));
        accepted.bandwidth_bps.reset();
    }
    if (accepted.latency_ms && !(std::isfinite(*accepted.latency_ms) && *accepted.latency_ms >= 0.0)) {
        Logger::instance().warning("Ignoring latency {} reported for {}", *accepted.latency_ms, short_hex(peer));
        accepted.latency_ms.reset();
    }
    metrics_[peer] = accepted;
}

void Scheduler::remove_metrics(const DeviceId& peer) {
    metrics_.erase(peer);
}

} // namespace peapod
