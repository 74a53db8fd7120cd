#include <cstdint>
#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "peapod/base/bytes.h"
#include "peapod/base/config.h"
#include "peapod/base/logger.h"
#include "peapod/core/coordinator.h"
#include "peapod/wire/handshake.h"

using namespace peapod;

namespace {

const char* VERSION = "0.1.0";

// Read a hex private key written by a previous run
std::optional<Keypair> load_identity(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        Logger::instance().error("Cannot open identity key file: " + path);
        return std::nullopt;
    }
    std::string text;
    std::getline(file, text);
    auto raw = from_hex(text);
    if (!raw) {
        Logger::instance().error("Identity key file is not valid hex: " + path);
        return std::nullopt;
    }
    auto keypair = Keypair::from_private_bytes(raw->data(), raw->size());
    if (!keypair) {
        Logger::instance().error("Identity key file does not hold a 32-byte key: " + path);
        return std::nullopt;
    }
    return std::move(keypair).value();
}

// In-memory pod: every coordinator is wired to every other one and frames are
// delivered through a FIFO queue, so each direction keeps its nonce order.
class PodSimulation {
public:
    PodSimulation(const CoreConfig& config, std::optional<Keypair> origin_identity, uint32_t peers)
        : config_(config) {
        nodes_.push_back(std::make_unique<Coordinator>(config, std::move(origin_identity)));
        for (uint32_t i = 0; i < peers; ++i) {
            nodes_.push_back(std::make_unique<Coordinator>(config));
        }
    }

    bool connect_all() {
        for (size_t a = 0; a < nodes_.size(); ++a) {
            for (size_t b = 0; b < nodes_.size(); ++b) {
                if (a == b) continue;
                auto hs = nodes_[b]->handshake_bytes();
                auto parsed = parse_handshake(hs.data(), hs.size());
                if (!parsed) {
                    Logger::instance().error("Handshake from node {} rejected: {}", b, to_string(parsed.error()));
                    return false;
                }
                if (auto ec = nodes_[a]->on_peer_joined(parsed->device_id, parsed->public_key)) {
                    Logger::instance().error("Node {} refused node {}: {}", a, b, ec.message());
                    return false;
                }
            }
        }
        return true;
    }

    bool run_transfer(uint64_t size, bool drop_peer) {
        body_.resize(static_cast<size_t>(size));
        for (size_t i = 0; i < body_.size(); ++i) {
            body_[i] = static_cast<uint8_t>((i * 31 + 7) & 0xff);
        }

        IncomingRequest request;
        request.url = "http://origin.local/simulated.bin";
        request.range = HttpRange{0, size - 1};

        auto decision = nodes_[0]->on_incoming_request(request);
        const auto* accelerate = std::get_if<Accelerate>(&decision);
        if (accelerate == nullptr) {
            std::cout << "Request fell back to the direct path" << std::endl;
            return false;
        }
        std::cout << "Transfer " << to_hex(accelerate->transfer_id) << ": " << accelerate->plan.size()
                  << " chunks over " << nodes_.size() << " devices" << std::endl;

        for (const auto& action : accelerate->actions) {
            queue_.push_back({0, action});
        }

        if (drop_peer && nodes_.size() > 1) {
            dropped_.insert(1);
            std::cout << "Dropping device " << short_hex(nodes_[1]->device_id()) << " mid-transfer" << std::endl;
            enqueue(0, nodes_[0]->on_peer_left(nodes_[1]->device_id()));
        }

        for (uint32_t round = 0; round < 2 * config_.heartbeat_timeout_ticks + 4 && !completed_; ++round) {
            pump();
            if (completed_) break;
            for (size_t i = 0; i < nodes_.size(); ++i) {
                if (!dropped_.count(i)) {
                    enqueue(i, nodes_[i]->tick());
                }
            }
        }
        pump();

        if (!completed_) {
            std::cout << "Transfer did not complete" << std::endl;
            return false;
        }
        bool intact = *completed_ == body_;
        std::cout << "Reassembled " << completed_->size() << " bytes, "
                  << (intact ? "verified" : "MISMATCH") << std::endl;
        return intact;
    }

private:
    struct Pending {
        size_t from;
        Action action;
    };

    void enqueue(size_t from, Actions actions) {
        for (auto& action : actions) {
            queue_.push_back({from, std::move(action)});
        }
    }

    size_t index_of(const DeviceId& id) const {
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (nodes_[i]->device_id() == id) return i;
        }
        return nodes_.size();
    }

    void pump() {
        while (!queue_.empty()) {
            Pending item = std::move(queue_.front());
            queue_.pop_front();
            if (dropped_.count(item.from)) continue;

            if (auto* send = std::get_if<SendMessage>(&item.action)) {
                deliver(item.from, *send);
            } else if (auto* fetch = std::get_if<FetchChunk>(&item.action)) {
                fetch_origin(item.from, *fetch);
            } else if (auto* abandoned = std::get_if<TransferAbandoned>(&item.action)) {
                Logger::instance().warning("Transfer {} abandoned", short_hex(abandoned->transfer_id));
            }
        }
    }

    void deliver(size_t from, const SendMessage& send) {
        size_t to = index_of(send.peer);
        if (to >= nodes_.size() || dropped_.count(to)) return;

        auto outcome = nodes_[to]->on_message_received(nodes_[from]->device_id(), send.frame);
        if (!outcome) {
            Logger::instance().warning("Node {} dropped a frame from node {}: {}", to, from,
                                       to_string(outcome.error()));
            return;
        }
        if (outcome->completed) {
            completed_ = std::move(outcome->completed->body);
        }
        enqueue(to, std::move(outcome->actions));
    }

    // Stand-in for the host's HTTP range fetch
    void fetch_origin(size_t from, const FetchChunk& fetch) {
        Bytes payload(body_.begin() + static_cast<std::ptrdiff_t>(fetch.start),
                      body_.begin() + static_cast<std::ptrdiff_t>(fetch.end));
        Coordinator& node = *nodes_[from];

        if (fetch.for_peer) {
            auto sent = node.serve_chunk(*fetch.for_peer, fetch.transfer_id, fetch.start, fetch.end, payload);
            if (!sent) {
                Logger::instance().warning("Node {} cannot serve chunk: {}", from, to_string(sent.error()));
                return;
            }
            queue_.push_back({from, std::move(sent).value()});
            return;
        }

        auto result = node.on_chunk_received(fetch.transfer_id, fetch.start, fetch.end, hash_chunk(payload), payload);
        if (!result) {
            Logger::instance().warning("Own chunk rejected: {}", to_string(result.error()));
            return;
        }
        if (result->has_value()) {
            completed_ = std::move(**result);
        }
    }

    CoreConfig config_;
    std::vector<std::unique_ptr<Coordinator>> nodes_;
    std::deque<Pending> queue_;
    std::set<size_t> dropped_;
    Bytes body_;
    std::optional<Bytes> completed_;
};

class PeaPodApplication {
public:
    // Returns false for --help/--version or bad options
    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            Logger::instance().error("Invalid configuration");
            return false;
        }
        Config::instance().print();
        return true;
    }

    int run() {
        const auto& config = Config::instance().get();
        std::optional<Keypair> identity;
        if (!config.node.identity_key_file.empty()) {
            identity = load_identity(config.node.identity_key_file);
            if (!identity) {
                return 1;
            }
        }

        const auto& tool = Config::instance().tool();
        if (tool.simulate_peers > 0) {
            return simulate(config.core, std::move(identity), tool);
        }

        Coordinator core(config.core, std::move(identity));
        std::cout << "Device ID:   " << to_hex(core.device_id()) << std::endl;
        std::cout << "Public key:  " << to_hex(core.public_key()) << std::endl;
        std::cout << "Handshake:   " << to_hex(core.handshake_bytes()) << std::endl;
        std::cout << "Beacon:      " << to_hex(core.beacon_frame(config.node.transport_port)) << std::endl;
        std::cout << "Discovery on UDP " << config.node.discovery_port << ", transport on TCP "
                  << config.node.transport_port << ", proxy on " << config.node.proxy_port << std::endl;
        return 0;
    }

private:
    int simulate(const CoreConfig& core, std::optional<Keypair> identity, const ToolOptions& tool) {
        if (tool.simulate_size == 0) {
            Logger::instance().error("--size must be positive");
            return 1;
        }
        PodSimulation pod(core, std::move(identity), tool.simulate_peers);
        if (!pod.connect_all()) {
            return 1;
        }
        return pod.run_transfer(tool.simulate_size, tool.drop_peer) ? 0 : 1;
    }
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    bool info_only = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h" || arg == "--version" || arg == "-v") {
            info_only = true;
        }
    }

    std::cout << "PeaPod - local peer-assisted download acceleration" << std::endl;
    std::cout << "Version: " << VERSION << std::endl;

    try {
        PeaPodApplication app;
        if (!app.initialize(argc, argv)) {
            // CLI11 already printed help, version or the parse error
            return info_only ? 0 : 1;
        }
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
