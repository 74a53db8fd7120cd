#include "peapod/crypto/integrity.h"
#include <algorithm>
#include <iterator>

#include <elio/hash/sha256.hpp>

namespace peapod {

ChunkHash hash_chunk(const uint8_t* data, size_t size) {
    auto digest = elio::hash::sha256(data, size);
    ChunkHash out{};
    std::copy(std::begin(digest), std::end(digest), out.begin());
    return out;
}

ChunkHash hash_chunk(const Bytes& payload) {
    return hash_chunk(payload.data(), payload.size());
}

bool verify(const ChunkHash& expected, const ChunkHash& actual) {
    return expected == actual;
}

bool verify_chunk(const Bytes& payload, const ChunkHash& expected) {
    return verify(expected, hash_chunk(payload));
}

} // namespace peapod
