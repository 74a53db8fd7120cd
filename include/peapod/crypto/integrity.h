#ifndef PEAPOD_CRYPTO_INTEGRITY_H
#define PEAPOD_CRYPTO_INTEGRITY_H

#include "peapod/base/bytes.h"
#include <array>
#include <cstdint>

namespace peapod {

static constexpr size_t CHUNK_HASH_SIZE = 32;

using ChunkHash = std::array<uint8_t, CHUNK_HASH_SIZE>;

// SHA-256 of a plaintext chunk payload. Computed before encryption on send
// and after decryption on receive.
ChunkHash hash_chunk(const uint8_t* data, size_t size);
ChunkHash hash_chunk(const Bytes& payload);

// Exact byte equality
bool verify(const ChunkHash& expected, const ChunkHash& actual);

// hash_chunk(payload) == expected
bool verify_chunk(const Bytes& payload, const ChunkHash& expected);

} // namespace peapod

#endif // PEAPOD_CRYPTO_INTEGRITY_H
