#ifndef PEAPOD_CRYPTO_IDENTITY_H
#define PEAPOD_CRYPTO_IDENTITY_H

#include "peapod/base/bytes.h"
#include "peapod/base/result.h"
#include <array>
#include <cstdint>

namespace peapod {

static constexpr size_t DEVICE_ID_SIZE = 16;
static constexpr size_t PUBLIC_KEY_SIZE = 32;
static constexpr size_t PRIVATE_KEY_SIZE = 32;
static constexpr size_t SESSION_KEY_SIZE = 32;
static constexpr size_t AEAD_NONCE_SIZE = 12;
static constexpr size_t AEAD_TAG_SIZE = 16;

using DeviceId = std::array<uint8_t, DEVICE_ID_SIZE>;
using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SessionKey = std::array<uint8_t, SESSION_KEY_SIZE>;

// Device ID: first 16 bytes of SHA-256(public key)
DeviceId device_id(const PublicKey& public_key);

// X25519 identity keypair. The private scalar never leaves this object except
// through private_bytes(), which exists so a host can persist its identity.
class Keypair {
public:
    // Fresh keypair from the system RNG. Throws PeaPodError(RngFailure) if the
    // RNG or key generation fails.
    static Keypair generate();

    // Restore a persisted keypair; InvalidArgument if the length is not 32.
    static Result<Keypair> from_private_bytes(const uint8_t* data, size_t size);

    Keypair(Keypair&& other) noexcept;
    Keypair& operator=(Keypair&& other) noexcept;
    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;
    ~Keypair();

    const PublicKey& public_key() const { return public_key_; }
    const DeviceId& device_id() const { return device_id_; }
    std::array<uint8_t, PRIVATE_KEY_SIZE> private_bytes() const { return secret_; }

private:
    Keypair() = default;

    friend Result<SessionKey> derive_session_key(const Keypair& mine, const uint8_t* peer_public, size_t size);

    std::array<uint8_t, PRIVATE_KEY_SIZE> secret_{};
    PublicKey public_key_{};
    DeviceId device_id_{};
};

// X25519 shared secret, then SHA-256("peapod-session-v1" || secret).
// Commutative: both ends derive the same key from swapped inputs.
// InvalidPeerKey on a wrong-length or degenerate peer key.
Result<SessionKey> derive_session_key(const Keypair& mine, const uint8_t* peer_public, size_t size);
Result<SessionKey> derive_session_key(const Keypair& mine, const PublicKey& peer_public);

// ChaCha20-Poly1305 with nonce = 4 zero bytes || counter (u64 LE).
// Output is ciphertext || 16-byte tag. The caller owns nonce discipline.
Bytes encrypt(const SessionKey& key, uint64_t nonce, const uint8_t* plaintext, size_t size);
Bytes encrypt(const SessionKey& key, uint64_t nonce, const Bytes& plaintext);

// AuthFailed on tag mismatch or truncated input; no partial plaintext is returned.
Result<Bytes> decrypt(const SessionKey& key, uint64_t nonce, const uint8_t* ciphertext, size_t size);
Result<Bytes> decrypt(const SessionKey& key, uint64_t nonce, const Bytes& ciphertext);

} // namespace peapod

#endif // PEAPOD_CRYPTO_IDENTITY_H
