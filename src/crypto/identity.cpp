#include "peapod/crypto/identity.h"
#include "peapod/base/logger.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cstring>
#include <memory>

namespace peapod {

namespace {

const char SESSION_KDF_LABEL[] = "peapod-session-v1";

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::array<uint8_t, AEAD_NONCE_SIZE> make_nonce(uint64_t counter) {
    std::array<uint8_t, AEAD_NONCE_SIZE> nonce{};
    for (size_t i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>(counter >> (8 * i));
    }
    return nonce;
}

PkeyPtr private_key_from(const uint8_t* secret) {
    return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secret, PRIVATE_KEY_SIZE));
}

CipherCtxPtr new_aead_context(const SessionKey& key, uint64_t counter, bool encrypting) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return nullptr;
    }
    auto nonce = make_nonce(counter);
    int ok = encrypting
        ? EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, key.data(), nonce.data())
        : EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, key.data(), nonce.data());
    if (ok != 1) {
        return nullptr;
    }
    return ctx;
}

} // anonymous namespace

DeviceId device_id(const PublicKey& public_key) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(public_key.data(), public_key.size(), digest);
    DeviceId id{};
    std::copy(digest, digest + DEVICE_ID_SIZE, id.begin());
    return id;
}

Keypair Keypair::generate() {
    Keypair kp;
    if (RAND_bytes(kp.secret_.data(), static_cast<int>(kp.secret_.size())) != 1) {
        Logger::instance().fatal("System RNG failed while generating identity key");
        throw PeaPodError(ErrorCode::RngFailure, "RAND_bytes failed");
    }

    PkeyPtr pkey = private_key_from(kp.secret_.data());
    size_t pub_len = kp.public_key_.size();
    if (!pkey || EVP_PKEY_get_raw_public_key(pkey.get(), kp.public_key_.data(), &pub_len) != 1 ||
        pub_len != PUBLIC_KEY_SIZE) {
        Logger::instance().fatal("X25519 key generation failed");
        throw PeaPodError(ErrorCode::RngFailure, "X25519 key generation failed");
    }

    kp.device_id_ = peapod::device_id(kp.public_key_);
    return kp;
}

Result<Keypair> Keypair::from_private_bytes(const uint8_t* data, size_t size) {
    if (data == nullptr || size != PRIVATE_KEY_SIZE) {
        return ErrorCode::InvalidArgument;
    }

    Keypair kp;
    std::memcpy(kp.secret_.data(), data, PRIVATE_KEY_SIZE);

    PkeyPtr pkey = private_key_from(kp.secret_.data());
    size_t pub_len = kp.public_key_.size();
    if (!pkey || EVP_PKEY_get_raw_public_key(pkey.get(), kp.public_key_.data(), &pub_len) != 1 ||
        pub_len != PUBLIC_KEY_SIZE) {
        return ErrorCode::InvalidArgument;
    }

    kp.device_id_ = peapod::device_id(kp.public_key_);
    return Result<Keypair>(std::move(kp));
}

Keypair::Keypair(Keypair&& other) noexcept
    : secret_(other.secret_), public_key_(other.public_key_), device_id_(other.device_id_) {
    OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
}

Keypair& Keypair::operator=(Keypair&& other) noexcept {
    if (this != &other) {
        secret_ = other.secret_;
        public_key_ = other.public_key_;
        device_id_ = other.device_id_;
        OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
    }
    return *this;
}

Keypair::~Keypair() {
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

Result<SessionKey> derive_session_key(const Keypair& mine, const uint8_t* peer_public, size_t size) {
    if (peer_public == nullptr || size != PUBLIC_KEY_SIZE) {
        return ErrorCode::InvalidPeerKey;
    }

    PkeyPtr own = private_key_from(mine.secret_.data());
    PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_public, size));
    if (!own || !peer) {
        return ErrorCode::InvalidPeerKey;
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own.get(), nullptr));
    std::array<uint8_t, 32> shared{};
    size_t shared_len = shared.size();
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1 ||
        EVP_PKEY_derive(ctx.get(), shared.data(), &shared_len) != 1 ||
        shared_len != shared.size()) {
        return ErrorCode::InvalidPeerKey;
    }

    // Low-order points produce an all-zero secret
    bool all_zero = std::all_of(shared.begin(), shared.end(), [](uint8_t b) { return b == 0; });
    if (all_zero) {
        return ErrorCode::InvalidPeerKey;
    }

    std::array<uint8_t, sizeof(SESSION_KDF_LABEL) - 1 + 32> kdf_input{};
    std::memcpy(kdf_input.data(), SESSION_KDF_LABEL, sizeof(SESSION_KDF_LABEL) - 1);
    std::memcpy(kdf_input.data() + sizeof(SESSION_KDF_LABEL) - 1, shared.data(), shared.size());

    SessionKey key{};
    SHA256(kdf_input.data(), kdf_input.size(), key.data());

    OPENSSL_cleanse(shared.data(), shared.size());
    OPENSSL_cleanse(kdf_input.data(), kdf_input.size());
    return key;
}

Result<SessionKey> derive_session_key(const Keypair& mine, const PublicKey& peer_public) {
    return derive_session_key(mine, peer_public.data(), peer_public.size());
}

Bytes encrypt(const SessionKey& key, uint64_t nonce, const uint8_t* plaintext, size_t size) {
    CipherCtxPtr ctx = new_aead_context(key, nonce, true);
    if (!ctx) {
        throw PeaPodError(ErrorCode::InternalError, "failed to initialise AEAD context");
    }

    Bytes out(size + AEAD_TAG_SIZE);
    int len = 0;
    int total = 0;
    if (size > 0 &&
        EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext, static_cast<int>(size)) != 1) {
        throw PeaPodError(ErrorCode::InternalError, "AEAD encryption failed");
    }
    total += len;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw PeaPodError(ErrorCode::InternalError, "AEAD finalisation failed");
    }
    total += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, AEAD_TAG_SIZE, out.data() + total) != 1) {
        throw PeaPodError(ErrorCode::InternalError, "AEAD tag extraction failed");
    }
    out.resize(static_cast<size_t>(total) + AEAD_TAG_SIZE);
    return out;
}

Bytes encrypt(const SessionKey& key, uint64_t nonce, const Bytes& plaintext) {
    return encrypt(key, nonce, plaintext.data(), plaintext.size());
}

Result<Bytes> decrypt(const SessionKey& key, uint64_t nonce, const uint8_t* ciphertext, size_t size) {
    if (ciphertext == nullptr || size < AEAD_TAG_SIZE) {
        return ErrorCode::AuthFailed;
    }

    CipherCtxPtr ctx = new_aead_context(key, nonce, false);
    if (!ctx) {
        return ErrorCode::AuthFailed;
    }

    size_t body_size = size - AEAD_TAG_SIZE;
    // Headroom so the final call always has a valid output pointer
    Bytes plain(body_size + AEAD_TAG_SIZE);
    int len = 0;
    int total = 0;
    if (body_size > 0 &&
        EVP_DecryptUpdate(ctx.get(), plain.data(), &len, ciphertext, static_cast<int>(body_size)) != 1) {
        OPENSSL_cleanse(plain.data(), plain.size());
        return ErrorCode::AuthFailed;
    }
    total += len;

    std::array<uint8_t, AEAD_TAG_SIZE> tag{};
    std::memcpy(tag.data(), ciphertext + body_size, AEAD_TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, AEAD_TAG_SIZE, tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &len) != 1) {
        OPENSSL_cleanse(plain.data(), plain.size());
        return ErrorCode::AuthFailed;
    }
    total += len;
    plain.resize(static_cast<size_t>(total));
    return plain;
}

Result<Bytes> decrypt(const SessionKey& key, uint64_t nonce, const Bytes& ciphertext) {
    return decrypt(key, nonce, ciphertext.data(), ciphertext.size());
}

} // namespace peapod
