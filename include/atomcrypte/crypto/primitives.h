/**
 * @file primitives.h
 * @brief OpenSSL EVP-backed building blocks
 *
 * Thin RAII wrappers over libcrypto used by every engine component:
 * - Blake2b: unkeyed BLAKE2b-512 (EVP_MD)
 * - Blake2bMac: keyed BLAKE2b with 1..64 byte output (EVP_MAC "BLAKE2BMAC")
 * - HmacSha3_512: HMAC over SHA3-512 (EVP_MAC "HMAC")
 * - scrypt: memory-hard password hash (EVP_PBE_scrypt)
 * - ChaCha20Keystream: raw ChaCha20 keystream (EVP_chacha20)
 *
 * All failures throw CryptoError(ATOMCRYPTE_ERROR_INTERNAL) carrying the
 * OpenSSL error string.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_PRIMITIVES_H
#define ATOMCRYPTE_CRYPTO_PRIMITIVES_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include <openssl/types.h>

namespace atomcrypte {
namespace primitives {

constexpr size_t BLAKE2B_OUTPUT_SIZE = 64;
constexpr size_t BLAKE2B_MAX_KEY_SIZE = 64;
constexpr size_t HMAC_SHA3_512_SIZE = 64;
constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_IV_SIZE = 16;  ///< 32-bit LE counter || 96-bit nonce

/**
 * @brief Common update surface for the streaming hash wrappers
 */
template<typename Derived>
class Absorber {
public:
    Derived& update(const ByteVec& data) {
        return self().update(data.data(), data.size());
    }

    Derived& update(const SecureBytes& data) {
        return self().update(data.data(), data.size());
    }

    Derived& update(const std::string& label) {
        return self().update(reinterpret_cast<const uint8_t*>(label.data()), label.size());
    }

    Derived& update_u8(uint8_t v) {
        return self().update(&v, 1);
    }

    Derived& update_u16(uint16_t v);
    Derived& update_u32(uint32_t v);
    Derived& update_u64(uint64_t v);

private:
    Derived& self() { return static_cast<Derived&>(*this); }
};

/**
 * @brief Streaming unkeyed BLAKE2b-512
 */
class Blake2b : public Absorber<Blake2b> {
public:
    using Absorber<Blake2b>::update;

    Blake2b();
    ~Blake2b();

    Blake2b(const Blake2b&) = delete;
    Blake2b& operator=(const Blake2b&) = delete;

    Blake2b& update(const uint8_t* data, size_t len);

    /**
     * @brief Finish; the object cannot be updated afterwards
     */
    Blake2b512Digest finish();

    static Blake2b512Digest digest(const uint8_t* data, size_t len);

private:
    EVP_MD_CTX* ctx_;
};

/**
 * @brief Streaming keyed BLAKE2b (RFC 7693 keyed mode)
 *
 * Key length must be 1..64 bytes; output length 1..64 bytes.
 */
class Blake2bMac : public Absorber<Blake2bMac> {
public:
    using Absorber<Blake2bMac>::update;

    Blake2bMac(const uint8_t* key, size_t key_len, size_t output_len);
    Blake2bMac(const SecureBytes& key, size_t output_len)
        : Blake2bMac(key.data(), key.size(), output_len) {}
    Blake2bMac(const ByteVec& key, size_t output_len)
        : Blake2bMac(key.data(), key.size(), output_len) {}
    ~Blake2bMac();

    Blake2bMac(const Blake2bMac&) = delete;
    Blake2bMac& operator=(const Blake2bMac&) = delete;

    Blake2bMac& update(const uint8_t* data, size_t len);

    void finish(uint8_t* out);
    SecureBytes finish_secure();
    ByteVec finish_vec();

    size_t output_size() const noexcept { return output_len_; }

private:
    EVP_MAC_CTX* ctx_;
    size_t output_len_;
};

/**
 * @brief Streaming HMAC-SHA3-512
 */
class HmacSha3_512 : public Absorber<HmacSha3_512> {
public:
    using Absorber<HmacSha3_512>::update;

    HmacSha3_512(const uint8_t* key, size_t key_len);
    explicit HmacSha3_512(const SecureBytes& key)
        : HmacSha3_512(key.data(), key.size()) {}
    ~HmacSha3_512();

    HmacSha3_512(const HmacSha3_512&) = delete;
    HmacSha3_512& operator=(const HmacSha3_512&) = delete;

    HmacSha3_512& update(const uint8_t* data, size_t len);

    MacTag finish();

private:
    EVP_MAC_CTX* ctx_;
};

/**
 * @brief scrypt(password, salt, N = 2^log2_n, r = 8, p = 1)
 */
void scrypt(const uint8_t* password, size_t password_len,
            const uint8_t* salt, size_t salt_len,
            uint32_t log2_n, uint8_t* out, size_t out_len);

/**
 * @brief Reusable ChaCha20 keystream generator (one per worker)
 */
class ChaCha20Keystream {
public:
    ChaCha20Keystream();
    ~ChaCha20Keystream();

    ChaCha20Keystream(const ChaCha20Keystream&) = delete;
    ChaCha20Keystream& operator=(const ChaCha20Keystream&) = delete;

    /**
     * @brief Write len keystream bytes for (key, iv) starting at block 0 of iv
     */
    void generate(const uint8_t key[CHACHA20_KEY_SIZE],
                  const uint8_t iv[CHACHA20_IV_SIZE],
                  uint8_t* out, size_t len);

private:
    EVP_CIPHER_CTX* ctx_;
};

// ============================================================================
// Absorber integer helpers (little-endian encoding)
// ============================================================================

template<typename Derived>
Derived& Absorber<Derived>::update_u16(uint16_t v) {
    uint8_t b[2] = {static_cast<uint8_t>(v), static_cast<uint8_t>(v >> 8)};
    return self().update(b, sizeof(b));
}

template<typename Derived>
Derived& Absorber<Derived>::update_u32(uint32_t v) {
    uint8_t b[4];
    for (int i = 0; i < 4; i++) b[i] = static_cast<uint8_t>(v >> (8 * i));
    return self().update(b, sizeof(b));
}

template<typename Derived>
Derived& Absorber<Derived>::update_u64(uint64_t v) {
    uint8_t b[8];
    for (int i = 0; i < 8; i++) b[i] = static_cast<uint8_t>(v >> (8 * i));
    return self().update(b, sizeof(b));
}

} // namespace primitives
} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_PRIMITIVES_H
