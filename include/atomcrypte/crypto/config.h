/**
 * @file config.h
 * @brief Per-operation configuration and key material
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_CONFIG_H
#define ATOMCRYPTE_CRYPTO_CONFIG_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/thread_strategy.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace atomcrypte {

enum class KeyLength : uint16_t {
    Bits256 = 256,
    Bits512 = 512
};

enum class Profile : uint8_t {
    Standard = 0,  ///< 256-bit key, 4 rounds
    Secure = 1,    ///< 512-bit key, 6 rounds
    Max = 2,       ///< 512-bit key, 12 rounds
    Custom = 3     ///< caller-chosen key length and rounds
};

/**
 * @brief What the S-box permutation is seeded from
 */
enum class SboxSource : uint8_t {
    PasswordDerived = 0,  ///< derived master key only
    NonceDerived = 1,     ///< nonce only
    Combined = 2          ///< nonce || derived master key
};

/**
 * @brief Output shape: caller-managed metadata or one self-describing blob
 */
enum class OutputShape : uint8_t {
    Detached = 0,  ///< [ciphertext][tag]; salt, nonce and version kept by the caller
    Wrapped = 1    ///< [version][params][salt][nonce][ciphertext][tag]...
};

constexpr uint32_t KDF_COST_DEFAULT = 15;
constexpr uint32_t KDF_COST_MIN = 4;
constexpr uint32_t KDF_COST_MAX = 20;

inline size_t key_bytes(KeyLength length) noexcept {
    return static_cast<size_t>(length) / 8;
}

const char* to_string(KeyLength length) noexcept;
const char* to_string(Profile profile) noexcept;
const char* to_string(SboxSource source) noexcept;

/**
 * @brief Immutable per-operation parameters
 *
 * Build with from_profile() and the with_* modifiers; each modifier returns
 * a modified copy. Changing key length or rounds moves the profile to Custom.
 */
struct Config {
    KeyLength key_length = KeyLength::Bits256;
    uint32_t rounds = 4;
    Profile profile = Profile::Standard;
    ThreadStrategy thread_strategy = ThreadStrategy::automatic();
    SboxSource sbox_source = SboxSource::Combined;
    OutputShape output_shape = OutputShape::Detached;
    bool recovery_key = false;
    bool dummy_data = false;
    bool benchmark = false;
    uint32_t kdf_cost = KDF_COST_DEFAULT;  ///< log2 of the scrypt work factor

    static Config from_profile(Profile profile);

    Config with_key_length(KeyLength length) const;
    Config with_rounds(uint32_t count) const;
    Config with_threads(ThreadStrategy strategy) const;
    Config with_sbox(SboxSource source) const;
    Config with_output_shape(OutputShape shape) const;
    Config with_recovery_key(bool enabled) const;
    Config with_dummy_data(bool enabled) const;
    Config with_benchmark(bool enabled) const;
    Config with_kdf_cost(uint32_t cost) const;

    size_t key_size() const noexcept { return key_bytes(key_length); }

    /**
     * @throws CryptoError(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG)
     */
    void validate() const;

    /**
     * @brief Parse a profile name: standard, secure, max or custom
     */
    static Profile parse_profile(const std::string& name);

    static SboxSource parse_sbox(const std::string& name);
};

/**
 * @brief Password, optional salt and nonce for one operation
 *
 * The salt defaults to the nonce. Nonce reuse under one password repeats
 * the keystream; the engine does not detect it.
 */
struct KeyMaterial {
    SecureBytes password;
    std::optional<ByteVec> salt;
    ByteVec nonce;

    KeyMaterial() = default;
    KeyMaterial(SecureBytes pw, ByteVec nonce_bytes, std::optional<ByteVec> salt_bytes = std::nullopt)
        : password(std::move(pw)), salt(std::move(salt_bytes)), nonce(std::move(nonce_bytes)) {}

    static KeyMaterial from_password(const std::string& password, ByteVec nonce,
                                     std::optional<ByteVec> salt = std::nullopt);

    const ByteVec& effective_salt() const noexcept { return salt ? *salt : nonce; }

    /**
     * @throws CryptoError(ATOMCRYPTE_ERROR_WEAK_INPUT) for an empty password
     * @throws CryptoError(ATOMCRYPTE_ERROR_INVALID_LENGTH) for nonce or salt outside 8..64 bytes
     */
    void validate() const;

    /**
     * @brief Password-only check, used when nonce and salt come from a wrapped header
     */
    void validate_password() const;
};

/**
 * @brief Length check shared by nonce and salt validation
 */
void check_nonce_length(size_t len, const char* what);

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_CONFIG_H
