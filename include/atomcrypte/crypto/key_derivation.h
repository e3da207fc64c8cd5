/**
 * @file key_derivation.h
 * @brief Password to master key derivation and subkey schedule
 *
 * master = BLAKE2b-MAC(key = nonce,
 *                      "atomcrypte.master-key" || scrypt(password, salt, 2^cost, 8, 1))
 *
 * The master key never feeds the transform or MAC directly; both use
 * domain-separated subkeys from derive_subkeys().
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_KEY_DERIVATION_H
#define ATOMCRYPTE_CRYPTO_KEY_DERIVATION_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"

#include <cstdint>
#include <string>

namespace atomcrypte {

/// Size of the scrypt intermediate fed to the extract step
constexpr size_t KDF_INTERMEDIATE_SIZE = 64;

/// Size of the MAC subkey
constexpr size_t MAC_KEY_SIZE = 64;

/**
 * @brief Transform and MAC keys derived from one master key
 */
struct SessionKeys {
    SecureBytes transform_key;  ///< key_length / 8 bytes
    SecureBytes mac_key;        ///< MAC_KEY_SIZE bytes
};

class KeyDerivation {
public:
    /**
     * @brief Derive the master key
     *
     * @param password Non-empty password
     * @param salt scrypt salt (KeyMaterial::effective_salt())
     * @param nonce 8..64 bytes, keys the extract step
     * @param key_bits 256 or 512
     * @param kdf_cost log2 of the scrypt work factor
     * @throws CryptoError WEAK_INPUT for an empty password, INVALID_LENGTH for
     *         key_bits outside {256, 512} or a bad nonce/salt length
     */
    static SecureBytes derive(const SecureBytes& password, const ByteVec& salt,
                              const ByteVec& nonce, uint32_t key_bits,
                              uint32_t kdf_cost = KDF_COST_DEFAULT);

    static SecureBytes derive(const KeyMaterial& material, KeyLength key_length,
                              uint32_t kdf_cost = KDF_COST_DEFAULT);

    /**
     * @brief scrypt + nonce-keyed extract under an arbitrary domain label
     *
     * Shared by the master key and the recovery key.
     */
    static SecureBytes derive_labeled(const std::string& label,
                                      const SecureBytes& password, const ByteVec& salt,
                                      const ByteVec& nonce, size_t out_len,
                                      uint32_t kdf_cost);

    static SessionKeys derive_subkeys(const SecureBytes& master_key);

    /**
     * @throws CryptoError(ATOMCRYPTE_ERROR_INVALID_LENGTH) for key_bits outside {256, 512}
     */
    static size_t key_size_for_bits(uint32_t key_bits);
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_KEY_DERIVATION_H
