/**
 * @file recovery.h
 * @brief Salt-independent recovery key and master-key escrow block
 *
 * The recovery key depends only on (password, nonce): its scrypt salt is
 * BLAKE2b-512("atomcrypte.recovery-salt" || nonce). At encryption time the
 * master key is sealed under the recovery key into a recovery block; a
 * caller that lost the salt can open the block and decrypt.
 *
 * Block layout: u8 key_len || wrapped key (key_len) || seal tag (32)
 *
 * Recovery keys are never cached.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_RECOVERY_H
#define ATOMCRYPTE_CRYPTO_RECOVERY_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"

#include <cstdint>

namespace atomcrypte {

constexpr size_t RECOVERY_SEAL_SIZE = 32;

class RecoveryKeyDeriver {
public:
    /**
     * @brief Derive the recovery key (same size as the master key)
     * @throws CryptoError WEAK_INPUT / INVALID_LENGTH as KeyDerivation::derive
     */
    static SecureBytes derive_recovery(const SecureBytes& password, const ByteVec& nonce,
                                       KeyLength key_length,
                                       uint32_t kdf_cost = KDF_COST_DEFAULT);

    /**
     * @brief Seal the master key under the recovery key
     */
    static ByteVec seal_master_key(const SecureBytes& master_key,
                                   const SecureBytes& recovery_key, const ByteVec& nonce);

    /**
     * @brief Open a recovery block
     * @throws CryptoError MALFORMED_INPUT for a structurally bad block,
     *         MAC_MISMATCH when the seal does not verify
     */
    static SecureBytes open_master_key(const ByteVec& block,
                                       const SecureBytes& recovery_key, const ByteVec& nonce);

    static size_t block_size(KeyLength key_length) noexcept {
        return 1 + key_bytes(key_length) + RECOVERY_SEAL_SIZE;
    }
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_RECOVERY_H
