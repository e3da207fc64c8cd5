/**
 * @file nonce.h
 * @brief Nonce and salt generators
 *
 * Every generator returns len bytes (8..64) and mixes in fresh CSPRNG
 * output, so two calls never repeat in practice. Uniqueness per password is
 * still the caller's responsibility; the engine does not detect reuse.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_NONCE_H
#define ATOMCRYPTE_CRYPTO_NONCE_H

#include "atomcrypte/core/common.h"
#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"

#include <string>

namespace atomcrypte {
namespace nonce {

/**
 * @brief Plain CSPRNG bytes
 * @throws CryptoError(ATOMCRYPTE_ERROR_INVALID_LENGTH) for len outside 8..64
 */
ByteVec random(size_t len = ATOMCRYPTE_NONCE_DEFAULT_SIZE);

/**
 * @brief CSPRNG bytes re-hashed with BLAKE2b a random number (1..16) of times
 */
ByteVec hashed(size_t len = ATOMCRYPTE_NONCE_DEFAULT_SIZE);

/**
 * @brief BLAKE2b(tag || random bytes), truncated to len
 */
ByteVec tagged(const std::string& tag, size_t len = ATOMCRYPTE_NONCE_DEFAULT_SIZE);

/**
 * @brief BLAKE2b(machine identity || random bytes), truncated to len
 */
ByteVec machine(size_t len = ATOMCRYPTE_NONCE_DEFAULT_SIZE);

/**
 * @brief Random salt for KeyMaterial::salt
 */
ByteVec salt(size_t len = ATOMCRYPTE_NONCE_DEFAULT_SIZE);

/**
 * @brief "user|host|os" for the current process
 */
std::string machine_identity();

/**
 * @brief Bind a password to the current user and host
 *
 * Deterministic: 64 bytes of BLAKE2b-MAC keyed by BLAKE2b(machine identity)
 * over the password. Ciphertexts sealed with the result only open on the
 * same machine account.
 *
 * @throws CryptoError(ATOMCRYPTE_ERROR_WEAK_INPUT) for an empty password
 */
SecureBytes machine_bound_password(const SecureBytes& password);

} // namespace nonce
} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_NONCE_H
