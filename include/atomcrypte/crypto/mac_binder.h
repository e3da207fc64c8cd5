/**
 * @file mac_binder.h
 * @brief HMAC-SHA3-512 binding of plaintext, ciphertext and parameters
 *
 * tag = HMAC-SHA3-512(mac_key, "atomcrypte.mac" || context ||
 *                     u64le(|pt|) || pt || u64le(|ct|) || ct)
 *
 * Binding the plaintext as well as the ciphertext means a tag cannot be
 * forged by someone who only controls the ciphertext.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_MAC_BINDER_H
#define ATOMCRYPTE_CRYPTO_MAC_BINDER_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"

#include <cstdint>

namespace atomcrypte {

/**
 * @brief Parameters folded into the tag so they cannot be swapped silently
 */
struct MacContext {
    uint8_t format_version = 0;
    Profile profile = Profile::Standard;
    KeyLength key_length = KeyLength::Bits256;
    SboxSource sbox_source = SboxSource::Combined;
    uint32_t rounds = 0;

    static MacContext from_config(const Config& config);
};

class MacBinder {
public:
    static MacTag compute(const uint8_t* plaintext, size_t plaintext_len,
                          const uint8_t* ciphertext, size_t ciphertext_len,
                          const SecureBytes& mac_key, const MacContext& context = MacContext{});

    static MacTag compute(const ByteVec& plaintext, const ByteVec& ciphertext,
                          const SecureBytes& mac_key, const MacContext& context = MacContext{}) {
        return compute(plaintext.data(), plaintext.size(), ciphertext.data(), ciphertext.size(),
                       mac_key, context);
    }

    /**
     * @brief Recompute the full tag and compare in constant time
     */
    static bool verify(const uint8_t* plaintext, size_t plaintext_len,
                       const uint8_t* ciphertext, size_t ciphertext_len,
                       const SecureBytes& mac_key, const MacTag& tag,
                       const MacContext& context = MacContext{});

    static bool verify(const ByteVec& plaintext, const ByteVec& ciphertext,
                       const SecureBytes& mac_key, const MacTag& tag,
                       const MacContext& context = MacContext{}) {
        return verify(plaintext.data(), plaintext.size(), ciphertext.data(), ciphertext.size(),
                      mac_key, tag, context);
    }
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_MAC_BINDER_H
