/**
 * @file sbox.h
 * @brief Key-dependent byte substitution tables
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_SBOX_H
#define ATOMCRYPTE_CRYPTO_SBOX_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"

#include <array>
#include <cstdint>

namespace atomcrypte {

/**
 * @brief Forward/inverse permutation pair; inverse[forward[x]] == x
 *
 * Tables are key-dependent and are zeroed on destruction.
 */
struct SBoxPair {
    std::array<uint8_t, 256> forward{};
    std::array<uint8_t, 256> inverse{};

    SBoxPair() = default;
    SBoxPair(const SBoxPair&) = default;
    SBoxPair& operator=(const SBoxPair&) = default;
    ~SBoxPair() {
        internal::secure_zero(forward.data(), forward.size());
        internal::secure_zero(inverse.data(), inverse.size());
    }

    /**
     * @brief True when forward is a bijection and inverse undoes it
     */
    bool is_consistent() const noexcept;
};

class SBoxGenerator {
public:
    /**
     * @brief Deterministic permutation from seed bytes
     *
     * A BLAKE2b-512 stream over ("atomcrypte.sbox" || selector || counter || seed)
     * drives a Fisher-Yates shuffle of [0, 256) with rejection-sampled
     * 16-bit draws. The selector separates the three sources, so the same
     * bytes under a different source give an unrelated permutation.
     */
    static SBoxPair generate(const uint8_t* seed, size_t seed_len, SboxSource source);

    static SBoxPair generate(const SecureBytes& seed, SboxSource source) {
        return generate(seed.data(), seed.size(), source);
    }

    /**
     * @brief Seed bytes for a source: master key, nonce, or nonce || master key
     */
    static SecureBytes seed_material(SboxSource source, const SecureBytes& master_key,
                                     const ByteVec& nonce);

    /**
     * @brief seed_material() + generate(); the seed is wiped before returning
     */
    static SBoxPair for_source(SboxSource source, const SecureBytes& master_key,
                               const ByteVec& nonce);
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_SBOX_H
