/**
 * @file round_kernels.cpp
 * @brief Scalar round kernels
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "round_kernels.h"
#include "atomcrypte/core/common.h"

namespace atomcrypte {
namespace internal {

void scalar_encrypt_round(uint8_t* data, size_t n,
                          const uint8_t* x, const uint8_t* a, const uint8_t* r,
                          const uint8_t forward[256]) {
    for (size_t i = 0; i < n; i++) {
        uint8_t b = forward[data[i]];
        b ^= x[i];
        b = static_cast<uint8_t>(b + a[i]);
        data[i] = ATOMCRYPTE_ROTL8(b, r[i] & 7);
    }
}

void scalar_decrypt_round(uint8_t* data, size_t n,
                          const uint8_t* x, const uint8_t* a, const uint8_t* r,
                          const uint8_t inverse[256]) {
    for (size_t i = 0; i < n; i++) {
        uint8_t b = ATOMCRYPTE_ROTR8(data[i], r[i] & 7);
        b = static_cast<uint8_t>(b - a[i]);
        b ^= x[i];
        data[i] = inverse[b];
    }
}

} // namespace internal
} // namespace atomcrypte
