/**
 * @file round_kernels.h
 * @brief Per-round byte kernels (scalar and AVX2)
 *
 * Encrypt round, per byte:  b = fwd[b]; b ^= x; b += a; b = rotl8(b, r & 7)
 * Decrypt round, per byte:  b = rotr8(b, r & 7); b -= a; b ^= x; b = inv[b]
 *
 * x, a and r point at n keystream bytes each. Both backends produce
 * identical output for identical inputs.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_SRC_CRYPTO_ROUND_KERNELS_H
#define ATOMCRYPTE_SRC_CRYPTO_ROUND_KERNELS_H

#include <cstddef>
#include <cstdint>

namespace atomcrypte {
namespace internal {

using RoundKernelFn = void (*)(uint8_t* data, size_t n,
                               const uint8_t* x, const uint8_t* a, const uint8_t* r,
                               const uint8_t table[256]);

void scalar_encrypt_round(uint8_t* data, size_t n,
                          const uint8_t* x, const uint8_t* a, const uint8_t* r,
                          const uint8_t forward[256]);

void scalar_decrypt_round(uint8_t* data, size_t n,
                          const uint8_t* x, const uint8_t* a, const uint8_t* r,
                          const uint8_t inverse[256]);

/**
 * @brief True when this build carries the AVX2 kernel (ATOMCRYPTE_ENABLE_AVX2)
 */
bool avx2_kernel_compiled() noexcept;

// Only call when avx2_kernel_compiled() and the CPU reports AVX2
void avx2_encrypt_round(uint8_t* data, size_t n,
                        const uint8_t* x, const uint8_t* a, const uint8_t* r,
                        const uint8_t forward[256]);

void avx2_decrypt_round(uint8_t* data, size_t n,
                        const uint8_t* x, const uint8_t* a, const uint8_t* r,
                        const uint8_t inverse[256]);

} // namespace internal
} // namespace atomcrypte

#endif // ATOMCRYPTE_SRC_CRYPTO_ROUND_KERNELS_H
