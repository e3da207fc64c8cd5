/**
 * @file random.h
 * @brief C++ helpers over the platform CSPRNG
 *
 * All helpers throw CryptoError(ATOMCRYPTE_ERROR_RANDOM_FAILED) when the
 * CSPRNG cannot serve the request.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ATOMCRYPTE_UTILS_RANDOM_H
#define ATOMCRYPTE_UTILS_RANDOM_H

#include "atomcrypte/core/types.h"

namespace atomcrypte {

ByteVec random_bytes(size_t len);
void random_fill(uint8_t* buffer, size_t len);
uint32_t random_u32();
uint64_t random_u64();

/**
 * @brief Uniform value in [min, max] (inclusive), rejection sampled
 */
uint64_t random_range(uint64_t min, uint64_t max);

} // namespace atomcrypte

#endif // ATOMCRYPTE_UTILS_RANDOM_H
