/**
 * @file types.h
 * @brief Type definitions for atomcrypte
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ATOMCRYPTE_CORE_TYPES_H
#define ATOMCRYPTE_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef uint8_t atomcrypte_byte;

// Buffer type for binary data
typedef struct {
    atomcrypte_byte* data;
    size_t length;
} atomcrypte_buffer_t;

#ifdef __cplusplus
}
#endif

// C++ types
#ifdef __cplusplus

#include <vector>
#include <array>

namespace atomcrypte {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Digests
using Blake2b512Digest = ByteArray<64>;
using MacTag = ByteArray<64>;

} // namespace atomcrypte

#endif // __cplusplus

#endif // ATOMCRYPTE_CORE_TYPES_H
