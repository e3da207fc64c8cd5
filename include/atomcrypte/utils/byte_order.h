/**
 * @file byte_order.h
 * @brief Little-endian load/store helpers
 *
 * Every multi-byte integer atomcrypte hashes or serializes is little-endian,
 * independent of the host.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ATOMCRYPTE_UTILS_BYTE_ORDER_H
#define ATOMCRYPTE_UTILS_BYTE_ORDER_H

#include "atomcrypte/core/types.h"

#include <cstdint>
#include <cstddef>

namespace atomcrypte {
namespace byte_order {

inline void store_le16(uint8_t* out, uint16_t v) noexcept {
    out[0] = static_cast<uint8_t>(v);
    out[1] = static_cast<uint8_t>(v >> 8);
}

inline void store_le32(uint8_t* out, uint32_t v) noexcept {
    for (int i = 0; i < 4; i++) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

inline void store_le64(uint8_t* out, uint64_t v) noexcept {
    for (int i = 0; i < 8; i++) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

inline uint16_t load_le16(const uint8_t* in) noexcept {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

inline uint32_t load_le32(const uint8_t* in) noexcept {
    uint32_t v = 0;
    for (int i = 3; i >= 0; i--) {
        v = (v << 8) | in[i];
    }
    return v;
}

inline uint64_t load_le64(const uint8_t* in) noexcept {
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) {
        v = (v << 8) | in[i];
    }
    return v;
}

// Append helpers for building length-prefixed records
inline void append_le16(ByteVec& out, uint16_t v) {
    uint8_t b[2];
    store_le16(b, v);
    out.insert(out.end(), b, b + 2);
}

inline void append_le32(ByteVec& out, uint32_t v) {
    uint8_t b[4];
    store_le32(b, v);
    out.insert(out.end(), b, b + 4);
}

inline void append_le64(ByteVec& out, uint64_t v) {
    uint8_t b[8];
    store_le64(b, v);
    out.insert(out.end(), b, b + 8);
}

} // namespace byte_order
} // namespace atomcrypte

#endif // ATOMCRYPTE_UTILS_BYTE_ORDER_H
