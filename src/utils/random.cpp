/**
 * @file random.cpp
 * @brief C++ CSPRNG helpers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "atomcrypte/utils/random.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/core/security.h"

namespace atomcrypte {

void random_fill(uint8_t* buffer, size_t len) {
    if (len == 0) {
        return;
    }
    int rc = internal::random_bytes(buffer, len);
    if (rc != ATOMCRYPTE_SUCCESS) {
        throw_error(ATOMCRYPTE_ERROR_RANDOM_FAILED, "platform CSPRNG unavailable");
    }
}

ByteVec random_bytes(size_t len) {
    ByteVec result(len);
    random_fill(result.data(), len);
    return result;
}

uint32_t random_u32() {
    uint8_t buf[4];
    random_fill(buf, sizeof(buf));
    return static_cast<uint32_t>(buf[0]) | (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) | (static_cast<uint32_t>(buf[3]) << 24);
}

uint64_t random_u64() {
    return (static_cast<uint64_t>(random_u32()) << 32) | random_u32();
}

uint64_t random_range(uint64_t min, uint64_t max) {
    if (min >= max) {
        return min;
    }
    const uint64_t span = max - min;
    if (span == UINT64_MAX) {
        return random_u64();
    }
    const uint64_t bound = span + 1;
    // Reject the low remainder so every residue is equally likely
    const uint64_t threshold = (0 - bound) % bound;
    uint64_t value;
    do {
        value = random_u64();
    } while (value < threshold);
    return min + value % bound;
}

} // namespace atomcrypte
