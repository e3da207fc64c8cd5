/**
 * @file dummy_data.cpp
 * @brief DummyDataInjector implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/dummy_data.h"
#include "atomcrypte/utils/random.h"

#include <utility>

namespace atomcrypte {

ByteVec DummyDataInjector::empty_filler() {
    const size_t len = static_cast<size_t>(random_range(EMPTY_FILLER_MIN, EMPTY_FILLER_MAX));
    return random_bytes(len);
}

ByteVec DummyDataInjector::random_padding() {
    const size_t len = static_cast<size_t>(random_range(PADDING_MIN, PADDING_MAX));
    return random_bytes(len);
}

EncryptedOutput DummyDataInjector::pad(EncryptedOutput output, bool enabled) {
    if (enabled) {
        output.padding = random_padding();
    } else {
        output.padding.clear();
    }
    return output;
}

} // namespace atomcrypte
