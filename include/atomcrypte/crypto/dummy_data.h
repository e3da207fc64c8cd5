/**
 * @file dummy_data.h
 * @brief Random filler for empty inputs and random padding for outputs
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_DUMMY_DATA_H
#define ATOMCRYPTE_CRYPTO_DUMMY_DATA_H

#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/wire_format.h"

#include <cstddef>

namespace atomcrypte {

class DummyDataInjector {
public:
    static constexpr size_t EMPTY_FILLER_MIN = 1;
    static constexpr size_t EMPTY_FILLER_MAX = 8192;
    static constexpr size_t PADDING_MIN = 1;
    static constexpr size_t PADDING_MAX = 1024 * 1024;

    /**
     * @brief 1..8192 random bytes standing in for an empty plaintext
     */
    static ByteVec empty_filler();

    /**
     * @brief 1..1 MiB of random bytes
     */
    static ByteVec random_padding();

    /**
     * @brief Attach random padding when enabled, clear it otherwise
     *
     * The padding is length-prefixed by the serializers and never enters
     * the MAC.
     */
    static EncryptedOutput pad(EncryptedOutput output, bool enabled);
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_DUMMY_DATA_H
