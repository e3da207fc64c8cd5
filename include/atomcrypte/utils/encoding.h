/**
 * @file encoding.h
 * @brief Hex and Base64 rendering of engine outputs
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_UTILS_ENCODING_H
#define ATOMCRYPTE_UTILS_ENCODING_H

#include "atomcrypte/core/types.h"

#include <stdexcept>
#include <string>

namespace atomcrypte {
namespace encoding {

/**
 * @brief Exception for encoding/decoding errors
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Hex
// ============================================================================

std::string hex_encode(const ByteVec& data);
std::string hex_encode(const uint8_t* data, size_t len);

/**
 * @brief Decode lowercase or uppercase hex
 * @throws EncodingError on odd length or a non-hex character
 */
ByteVec hex_decode(const std::string& hex);

bool is_valid_hex(const std::string& str) noexcept;

// ============================================================================
// Base64 (RFC 4648, standard alphabet, padded)
// ============================================================================

std::string base64_encode(const ByteVec& data);
std::string base64_encode(const uint8_t* data, size_t len);

/**
 * @brief Decode padded standard Base64; ASCII whitespace is skipped
 * @throws EncodingError on invalid characters or length
 */
ByteVec base64_decode(const std::string& b64);

} // namespace encoding
} // namespace atomcrypte

#endif // ATOMCRYPTE_UTILS_ENCODING_H
