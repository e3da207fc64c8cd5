/**
 * @file wire_format.h
 * @brief EncryptedOutput and its detached / wrapped serializations
 *
 * Detached:
 *   ciphertext || tag(64) [|| padding || u32le(len(padding))]
 *
 * Wrapped (version 0x04):
 *   u8 version | u8 profile | u16le key bits | u8 sbox source | u32le rounds |
 *   u8 flags (bit0 padding, bit1 recovery block) |
 *   u8 salt len | salt | u8 nonce len | nonce |
 *   u64le ciphertext len | ciphertext | tag(64) |
 *   [u16le block len | recovery block] | [u32le padding len | padding]
 *
 * Padding sits outside the MAC and is located from its length prefix, so
 * it is stripped before verification.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_WIRE_FORMAT_H
#define ATOMCRYPTE_CRYPTO_WIRE_FORMAT_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"

#include <cstdint>
#include <optional>
#include <utility>

namespace atomcrypte {

constexpr uint8_t WRAP_FLAG_PADDING = 0x01;
constexpr uint8_t WRAP_FLAG_RECOVERY = 0x02;

/**
 * @brief Self-describing metadata carried by a wrapped blob
 */
struct WrappedHeader {
    uint8_t version = 0;
    Profile profile = Profile::Standard;
    KeyLength key_length = KeyLength::Bits256;
    SboxSource sbox_source = SboxSource::Combined;
    uint32_t rounds = 0;
    ByteVec salt;
    ByteVec nonce;

    static WrappedHeader from(const Config& config, const ByteVec& salt, const ByteVec& nonce);

    /**
     * @throws CryptoError(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG) if the header
     *         disagrees with config or carries an unknown version
     */
    void check_against(const Config& config) const;
};

/**
 * @brief Result of one encryption, fully owned by the caller
 */
struct EncryptedOutput {
    OutputShape shape = OutputShape::Detached;
    ByteVec ciphertext;
    MacTag mac_tag{};
    ByteVec padding;                      ///< dummy bytes, outside the MAC
    std::optional<WrappedHeader> header;  ///< set for OutputShape::Wrapped
    ByteVec recovery_block;               ///< sealed master key, when enabled
    SecureBytes recovery_key;             ///< handed to the caller, never cached

    /**
     * @brief Move the recovery key out; the output keeps nothing
     */
    SecureBytes take_recovery_key() {
        SecureBytes key(std::move(recovery_key));
        recovery_key.wipe();
        return key;
    }

    /**
     * @brief Serialize in this output's shape
     */
    ByteVec serialize() const;

    /**
     * @brief Parse a serialized blob in config.output_shape
     *
     * Detached blobs carry a padding trailer exactly when config.dummy_data
     * is set. Wrapped headers are checked against config.
     *
     * @throws CryptoError MALFORMED_INPUT for truncated or inconsistent
     *         blobs, UNSUPPORTED_CONFIG for a header/config disagreement
     */
    static EncryptedOutput parse(const uint8_t* data, size_t len, const Config& config);

    static EncryptedOutput parse(const ByteVec& blob, const Config& config) {
        return parse(blob.data(), blob.size(), config);
    }
};

namespace wire {

ByteVec serialize_detached(const EncryptedOutput& output);
ByteVec serialize_wrapped(const EncryptedOutput& output);

EncryptedOutput parse_detached(const uint8_t* data, size_t len, bool has_padding);
EncryptedOutput parse_wrapped(const uint8_t* data, size_t len);

} // namespace wire

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_WIRE_FORMAT_H
