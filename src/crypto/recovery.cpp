/**
 * @file recovery.cpp
 * @brief RecoveryKeyDeriver implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/recovery.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/key_derivation.h"
#include "atomcrypte/crypto/primitives.h"

#include <cstring>
#include <string>

namespace atomcrypte {

namespace {

const char* const RECOVERY_SALT_LABEL = "atomcrypte.recovery-salt";
const char* const RECOVERY_KEY_LABEL = "atomcrypte.recovery-key";
const char* const RECOVERY_WRAP_LABEL = "atomcrypte.recovery-wrap";
const char* const RECOVERY_SEAL_LABEL = "atomcrypte.recovery-seal";

SecureBytes wrap_stream(const SecureBytes& recovery_key, const ByteVec& nonce, size_t len) {
    primitives::Blake2bMac mac(recovery_key, len);
    mac.update(std::string(RECOVERY_WRAP_LABEL)).update(nonce);
    return mac.finish_secure();
}

ByteArray<RECOVERY_SEAL_SIZE> seal_tag(const SecureBytes& recovery_key, const ByteVec& nonce,
                                       const uint8_t* wrapped, size_t wrapped_len) {
    ByteArray<RECOVERY_SEAL_SIZE> tag{};
    primitives::Blake2bMac mac(recovery_key, RECOVERY_SEAL_SIZE);
    mac.update(std::string(RECOVERY_SEAL_LABEL))
       .update(nonce)
       .update_u8(static_cast<uint8_t>(wrapped_len))
       .update(wrapped, wrapped_len);
    mac.finish(tag.data());
    return tag;
}

} // anonymous namespace

SecureBytes RecoveryKeyDeriver::derive_recovery(const SecureBytes& password, const ByteVec& nonce,
                                                KeyLength key_length, uint32_t kdf_cost) {
    if (password.empty()) {
        throw_error(ATOMCRYPTE_ERROR_WEAK_INPUT, "password must not be empty");
    }
    check_nonce_length(nonce.size(), "nonce");
    const size_t key_len = KeyDerivation::key_size_for_bits(static_cast<uint32_t>(key_length));

    primitives::Blake2b salt_hash;
    salt_hash.update(std::string(RECOVERY_SALT_LABEL)).update(nonce);
    const Blake2b512Digest digest = salt_hash.finish();
    const ByteVec salt(digest.begin(), digest.end());

    return KeyDerivation::derive_labeled(RECOVERY_KEY_LABEL, password, salt, nonce,
                                         key_len, kdf_cost);
}

ByteVec RecoveryKeyDeriver::seal_master_key(const SecureBytes& master_key,
                                            const SecureBytes& recovery_key,
                                            const ByteVec& nonce) {
    const size_t len = master_key.size();
    if (len != ATOMCRYPTE_KEY_256_SIZE && len != ATOMCRYPTE_KEY_512_SIZE) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "master key must be 32 or 64 bytes, got " + std::to_string(len));
    }

    const SecureBytes stream = wrap_stream(recovery_key, nonce, len);

    ByteVec block(1 + len + RECOVERY_SEAL_SIZE);
    block[0] = static_cast<uint8_t>(len);
    for (size_t i = 0; i < len; i++) {
        block[1 + i] = static_cast<uint8_t>(master_key[i] ^ stream[i]);
    }
    const auto tag = seal_tag(recovery_key, nonce, block.data() + 1, len);
    std::memcpy(block.data() + 1 + len, tag.data(), tag.size());
    return block;
}

SecureBytes RecoveryKeyDeriver::open_master_key(const ByteVec& block,
                                                const SecureBytes& recovery_key,
                                                const ByteVec& nonce) {
    if (block.empty()) {
        throw_error(ATOMCRYPTE_ERROR_MALFORMED_INPUT, "recovery block is empty");
    }
    const size_t len = block[0];
    if ((len != ATOMCRYPTE_KEY_256_SIZE && len != ATOMCRYPTE_KEY_512_SIZE) ||
        block.size() != 1 + len + RECOVERY_SEAL_SIZE) {
        throw_error(ATOMCRYPTE_ERROR_MALFORMED_INPUT, "recovery block has an invalid layout");
    }
    if (recovery_key.size() != len) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH, "recovery key size does not match the block");
    }

    auto expected = seal_tag(recovery_key, nonce, block.data() + 1, len);
    const bool sealed = internal::secure_compare(expected.data(), block.data() + 1 + len,
                                                 RECOVERY_SEAL_SIZE);
    internal::secure_zero(expected.data(), expected.size());
    if (!sealed) {
        throw_error(ATOMCRYPTE_ERROR_MAC_MISMATCH, "recovery block seal does not verify");
    }

    const SecureBytes stream = wrap_stream(recovery_key, nonce, len);
    SecureBytes master(len);
    for (size_t i = 0; i < len; i++) {
        master[i] = static_cast<uint8_t>(block[1 + i] ^ stream[i]);
    }
    return master;
}

} // namespace atomcrypte
