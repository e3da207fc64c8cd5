/**
 * @file key_derivation.cpp
 * @brief scrypt + keyed BLAKE2b master key derivation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/key_derivation.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/primitives.h"

namespace atomcrypte {

namespace {

const char* const MASTER_KEY_LABEL = "atomcrypte.master-key";
const char* const TRANSFORM_KEY_LABEL = "atomcrypte.transform-key";
const char* const MAC_KEY_LABEL = "atomcrypte.mac-key";

} // anonymous namespace

size_t KeyDerivation::key_size_for_bits(uint32_t key_bits) {
    if (key_bits != 256 && key_bits != 512) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "unsupported key length: " + std::to_string(key_bits) + " bits");
    }
    return key_bits / 8;
}

SecureBytes KeyDerivation::derive_labeled(const std::string& label,
                                          const SecureBytes& password, const ByteVec& salt,
                                          const ByteVec& nonce, size_t out_len,
                                          uint32_t kdf_cost) {
    if (password.empty()) {
        throw_error(ATOMCRYPTE_ERROR_WEAK_INPUT, "password must not be empty");
    }
    check_nonce_length(nonce.size(), "nonce");
    if (salt.empty()) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH, "salt must not be empty");
    }

    SecureBytes intermediate(KDF_INTERMEDIATE_SIZE);
    primitives::scrypt(password.data(), password.size(), salt.data(), salt.size(),
                       kdf_cost, intermediate.data(), intermediate.size());

    primitives::Blake2bMac extract(nonce, out_len);
    extract.update(label).update(intermediate);
    return extract.finish_secure();
}

SecureBytes KeyDerivation::derive(const SecureBytes& password, const ByteVec& salt,
                                  const ByteVec& nonce, uint32_t key_bits,
                                  uint32_t kdf_cost) {
    if (password.empty()) {
        throw_error(ATOMCRYPTE_ERROR_WEAK_INPUT, "password must not be empty");
    }
    const size_t key_len = key_size_for_bits(key_bits);
    return derive_labeled(MASTER_KEY_LABEL, password, salt, nonce, key_len, kdf_cost);
}

SecureBytes KeyDerivation::derive(const KeyMaterial& material, KeyLength key_length,
                                  uint32_t kdf_cost) {
    material.validate();
    return derive(material.password, material.effective_salt(), material.nonce,
                  static_cast<uint32_t>(key_length), kdf_cost);
}

SessionKeys KeyDerivation::derive_subkeys(const SecureBytes& master_key) {
    SessionKeys keys;

    primitives::Blake2bMac transform(master_key, master_key.size());
    transform.update(std::string(TRANSFORM_KEY_LABEL));
    keys.transform_key = transform.finish_secure();

    primitives::Blake2bMac mac(master_key, MAC_KEY_SIZE);
    mac.update(std::string(MAC_KEY_LABEL));
    keys.mac_key = mac.finish_secure();

    return keys;
}

} // namespace atomcrypte
