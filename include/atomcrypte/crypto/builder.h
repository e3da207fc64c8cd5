/**
 * @file builder.h
 * @brief Fluent front-end over Engine
 *
 * @code
 *   ByteVec blob = Builder()
 *       .data(plaintext)
 *       .password("correct horse")
 *       .nonce(nonce::random())
 *       .config(Config::from_profile(Profile::Secure))
 *       .wrap_all(true)
 *       .encrypt();
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_BUILDER_H
#define ATOMCRYPTE_CRYPTO_BUILDER_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"
#include "atomcrypte/crypto/engine.h"
#include "atomcrypte/crypto/key_cache.h"
#include "atomcrypte/crypto/wire_format.h"

#include <optional>
#include <string>

namespace atomcrypte {

class Builder {
public:
    Builder() = default;

    Builder& data(const ByteVec& bytes);
    Builder& data(const uint8_t* bytes, size_t len);
    Builder& data(const std::string& text);
    Builder& password(const std::string& pw);
    Builder& password(SecureBytes pw);
    Builder& nonce(ByteVec value);
    Builder& salt(ByteVec value);
    Builder& config(const Config& cfg);
    Builder& wrap_all(bool enabled);
    Builder& benchmark(bool enabled = true);
    Builder& cache(KeyCache* shared);
    Builder& decrypt_options(DecryptOptions options);

    /**
     * @brief Encrypt and serialize in the configured output shape
     *
     * @throws CryptoError(ATOMCRYPTE_ERROR_INVALID_PARAM) if data, password,
     *         nonce or config was not set, plus every Engine::encrypt error
     */
    ByteVec encrypt() const;

    /**
     * @brief Encrypt and keep the structured output (recovery key included)
     */
    EncryptedOutput encrypt_output() const;

    /**
     * @brief Parse data as a serialized blob and decrypt it
     *
     * The nonce may be omitted for wrapped blobs.
     */
    ByteVec decrypt() const;

private:
    Config effective_config() const;
    KeyMaterial material(bool nonce_required) const;

    std::optional<ByteVec> data_;
    std::optional<SecureBytes> password_;
    std::optional<ByteVec> nonce_;
    std::optional<ByteVec> salt_;
    std::optional<Config> config_;
    bool wrap_all_ = false;
    bool benchmark_ = false;
    KeyCache* cache_ = nullptr;
    DecryptOptions decrypt_options_;
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_BUILDER_H
