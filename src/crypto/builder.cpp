/**
 * @file builder.cpp
 * @brief Builder implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/builder.h"
#include "atomcrypte/core/errors.h"

#include <utility>

namespace atomcrypte {

namespace {

[[noreturn]] void missing(const char* field) {
    throw_error(ATOMCRYPTE_ERROR_INVALID_PARAM, std::string("build failed: missing ") + field);
}

} // anonymous namespace

Builder& Builder::data(const ByteVec& bytes) {
    data_ = bytes;
    return *this;
}

Builder& Builder::data(const uint8_t* bytes, size_t len) {
    if (bytes == nullptr && len != 0) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_PARAM, "null data");
    }
    data_ = ByteVec(bytes, bytes + len);
    return *this;
}

Builder& Builder::data(const std::string& text) {
    data_ = ByteVec(text.begin(), text.end());
    return *this;
}

Builder& Builder::password(const std::string& pw) {
    password_ = SecureBytes(pw);
    return *this;
}

Builder& Builder::password(SecureBytes pw) {
    password_ = std::move(pw);
    return *this;
}

Builder& Builder::nonce(ByteVec value) {
    nonce_ = std::move(value);
    return *this;
}

Builder& Builder::salt(ByteVec value) {
    salt_ = std::move(value);
    return *this;
}

Builder& Builder::config(const Config& cfg) {
    config_ = cfg;
    return *this;
}

Builder& Builder::wrap_all(bool enabled) {
    wrap_all_ = enabled;
    return *this;
}

Builder& Builder::benchmark(bool enabled) {
    benchmark_ = enabled;
    return *this;
}

Builder& Builder::cache(KeyCache* shared) {
    cache_ = shared;
    return *this;
}

Builder& Builder::decrypt_options(DecryptOptions options) {
    decrypt_options_ = std::move(options);
    return *this;
}

Config Builder::effective_config() const {
    if (!config_) missing("config");
    Config cfg = *config_;
    if (wrap_all_) {
        cfg.output_shape = OutputShape::Wrapped;
    }
    if (benchmark_) {
        cfg.benchmark = true;
    }
    return cfg;
}

KeyMaterial Builder::material(bool nonce_required) const {
    if (!password_) missing("password");
    if (nonce_required && !nonce_) missing("nonce");
    return KeyMaterial(*password_, nonce_ ? *nonce_ : ByteVec(), salt_);
}

EncryptedOutput Builder::encrypt_output() const {
    const Config cfg = effective_config();
    if (!data_) missing("data");
    const KeyMaterial km = material(true);
    return Engine(cache_).encrypt(cfg, km, *data_);
}

ByteVec Builder::encrypt() const {
    return encrypt_output().serialize();
}

ByteVec Builder::decrypt() const {
    const Config cfg = effective_config();
    if (!data_) missing("data");
    const KeyMaterial km = material(cfg.output_shape == OutputShape::Detached);
    return Engine(cache_).decrypt(cfg, km, *data_, decrypt_options_);
}

} // namespace atomcrypte
