/**
 * @file config.cpp
 * @brief Config presets, modifiers and validation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/config.h"
#include "atomcrypte/core/errors.h"

#include <algorithm>
#include <cctype>

namespace atomcrypte {

namespace {

struct ProfilePreset {
    KeyLength key_length;
    uint32_t rounds;
};

bool preset_for(Profile profile, ProfilePreset& out) {
    switch (profile) {
        case Profile::Standard: out = {KeyLength::Bits256, 4}; return true;
        case Profile::Secure:   out = {KeyLength::Bits512, 6}; return true;
        case Profile::Max:      out = {KeyLength::Bits512, 12}; return true;
        default:                return false;
    }
}

std::string lowercase(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

const char* to_string(KeyLength length) noexcept {
    return length == KeyLength::Bits512 ? "512" : "256";
}

const char* to_string(Profile profile) noexcept {
    switch (profile) {
        case Profile::Standard: return "standard";
        case Profile::Secure:   return "secure";
        case Profile::Max:      return "max";
        case Profile::Custom:   return "custom";
    }
    return "unknown";
}

const char* to_string(SboxSource source) noexcept {
    switch (source) {
        case SboxSource::PasswordDerived: return "password";
        case SboxSource::NonceDerived:    return "nonce";
        case SboxSource::Combined:        return "combined";
    }
    return "unknown";
}

// ============================================================================
// Config
// ============================================================================

Config Config::from_profile(Profile profile) {
    Config config;
    config.profile = profile;
    ProfilePreset preset{};
    if (preset_for(profile, preset)) {
        config.key_length = preset.key_length;
        config.rounds = preset.rounds;
    }
    return config;
}

Config Config::with_key_length(KeyLength length) const {
    Config c(*this);
    c.key_length = length;
    c.profile = Profile::Custom;
    return c;
}

Config Config::with_rounds(uint32_t count) const {
    Config c(*this);
    c.rounds = count;
    c.profile = Profile::Custom;
    return c;
}

Config Config::with_threads(ThreadStrategy strategy) const {
    Config c(*this);
    c.thread_strategy = strategy;
    return c;
}

Config Config::with_sbox(SboxSource source) const {
    Config c(*this);
    c.sbox_source = source;
    return c;
}

Config Config::with_output_shape(OutputShape shape) const {
    Config c(*this);
    c.output_shape = shape;
    return c;
}

Config Config::with_recovery_key(bool enabled) const {
    Config c(*this);
    c.recovery_key = enabled;
    return c;
}

Config Config::with_dummy_data(bool enabled) const {
    Config c(*this);
    c.dummy_data = enabled;
    return c;
}

Config Config::with_benchmark(bool enabled) const {
    Config c(*this);
    c.benchmark = enabled;
    return c;
}

Config Config::with_kdf_cost(uint32_t cost) const {
    Config c(*this);
    c.kdf_cost = cost;
    return c;
}

void Config::validate() const {
    if (key_length != KeyLength::Bits256 && key_length != KeyLength::Bits512) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "key length must be 256 or 512 bits, got " +
                    std::to_string(static_cast<unsigned>(key_length)));
    }
    if (rounds == 0) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "rounds must be at least 1");
    }

    ProfilePreset preset{};
    if (preset_for(profile, preset)) {
        if (preset.key_length != key_length || preset.rounds != rounds) {
            throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                        std::string("profile '") + to_string(profile) + "' requires " +
                        to_string(preset.key_length) + "-bit keys and " +
                        std::to_string(preset.rounds) + " rounds");
        }
    } else if (profile != Profile::Custom) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "unknown profile");
    }

    if (thread_strategy.mode() == ThreadMode::Custom && thread_strategy.custom_threads() == 0) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "custom thread count must be at least 1");
    }

    if (kdf_cost < KDF_COST_MIN || kdf_cost > KDF_COST_MAX) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                    "kdf cost must be in [" + std::to_string(KDF_COST_MIN) + ", " +
                    std::to_string(KDF_COST_MAX) + "], got " + std::to_string(kdf_cost));
    }

    if (static_cast<uint8_t>(sbox_source) > static_cast<uint8_t>(SboxSource::Combined) ||
        static_cast<uint8_t>(output_shape) > static_cast<uint8_t>(OutputShape::Wrapped)) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "unknown sbox source or output shape");
    }
}

Profile Config::parse_profile(const std::string& name) {
    const std::string n = lowercase(name);
    if (n == "standard") return Profile::Standard;
    if (n == "secure") return Profile::Secure;
    if (n == "max") return Profile::Max;
    if (n == "custom") return Profile::Custom;
    throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "unknown profile: " + name);
}

SboxSource Config::parse_sbox(const std::string& name) {
    const std::string n = lowercase(name);
    if (n == "password") return SboxSource::PasswordDerived;
    if (n == "nonce") return SboxSource::NonceDerived;
    if (n == "combined") return SboxSource::Combined;
    throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "unknown sbox source: " + name);
}

// ============================================================================
// KeyMaterial
// ============================================================================

void check_nonce_length(size_t len, const char* what) {
    if (len < ATOMCRYPTE_NONCE_MIN_SIZE || len > ATOMCRYPTE_NONCE_MAX_SIZE) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    std::string(what) + " must be " + std::to_string(ATOMCRYPTE_NONCE_MIN_SIZE) +
                    ".." + std::to_string(ATOMCRYPTE_NONCE_MAX_SIZE) + " bytes, got " +
                    std::to_string(len));
    }
}

KeyMaterial KeyMaterial::from_password(const std::string& password, ByteVec nonce,
                                       std::optional<ByteVec> salt) {
    return KeyMaterial(SecureBytes(password), std::move(nonce), std::move(salt));
}

void KeyMaterial::validate_password() const {
    if (password.empty()) {
        throw_error(ATOMCRYPTE_ERROR_WEAK_INPUT, "password must not be empty");
    }
}

void KeyMaterial::validate() const {
    validate_password();
    check_nonce_length(nonce.size(), "nonce");
    if (salt) {
        check_nonce_length(salt->size(), "salt");
    }
}

} // namespace atomcrypte
