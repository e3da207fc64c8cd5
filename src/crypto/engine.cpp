/**
 * @file engine.cpp
 * @brief Engine implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/engine.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/dummy_data.h"
#include "atomcrypte/crypto/key_derivation.h"
#include "atomcrypte/crypto/mac_binder.h"
#include "atomcrypte/crypto/pipeline.h"
#include "atomcrypte/crypto/recovery.h"
#include "atomcrypte/crypto/sbox.h"
#include "atomcrypte/utils/log.h"
#include "atomcrypte/version.h"

#include <chrono>
#include <string>
#include <utility>

namespace atomcrypte {

namespace {

/**
 * @brief Phase timer for Config::benchmark
 */
class PhaseTimer {
public:
    explicit PhaseTimer(bool enabled)
        : enabled_(enabled), start_(Clock::now()), phase_start_(start_) {}

    void phase(const char* name) {
        if (!enabled_) return;
        const auto now = Clock::now();
        log::benchmark(name, to_ms(now - phase_start_));
        phase_start_ = now;
    }

    void total(const char* name) {
        if (!enabled_) return;
        log::benchmark(name, to_ms(Clock::now() - start_));
    }

private:
    using Clock = std::chrono::steady_clock;

    static double to_ms(Clock::duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    }

    bool enabled_;
    Clock::time_point start_;
    Clock::time_point phase_start_;
};

} // anonymous namespace

ExecutionPlan Engine::plan_for(const Config& config, size_t input_len) const {
    const CpuSnapshot cpu = snapshot_ ? *snapshot_ : CpuSnapshot::capture();
    return plan_execution(config.thread_strategy, input_len, cpu);
}

SecureBytes Engine::master_key(const Config& config, const KeyMaterial& material) const {
    if (cache_ != nullptr) {
        return cache_->get_or_derive(material, config.key_length, config.kdf_cost);
    }
    return KeyDerivation::derive(material, config.key_length, config.kdf_cost);
}

EncryptedOutput Engine::encrypt(const Config& config, const KeyMaterial& material,
                                const uint8_t* plaintext, size_t plaintext_len) const {
    config.validate();
    material.validate();
    if (plaintext == nullptr && plaintext_len != 0) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_PARAM, "null plaintext");
    }

    PhaseTimer timer(config.benchmark);

    const SecureBytes master = master_key(config, material);
    const SessionKeys keys = KeyDerivation::derive_subkeys(master);
    const SBoxPair sbox = SBoxGenerator::for_source(config.sbox_source, master, material.nonce);
    timer.phase("key-derivation");

    EncryptedOutput output;
    output.shape = config.output_shape;
    if (plaintext_len == 0) {
        output.ciphertext = DummyDataInjector::empty_filler();
    } else {
        output.ciphertext.assign(plaintext, plaintext + plaintext_len);
    }
    // Holds plaintext until the transform completes
    WipeGuard ciphertext_guard(output.ciphertext);

    const ExecutionPlan plan = plan_for(config, output.ciphertext.size());
    log::debug("encrypt: profile " + std::string(to_string(config.profile)) +
               ", threads " + config.thread_strategy.to_string() +
               " -> " + std::to_string(plan.worker_count) +
               (plan.use_vectorized ? " (vectorized)" : " (scalar)"));

    ChunkRoundPipeline pipeline(config.key_length);
    pipeline.transform(output.ciphertext.data(), output.ciphertext.size(),
                       output.ciphertext.data(), output.ciphertext.size(),
                       keys.transform_key, sbox, config.rounds, plan, Direction::Encrypt);
    timer.phase("transform");

    output.mac_tag = MacBinder::compute(plaintext, plaintext_len,
                                        output.ciphertext.data(), output.ciphertext.size(),
                                        keys.mac_key, MacContext::from_config(config));
    timer.phase("mac");

    if (config.output_shape == OutputShape::Wrapped) {
        output.header = WrappedHeader::from(config, material.effective_salt(), material.nonce);
    }

    if (config.recovery_key) {
        SecureBytes recovery_key = RecoveryKeyDeriver::derive_recovery(
            material.password, material.nonce, config.key_length, config.kdf_cost);
        output.recovery_block = RecoveryKeyDeriver::seal_master_key(master, recovery_key,
                                                                    material.nonce);
        output.recovery_key = std::move(recovery_key);
        timer.phase("recovery-key");
    }

    output = DummyDataInjector::pad(std::move(output), config.dummy_data);
    ciphertext_guard.dismiss();
    timer.total("encrypt-total");
    return output;
}

ByteVec Engine::open_with_master(const Config& config, const SecureBytes& master,
                                 const ByteVec& nonce, const EncryptedOutput& output) const {
    const SessionKeys keys = KeyDerivation::derive_subkeys(master);
    const SBoxPair sbox = SBoxGenerator::for_source(config.sbox_source, master, nonce);
    const ExecutionPlan plan = plan_for(config, output.ciphertext.size());

    ChunkRoundPipeline pipeline(config.key_length);
    ByteVec recovered = pipeline.transform(output.ciphertext, keys.transform_key, sbox,
                                           config.rounds, plan, Direction::Decrypt);
    WipeGuard guard(recovered);

    // Both candidates are always computed: empty input (filler ciphertext)
    // and the recovered bytes
    const MacContext context = MacContext::from_config(config);
    const bool full_ok = MacBinder::verify(recovered.data(), recovered.size(),
                                           output.ciphertext.data(), output.ciphertext.size(),
                                           keys.mac_key, output.mac_tag, context);
    const bool empty_ok = MacBinder::verify(nullptr, 0,
                                            output.ciphertext.data(), output.ciphertext.size(),
                                            keys.mac_key, output.mac_tag, context);

    if (empty_ok) {
        return ByteVec();
    }
    if (!full_ok) {
        throw_error(ATOMCRYPTE_ERROR_MAC_MISMATCH, "authentication tag does not verify");
    }
    guard.dismiss();
    return recovered;
}

ByteVec Engine::decrypt(const Config& config, const KeyMaterial& material,
                        const EncryptedOutput& output, const DecryptOptions& options) const {
    config.validate();

    // Nonce and salt: wrapped header first, caller material otherwise
    KeyMaterial effective;
    if (output.header) {
        output.header->check_against(config);
        effective = KeyMaterial(material.password, output.header->nonce, output.header->salt);
    } else {
        effective = material;
    }

    const bool recovery_mode = options.key_path == KeyPath::Recovery;
    const bool try_standard = !recovery_mode || !effective.password.empty() ||
                              options.recovery_key.empty();
    if (try_standard) {
        effective.validate();
    } else {
        check_nonce_length(effective.nonce.size(), "nonce");
    }

    if (output.ciphertext.empty()) {
        throw_error(ATOMCRYPTE_ERROR_MALFORMED_INPUT, "ciphertext is empty");
    }

    PhaseTimer timer(config.benchmark);

    if (try_standard) {
        try {
            const SecureBytes master = master_key(config, effective);
            timer.phase("key-derivation");
            ByteVec plaintext = open_with_master(config, master, effective.nonce, output);
            timer.total("decrypt-total");
            return plaintext;
        } catch (const CryptoError& e) {
            if (!recovery_mode || e.code() != ATOMCRYPTE_ERROR_MAC_MISMATCH) {
                throw;
            }
            log::info("standard key path failed authentication, trying recovery block");
        }
    }

    const ByteVec& block = options.recovery_block.empty() ? output.recovery_block
                                                          : options.recovery_block;
    if (block.empty()) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                    "recovery mode requires a recovery block");
    }

    SecureBytes recovery_key = options.recovery_key;
    if (recovery_key.empty()) {
        recovery_key = RecoveryKeyDeriver::derive_recovery(effective.password, effective.nonce,
                                                           config.key_length, config.kdf_cost);
    }

    const SecureBytes master = RecoveryKeyDeriver::open_master_key(block, recovery_key,
                                                                   effective.nonce);
    if (master.size() != config.key_size()) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "recovered key does not match the configured key length");
    }
    timer.phase("recovery-key");

    ByteVec plaintext = open_with_master(config, master, effective.nonce, output);
    timer.total("decrypt-total");
    return plaintext;
}

ByteVec Engine::decrypt(const Config& config, const KeyMaterial& material, const ByteVec& blob,
                        const DecryptOptions& options) const {
    config.validate();
    const EncryptedOutput output = EncryptedOutput::parse(blob, config);
    return decrypt(config, material, output, options);
}

} // namespace atomcrypte
