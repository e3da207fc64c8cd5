/**
 * @file engine.h
 * @brief encrypt / decrypt orchestration
 *
 * Encrypt: validate -> master key (KeyCache or KeyDerivation) -> subkeys
 * and S-box -> plan -> ChunkRoundPipeline -> MacBinder -> recovery block ->
 * dummy padding. Decrypt reverses this and releases plaintext only after
 * the full tag has been recomputed and compared in constant time.
 *
 * Engine holds no per-call state; one instance may serve concurrent calls
 * once configured. The optional KeyCache is owned by the caller.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_ENGINE_H
#define ATOMCRYPTE_CRYPTO_ENGINE_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"
#include "atomcrypte/crypto/key_cache.h"
#include "atomcrypte/crypto/thread_strategy.h"
#include "atomcrypte/crypto/wire_format.h"

#include <optional>

namespace atomcrypte {

enum class KeyPath {
    Standard,  ///< password + salt + nonce only
    Recovery   ///< standard first, then the recovery block on MAC mismatch
};

struct DecryptOptions {
    KeyPath key_path = KeyPath::Standard;
    SecureBytes recovery_key;   ///< optional; re-derived from password + nonce when empty
    ByteVec recovery_block;     ///< optional; taken from the output when empty

    static DecryptOptions recovery(SecureBytes key = SecureBytes(), ByteVec block = ByteVec()) {
        DecryptOptions options;
        options.key_path = KeyPath::Recovery;
        options.recovery_key = std::move(key);
        options.recovery_block = std::move(block);
        return options;
    }
};

class Engine {
public:
    /**
     * @param cache optional shared key cache; nullptr derives every key
     */
    explicit Engine(KeyCache* cache = nullptr) : cache_(cache) {}

    /**
     * @brief Pin the CPU snapshot used for planning (default: sampled per call)
     */
    void set_cpu_snapshot(const CpuSnapshot& snapshot) { snapshot_ = snapshot; }
    void clear_cpu_snapshot() { snapshot_.reset(); }

    /**
     * @throws CryptoError UNSUPPORTED_CONFIG, WEAK_INPUT or INVALID_LENGTH
     *         before any transform work starts
     */
    EncryptedOutput encrypt(const Config& config, const KeyMaterial& material,
                            const uint8_t* plaintext, size_t plaintext_len) const;

    EncryptedOutput encrypt(const Config& config, const KeyMaterial& material,
                            const ByteVec& plaintext) const {
        return encrypt(config, material, plaintext.data(), plaintext.size());
    }

    /**
     * @brief Decrypt a structured output
     *
     * For wrapped outputs the nonce and salt come from the header and only
     * the password of material is used.
     *
     * @throws CryptoError MAC_MISMATCH on authentication failure (no
     *         plaintext is released), plus the validation errors of encrypt()
     */
    ByteVec decrypt(const Config& config, const KeyMaterial& material,
                    const EncryptedOutput& output,
                    const DecryptOptions& options = DecryptOptions()) const;

    /**
     * @brief Parse blob in config.output_shape, then decrypt
     */
    ByteVec decrypt(const Config& config, const KeyMaterial& material, const ByteVec& blob,
                    const DecryptOptions& options = DecryptOptions()) const;

    ExecutionPlan plan_for(const Config& config, size_t input_len) const;

private:
    SecureBytes master_key(const Config& config, const KeyMaterial& material) const;

    ByteVec open_with_master(const Config& config, const SecureBytes& master,
                             const ByteVec& nonce, const EncryptedOutput& output) const;

    KeyCache* cache_;
    std::optional<CpuSnapshot> snapshot_;
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_ENGINE_H
