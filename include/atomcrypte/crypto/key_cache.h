/**
 * @file key_cache.h
 * @brief Thread-safe, read-mostly cache of derived master keys
 *
 * Lifecycle: created by the application (one per process or per engine),
 * handed to Engine by pointer, entries wiped on eviction, everything wiped
 * on clear() and destruction. Values are copied out so eviction never
 * invalidates an in-flight operation.
 *
 * Map keys are keyed BLAKE2b over the inputs with a random per-cache key,
 * so the index alone gives no shortcut around the KDF cost. The key is
 * replaced on clear() and wiped on destruction.
 *
 * Concurrency: hits take a shared lock only. A miss derives with no lock
 * held and then inserts under the exclusive lock if the entry is still
 * absent; racing misses may derive twice but only the first insert is
 * retained and every caller returns the retained value.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_KEY_CACHE_H
#define ATOMCRYPTE_CRYPTO_KEY_CACHE_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"

#include <atomic>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <shared_mutex>
#include <unordered_map>

namespace atomcrypte {

class KeyCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    using Fingerprint = ByteArray<32>;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t lock_failures = 0;  ///< CacheUnavailable events
    };

    explicit KeyCache(size_t capacity = DEFAULT_CAPACITY);
    ~KeyCache();

    KeyCache(const KeyCache&) = delete;
    KeyCache& operator=(const KeyCache&) = delete;

    /**
     * @brief Return the cached master key or derive, insert and return it
     *
     * Errors from derivation (weak password, bad lengths) propagate; lock
     * failures are logged and answered with an uncached derivation.
     */
    SecureBytes get_or_derive(const KeyMaterial& material, KeyLength key_length,
                              uint32_t kdf_cost);

    /**
     * @brief Generic form used by get_or_derive(); derive runs without any lock held
     */
    SecureBytes get_or_compute(const Fingerprint& fingerprint,
                               const std::function<SecureBytes()>& derive);

    /// Only comparable within this cache instance
    Fingerprint fingerprint(const KeyMaterial& material, KeyLength key_length,
                            uint32_t kdf_cost) const;

    bool contains(const Fingerprint& fingerprint) const;
    size_t size() const;
    size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Wipe and drop every entry
     */
    void clear();

    Stats stats() const noexcept;

private:
    struct FingerprintHash {
        size_t operator()(const Fingerprint& fp) const noexcept {
            size_t h;
            std::memcpy(&h, fp.data(), sizeof(h));
            return h;
        }
    };

    void evict_locked();

    static SecureBytes new_fingerprint_key();

    const size_t capacity_;
    mutable std::shared_mutex mutex_;
    SecureBytes fingerprint_key_;
    std::unordered_map<Fingerprint, SecureBytes, FingerprintHash> entries_;
    std::deque<Fingerprint> order_;  ///< insertion order for FIFO eviction

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> lock_failures_{0};
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_KEY_CACHE_H
