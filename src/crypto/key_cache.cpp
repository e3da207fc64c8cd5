/**
 * @file key_cache.cpp
 * @brief KeyCache implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/key_cache.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/key_derivation.h"
#include "atomcrypte/crypto/primitives.h"
#include "atomcrypte/utils/log.h"
#include "atomcrypte/utils/random.h"

#include <mutex>
#include <system_error>
#include <tuple>

namespace atomcrypte {

KeyCache::KeyCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), fingerprint_key_(new_fingerprint_key()) {}

KeyCache::~KeyCache() {
    // SecureBytes wipes each value as the map is destroyed
    entries_.clear();
    order_.clear();
    fingerprint_key_.wipe();
}

SecureBytes KeyCache::new_fingerprint_key() {
    SecureBytes key(std::tuple_size<Fingerprint>::value);
    random_fill(key.data(), key.size());
    return key;
}

KeyCache::Fingerprint KeyCache::fingerprint(const KeyMaterial& material,
                                            KeyLength key_length, uint32_t kdf_cost) const {
    const ByteVec& salt = material.effective_salt();
    Fingerprint fp{};

    std::shared_lock<std::shared_mutex> lock(mutex_);
    // Length-prefixed fields so (a, bc) and (ab, c) never collide
    primitives::Blake2bMac h(fingerprint_key_, fp.size());
    h.update(std::string("atomcrypte.key-cache"))
     .update_u64(material.password.size()).update(material.password)
     .update_u64(salt.size()).update(salt)
     .update_u64(material.nonce.size()).update(material.nonce)
     .update_u16(static_cast<uint16_t>(key_length))
     .update_u32(kdf_cost);
    h.finish(fp.data());
    return fp;
}

SecureBytes KeyCache::get_or_derive(const KeyMaterial& material, KeyLength key_length,
                                    uint32_t kdf_cost) {
    material.validate();
    auto derive = [&]() {
        return KeyDerivation::derive(material.password, material.effective_salt(),
                                     material.nonce, static_cast<uint32_t>(key_length),
                                     kdf_cost);
    };

    Fingerprint fp{};
    try {
        fp = fingerprint(material, key_length, kdf_cost);
    } catch (const std::system_error& e) {
        lock_failures_.fetch_add(1, std::memory_order_relaxed);
        log::warn(std::string("key cache unavailable (") + e.what() + "), deriving uncached");
        return derive();
    }
    return get_or_compute(fp, derive);
}

SecureBytes KeyCache::get_or_compute(const Fingerprint& fp,
                                     const std::function<SecureBytes()>& derive) {
    // Fast path: shared lock, copy out
    try {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(fp);
        if (it != entries_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    } catch (const std::system_error& e) {
        lock_failures_.fetch_add(1, std::memory_order_relaxed);
        log::warn(std::string("key cache unavailable (") + e.what() + "), deriving uncached");
        return derive();
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    SecureBytes derived = derive();

    try {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto result = entries_.try_emplace(fp, derived);
        if (result.second) {
            order_.push_back(fp);
            evict_locked();
            return derived;
        }
        // Lost the race: hand back the retained value, drop ours
        return result.first->second;
    } catch (const std::system_error& e) {
        lock_failures_.fetch_add(1, std::memory_order_relaxed);
        log::warn(std::string("key cache unavailable (") + e.what() + "), result not cached");
        return derived;
    }
}

void KeyCache::evict_locked() {
    while (entries_.size() > capacity_ && !order_.empty()) {
        auto it = entries_.find(order_.front());
        order_.pop_front();
        if (it != entries_.end()) {
            it->second.wipe();
            entries_.erase(it);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

bool KeyCache::contains(const Fingerprint& fp) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.find(fp) != entries_.end();
}

size_t KeyCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void KeyCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : entries_) {
        entry.second.wipe();
    }
    entries_.clear();
    order_.clear();
    fingerprint_key_ = new_fingerprint_key();
}

KeyCache::Stats KeyCache::stats() const noexcept {
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.lock_failures = lock_failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace atomcrypte
