/**
 * @file sbox.cpp
 * @brief S-box generation (keyed Fisher-Yates)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/sbox.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/primitives.h"

#include <cstring>
#include <string>

namespace atomcrypte {

namespace {

const char* const SBOX_LABEL = "atomcrypte.sbox";

/**
 * @brief Counter-mode BLAKE2b byte stream
 */
class SeedStream {
public:
    SeedStream(const uint8_t* seed, size_t seed_len, SboxSource source)
        : seed_(seed), seed_len_(seed_len), selector_(static_cast<uint8_t>(source)) {}

    ~SeedStream() {
        internal::secure_zero(block_.data(), block_.size());
    }

    uint16_t next_u16() {
        uint8_t lo = next_byte();
        uint8_t hi = next_byte();
        return static_cast<uint16_t>(lo | (hi << 8));
    }

private:
    uint8_t next_byte() {
        if (pos_ == block_.size()) {
            refill();
        }
        return block_[pos_++];
    }

    void refill() {
        primitives::Blake2b h;
        h.update(std::string(SBOX_LABEL))
         .update_u8(selector_)
         .update_u32(counter_++)
         .update(seed_, seed_len_);
        block_ = h.finish();
        pos_ = 0;
    }

    const uint8_t* seed_;
    size_t seed_len_;
    uint8_t selector_;
    uint32_t counter_ = 0;
    Blake2b512Digest block_{};
    size_t pos_ = block_.size();
};

} // anonymous namespace

bool SBoxPair::is_consistent() const noexcept {
    bool seen[256] = {false};
    for (size_t x = 0; x < 256; x++) {
        if (seen[forward[x]]) return false;
        seen[forward[x]] = true;
        if (inverse[forward[x]] != x) return false;
    }
    return true;
}

SBoxPair SBoxGenerator::generate(const uint8_t* seed, size_t seed_len, SboxSource source) {
    if (seed == nullptr || seed_len == 0) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH, "sbox seed must not be empty");
    }

    SBoxPair pair;
    for (size_t i = 0; i < 256; i++) {
        pair.forward[i] = static_cast<uint8_t>(i);
    }

    SeedStream stream(seed, seed_len, source);
    for (uint32_t i = 255; i > 0; i--) {
        const uint32_t bound = i + 1;
        // Largest multiple of bound below 2^16; draws at or above it are rejected
        const uint32_t limit = 65536u - (65536u % bound);
        uint32_t draw;
        do {
            draw = stream.next_u16();
        } while (draw >= limit);
        const uint32_t j = draw % bound;

        uint8_t tmp = pair.forward[i];
        pair.forward[i] = pair.forward[j];
        pair.forward[j] = tmp;
    }

    for (size_t i = 0; i < 256; i++) {
        pair.inverse[pair.forward[i]] = static_cast<uint8_t>(i);
    }
    return pair;
}

SecureBytes SBoxGenerator::seed_material(SboxSource source, const SecureBytes& master_key,
                                         const ByteVec& nonce) {
    switch (source) {
        case SboxSource::PasswordDerived:
            return master_key;
        case SboxSource::NonceDerived:
            return SecureBytes(nonce);
        case SboxSource::Combined: {
            SecureBytes seed(nonce.size() + master_key.size());
            if (!nonce.empty()) {
                std::memcpy(seed.data(), nonce.data(), nonce.size());
            }
            if (!master_key.empty()) {
                std::memcpy(seed.data() + nonce.size(), master_key.data(), master_key.size());
            }
            return seed;
        }
    }
    throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "unknown sbox source");
}

SBoxPair SBoxGenerator::for_source(SboxSource source, const SecureBytes& master_key,
                                   const ByteVec& nonce) {
    SecureBytes seed = seed_material(source, master_key, nonce);
    return generate(seed, source);
}

} // namespace atomcrypte
