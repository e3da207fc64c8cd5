/**
 * @file pipeline.cpp
 * @brief ChunkRoundPipeline implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/pipeline.h"
#include "atomcrypte/core/cpu_features.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/primitives.h"
#include "atomcrypte/utils/byte_order.h"
#include "atomcrypte/utils/log.h"
#include "atomcrypte/utils/worker_pool.h"
#include "round_kernels.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <string>

namespace atomcrypte {

namespace {

const char* const ROUND_KEY_LABEL = "atomcrypte.round-key";

struct RoundBackend {
    internal::RoundKernelFn encrypt;
    internal::RoundKernelFn decrypt;
};

RoundBackend select_backend(bool vectorized) {
    if (vectorized) {
        return {internal::avx2_encrypt_round, internal::avx2_decrypt_round};
    }
    return {internal::scalar_encrypt_round, internal::scalar_decrypt_round};
}

void warn_vector_fallback_once() {
    static std::atomic<bool> warned{false};
    if (!warned.exchange(true)) {
        log::warn(std::string(atomcrypte_error_string(ATOMCRYPTE_ERROR_CAPABILITY_UNAVAILABLE)) +
                  ": AVX2 kernel not usable in this build or on this CPU, using scalar path");
    }
}

SecureBytes derive_round_keys(const SecureBytes& key, uint32_t rounds) {
    SecureBytes round_keys(static_cast<size_t>(rounds) * ROUND_KEY_SIZE);
    for (uint32_t r = 0; r < rounds; r++) {
        primitives::Blake2bMac mac(key, ROUND_KEY_SIZE);
        mac.update(std::string(ROUND_KEY_LABEL)).update_u32(r);
        mac.finish(round_keys.data() + static_cast<size_t>(r) * ROUND_KEY_SIZE);
    }
    return round_keys;
}

/**
 * @brief Per-task keystream state: one cipher context and one wiped buffer
 */
class SliceKeystream {
public:
    SliceKeystream() : buffer_(3 * KEYSTREAM_SLICE) {}

    ~SliceKeystream() {
        internal::secure_wipe(buffer_.data(), buffer_.size());
    }

    SliceKeystream(const SliceKeystream&) = delete;
    SliceKeystream& operator=(const SliceKeystream&) = delete;

    // Fills 3 * n bytes: [xor | add | rot]
    const uint8_t* generate(const uint8_t* round_key, uint32_t round, uint64_t slice, size_t n) {
        uint8_t iv[primitives::CHACHA20_IV_SIZE];
        byte_order::store_le32(iv, 0);
        byte_order::store_le32(iv + 4, round);
        byte_order::store_le64(iv + 8, slice);
        stream_.generate(round_key, iv, buffer_.data(), 3 * n);
        return buffer_.data();
    }

private:
    primitives::ChaCha20Keystream stream_;
    ByteVec buffer_;
};

} // anonymous namespace

std::vector<Chunk> plan_chunks(size_t total_len, uint32_t worker_count) {
    std::vector<Chunk> chunks;
    if (total_len == 0) {
        return chunks;
    }
    if (total_len <= SINGLE_CHUNK_MAX) {
        chunks.push_back({0, 0, total_len});
        return chunks;
    }

    const size_t workers = std::max<uint32_t>(1u, worker_count);
    const size_t target_count = workers * CHUNKS_PER_WORKER;
    size_t chunk_size = (total_len + target_count - 1) / target_count;
    chunk_size = std::max(chunk_size, MIN_CHUNK_SIZE);
    chunk_size = (chunk_size + KEYSTREAM_SLICE - 1) / KEYSTREAM_SLICE * KEYSTREAM_SLICE;

    size_t offset = 0;
    size_t index = 0;
    while (offset < total_len) {
        const size_t length = std::min(chunk_size, total_len - offset);
        chunks.push_back({index++, offset, length});
        offset += length;
    }
    return chunks;
}

bool ChunkRoundPipeline::vector_backend_available() noexcept {
    return internal::avx2_kernel_compiled() && cpu::CPUFeatures::current().has_avx2;
}

void ChunkRoundPipeline::transform(const uint8_t* in, size_t in_len, uint8_t* out, size_t out_len,
                                   const SecureBytes& key, const SBoxPair& sbox, uint32_t rounds,
                                   const ExecutionPlan& plan, Direction direction) const {
    if (out_len != in_len) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "length mismatch: input " + std::to_string(in_len) +
                    " bytes, output buffer " + std::to_string(out_len) + " bytes");
    }
    if (key.size() != key_bytes(key_length_)) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "unsupported key length: got " + std::to_string(key.size() * 8) +
                    " bits, configured " + to_string(key_length_));
    }
    if (rounds == 0) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "rounds must be at least 1");
    }
    if (in_len == 0) {
        return;
    }
    if (in == nullptr || out == nullptr) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_PARAM, "null buffer");
    }

    bool vectorized = plan.use_vectorized;
    if (vectorized && !vector_backend_available()) {
        warn_vector_fallback_once();
        vectorized = false;
    }
    const RoundBackend backend = select_backend(vectorized);
    const internal::RoundKernelFn kernel =
        direction == Direction::Encrypt ? backend.encrypt : backend.decrypt;
    const uint8_t* table =
        direction == Direction::Encrypt ? sbox.forward.data() : sbox.inverse.data();

    if (in != out) {
        std::memmove(out, in, in_len);
    }

    const SecureBytes round_keys = derive_round_keys(key, rounds);
    const std::vector<Chunk> chunks = plan_chunks(in_len, plan.worker_count);

    log::debug("pipeline: " + std::to_string(in_len) + " bytes, " +
               std::to_string(chunks.size()) + " chunk(s), " +
               std::to_string(plan.worker_count) + " worker(s), " +
               (vectorized ? "avx2" : "scalar") + ", " + std::to_string(rounds) + " round(s)");

    WorkerPool pool(plan.worker_count);
    pool.run(chunks.size(), [&](size_t task, uint32_t) {
        const Chunk& chunk = chunks[task];
        SliceKeystream keystream;

        const size_t end = chunk.offset + chunk.length;
        for (size_t pos = chunk.offset; pos < end; pos += KEYSTREAM_SLICE) {
            const size_t n = std::min(KEYSTREAM_SLICE, end - pos);
            const uint64_t slice = pos / KEYSTREAM_SLICE;
            uint8_t* data = out + pos;

            for (uint32_t step = 0; step < rounds; step++) {
                const uint32_t round = direction == Direction::Encrypt ? step : rounds - 1 - step;
                const uint8_t* ks = keystream.generate(
                    round_keys.data() + static_cast<size_t>(round) * ROUND_KEY_SIZE,
                    round, slice, n);
                kernel(data, n, ks, ks + n, ks + 2 * n, table);
            }
        }
    });
}

ByteVec ChunkRoundPipeline::transform(const ByteVec& data, const SecureBytes& key,
                                      const SBoxPair& sbox, uint32_t rounds,
                                      const ExecutionPlan& plan, Direction direction) const {
    ByteVec out(data.size());
    WipeGuard guard(out);
    transform(data.data(), data.size(), out.data(), out.size(), key, sbox, rounds, plan, direction);
    guard.dismiss();
    return out;
}

} // namespace atomcrypte
