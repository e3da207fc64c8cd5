/**
 * @file pipeline.h
 * @brief Chunked, parallel multi-round byte transform
 *
 * Each round applies, per byte: substitution, keystream XOR, keystream ADD
 * (mod 256) and a keystream-selected left rotation; decryption applies the
 * inverse steps in reverse order. Keystream for round r and slice s
 * (4096-byte unit at absolute offset s * 4096) is
 *
 *   ChaCha20(key = round_key[r], counter = 0, nonce = u32le(r) || u64le(s))
 *
 * split into XOR, ADD and ROT thirds. Chunks are whole multiples of the
 * slice, so output depends only on (data, key, sbox, rounds), never on the
 * chunking, worker count or backend.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_PIPELINE_H
#define ATOMCRYPTE_CRYPTO_PIPELINE_H

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/crypto/config.h"
#include "atomcrypte/crypto/sbox.h"
#include "atomcrypte/crypto/thread_strategy.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace atomcrypte {

enum class Direction {
    Encrypt,
    Decrypt
};

constexpr size_t KEYSTREAM_SLICE = 4096;
constexpr size_t SINGLE_CHUNK_MAX = 64 * 1024;
constexpr size_t MIN_CHUNK_SIZE = 64 * 1024;
constexpr size_t CHUNKS_PER_WORKER = 4;
constexpr size_t ROUND_KEY_SIZE = 32;

/**
 * @brief Contiguous byte range processed by one task
 */
struct Chunk {
    size_t index;
    size_t offset;
    size_t length;
};

/**
 * @brief Split total_len bytes into chunks
 *
 * Inputs up to SINGLE_CHUNK_MAX form one chunk. Larger inputs get
 * roughly CHUNKS_PER_WORKER chunks per worker, each at least MIN_CHUNK_SIZE
 * and a multiple of KEYSTREAM_SLICE (the last chunk takes the remainder).
 */
std::vector<Chunk> plan_chunks(size_t total_len, uint32_t worker_count);

class ChunkRoundPipeline {
public:
    /**
     * @param key_length configured key length; transform() rejects keys of any other size
     */
    explicit ChunkRoundPipeline(KeyLength key_length) : key_length_(key_length) {}

    /**
     * @brief Transform in_len bytes into out (in == out is allowed)
     *
     * @throws CryptoError INVALID_LENGTH if out_len != in_len (length mismatch)
     *         or the key size disagrees with the configured key length
     * @throws CryptoError UNSUPPORTED_CONFIG if rounds == 0
     */
    void transform(const uint8_t* in, size_t in_len, uint8_t* out, size_t out_len,
                   const SecureBytes& key, const SBoxPair& sbox, uint32_t rounds,
                   const ExecutionPlan& plan, Direction direction) const;

    ByteVec transform(const ByteVec& data, const SecureBytes& key, const SBoxPair& sbox,
                      uint32_t rounds, const ExecutionPlan& plan, Direction direction) const;

    /**
     * @brief Vector kernel compiled into this build and supported by this CPU
     */
    static bool vector_backend_available() noexcept;

private:
    KeyLength key_length_;
};

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_PIPELINE_H
