/**
 * @file round_kernels_avx2.cpp
 * @brief AVX2 round kernels, 32 bytes per step
 *
 * - S-box: sixteen 16-entry PSHUFB tables selected by the high nibble
 * - XOR / ADD / SUB: native epi8 ops
 * - Per-byte variable rotate: three conditional constant rotates
 *   (by 1, 2, 4) selected with BLENDV on the bits of r
 *
 * This file is compiled with -mavx2 when ATOMCRYPTE_ENABLE_AVX2 is on;
 * otherwise the entry points forward to the scalar kernels and
 * avx2_kernel_compiled() reports false.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "round_kernels.h"

#if defined(__AVX2__)
#define ATOMCRYPTE_HAS_AVX2_KERNEL 1
#include <immintrin.h>
#else
#define ATOMCRYPTE_HAS_AVX2_KERNEL 0
#endif

namespace atomcrypte {
namespace internal {

#if ATOMCRYPTE_HAS_AVX2_KERNEL

namespace {

struct SboxLanes {
    __m256i rows[16];
};

inline void load_sbox(SboxLanes& lanes, const uint8_t table[256]) {
    for (int k = 0; k < 16; k++) {
        __m128i row = _mm_loadu_si128(reinterpret_cast<const __m128i*>(table + 16 * k));
        lanes.rows[k] = _mm256_broadcastsi128_si256(row);
    }
}

inline __m256i substitute(const SboxLanes& lanes, __m256i v) {
    const __m256i nibble = _mm256_set1_epi8(0x0F);
    const __m256i lo = _mm256_and_si256(v, nibble);
    const __m256i hi = _mm256_and_si256(_mm256_srli_epi16(v, 4), nibble);

    __m256i result = _mm256_setzero_si256();
    for (int k = 0; k < 16; k++) {
        const __m256i select = _mm256_cmpeq_epi8(hi, _mm256_set1_epi8(static_cast<char>(k)));
        const __m256i looked = _mm256_shuffle_epi8(lanes.rows[k], lo);
        result = _mm256_or_si256(result, _mm256_and_si256(select, looked));
    }
    return result;
}

template<int K>
inline __m256i rotl_const(__m256i v) {
    const __m256i hi_mask = _mm256_set1_epi8(static_cast<char>((0xFF << K) & 0xFF));
    const __m256i lo_mask = _mm256_set1_epi8(static_cast<char>(0xFF >> (8 - K)));
    const __m256i left = _mm256_and_si256(_mm256_slli_epi16(v, K), hi_mask);
    const __m256i right = _mm256_and_si256(_mm256_srli_epi16(v, 8 - K), lo_mask);
    return _mm256_or_si256(left, right);
}

template<int K>
inline __m256i rotl_if(__m256i v, __m256i amount) {
    const __m256i bit = _mm256_set1_epi8(K);
    const __m256i take = _mm256_cmpeq_epi8(_mm256_and_si256(amount, bit), bit);
    return _mm256_blendv_epi8(v, rotl_const<K>(v), take);
}

// amount must already be in 0..7
inline __m256i rotl_var(__m256i v, __m256i amount) {
    v = rotl_if<1>(v, amount);
    v = rotl_if<2>(v, amount);
    v = rotl_if<4>(v, amount);
    return v;
}

} // anonymous namespace

bool avx2_kernel_compiled() noexcept {
    return true;
}

void avx2_encrypt_round(uint8_t* data, size_t n,
                        const uint8_t* x, const uint8_t* a, const uint8_t* r,
                        const uint8_t forward[256]) {
    SboxLanes lanes;
    load_sbox(lanes, forward);
    const __m256i seven = _mm256_set1_epi8(7);

    size_t i = 0;
    for (; i + 32 <= n; i += 32) {
        __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(data + i));
        const __m256i vx = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(x + i));
        const __m256i va = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(a + i));
        const __m256i vr = _mm256_and_si256(
            _mm256_loadu_si256(reinterpret_cast<const __m256i*>(r + i)), seven);

        v = substitute(lanes, v);
        v = _mm256_xor_si256(v, vx);
        v = _mm256_add_epi8(v, va);
        v = rotl_var(v, vr);

        _mm256_storeu_si256(reinterpret_cast<__m256i*>(data + i), v);
    }

    if (i < n) {
        scalar_encrypt_round(data + i, n - i, x + i, a + i, r + i, forward);
    }
}

void avx2_decrypt_round(uint8_t* data, size_t n,
                        const uint8_t* x, const uint8_t* a, const uint8_t* r,
                        const uint8_t inverse[256]) {
    SboxLanes lanes;
    load_sbox(lanes, inverse);
    const __m256i seven = _mm256_set1_epi8(7);
    const __m256i eight = _mm256_set1_epi8(8);

    size_t i = 0;
    for (; i + 32 <= n; i += 32) {
        __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(data + i));
        const __m256i vx = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(x + i));
        const __m256i va = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(a + i));
        const __m256i vr = _mm256_and_si256(
            _mm256_loadu_si256(reinterpret_cast<const __m256i*>(r + i)), seven);

        // rotr by r == rotl by (8 - r) & 7
        const __m256i back = _mm256_and_si256(_mm256_sub_epi8(eight, vr), seven);
        v = rotl_var(v, back);
        v = _mm256_sub_epi8(v, va);
        v = _mm256_xor_si256(v, vx);
        v = substitute(lanes, v);

        _mm256_storeu_si256(reinterpret_cast<__m256i*>(data + i), v);
    }

    if (i < n) {
        scalar_decrypt_round(data + i, n - i, x + i, a + i, r + i, inverse);
    }
}

#else

bool avx2_kernel_compiled() noexcept {
    return false;
}

void avx2_encrypt_round(uint8_t* data, size_t n,
                        const uint8_t* x, const uint8_t* a, const uint8_t* r,
                        const uint8_t forward[256]) {
    scalar_encrypt_round(data, n, x, a, r, forward);
}

void avx2_decrypt_round(uint8_t* data, size_t n,
                        const uint8_t* x, const uint8_t* a, const uint8_t* r,
                        const uint8_t inverse[256]) {
    scalar_decrypt_round(data, n, x, a, r, inverse);
}

#endif // ATOMCRYPTE_HAS_AVX2_KERNEL

} // namespace internal
} // namespace atomcrypte
