/**
 * @file cpu_features.h
 * @brief CPU Feature Detection API
 *
 * Runtime detection of SIMD capabilities for the vectorized round kernel.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ATOMCRYPTE_CORE_CPU_FEATURES_H
#define ATOMCRYPTE_CORE_CPU_FEATURES_H

#include "atomcrypte/core/common.h"
#include <string>

namespace atomcrypte {
namespace cpu {

/**
 * @brief CPU feature flags detected at runtime
 */
struct CPUFeatures {
    // x86_64 features
    bool has_sse2   = false;  ///< SSE2 (baseline for x86_64)
    bool has_ssse3  = false;  ///< SSSE3 (PSHUFB)
    bool has_sse41  = false;  ///< SSE4.1
    bool has_avx    = false;  ///< AVX 256-bit SIMD
    bool has_avx2   = false;  ///< AVX2 with integer ops (OS-enabled YMM state)

    // ARM64 features
    bool has_neon = false;    ///< ARM NEON SIMD

    // CPU vendor
    bool is_intel = false;
    bool is_amd   = false;

    /**
     * @brief Detect CPU features using CPUID/getauxval
     * @return Populated CPUFeatures struct
     */
    static CPUFeatures detect() noexcept;

    /**
     * @brief Features of the running CPU, detected once per process
     */
    static const CPUFeatures& current() noexcept;

    /**
     * @brief Get human-readable feature string
     * @return Space-separated feature names
     */
    std::string to_string() const;
};

} // namespace cpu
} // namespace atomcrypte

#endif // ATOMCRYPTE_CORE_CPU_FEATURES_H
