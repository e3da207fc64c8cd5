/**
 * @file cpu_features.cpp
 * @brief CPU Feature Detection for Runtime SIMD Dispatch
 *
 * Uses CPUID (plus XGETBV for OS-enabled YMM state) on x86_64 and
 * getauxval on ARM64 Linux.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "atomcrypte/core/cpu_features.h"
#include <cstdint>
#include <cstring>

#if defined(__GNUC__) || defined(__clang__)
    #if defined(__x86_64__)
        #include <cpuid.h>
    #endif
#endif

#if defined(__linux__) && defined(__aarch64__)
    #include <sys/auxv.h>
    #include <asm/hwcap.h>
#endif

namespace atomcrypte {
namespace cpu {

namespace {

#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
static inline void cpuid(uint32_t leaf, uint32_t subleaf, uint32_t regs[4]) {
    __cpuid_count(leaf, subleaf, regs[0], regs[1], regs[2], regs[3]);
}

// XCR0 bits 1 and 2: XMM and YMM state saved by the OS
static inline bool os_saves_ymm() {
    uint32_t eax = 0;
    uint32_t edx = 0;
    __asm__ __volatile__("xgetbv" : "=a"(eax), "=d"(edx) : "c"(0));
    return (eax & 0x6) == 0x6;
}
#endif

} // anonymous namespace

CPUFeatures CPUFeatures::detect() noexcept {
    CPUFeatures features{};

#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
    uint32_t regs[4];

    cpuid(0, 0, regs);
    const uint32_t max_leaf = regs[0];
    char vendor[13] = {0};
    std::memcpy(vendor, &regs[1], 4);     // EBX
    std::memcpy(vendor + 4, &regs[3], 4); // EDX
    std::memcpy(vendor + 8, &regs[2], 4); // ECX

    if (std::strcmp(vendor, "GenuineIntel") == 0) {
        features.is_intel = true;
    } else if (std::strcmp(vendor, "AuthenticAMD") == 0) {
        features.is_amd = true;
    }

    cpuid(1, 0, regs);
    features.has_sse2  = (regs[3] & (1u << 26)) != 0;  // EDX bit 26
    features.has_ssse3 = (regs[2] & (1u << 9))  != 0;  // ECX bit 9
    features.has_sse41 = (regs[2] & (1u << 19)) != 0;  // ECX bit 19
    const bool osxsave = (regs[2] & (1u << 27)) != 0;  // ECX bit 27
    const bool avx_bit = (regs[2] & (1u << 28)) != 0;  // ECX bit 28
    const bool ymm_ok = osxsave && os_saves_ymm();
    features.has_avx = avx_bit && ymm_ok;

    if (max_leaf >= 7) {
        cpuid(7, 0, regs);
        features.has_avx2 = ymm_ok && (regs[1] & (1u << 5)) != 0;  // EBX bit 5
    }

#elif defined(__aarch64__)
#if defined(__linux__)
    unsigned long hwcaps = getauxval(AT_HWCAP);
    features.has_neon = (hwcaps & HWCAP_ASIMD) != 0;
#elif defined(__APPLE__)
    features.has_neon = true;
#endif
#endif

    return features;
}

const CPUFeatures& CPUFeatures::current() noexcept {
    static const CPUFeatures features = detect();
    return features;
}

std::string CPUFeatures::to_string() const {
    std::string result;

#if defined(__x86_64__)
    if (is_intel) result += "Intel ";
    if (is_amd) result += "AMD ";

    if (has_sse2) result += "SSE2 ";
    if (has_ssse3) result += "SSSE3 ";
    if (has_sse41) result += "SSE4.1 ";
    if (has_avx) result += "AVX ";
    if (has_avx2) result += "AVX2 ";
#elif defined(__aarch64__)
    result += "ARM64 ";
    if (has_neon) result += "NEON ";
#endif

    if (result.empty()) {
        return "none";
    }
    result.pop_back();
    return result;
}

} // namespace cpu
} // namespace atomcrypte
