/**
 * @file thread_strategy.h
 * @brief Worker-count and backend planning
 *
 * plan_execution() is a pure function of its inputs: the CPU state is passed
 * in as a CpuSnapshot so the planner can be driven with synthetic values.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CRYPTO_THREAD_STRATEGY_H
#define ATOMCRYPTE_CRYPTO_THREAD_STRATEGY_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace atomcrypte {

enum class ThreadMode : uint8_t {
    Auto = 0,    ///< scale with idle cores, keep headroom
    Full = 1,    ///< every reported core
    Low = 2,     ///< a quarter of the cores, at least one
    Custom = 3   ///< exactly the requested count
};

/**
 * @brief Thread strategy: Auto, Full, Low or Custom(n)
 */
class ThreadStrategy {
public:
    ThreadStrategy() = default;

    static ThreadStrategy automatic() { return ThreadStrategy(ThreadMode::Auto, 0); }
    static ThreadStrategy full() { return ThreadStrategy(ThreadMode::Full, 0); }
    static ThreadStrategy low() { return ThreadStrategy(ThreadMode::Low, 0); }
    static ThreadStrategy custom(uint32_t threads) { return ThreadStrategy(ThreadMode::Custom, threads); }

    ThreadMode mode() const noexcept { return mode_; }
    uint32_t custom_threads() const noexcept { return threads_; }

    bool operator==(const ThreadStrategy& other) const noexcept {
        return mode_ == other.mode_ && threads_ == other.threads_;
    }
    bool operator!=(const ThreadStrategy& other) const noexcept { return !(*this == other); }

    std::string to_string() const;

    /**
     * @brief Parse "auto", "full", "low" or a positive thread count
     * @throws CryptoError(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG)
     */
    static ThreadStrategy parse(const std::string& text);

private:
    ThreadStrategy(ThreadMode mode, uint32_t threads) : mode_(mode), threads_(threads) {}

    ThreadMode mode_ = ThreadMode::Auto;
    uint32_t threads_ = 0;
};

/**
 * @brief CPU state fed into the planner
 */
struct CpuSnapshot {
    uint32_t core_count = 1;
    float current_load = 0.0f;   ///< 0.0 idle .. 1.0 saturated
    bool has_avx2 = false;

    /**
     * @brief Sample the running host (hardware_concurrency, loadavg, CPUID)
     */
    static CpuSnapshot capture();
};

/**
 * @brief Result of planning one transform
 */
struct ExecutionPlan {
    uint32_t worker_count = 1;
    bool use_vectorized = false;
};

/// Inputs shorter than this always use the scalar path
constexpr size_t VECTORIZE_MIN_INPUT = 1024;

/// Fraction of idle cores Auto is allowed to claim
constexpr double AUTO_HEADROOM = 0.75;

/**
 * @brief Decide worker count and backend for one transform
 *
 * - Auto: round(cores * (1 - load) * 0.75), clamped to [1, cores - 1]
 *   (a single-core host gets 1)
 * - Full: cores
 * - Low: max(1, cores / 4)
 * - Custom(n): n
 *
 * use_vectorized is set only when the snapshot reports AVX2 and
 * input_len >= VECTORIZE_MIN_INPUT.
 *
 * @throws CryptoError(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG) for Custom(0)
 */
ExecutionPlan plan_execution(const ThreadStrategy& strategy, size_t input_len,
                             const CpuSnapshot& cpu);

} // namespace atomcrypte

#endif // ATOMCRYPTE_CRYPTO_THREAD_STRATEGY_H
