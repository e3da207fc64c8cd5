/**
 * @file thread_strategy.cpp
 * @brief Worker-count planning and host CPU sampling
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/thread_strategy.h"
#include "atomcrypte/core/cpu_features.h"
#include "atomcrypte/core/errors.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <thread>

namespace atomcrypte {

std::string ThreadStrategy::to_string() const {
    switch (mode_) {
        case ThreadMode::Auto:   return "auto";
        case ThreadMode::Full:   return "full";
        case ThreadMode::Low:    return "low";
        case ThreadMode::Custom: return "custom(" + std::to_string(threads_) + ")";
    }
    return "unknown";
}

ThreadStrategy ThreadStrategy::parse(const std::string& text) {
    if (text == "auto") return automatic();
    if (text == "full") return full();
    if (text == "low") return low();

    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
        text.size() > 6) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "invalid thread strategy: " + text);
    }
    const unsigned long n = std::strtoul(text.c_str(), nullptr, 10);
    if (n == 0) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG, "custom thread count must be at least 1");
    }
    return custom(static_cast<uint32_t>(n));
}

CpuSnapshot CpuSnapshot::capture() {
    CpuSnapshot snapshot;
    snapshot.core_count = std::max(1u, std::thread::hardware_concurrency());
    snapshot.has_avx2 = cpu::CPUFeatures::current().has_avx2;

    double loadavg[1] = {0.0};
    if (getloadavg(loadavg, 1) == 1) {
        const double per_core = loadavg[0] / static_cast<double>(snapshot.core_count);
        snapshot.current_load = static_cast<float>(std::min(1.0, std::max(0.0, per_core)));
    }
    return snapshot;
}

ExecutionPlan plan_execution(const ThreadStrategy& strategy, size_t input_len,
                             const CpuSnapshot& cpu) {
    const uint32_t cores = std::max(1u, cpu.core_count);
    ExecutionPlan plan;

    switch (strategy.mode()) {
        case ThreadMode::Auto: {
            const double load = std::min(1.0, std::max(0.0, static_cast<double>(cpu.current_load)));
            const double wanted = std::round(cores * (1.0 - load) * AUTO_HEADROOM);
            const uint32_t ceiling = cores > 1 ? cores - 1 : 1;
            plan.worker_count = static_cast<uint32_t>(
                std::min<double>(ceiling, std::max(1.0, wanted)));
            break;
        }
        case ThreadMode::Full:
            plan.worker_count = cores;
            break;
        case ThreadMode::Low:
            plan.worker_count = std::max(1u, cores / 4);
            break;
        case ThreadMode::Custom:
            if (strategy.custom_threads() == 0) {
                throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                            "custom thread count must be at least 1");
            }
            plan.worker_count = strategy.custom_threads();
            break;
    }

    plan.use_vectorized = cpu.has_avx2 && input_len >= VECTORIZE_MIN_INPUT;
    return plan;
}

} // namespace atomcrypte
