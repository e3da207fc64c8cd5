/**
 * @file log.cpp
 * @brief Leveled stderr logger
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/utils/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace atomcrypte {
namespace log {

namespace {

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

Level initial_level() {
    Level level = Level::Warn;
    const char* env = std::getenv("ATOMCRYPTE_LOG_LEVEL");
    if (env != nullptr) {
        parse_level(env, level);
    }
    return level;
}

std::atomic<int>& current_level() {
    static std::atomic<int> level{static_cast<int>(initial_level())};
    return level;
}

const char* prefix(Level level) {
    switch (level) {
        case Level::Debug: return "[DEBUG] ";
        case Level::Info:  return "[INFO] ";
        case Level::Warn:  return "[WARN] ";
        case Level::Error: return "[ERROR] ";
        default:           return "";
    }
}

} // anonymous namespace

void set_level(Level level) noexcept {
    current_level().store(static_cast<int>(level));
}

Level level() noexcept {
    return static_cast<Level>(current_level().load());
}

bool parse_level(const std::string& name, Level& out) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        out = Level::Debug;
    } else if (lower == "info") {
        out = Level::Info;
    } else if (lower == "warn" || lower == "warning") {
        out = Level::Warn;
    } else if (lower == "error") {
        out = Level::Error;
    } else if (lower == "off" || lower == "none") {
        out = Level::Off;
    } else {
        return false;
    }
    return true;
}

void write(Level lvl, const std::string& message) {
    if (lvl == Level::Off || static_cast<int>(lvl) < current_level().load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << prefix(lvl) << message << std::endl;
}

void benchmark(const std::string& phase, double milliseconds) {
    if (level() == Level::Off) {
        return;
    }
    std::ostringstream oss;
    oss << "[BENCH] " << std::left << std::setw(16) << phase
        << std::right << std::fixed << std::setprecision(3) << milliseconds << " ms";
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << oss.str() << std::endl;
}

} // namespace log
} // namespace atomcrypte
