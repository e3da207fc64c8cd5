/**
 * @file log.h
 * @brief Leveled diagnostic logging to stderr
 *
 * Default level is WARN. ATOMCRYPTE_LOG_LEVEL (debug|info|warn|error|off)
 * overrides it at first use; set_level() overrides both. Messages never
 * carry key material, passwords or plaintext.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_UTILS_LOG_H
#define ATOMCRYPTE_UTILS_LOG_H

#include <string>

namespace atomcrypte {
namespace log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

void set_level(Level level) noexcept;
Level level() noexcept;

/**
 * @brief Parse "debug", "info", "warn", "error" or "off" (case-insensitive)
 * @return false if the name is not recognized; out is left untouched
 */
bool parse_level(const std::string& name, Level& out) noexcept;

void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warn(const std::string& message) { write(Level::Warn, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

/**
 * @brief Timing report for Config::benchmark; emitted unless the level is Off
 */
void benchmark(const std::string& phase, double milliseconds);

} // namespace log
} // namespace atomcrypte

#endif // ATOMCRYPTE_UTILS_LOG_H
