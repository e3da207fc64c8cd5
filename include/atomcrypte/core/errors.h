/**
 * @file errors.h
 * @brief Exception type carrying an atomcrypte_error_t
 *
 * The C++ API reports failures by throwing CryptoError; the C ABI maps the
 * same codes onto return values.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CORE_ERRORS_H
#define ATOMCRYPTE_CORE_ERRORS_H

#include "atomcrypte/core/common.h"

#include <stdexcept>
#include <string>

namespace atomcrypte {

class CryptoError : public std::runtime_error {
public:
    CryptoError(atomcrypte_error_t code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    atomcrypte_error_t code() const noexcept { return code_; }

private:
    atomcrypte_error_t code_;
};

/**
 * @brief Throw CryptoError with the message prefixed by the code's name
 */
[[noreturn]] void throw_error(atomcrypte_error_t code, const std::string& detail);

} // namespace atomcrypte

#endif // ATOMCRYPTE_CORE_ERRORS_H
