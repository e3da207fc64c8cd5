/**
 * @file export.cpp
 * @brief Library export, initialization and error reporting
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "atomcrypte/atomcrypte.h"

#include <atomic>
#include <string>

#include <openssl/crypto.h>

#include <fcntl.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_atomcrypte_initialized{false};

}  // namespace

extern "C" {

const char* atomcrypte_version(void) {
    return ATOMCRYPTE_VERSION_STRING;
}

const char* atomcrypte_platform(void) {
    return ATOMCRYPTE_PLATFORM_NAME;
}

int atomcrypte_init(void) {
    if (g_atomcrypte_initialized.load()) {
        return ATOMCRYPTE_SUCCESS;
    }

    // Check /dev/urandom availability for the CSPRNG fallback path
    int fd = open("/dev/urandom", O_RDONLY);
    if (fd < 0) {
        return ATOMCRYPTE_ERROR_RANDOM_FAILED;
    }
    close(fd);

    if (OPENSSL_init_crypto(0, nullptr) != 1) {
        return ATOMCRYPTE_ERROR_INTERNAL;
    }

    g_atomcrypte_initialized.store(true);
    return ATOMCRYPTE_SUCCESS;
}

void atomcrypte_cleanup(void) {
    g_atomcrypte_initialized.store(false);
}

const char* atomcrypte_error_string(atomcrypte_error_t error) {
    switch (error) {
        case ATOMCRYPTE_SUCCESS:
            return "Success";
        case ATOMCRYPTE_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case ATOMCRYPTE_ERROR_WEAK_INPUT:
            return "Weak input";
        case ATOMCRYPTE_ERROR_INVALID_LENGTH:
            return "Invalid length";
        case ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG:
            return "Unsupported configuration";
        case ATOMCRYPTE_ERROR_MAC_MISMATCH:
            return "MAC mismatch";
        case ATOMCRYPTE_ERROR_CAPABILITY_UNAVAILABLE:
            return "Capability unavailable";
        case ATOMCRYPTE_ERROR_CACHE_UNAVAILABLE:
            return "Cache unavailable";
        case ATOMCRYPTE_ERROR_MALFORMED_INPUT:
            return "Malformed input";
        case ATOMCRYPTE_ERROR_RANDOM_FAILED:
            return "Random generation failed";
        case ATOMCRYPTE_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"

namespace atomcrypte {

void throw_error(atomcrypte_error_t code, const std::string& detail) {
    throw CryptoError(code, std::string(atomcrypte_error_string(code)) + ": " + detail);
}

} // namespace atomcrypte
