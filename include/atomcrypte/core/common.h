/**
 * @file common.h
 * @brief Common definitions and utility macros for atomcrypte
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ATOMCRYPTE_CORE_COMMON_H
#define ATOMCRYPTE_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define ATOMCRYPTE_PLATFORM_WINDOWS 1
    #define ATOMCRYPTE_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define ATOMCRYPTE_PLATFORM_LINUX 1
    #define ATOMCRYPTE_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define ATOMCRYPTE_PLATFORM_MACOS 1
    #define ATOMCRYPTE_PLATFORM_NAME "macOS"
#else
    #define ATOMCRYPTE_PLATFORM_UNKNOWN 1
    #define ATOMCRYPTE_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef ATOMCRYPTE_PLATFORM_WINDOWS
    #ifdef ATOMCRYPTE_SHARED_LIBRARY
        #ifdef ATOMCRYPTE_BUILDING
            #define ATOMCRYPTE_API __declspec(dllexport)
        #else
            #define ATOMCRYPTE_API __declspec(dllimport)
        #endif
    #else
        #define ATOMCRYPTE_API
    #endif
#else
    #ifdef ATOMCRYPTE_SHARED_LIBRARY
        #define ATOMCRYPTE_API __attribute__((visibility("default")))
    #else
        #define ATOMCRYPTE_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    ATOMCRYPTE_SUCCESS = 0,
    ATOMCRYPTE_ERROR_INVALID_PARAM = -1,
    ATOMCRYPTE_ERROR_WEAK_INPUT = -2,              // empty or degenerate password
    ATOMCRYPTE_ERROR_INVALID_LENGTH = -3,          // key, nonce, salt or buffer length
    ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG = -4,      // rounds/profile/strategy combination
    ATOMCRYPTE_ERROR_MAC_MISMATCH = -5,            // authentication failed on decrypt
    ATOMCRYPTE_ERROR_CAPABILITY_UNAVAILABLE = -6,  // vector kernel unavailable, scalar used
    ATOMCRYPTE_ERROR_CACHE_UNAVAILABLE = -7,       // key cache lock failed, derived uncached
    ATOMCRYPTE_ERROR_MALFORMED_INPUT = -8,         // truncated or inconsistent blob
    ATOMCRYPTE_ERROR_RANDOM_FAILED = -9,           // CSPRNG failure
    ATOMCRYPTE_ERROR_INTERNAL = -10
} atomcrypte_error_t;

// Key sizes (bytes)
#define ATOMCRYPTE_KEY_256_SIZE      32
#define ATOMCRYPTE_KEY_512_SIZE      64

// Nonce / salt bounds (bytes)
#define ATOMCRYPTE_NONCE_MIN_SIZE     8
#define ATOMCRYPTE_NONCE_MAX_SIZE    64
#define ATOMCRYPTE_NONCE_DEFAULT_SIZE 32

// MAC tag (HMAC-SHA3-512)
#define ATOMCRYPTE_MAC_TAG_SIZE      64

// Utility macros
#define ATOMCRYPTE_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define ATOMCRYPTE_MIN(a, b) ((a) < (b) ? (a) : (b))
#define ATOMCRYPTE_MAX(a, b) ((a) > (b) ? (a) : (b))

// Rotate operations (n in 0..7, masked so n == 0 is well defined)
#define ATOMCRYPTE_ROTL8(x, n)  ((uint8_t)(((x) << ((n) & 7)) | ((x) >> ((8 - ((n) & 7)) & 7))))
#define ATOMCRYPTE_ROTR8(x, n)  ((uint8_t)(((x) >> ((n) & 7)) | ((x) << ((8 - ((n) & 7)) & 7))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
ATOMCRYPTE_API const char* atomcrypte_error_string(atomcrypte_error_t error);

/**
 * @brief Library version string
 */
ATOMCRYPTE_API const char* atomcrypte_version(void);

/**
 * @brief Platform name the library was built for
 */
ATOMCRYPTE_API const char* atomcrypte_platform(void);

/**
 * @brief Initialize the library (checks the CSPRNG and loads OpenSSL)
 * @return ATOMCRYPTE_SUCCESS or an error code
 */
ATOMCRYPTE_API int atomcrypte_init(void);

/**
 * @brief Release library-wide state
 */
ATOMCRYPTE_API void atomcrypte_cleanup(void);

#ifdef __cplusplus
}
#endif

#endif // ATOMCRYPTE_CORE_COMMON_H
