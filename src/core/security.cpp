/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * - Secure zeroing and two-pass wiping
 * - Constant-time comparison
 * - Platform-specific CSPRNG
 * - SecureBytes lifecycle
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/core/security.h"
#include "atomcrypte/core/common.h"

#include <algorithm>
#include <cstring>
#include <cstdint>
#include <utility>

#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#if defined(__linux__)
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define ATOMCRYPTE_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t atomcrypte_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#elif defined(__APPLE__)
#include <Security/SecRandom.h>
#endif

namespace atomcrypte {
namespace internal {

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;
    secure_zero_ptr(ptr, len);
    COMPILER_BARRIER();
}

void secure_wipe(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

    // Pass 1: random overwrite. A CSPRNG failure here still leaves pass 2.
    (void)random_bytes(ptr, len);
    COMPILER_BARRIER();

    // Pass 2: zero
    secure_zero(ptr, len);
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    // Always iterate through all bytes
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

// ============================================================================
// CSPRNG Implementation
// ============================================================================

#if defined(__linux__)

int random_bytes(void* buf, size_t len) {
    if (!buf) return ATOMCRYPTE_ERROR_INVALID_PARAM;
    if (len == 0) return ATOMCRYPTE_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef ATOMCRYPTE_HAS_GETRANDOM_SYSCALL
    while (remaining > 0) {
        ssize_t ret = atomcrypte_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;  // ENOSYS or other: fall through to /dev/urandom
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    if (remaining == 0) return ATOMCRYPTE_SUCCESS;

    p = static_cast<unsigned char*>(buf);
    remaining = len;
#endif

    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return ATOMCRYPTE_ERROR_RANDOM_FAILED;

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return ATOMCRYPTE_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return ATOMCRYPTE_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return ATOMCRYPTE_SUCCESS;
}

#elif defined(__APPLE__)

int random_bytes(void* buf, size_t len) {
    if (!buf) return ATOMCRYPTE_ERROR_INVALID_PARAM;
    if (len == 0) return ATOMCRYPTE_SUCCESS;

    if (SecRandomCopyBytes(kSecRandomDefault, len, buf) == errSecSuccess) {
        return ATOMCRYPTE_SUCCESS;
    }

    arc4random_buf(buf, len);
    return ATOMCRYPTE_SUCCESS;
}

#else

int random_bytes(void* buf, size_t len) {
    if (!buf) return ATOMCRYPTE_ERROR_INVALID_PARAM;
    if (len == 0) return ATOMCRYPTE_SUCCESS;

    int fd = open("/dev/urandom", O_RDONLY);
    if (fd < 0) return ATOMCRYPTE_ERROR_RANDOM_FAILED;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret <= 0) {
            if (ret < 0 && errno == EINTR) continue;
            close(fd);
            return ATOMCRYPTE_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    close(fd);
    return ATOMCRYPTE_SUCCESS;
}

#endif

}  // namespace internal

// ============================================================================
// SecureBytes
// ============================================================================

SecureBytes::SecureBytes(size_t size) : bytes_(size, 0) {}

SecureBytes::SecureBytes(const uint8_t* data, size_t size)
    : bytes_(data, data + size) {}

SecureBytes::SecureBytes(const ByteVec& data) : bytes_(data) {}

SecureBytes::SecureBytes(const std::string& data)
    : bytes_(data.begin(), data.end()) {}

SecureBytes::~SecureBytes() {
    wipe();
}

SecureBytes::SecureBytes(const SecureBytes& other) : bytes_(other.bytes_) {}

SecureBytes& SecureBytes::operator=(const SecureBytes& other) {
    if (this != &other) {
        wipe();
        bytes_ = other.bytes_;
    }
    return *this;
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void SecureBytes::wipe() noexcept {
    if (!bytes_.empty()) {
        internal::secure_wipe(bytes_.data(), bytes_.size());
    }
    bytes_.clear();
}

bool SecureBytes::equals(const SecureBytes& other) const noexcept {
    if (bytes_.size() != other.bytes_.size()) return false;
    if (bytes_.empty()) return true;
    return internal::secure_compare(bytes_.data(), other.bytes_.data(), bytes_.size());
}

}  // namespace atomcrypte

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void atomcrypte_secure_zero(void* ptr, size_t len) {
    atomcrypte::internal::secure_zero(ptr, len);
}

void atomcrypte_secure_wipe(void* ptr, size_t len) {
    atomcrypte::internal::secure_wipe(ptr, len);
}

int atomcrypte_secure_compare(const void* a, const void* b, size_t len) {
    return atomcrypte::internal::secure_compare(a, b, len) ? 0 : 1;
}

int atomcrypte_random_bytes(void* buf, size_t len) {
    return atomcrypte::internal::random_bytes(buf, len);
}

}  // extern "C"
