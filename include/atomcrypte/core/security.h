/**
 * @file security.h
 * @brief Security primitives for atomcrypte - wiping, constant-time compare, CSPRNG
 *
 * This header provides:
 * - Secure zeroing that the compiler cannot elide
 * - Two-pass wiping (random overwrite, then zero) for key material
 * - Constant-time comparison to prevent timing attacks
 * - Cryptographically secure random bytes from the platform CSPRNG
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_CORE_SECURITY_H
#define ATOMCRYPTE_CORE_SECURITY_H

#include <stddef.h>
#include <stdint.h>

#include "atomcrypte/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * The execution time does not depend on the content of the memory regions.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 0 if equal, non-zero if different (but NOT the position of difference)
 */
ATOMCRYPTE_API int atomcrypte_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Secure memory zeroing, guaranteed not to be optimized away
 */
ATOMCRYPTE_API void atomcrypte_secure_zero(void* ptr, size_t len);

/**
 * @brief Two-pass wipe: overwrite with CSPRNG output, then with zeros
 *
 * The zero pass always runs, even if the random pass could not be served.
 */
ATOMCRYPTE_API void atomcrypte_secure_wipe(void* ptr, size_t len);

/**
 * @brief Cryptographically secure random bytes
 *
 * - Linux: getrandom() syscall, falling back to /dev/urandom
 * - macOS: SecRandomCopyBytes or arc4random_buf
 * - other POSIX: /dev/urandom
 *
 * @return ATOMCRYPTE_SUCCESS on success, ATOMCRYPTE_ERROR_RANDOM_FAILED on error
 */
ATOMCRYPTE_API int atomcrypte_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

#include "atomcrypte/core/types.h"

#include <string>
#include <vector>

namespace atomcrypte {

namespace internal {

void secure_zero(void* ptr, size_t len);
void secure_wipe(void* ptr, size_t len);
bool secure_compare(const void* a, const void* b, size_t len);
int random_bytes(void* buf, size_t len);

} // namespace internal

/**
 * @brief Owning byte buffer for key material
 *
 * Every buffer it has held is wiped (two-pass) before release, on
 * destruction, reassignment and wipe(). Copies are independent and are
 * wiped independently. The size is fixed at construction.
 */
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const uint8_t* data, size_t size);
    explicit SecureBytes(const ByteVec& data);
    explicit SecureBytes(const std::string& data);
    ~SecureBytes();

    SecureBytes(const SecureBytes& other);
    SecureBytes& operator=(const SecureBytes& other);
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    uint8_t* data() noexcept { return bytes_.data(); }
    const uint8_t* data() const noexcept { return bytes_.data(); }
    size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

    uint8_t& operator[](size_t i) { return bytes_[i]; }
    const uint8_t& operator[](size_t i) const { return bytes_[i]; }

    /**
     * @brief Wipe and release the contents; size() becomes 0
     */
    void wipe() noexcept;

    /**
     * @brief Constant-time equality (sizes are compared first)
     */
    bool equals(const SecureBytes& other) const noexcept;

    /**
     * @brief Plain copy for callers that take ownership of the lifecycle
     */
    ByteVec to_vec() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

/**
 * @brief Wipes a plain byte vector when the guard leaves scope
 *
 * Used for intermediates (keystream buffers, scrypt output, recovered
 * plaintext on the failure path) so every exit path clears them.
 */
class WipeGuard {
public:
    explicit WipeGuard(ByteVec& buffer) noexcept : buffer_(&buffer) {}
    ~WipeGuard() { release_wipe(); }

    WipeGuard(const WipeGuard&) = delete;
    WipeGuard& operator=(const WipeGuard&) = delete;

    /**
     * @brief Keep the contents (success path hands the buffer to the caller)
     */
    void dismiss() noexcept { buffer_ = nullptr; }

private:
    void release_wipe() noexcept {
        if (buffer_ && !buffer_->empty()) {
            internal::secure_wipe(buffer_->data(), buffer_->size());
        }
    }

    ByteVec* buffer_;
};

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    if (a.size() == 0) return true;
    return internal::secure_compare(a.data(), b.data(),
                                    a.size() * sizeof(typename Container::value_type));
}

} // namespace atomcrypte

#endif // __cplusplus

#endif // ATOMCRYPTE_CORE_SECURITY_H
