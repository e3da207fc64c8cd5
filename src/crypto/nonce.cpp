/**
 * @file nonce.cpp
 * @brief Nonce and salt generators
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/nonce.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/config.h"
#include "atomcrypte/crypto/primitives.h"
#include "atomcrypte/utils/random.h"

#include <cstddef>
#include <cstdlib>

#if defined(__unix__) || defined(__APPLE__)
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace atomcrypte {
namespace nonce {

namespace {

constexpr size_t RANDOM_INPUT_SIZE = 32;
constexpr uint64_t MAX_HASH_PASSES = 16;

ByteVec take_prefix(const Blake2b512Digest& digest, size_t len) {
    return ByteVec(digest.begin(), digest.begin() + static_cast<std::ptrdiff_t>(len));
}

std::string user_name() {
#if defined(__unix__) || defined(__APPLE__)
    if (const struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_name != nullptr) {
            return pw->pw_name;
        }
    }
#endif
    for (const char* var : {"USER", "USERNAME", "LOGNAME"}) {
        if (const char* value = std::getenv(var)) {
            return value;
        }
    }
    return "unknown";
}

std::string host_name() {
#if defined(__unix__) || defined(__APPLE__)
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') {
        return buf;
    }
#endif
    if (const char* value = std::getenv("COMPUTERNAME")) {
        return value;
    }
    return "localhost";
}

std::string os_name() {
#if defined(__unix__) || defined(__APPLE__)
    struct utsname info;
    if (uname(&info) == 0) {
        return std::string(info.sysname) + "-" + info.machine;
    }
#endif
    return atomcrypte_platform();
}

} // anonymous namespace

ByteVec random(size_t len) {
    check_nonce_length(len, "nonce");
    return random_bytes(len);
}

ByteVec hashed(size_t len) {
    check_nonce_length(len, "nonce");
    ByteVec seed = random_bytes(RANDOM_INPUT_SIZE);
    Blake2b512Digest digest = primitives::Blake2b::digest(seed.data(), seed.size());
    internal::secure_zero(seed.data(), seed.size());

    const uint64_t passes = random_range(1, MAX_HASH_PASSES);
    for (uint64_t i = 1; i < passes; ++i) {
        digest = primitives::Blake2b::digest(digest.data(), digest.size());
    }
    return take_prefix(digest, len);
}

ByteVec tagged(const std::string& tag, size_t len) {
    check_nonce_length(len, "nonce");
    primitives::Blake2b h;
    h.update(std::string("atomcrypte.nonce.tagged"))
     .update_u64(tag.size()).update(tag)
     .update(random_bytes(RANDOM_INPUT_SIZE));
    return take_prefix(h.finish(), len);
}

ByteVec machine(size_t len) {
    check_nonce_length(len, "nonce");
    primitives::Blake2b h;
    h.update(std::string("atomcrypte.nonce.machine"))
     .update(machine_identity())
     .update(random_bytes(RANDOM_INPUT_SIZE));
    return take_prefix(h.finish(), len);
}

ByteVec salt(size_t len) {
    check_nonce_length(len, "salt");
    return random_bytes(len);
}

std::string machine_identity() {
    return user_name() + "|" + host_name() + "|" + os_name();
}

SecureBytes machine_bound_password(const SecureBytes& password) {
    if (password.empty()) {
        throw_error(ATOMCRYPTE_ERROR_WEAK_INPUT, "password is empty");
    }
    primitives::Blake2b id;
    id.update(std::string("atomcrypte.machine-key")).update(machine_identity());
    const Blake2b512Digest machine_key = id.finish();

    primitives::Blake2bMac mac(machine_key.data(), machine_key.size(),
                               primitives::BLAKE2B_OUTPUT_SIZE);
    mac.update(password);
    return mac.finish_secure();
}

} // namespace nonce
} // namespace atomcrypte
