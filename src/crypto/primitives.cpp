/**
 * @file primitives.cpp
 * @brief OpenSSL EVP wrappers: BLAKE2b, BLAKE2b-MAC, HMAC-SHA3-512, scrypt, ChaCha20
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/primitives.h"
#include "atomcrypte/core/errors.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace atomcrypte {
namespace primitives {

namespace {

[[noreturn]] void throw_openssl(const char* what) {
    char buf[256];
    unsigned long err = ERR_get_error();
    std::string detail(what);
    if (err != 0) {
        ERR_error_string_n(err, buf, sizeof(buf));
        detail += " (";
        detail += buf;
        detail += ")";
    }
    ERR_clear_error();
    throw_error(ATOMCRYPTE_ERROR_INTERNAL, detail);
}

EVP_MAC* fetch_mac(const char* name) {
    EVP_MAC* mac = EVP_MAC_fetch(nullptr, name, nullptr);
    if (mac == nullptr) {
        throw_openssl("EVP_MAC_fetch failed");
    }
    return mac;
}

// Fetched once per process and kept for its lifetime
EVP_MAC* blake2b_mac_algorithm() {
    static EVP_MAC* mac = fetch_mac(OSSL_MAC_NAME_BLAKE2BMAC);
    return mac;
}

EVP_MAC* hmac_algorithm() {
    static EVP_MAC* mac = fetch_mac(OSSL_MAC_NAME_HMAC);
    return mac;
}

} // anonymous namespace

// ============================================================================
// Blake2b
// ============================================================================

Blake2b::Blake2b() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw_openssl("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_blake2b512(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw_openssl("BLAKE2b-512 init failed");
    }
}

Blake2b::~Blake2b() {
    EVP_MD_CTX_free(ctx_);
}

Blake2b& Blake2b::update(const uint8_t* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw_openssl("BLAKE2b-512 update failed");
    }
    return *this;
}

Blake2b512Digest Blake2b::finish() {
    Blake2b512Digest digest{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest.data(), &out_len) != 1 ||
        out_len != digest.size()) {
        throw_openssl("BLAKE2b-512 final failed");
    }
    return digest;
}

Blake2b512Digest Blake2b::digest(const uint8_t* data, size_t len) {
    Blake2b h;
    h.update(data, len);
    return h.finish();
}

// ============================================================================
// Blake2bMac
// ============================================================================

Blake2bMac::Blake2bMac(const uint8_t* key, size_t key_len, size_t output_len)
    : ctx_(nullptr), output_len_(output_len) {
    if (key == nullptr || key_len == 0 || key_len > BLAKE2B_MAX_KEY_SIZE) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "BLAKE2b key must be 1..64 bytes, got " + std::to_string(key_len));
    }
    if (output_len == 0 || output_len > BLAKE2B_OUTPUT_SIZE) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH,
                    "BLAKE2b output must be 1..64 bytes, got " + std::to_string(output_len));
    }

    ctx_ = EVP_MAC_CTX_new(blake2b_mac_algorithm());
    if (ctx_ == nullptr) {
        throw_openssl("EVP_MAC_CTX_new failed");
    }

    size_t size = output_len;
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &size);
    params[1] = OSSL_PARAM_construct_end();

    if (EVP_MAC_init(ctx_, key, key_len, params) != 1) {
        EVP_MAC_CTX_free(ctx_);
        throw_openssl("BLAKE2BMAC init failed");
    }
}

Blake2bMac::~Blake2bMac() {
    EVP_MAC_CTX_free(ctx_);
}

Blake2bMac& Blake2bMac::update(const uint8_t* data, size_t len) {
    if (len > 0 && EVP_MAC_update(ctx_, data, len) != 1) {
        throw_openssl("BLAKE2BMAC update failed");
    }
    return *this;
}

void Blake2bMac::finish(uint8_t* out) {
    size_t written = 0;
    if (EVP_MAC_final(ctx_, out, &written, output_len_) != 1 || written != output_len_) {
        throw_openssl("BLAKE2BMAC final failed");
    }
}

SecureBytes Blake2bMac::finish_secure() {
    SecureBytes out(output_len_);
    finish(out.data());
    return out;
}

ByteVec Blake2bMac::finish_vec() {
    ByteVec out(output_len_);
    finish(out.data());
    return out;
}

// ============================================================================
// HmacSha3_512
// ============================================================================

HmacSha3_512::HmacSha3_512(const uint8_t* key, size_t key_len) : ctx_(nullptr) {
    if (key == nullptr || key_len == 0) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH, "HMAC key must not be empty");
    }

    ctx_ = EVP_MAC_CTX_new(hmac_algorithm());
    if (ctx_ == nullptr) {
        throw_openssl("EVP_MAC_CTX_new failed");
    }

    char digest_name[] = "SHA3-512";
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0);
    params[1] = OSSL_PARAM_construct_end();

    if (EVP_MAC_init(ctx_, key, key_len, params) != 1) {
        EVP_MAC_CTX_free(ctx_);
        throw_openssl("HMAC-SHA3-512 init failed");
    }
}

HmacSha3_512::~HmacSha3_512() {
    EVP_MAC_CTX_free(ctx_);
}

HmacSha3_512& HmacSha3_512::update(const uint8_t* data, size_t len) {
    if (len > 0 && EVP_MAC_update(ctx_, data, len) != 1) {
        throw_openssl("HMAC-SHA3-512 update failed");
    }
    return *this;
}

MacTag HmacSha3_512::finish() {
    MacTag tag{};
    size_t written = 0;
    if (EVP_MAC_final(ctx_, tag.data(), &written, tag.size()) != 1 || written != tag.size()) {
        throw_openssl("HMAC-SHA3-512 final failed");
    }
    return tag;
}

// ============================================================================
// scrypt
// ============================================================================

void scrypt(const uint8_t* password, size_t password_len,
            const uint8_t* salt, size_t salt_len,
            uint32_t log2_n, uint8_t* out, size_t out_len) {
    constexpr uint64_t r = 8;
    constexpr uint64_t p = 1;

    if (log2_n == 0 || log2_n >= 63) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                    "scrypt cost out of range: " + std::to_string(log2_n));
    }
    const uint64_t n = uint64_t{1} << log2_n;
    // 128 * r * N for V, 256 * r * p for B and XY, plus slack
    const uint64_t maxmem = 128 * r * (n + p + 2) + (uint64_t{1} << 20);

    // A zero-length password is handed to OpenSSL as a non-null pointer
    static const char empty[1] = {0};
    const char* pass = password_len ? reinterpret_cast<const char*>(password) : empty;

    if (EVP_PBE_scrypt(pass, password_len, salt, salt_len,
                       n, r, p, maxmem, out, out_len) != 1) {
        throw_openssl("EVP_PBE_scrypt failed");
    }
}

// ============================================================================
// ChaCha20Keystream
// ============================================================================

ChaCha20Keystream::ChaCha20Keystream() : ctx_(EVP_CIPHER_CTX_new()) {
    if (ctx_ == nullptr) {
        throw_openssl("EVP_CIPHER_CTX_new failed");
    }
}

ChaCha20Keystream::~ChaCha20Keystream() {
    EVP_CIPHER_CTX_free(ctx_);
}

void ChaCha20Keystream::generate(const uint8_t key[CHACHA20_KEY_SIZE],
                                 const uint8_t iv[CHACHA20_IV_SIZE],
                                 uint8_t* out, size_t len) {
    if (EVP_EncryptInit_ex(ctx_, EVP_chacha20(), nullptr, key, iv) != 1) {
        throw_openssl("ChaCha20 init failed");
    }

    // Keystream = ChaCha20 applied to zeros, in place
    std::memset(out, 0, len);
    size_t done = 0;
    while (done < len) {
        const size_t step = std::min<size_t>(len - done, std::numeric_limits<int>::max() / 2);
        int produced = 0;
        if (EVP_EncryptUpdate(ctx_, out + done, &produced, out + done,
                              static_cast<int>(step)) != 1 ||
            produced != static_cast<int>(step)) {
            throw_openssl("ChaCha20 update failed");
        }
        done += step;
    }
}

} // namespace primitives
} // namespace atomcrypte
