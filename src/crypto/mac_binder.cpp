/**
 * @file mac_binder.cpp
 * @brief MacBinder implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/mac_binder.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/primitives.h"
#include "atomcrypte/version.h"

#include <string>

namespace atomcrypte {

MacContext MacContext::from_config(const Config& config) {
    MacContext ctx;
    ctx.format_version = ATOMCRYPTE_FORMAT_VERSION;
    ctx.profile = config.profile;
    ctx.key_length = config.key_length;
    ctx.sbox_source = config.sbox_source;
    ctx.rounds = config.rounds;
    return ctx;
}

MacTag MacBinder::compute(const uint8_t* plaintext, size_t plaintext_len,
                          const uint8_t* ciphertext, size_t ciphertext_len,
                          const SecureBytes& mac_key, const MacContext& context) {
    if (mac_key.empty()) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH, "MAC key must not be empty");
    }

    primitives::HmacSha3_512 mac(mac_key);
    mac.update(std::string("atomcrypte.mac"))
       .update_u8(context.format_version)
       .update_u8(static_cast<uint8_t>(context.profile))
       .update_u16(static_cast<uint16_t>(context.key_length))
       .update_u8(static_cast<uint8_t>(context.sbox_source))
       .update_u32(context.rounds)
       .update_u64(plaintext_len)
       .update(plaintext, plaintext_len)
       .update_u64(ciphertext_len)
       .update(ciphertext, ciphertext_len);
    return mac.finish();
}

bool MacBinder::verify(const uint8_t* plaintext, size_t plaintext_len,
                       const uint8_t* ciphertext, size_t ciphertext_len,
                       const SecureBytes& mac_key, const MacTag& tag,
                       const MacContext& context) {
    MacTag expected = compute(plaintext, plaintext_len, ciphertext, ciphertext_len,
                              mac_key, context);
    const bool ok = secure_compare(expected, tag);
    internal::secure_zero(expected.data(), expected.size());
    return ok;
}

} // namespace atomcrypte
