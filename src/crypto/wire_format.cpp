/**
 * @file wire_format.cpp
 * @brief Detached and wrapped serialization
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/crypto/wire_format.h"
#include "atomcrypte/core/errors.h"
#include "atomcrypte/crypto/dummy_data.h"
#include "atomcrypte/utils/byte_order.h"
#include "atomcrypte/version.h"

#include <cstring>
#include <string>

namespace atomcrypte {

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw_error(ATOMCRYPTE_ERROR_MALFORMED_INPUT, what);
}

/**
 * @brief Bounds-checked cursor over a serialized blob
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    size_t remaining() const noexcept { return len_ - pos_; }

    uint8_t u8(const char* field) {
        need(1, field);
        return data_[pos_++];
    }

    uint16_t u16(const char* field) {
        need(2, field);
        uint16_t v = byte_order::load_le16(data_ + pos_);
        pos_ += 2;
        return v;
    }

    uint32_t u32(const char* field) {
        need(4, field);
        uint32_t v = byte_order::load_le32(data_ + pos_);
        pos_ += 4;
        return v;
    }

    uint64_t u64(const char* field) {
        need(8, field);
        uint64_t v = byte_order::load_le64(data_ + pos_);
        pos_ += 8;
        return v;
    }

    ByteVec bytes(size_t n, const char* field) {
        need(n, field);
        ByteVec out(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return out;
    }

    void copy(uint8_t* out, size_t n, const char* field) {
        need(n, field);
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }

private:
    void need(size_t n, const char* field) const {
        if (n > remaining()) {
            malformed(std::string("truncated ") + field);
        }
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

bool key_length_code_valid(uint16_t bits) {
    return bits == 256 || bits == 512;
}

} // anonymous namespace

// ============================================================================
// WrappedHeader
// ============================================================================

WrappedHeader WrappedHeader::from(const Config& config, const ByteVec& salt, const ByteVec& nonce) {
    WrappedHeader header;
    header.version = ATOMCRYPTE_FORMAT_VERSION;
    header.profile = config.profile;
    header.key_length = config.key_length;
    header.sbox_source = config.sbox_source;
    header.rounds = config.rounds;
    header.salt = salt;
    header.nonce = nonce;
    return header;
}

void WrappedHeader::check_against(const Config& config) const {
    if (version != ATOMCRYPTE_FORMAT_VERSION) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                    "unsupported format version " + std::to_string(version));
    }
    if (profile != config.profile || key_length != config.key_length ||
        sbox_source != config.sbox_source || rounds != config.rounds) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                    std::string("wrapped header (") + to_string(profile) + ", " +
                    to_string(key_length) + "-bit, " + std::to_string(rounds) +
                    " rounds, sbox " + to_string(sbox_source) +
                    ") does not match the configuration");
    }
}

// ============================================================================
// EncryptedOutput
// ============================================================================

ByteVec EncryptedOutput::serialize() const {
    return shape == OutputShape::Wrapped ? wire::serialize_wrapped(*this)
                                         : wire::serialize_detached(*this);
}

EncryptedOutput EncryptedOutput::parse(const uint8_t* data, size_t len, const Config& config) {
    if (data == nullptr && len != 0) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_PARAM, "null input");
    }
    if (config.output_shape == OutputShape::Wrapped) {
        EncryptedOutput output = wire::parse_wrapped(data, len);
        output.header->check_against(config);
        return output;
    }
    return wire::parse_detached(data, len, config.dummy_data);
}

namespace wire {

ByteVec serialize_detached(const EncryptedOutput& output) {
    ByteVec out;
    out.reserve(output.ciphertext.size() + output.mac_tag.size() + output.padding.size() + 4);
    out.insert(out.end(), output.ciphertext.begin(), output.ciphertext.end());
    out.insert(out.end(), output.mac_tag.begin(), output.mac_tag.end());
    if (!output.padding.empty()) {
        out.insert(out.end(), output.padding.begin(), output.padding.end());
        byte_order::append_le32(out, static_cast<uint32_t>(output.padding.size()));
    }
    return out;
}

ByteVec serialize_wrapped(const EncryptedOutput& output) {
    if (!output.header) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_PARAM, "wrapped output has no header");
    }
    const WrappedHeader& h = *output.header;
    check_nonce_length(h.salt.size(), "salt");
    check_nonce_length(h.nonce.size(), "nonce");
    if (output.recovery_block.size() > 0xFFFF) {
        throw_error(ATOMCRYPTE_ERROR_INVALID_LENGTH, "recovery block too large");
    }

    uint8_t flags = 0;
    if (!output.padding.empty()) flags |= WRAP_FLAG_PADDING;
    if (!output.recovery_block.empty()) flags |= WRAP_FLAG_RECOVERY;

    ByteVec out;
    out.reserve(32 + h.salt.size() + h.nonce.size() + output.ciphertext.size() +
                output.mac_tag.size() + output.recovery_block.size() + output.padding.size());

    out.push_back(h.version);
    out.push_back(static_cast<uint8_t>(h.profile));
    byte_order::append_le16(out, static_cast<uint16_t>(h.key_length));
    out.push_back(static_cast<uint8_t>(h.sbox_source));
    byte_order::append_le32(out, h.rounds);
    out.push_back(flags);

    out.push_back(static_cast<uint8_t>(h.salt.size()));
    out.insert(out.end(), h.salt.begin(), h.salt.end());
    out.push_back(static_cast<uint8_t>(h.nonce.size()));
    out.insert(out.end(), h.nonce.begin(), h.nonce.end());

    byte_order::append_le64(out, output.ciphertext.size());
    out.insert(out.end(), output.ciphertext.begin(), output.ciphertext.end());
    out.insert(out.end(), output.mac_tag.begin(), output.mac_tag.end());

    if (flags & WRAP_FLAG_RECOVERY) {
        byte_order::append_le16(out, static_cast<uint16_t>(output.recovery_block.size()));
        out.insert(out.end(), output.recovery_block.begin(), output.recovery_block.end());
    }
    if (flags & WRAP_FLAG_PADDING) {
        byte_order::append_le32(out, static_cast<uint32_t>(output.padding.size()));
        out.insert(out.end(), output.padding.begin(), output.padding.end());
    }
    return out;
}

EncryptedOutput parse_detached(const uint8_t* data, size_t len, bool has_padding) {
    EncryptedOutput output;
    output.shape = OutputShape::Detached;

    size_t body_len = len;
    if (has_padding) {
        if (len < 4) {
            malformed("missing padding trailer");
        }
        const size_t pad_len = byte_order::load_le32(data + len - 4);
        if (pad_len < DummyDataInjector::PADDING_MIN || pad_len > DummyDataInjector::PADDING_MAX ||
            pad_len > len - 4) {
            malformed("padding length out of range");
        }
        body_len = len - 4 - pad_len;
        output.padding.assign(data + body_len, data + body_len + pad_len);
    }

    if (body_len <= output.mac_tag.size()) {
        malformed("blob shorter than ciphertext plus tag");
    }
    const size_t ct_len = body_len - output.mac_tag.size();
    output.ciphertext.assign(data, data + ct_len);
    std::memcpy(output.mac_tag.data(), data + ct_len, output.mac_tag.size());
    return output;
}

EncryptedOutput parse_wrapped(const uint8_t* data, size_t len) {
    Reader in(data, len);
    EncryptedOutput output;
    output.shape = OutputShape::Wrapped;
    WrappedHeader h;

    h.version = in.u8("version");
    if (h.version != ATOMCRYPTE_FORMAT_VERSION) {
        throw_error(ATOMCRYPTE_ERROR_UNSUPPORTED_CONFIG,
                    "unsupported format version " + std::to_string(h.version));
    }

    const uint8_t profile = in.u8("profile");
    if (profile > static_cast<uint8_t>(Profile::Custom)) {
        malformed("unknown profile " + std::to_string(profile));
    }
    h.profile = static_cast<Profile>(profile);

    const uint16_t key_bits = in.u16("key length");
    if (!key_length_code_valid(key_bits)) {
        malformed("unknown key length " + std::to_string(key_bits));
    }
    h.key_length = static_cast<KeyLength>(key_bits);

    const uint8_t sbox = in.u8("sbox source");
    if (sbox > static_cast<uint8_t>(SboxSource::Combined)) {
        malformed("unknown sbox source " + std::to_string(sbox));
    }
    h.sbox_source = static_cast<SboxSource>(sbox);

    h.rounds = in.u32("rounds");
    if (h.rounds == 0) {
        malformed("zero rounds");
    }

    const uint8_t flags = in.u8("flags");
    if (flags & ~(WRAP_FLAG_PADDING | WRAP_FLAG_RECOVERY)) {
        malformed("unknown flags");
    }

    const size_t salt_len = in.u8("salt length");
    h.salt = in.bytes(salt_len, "salt");
    const size_t nonce_len = in.u8("nonce length");
    h.nonce = in.bytes(nonce_len, "nonce");
    if (salt_len < ATOMCRYPTE_NONCE_MIN_SIZE || salt_len > ATOMCRYPTE_NONCE_MAX_SIZE ||
        nonce_len < ATOMCRYPTE_NONCE_MIN_SIZE || nonce_len > ATOMCRYPTE_NONCE_MAX_SIZE) {
        malformed("salt or nonce length out of range");
    }

    const uint64_t ct_len = in.u64("ciphertext length");
    if (ct_len == 0 || ct_len > in.remaining()) {
        malformed("ciphertext length out of range");
    }
    output.ciphertext = in.bytes(static_cast<size_t>(ct_len), "ciphertext");
    in.copy(output.mac_tag.data(), output.mac_tag.size(), "tag");

    if (flags & WRAP_FLAG_RECOVERY) {
        const size_t block_len = in.u16("recovery block length");
        if (block_len == 0) {
            malformed("empty recovery block");
        }
        output.recovery_block = in.bytes(block_len, "recovery block");
    }
    if (flags & WRAP_FLAG_PADDING) {
        const size_t pad_len = in.u32("padding length");
        if (pad_len < DummyDataInjector::PADDING_MIN || pad_len > DummyDataInjector::PADDING_MAX) {
            malformed("padding length out of range");
        }
        output.padding = in.bytes(pad_len, "padding");
    }
    if (in.remaining() != 0) {
        malformed("trailing bytes after wrapped record");
    }

    output.header = std::move(h);
    return output;
}

} // namespace wire
} // namespace atomcrypte
