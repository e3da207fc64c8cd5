/**
 * @file encoding.cpp
 * @brief Hex and Base64 encoding implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "atomcrypte/utils/encoding.h"

#include <cctype>

namespace atomcrypte {
namespace encoding {

namespace {

const char HEX_LOWER[] = "0123456789abcdef";

const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

// ============================================================================
// Hex
// ============================================================================

std::string hex_encode(const ByteVec& data) {
    return hex_encode(data.data(), data.size());
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result.push_back(HEX_LOWER[data[i] >> 4]);
        result.push_back(HEX_LOWER[data[i] & 0x0F]);
    }
    return result;
}

ByteVec hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw EncodingError("Invalid hex string: odd length");
    }
    ByteVec result(hex.size() / 2);
    for (size_t i = 0; i < result.size(); i++) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw EncodingError("Invalid hex string: " + hex.substr(0, 20));
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

bool is_valid_hex(const std::string& str) noexcept {
    if (str.size() % 2 != 0) return false;
    for (char c : str) {
        if (hex_value(c) < 0) return false;
    }
    return true;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const ByteVec& data) {
    return base64_encode(data.data(), data.size());
}

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
        result.push_back(BASE64_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 6) & 0x3F]);
        result.push_back(BASE64_CHARS[triple & 0x3F]);
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        result.push_back(BASE64_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 12) & 0x3F]);
        result.append("==");
    } else if (rest == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        result.push_back(BASE64_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 6) & 0x3F]);
        result.push_back('=');
    }
    return result;
}

ByteVec base64_decode(const std::string& b64) {
    std::string clean;
    clean.reserve(b64.size());
    for (char c : b64) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean.push_back(c);
        }
    }

    if (clean.size() % 4 != 0) {
        throw EncodingError("Invalid Base64 string: length not a multiple of 4");
    }

    size_t padding = 0;
    if (!clean.empty() && clean.back() == '=') padding++;
    if (clean.size() > 1 && clean[clean.size() - 2] == '=') padding++;

    ByteVec result;
    result.reserve(clean.size() / 4 * 3);

    for (size_t i = 0; i < clean.size(); i += 4) {
        const bool last = (i + 4 == clean.size());
        uint32_t quad = 0;
        for (size_t j = 0; j < 4; j++) {
            char c = clean[i + j];
            int v;
            if (c == '=' && last && j >= 4 - padding) {
                v = 0;
            } else {
                v = base64_value(c);
                if (v < 0) {
                    throw EncodingError("Invalid Base64 string");
                }
            }
            quad = (quad << 6) | static_cast<uint32_t>(v);
        }
        result.push_back(static_cast<uint8_t>(quad >> 16));
        if (!last || padding < 2) result.push_back(static_cast<uint8_t>(quad >> 8));
        if (!last || padding < 1) result.push_back(static_cast<uint8_t>(quad));
    }
    return result;
}

} // namespace encoding
} // namespace atomcrypte
