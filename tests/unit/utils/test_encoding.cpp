/**
 * @file test_encoding.cpp
 * @brief Hex and Base64 helper tests (RFC 4648 vectors)
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <string>

#include "atomcrypte/utils/encoding.h"

using namespace atomcrypte;
using namespace atomcrypte::encoding;

static ByteVec bytes_of(const std::string& s) {
    return ByteVec(s.begin(), s.end());
}

TEST(EncodingTest, HexKnownValues) {
    EXPECT_EQ(hex_encode(ByteVec{0x00, 0x01, 0xab, 0xff}), "0001abff");
    EXPECT_EQ(hex_decode("0001ABff"), (ByteVec{0x00, 0x01, 0xab, 0xff}));
    EXPECT_EQ(hex_encode(ByteVec{}), "");
    EXPECT_TRUE(hex_decode("").empty());
}

TEST(EncodingTest, HexRejectsMalformedInput) {
    EXPECT_THROW(hex_decode("abc"), EncodingError);
    EXPECT_THROW(hex_decode("zz"), EncodingError);
    EXPECT_TRUE(is_valid_hex("deadBEEF"));
    EXPECT_FALSE(is_valid_hex("deadbee"));
    EXPECT_FALSE(is_valid_hex("0x12"));
}

TEST(EncodingTest, Base64Rfc4648Vectors) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes_of("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(bytes_of("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");

    EXPECT_EQ(base64_decode("Zm9vYmE="), bytes_of("fooba"));
    EXPECT_EQ(base64_decode("Zg=="), bytes_of("f"));
}

TEST(EncodingTest, Base64BinaryData) {
    ByteVec all(256);
    for (size_t i = 0; i < all.size(); ++i) {
        all[i] = static_cast<uint8_t>(i);
    }
    EXPECT_EQ(base64_decode(base64_encode(all)), all);
}

TEST(EncodingTest, Base64RejectsMalformedInput) {
    EXPECT_THROW(base64_decode("Zm9"), EncodingError);
    EXPECT_THROW(base64_decode("Zm9v!A=="), EncodingError);
}
