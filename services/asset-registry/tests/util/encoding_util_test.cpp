/**
 * @file encoding_util_test.cpp
 * @brief Base64Util and UuidUtil
 */

#include <gtest/gtest.h>
#include "Base64Util.hpp"
#include "UuidUtil.hpp"

using shared::util::Base64Util;
using shared::util::UuidUtil;

// ============================================================================
// Base64Util
// ============================================================================

TEST(Base64UtilTest, Encode_StandardAlphabetWithPadding) {
    std::vector<uint8_t> data = {'f', 'o', 'o', 'b'};
    EXPECT_EQ(Base64Util::encode(data), "Zm9vYg==");
    EXPECT_EQ(Base64Util::encode(std::vector<uint8_t>{}), "");
}

TEST(Base64UtilTest, EncodeUrlSafeNoPad_SwapsAlphabetAndDropsPadding) {
    std::vector<uint8_t> data = {0xfb, 0xff, 0xbf};
    EXPECT_EQ(Base64Util::encode(data), "+/+/");
    EXPECT_EQ(Base64Util::encodeUrlSafeNoPad(data), "-_-_");

    std::vector<uint8_t> padded = {0xfb, 0xff};
    EXPECT_EQ(Base64Util::encodeUrlSafeNoPad(padded), "-_8");
}

TEST(Base64UtilTest, DecodeUrlSafe_RestoresPadding) {
    auto bytes = Base64Util::decodeUrlSafe("-_8");
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0xfb);
    EXPECT_EQ(bytes[1], 0xff);
}

TEST(Base64UtilTest, ToHex_Lowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(Base64Util::toHex(data), "000fabff");
}

// ============================================================================
// UuidUtil
// ============================================================================

TEST(UuidUtilTest, Generate_IsValidHyphenatedV4) {
    std::string uuid = UuidUtil::generate();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_TRUE(UuidUtil::isValid(uuid));
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(uuid, UuidUtil::generate());
}

TEST(UuidUtilTest, IsValid_AcceptsSimpleFormRejectsOthers) {
    EXPECT_TRUE(UuidUtil::isValid("0f8fad5bd9cb469fa16570867728950e"));
    EXPECT_FALSE(UuidUtil::isValid("0f8fad5b-d9cb-469f-a165-70867728950"));
    EXPECT_FALSE(UuidUtil::isValid("0f8fad5bxd9cbx469fxa165x70867728950e"));
    EXPECT_FALSE(UuidUtil::isValid("not-a-uuid"));
    EXPECT_FALSE(UuidUtil::isValid(""));
}
