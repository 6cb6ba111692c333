#include <gtest/gtest.h>
#include "../../src/utils/utf8.h"

using namespace graphtransliterator::utils;

TEST(UTF8Test, DecodeAtOffset) {
    std::string text = "a\xE0\xA4\x89z";
    size_t consumed = 0;
    
    EXPECT_EQ(U'a', utf8ToChar32(text, 0, consumed));
    EXPECT_EQ(1u, consumed);
    
    EXPECT_EQ(static_cast<char32_t>(0x0909), utf8ToChar32(text, 1, consumed));
    EXPECT_EQ(3u, consumed);
    
    EXPECT_EQ(U'z', utf8ToChar32(text, 4, consumed));
    EXPECT_EQ(1u, consumed);
}

TEST(UTF8Test, InvalidBytesAdvanceByOne) {
    std::string text = "\xFF" "a";
    size_t consumed = 0;
    EXPECT_EQ(static_cast<char32_t>(0xFFFD), utf8ToChar32(text, 0, consumed));
    EXPECT_EQ(1u, consumed);
    
    // Truncated three-byte sequence
    EXPECT_EQ(static_cast<char32_t>(0xFFFD), utf8ToChar32("\xE0\xA4", 0, consumed));
    EXPECT_EQ(1u, consumed);
}

TEST(UTF8Test, Validity) {
    EXPECT_TRUE(isValidUtf8("a\xE0\xA4\x89z"));
    EXPECT_FALSE(isValidUtf8("\xE0\xA4"));
    EXPECT_FALSE(isValidUtf8("\x80"));
    EXPECT_TRUE(isValidUtf8(""));
}

TEST(UTF8Test, CodepointName) {
    EXPECT_EQ("U+0021", codepointName(U'!'));
    EXPECT_EQ("U+1F600", codepointName(0x1F600));
}
