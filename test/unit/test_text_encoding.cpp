/**
 * @file test_text_encoding.cpp
 * @brief 代码页与字符解码测试
 */

#include <gtest/gtest.h>
#include "fastxls/biff/TextEncoding.hpp"

#include <vector>

using namespace fastxls;
using fastxls::biff::TextEncoding;

TEST(TextEncodingTest, DefaultIsWindows1252) {
    TextEncoding encoding;
    EXPECT_EQ(encoding.codePage(), 1252);
    const std::vector<uint8_t> ascii = {'S', 'h', 'e', 'e', 't'};
    EXPECT_EQ(encoding.decode(core::ByteView(ascii)), "Sheet");
    EXPECT_EQ(encoding.decode(core::ByteView()), "");
}

TEST(TextEncodingTest, Latin1Fallback) {
    const std::vector<uint8_t> bytes = {'c', 'a', 'f', 0xE9};
    EXPECT_EQ(TextEncoding::decodeLatin1(core::ByteView(bytes)), "caf\xC3\xA9");
}

TEST(TextEncodingTest, Utf16Decoding) {
    // "€" U+20AC 与代理对 U+1F600
    const std::vector<uint8_t> bytes = {0xAC, 0x20, 0x3D, 0xD8, 0x00, 0xDE};
    EXPECT_EQ(TextEncoding::decodeUtf16(core::ByteView(bytes)), "\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(TextEncodingTest, LoneSurrogateIsReplaced) {
    const std::vector<uint8_t> bytes = {0x41, 0x00, 0x3D, 0xD8, 0x42, 0x00};
    EXPECT_EQ(TextEncoding::decodeUtf16(core::ByteView(bytes)), "A\xEF\xBF\xBD" "B");
}

TEST(TextEncodingTest, CodePageLookup) {
    EXPECT_FALSE(TextEncoding::fromCodePage(4321));
    EXPECT_STREQ(TextEncoding::iconvNameFor(1251), "CP1251");
    EXPECT_EQ(TextEncoding::iconvNameFor(4321), nullptr);

    auto utf16 = TextEncoding::fromCodePage(1200);
    ASSERT_TRUE(utf16);
    const std::vector<uint8_t> bytes = {0x4F, 0x00, 0x4B, 0x00};
    EXPECT_EQ(utf16->decode(core::ByteView(bytes)), "OK");
}

TEST(TextEncodingTest, Utf8CodePageReplacesInvalidBytes) {
    auto utf8 = TextEncoding::fromCodePage(65001);
    ASSERT_TRUE(utf8);
    const std::vector<uint8_t> bytes = {'o', 'k', 0xFF};
    EXPECT_EQ(utf8->decode(core::ByteView(bytes)), "ok\xEF\xBF\xBD");
}
