// cpp/tests/text_common_test.cpp
#include <gtest/gtest.h>

#include "text_common.h"

TEST(TextCommon, DecodesMixedScripts) {
    const auto cps = utf8_code_points("a學が𠀀");
    ASSERT_EQ(cps.size(), 4u);
    EXPECT_EQ(cps[0], 0x61u);
    EXPECT_EQ(cps[1], 0x5B78u);
    EXPECT_EQ(cps[2], 0x304Cu);
    EXPECT_EQ(cps[3], 0x20000u);
}

TEST(TextCommon, InvalidBytesBecomeReplacementChar) {
    const auto cps = utf8_code_points(std::string("\xE5\x00z", 3));
    ASSERT_FALSE(cps.empty());
    EXPECT_EQ(cps[0], 0xFFFDu);
}

TEST(TextCommon, RejectsOverlongAndSurrogates) {
    // C0 AF: overlong '/', ED A0 80: U+D800
    EXPECT_EQ(utf8_code_points(std::string("\xC0\xAF", 2))[0], 0xFFFDu);
    EXPECT_EQ(utf8_code_points(std::string("\xED\xA0\x80", 3))[0], 0xFFFDu);

    std::string out;
    append_utf8_cp(out, 0x20000);
    append_utf8_cp(out, 0x5B78);
    EXPECT_EQ(out, "𠀀學");
}

TEST(TextCommon, HanRanges) {
    EXPECT_TRUE(is_han_cp(0x4E00));
    EXPECT_TRUE(is_han_cp(0x9FFF));
    EXPECT_TRUE(is_han_cp(0x3400));     // Ext A
    EXPECT_TRUE(is_han_cp(0x20000));    // Ext B
    EXPECT_TRUE(is_han_cp(0x2B740));    // Ext D
    EXPECT_TRUE(is_han_cp(0x30000));    // Ext G
    EXPECT_FALSE(is_han_cp(0x3042));    // hiragana
    EXPECT_FALSE(is_han_cp(0x30A2));    // katakana
    EXPECT_FALSE(is_han_cp(0x3005));    // 々
    EXPECT_FALSE(is_han_cp(0xF900));    // compatibility ideograph
    EXPECT_FALSE(is_han_cp('A'));
}

TEST(TextCommon, CountsHanOnly) {
    EXPECT_EQ(count_han_cps(""), 0u);
    EXPECT_EQ(count_han_cps("abc"), 0u);
    EXPECT_EQ(count_han_cps("的"), 1u);
    EXPECT_EQ(count_han_cps("学生"), 2u);
    EXPECT_EQ(count_han_cps("食べ物"), 2u);
    EXPECT_EQ(count_han_cps("中华人民"), 4u);
}

TEST(TextCommon, NormalizeMatchKey) {
    EXPECT_EQ(normalize_match_key("  學生\t"), "學生");
    EXPECT_EQ(normalize_match_key("\xE3\x80\x80學生\xE3\x80\x80"), "學生");   // ideographic space
    EXPECT_EQ(normalize_match_key("ＡＢＣ"), "abc");
    EXPECT_EQ(normalize_match_key("CD機"), "cd機");
    EXPECT_EQ(normalize_match_key("学生"), "学生");   // script variants untouched
    EXPECT_EQ(normalize_match_key("   "), "");
}
