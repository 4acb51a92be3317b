// cpp/tests/dict_types_test.cpp
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "dict_types.h"
#include "test_util.h"

using json = nlohmann::json;

TEST(DictTypes, SimpTradNames) {
    EXPECT_EQ(simp_trad_from_name("simp"), SimpTrad::SimplifiedOnly);
    EXPECT_EQ(simp_trad_from_name("trad"), SimpTrad::TraditionalOnly);
    EXPECT_EQ(simp_trad_from_name("both"), SimpTrad::Both);
    EXPECT_EQ(simp_trad_from_name("???"), SimpTrad::Unspecified);
    EXPECT_STREQ(simp_trad_name(SimpTrad::Both), "both");
}

TEST(DictTypes, SourcePriorityOrder) {
    EXPECT_LT(chinese_source_priority("cedict"), chinese_source_priority("dong-chinese"));
    EXPECT_LT(chinese_source_priority("dong-chinese"), chinese_source_priority("unicode"));
    EXPECT_LT(chinese_source_priority("unicode"), chinese_source_priority("somewhere-else"));
}

TEST(DictTypes, ChineseJsonUsesSourceFieldNames) {
    ChineseEntry e = make_chinese("学生", "學生", "xué sheng", {"student"});
    e.statistics.hsk_level = 1;

    const json j = e;
    EXPECT_EQ(j["simp"], "学生");
    EXPECT_EQ(j["trad"], "學生");
    EXPECT_EQ(j["items"][0]["pinyin"], "xué sheng");
    EXPECT_EQ(j["statistics"]["hskLevel"], 1);
    EXPECT_FALSE(j["statistics"].contains("frequency"));
    EXPECT_FALSE(j.contains("_id"));
}

TEST(DictTypes, UnifiedEntryOmitsAbsentSide) {
    UnifiedEntry u;
    u.word = "がくせい";
    u.japanese_entry = make_japanese("1", {}, {"がくせい"}, {"student"});
    u.metadata.japanese_count = 1;
    u.metadata.key_source = KeySource::Japanese;

    const json j = u;
    EXPECT_FALSE(j.contains("chinese_entry"));
    EXPECT_TRUE(j.contains("japanese_entry"));
    EXPECT_EQ(j["metadata"]["key_source"], "japanese");
    EXPECT_EQ(j["metadata"]["is_unified"], false);

    EXPECT_EQ(j.get<UnifiedEntry>(), u);
}

TEST(DictTypes, FullEntrySurvivesJson) {
    UnifiedEntry u;
    u.word = "學生";
    u.chinese_entry = make_chinese("学生", "學生", "xué sheng", {"student", "pupil"});
    u.chinese_entry->id = "abc123";
    u.chinese_entry->statistics.frequency = 4242;
    u.japanese_entry = make_japanese("1206900", {"学生"}, {"がくせい"}, {"student"}, true);
    u.japanese_entry->sense[0].part_of_speech.insert("adj-no");
    u.metadata = {true, 1, 1, KeySource::Chinese};

    const json j = u;
    EXPECT_EQ(json::parse(j.dump()).get<UnifiedEntry>(), u);
}

TEST(DictTypes, CodepointLabels) {
    EXPECT_EQ(format_codepoint("学"), "U+5B66");
    EXPECT_EQ(format_codepoint("a"), "U+0061");
    EXPECT_EQ(format_codepoint("𠀋"), "U+2000B");
    EXPECT_EQ(format_codepoint(""), "");

    EXPECT_EQ(character_match_from_name(character_match_name(CharacterMatch::Mapping)), CharacterMatch::Mapping);
    EXPECT_EQ(character_match_from_name("???"), CharacterMatch::None);
}

TEST(DictTypes, CharacterJsonUsesSourceFieldNames) {
    ChineseCharacter c;
    c.id = "x1";
    c.character = "國";
    c.stroke_count = 11;
    c.simp_variants = {"国"};

    const json j = c;
    EXPECT_EQ(j["_id"], "x1");
    EXPECT_EQ(j["char"], "國");
    EXPECT_EQ(j["strokeCount"], 11);
    EXPECT_EQ(j["simpVariants"][0], "国");
    EXPECT_FALSE(j.contains("hskLevel"));
    EXPECT_EQ(j.get<ChineseCharacter>(), c);
}
