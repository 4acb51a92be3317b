// cpp/tests/character_unifier_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "character_unifier.h"
#include "pipeline_error.h"

namespace {

ChineseCharacter zh_char(const std::string& c, const std::string& pinyin) {
    ChineseCharacter z;
    z.character = c;
    z.pinyin = {pinyin};
    return z;
}

KanjiCharacter kanji(const std::string& lit, const std::string& on) {
    KanjiCharacter k;
    k.literal = lit;
    k.onyomi = {on};
    return k;
}

const UnifiedCharacter* find_char(const std::vector<UnifiedCharacter>& v, const std::string& c) {
    for (const auto& u : v) {
        if (u.character == c) return &u;
    }
    return nullptr;
}

} // namespace

TEST(CharacterUnifier, DirectMappedAndOneSided) {
    const std::vector<ChineseCharacter> zh = {
        zh_char("学", "xué"),
        zh_char("國", "guó"),
        zh_char("们", "men"),
    };
    const std::vector<KanjiCharacter> ja = {
        kanji("学", "ガク"),
        kanji("国", "コク"),
        kanji("込", "コム"),
    };
    const CharacterMapping mapping(CharacterMapping::Map{{"国", "國"}});

    CharacterMergeStats st;
    const auto out = merge_characters(zh, ja, mapping, &st);

    EXPECT_EQ(st.direct, 1u);
    EXPECT_EQ(st.mapping, 1u);
    EXPECT_EQ(st.japanese_only, 1u);
    EXPECT_EQ(st.chinese_only, 2u);   // 國 and 们 are not kanji literals
    EXPECT_EQ(st.total, 5u);
    ASSERT_EQ(out.size(), 5u);

    const UnifiedCharacter* gaku = find_char(out, "学");
    ASSERT_NE(gaku, nullptr);
    EXPECT_EQ(gaku->match, CharacterMatch::Direct);
    EXPECT_EQ(gaku->codepoint, "U+5B66");
    ASSERT_TRUE(gaku->chinese && gaku->japanese);
    EXPECT_EQ(gaku->chinese->pinyin[0], "xué");

    const UnifiedCharacter* koku = find_char(out, "国");
    ASSERT_NE(koku, nullptr);
    EXPECT_EQ(koku->match, CharacterMatch::Mapping);
    EXPECT_EQ(koku->chinese->character, "國");
    EXPECT_EQ(koku->japanese->onyomi[0], "コク");

    const UnifiedCharacter* komu = find_char(out, "込");
    ASSERT_NE(komu, nullptr);
    EXPECT_EQ(komu->match, CharacterMatch::None);
    EXPECT_FALSE(komu->chinese.has_value());

    const UnifiedCharacter* guo = find_char(out, "國");
    ASSERT_NE(guo, nullptr);
    EXPECT_EQ(guo->match, CharacterMatch::None);
    EXPECT_FALSE(guo->japanese.has_value());
}

TEST(CharacterUnifier, DirectMatchBeatsMapping) {
    const std::vector<ChineseCharacter> zh = {zh_char("学", "xué"), zh_char("學", "xué (trad)")};
    const std::vector<KanjiCharacter> ja = {kanji("学", "ガク")};
    const auto out = merge_characters(zh, ja, CharacterMapping(CharacterMapping::Map{{"学", "學"}}));

    const UnifiedCharacter* gaku = find_char(out, "学");
    ASSERT_NE(gaku, nullptr);
    EXPECT_EQ(gaku->match, CharacterMatch::Direct);
    EXPECT_EQ(gaku->chinese->character, "学");
}

TEST(CharacterUnifier, FirstRecordWinsForDuplicates) {
    const std::vector<ChineseCharacter> zh = {zh_char("学", "xué"), zh_char("学", "xiáo")};
    const std::vector<KanjiCharacter> ja = {kanji("学", "ガク"), kanji("学", "コウ")};

    CharacterMergeStats st;
    const auto out = merge_characters(zh, ja, CharacterMapping(), &st);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].chinese->pinyin[0], "xué");
    EXPECT_EQ(out[0].japanese->onyomi[0], "ガク");
    EXPECT_EQ(st.chinese_duplicates, 1u);
    EXPECT_EQ(st.kanji_duplicates, 1u);
}

TEST(CharacterUnifier, SortedByKeyBytes) {
    const std::vector<ChineseCharacter> zh = {zh_char("们", "men"), zh_char("一", "yī")};
    const std::vector<KanjiCharacter> ja = {kanji("込", "コム"), kanji("亜", "ア")};
    const auto out = merge_characters(zh, ja, CharacterMapping());

    ASSERT_EQ(out.size(), 4u);
    for (std::size_t i = 1; i < out.size(); ++i) {
        EXPECT_LT(out[i - 1].character, out[i].character);
    }
}

TEST(CharacterUnifier, EmptyInputs) {
    CharacterMergeStats st;
    EXPECT_TRUE(merge_characters({}, {}, CharacterMapping(), &st).empty());
    EXPECT_EQ(st.total, 0u);
}
