// cpp/tests/corpus_loader_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "corpus_loader.h"
#include "pipeline_error.h"
#include "test_util.h"

namespace {

const char* kJmdictDoc = R"({
  "version": "3.6.1",
  "words": [
    {"id": "1206900",
     "kanji": [{"common": true, "text": "学生"}],
     "kana": [{"common": true, "text": "がくせい"}],
     "sense": [{"partOfSpeech": ["n"], "gloss": [{"lang": "eng", "text": "student"}]}]},
    {"id": "bad-no-spellings", "kanji": [], "kana": []},
    {"id": 1000220,
     "kana": [{"common": false, "text": "あいうえお"}],
     "sense": [{"partOfSpeech": ["n"], "gloss": [{"lang": "eng", "text": "vowels"}]}]}
  ]
})";

} // namespace

TEST(CorpusLoader, ChineseLinesSkipMalformed) {
    const std::vector<std::string> lines = {
        R"({"_id":"a1","simp":"学生","trad":"學生","gloss":"student","items":[{"source":"cedict","pinyin":"xué sheng","simpTrad":"simp","definitions":["student","schoolchild"]}],"statistics":{"hskLevel":1}})",
        R"({"simp":"坏","trad":)",
        R"({"simp":"","trad":"空"})",
        R"({"simp":"的","trad":"的","items":[],"statistics":{"movieWordCount":123}})",
    };

    const ChineseCorpus c = parse_chinese_lines(lines, 2);
    ASSERT_EQ(c.entries.size(), 2u);
    EXPECT_EQ(c.stats.records_total, 4u);
    EXPECT_EQ(c.stats.records_loaded, 2u);
    EXPECT_EQ(c.stats.records_skipped, 2u);

    const ChineseEntry& e = c.entries[0];
    EXPECT_EQ(e.id, "a1");
    EXPECT_EQ(e.traditional, "學生");
    ASSERT_EQ(e.items.size(), 1u);
    EXPECT_EQ(e.items[0].simp_trad, SimpTrad::SimplifiedOnly);
    EXPECT_EQ(e.items[0].definitions.size(), 2u);
    ASSERT_TRUE(e.statistics.hsk_level.has_value());
    EXPECT_EQ(*e.statistics.hsk_level, 1);

    ASSERT_TRUE(c.entries[1].statistics.frequency.has_value());
    EXPECT_EQ(*c.entries[1].statistics.frequency, 123);
}

TEST(CorpusLoader, ChineseOrderIsStableAcrossThreadCounts) {
    std::vector<std::string> lines;
    for (int i = 0; i < 200; ++i) {
        lines.push_back(R"({"simp":"字)" + std::to_string(i) + R"(","trad":"字)" + std::to_string(i) + R"("})");
    }
    const ChineseCorpus one = parse_chinese_lines(lines, 1);
    const ChineseCorpus many = parse_chinese_lines(lines, 7);
    ASSERT_EQ(one.entries.size(), 200u);
    EXPECT_EQ(one.entries, many.entries);
    EXPECT_EQ(many.entries[199].simplified, "字199");
}

TEST(CorpusLoader, SpellingIndexKeepsHomographsInOrder) {
    const std::vector<std::string> lines = {
        R"({"simp":"发","trad":"發"})",
        R"({"simp":"发","trad":"髮"})",
        R"({"simp":"发","trad":"发"})",
    };
    const ChineseCorpus c = parse_chinese_lines(lines, 3);

    const auto& owners = c.index.find("发");
    ASSERT_EQ(owners.size(), 3u);
    EXPECT_EQ(owners[0], 0u);
    EXPECT_EQ(owners[1], 1u);
    EXPECT_EQ(owners[2], 2u);

    EXPECT_EQ(c.index.find("髮").size(), 1u);
    EXPECT_TRUE(c.index.find("無").empty());
}

TEST(CorpusLoader, JapaneseDocument) {
    const JapaneseCorpus j = parse_japanese_document(kJmdictDoc);
    ASSERT_EQ(j.entries.size(), 2u);
    EXPECT_EQ(j.stats.records_total, 3u);
    EXPECT_EQ(j.stats.records_skipped, 1u);

    const JapaneseEntry& w = j.entries[0];
    EXPECT_EQ(w.id, "1206900");
    ASSERT_EQ(w.kanji.size(), 1u);
    EXPECT_TRUE(w.kanji[0].common);
    EXPECT_EQ(w.sense[0].gloss[0].text, "student");
    EXPECT_EQ(w.sense[0].part_of_speech.count("n"), 1u);

    EXPECT_EQ(j.entries[1].id, "1000220");   // integer id accepted
    EXPECT_EQ(j.index.find("学生").size(), 1u);
    EXPECT_EQ(j.index.find("がくせい").size(), 1u);
}

TEST(CorpusLoader, JapaneseFileModes) {
    TempDir tmp;
    write_text(tmp / "jmdict.json", kJmdictDoc);
    write_text(tmp / "jmdict.jsonl",
               R"({"id":"1","kana":[{"text":"ねこ","common":true}]})" "\n"
               "not json\n"
               R"({"id":"2","kanji":[{"text":"犬"}],"kana":[{"text":"いぬ"}]})" "\n");

    const JapaneseCorpus doc = load_japanese_corpus((tmp / "jmdict.json").string(), 2);
    EXPECT_EQ(doc.entries.size(), 2u);

    const JapaneseCorpus jl = load_japanese_corpus((tmp / "jmdict.jsonl").string(), 2);
    ASSERT_EQ(jl.entries.size(), 2u);
    EXPECT_EQ(jl.stats.records_skipped, 1u);
    EXPECT_EQ(jl.entries[1].kanji[0].text, "犬");
}

TEST(CorpusLoader, MissingFileIsIoFailure) {
    TempDir tmp;
    EXPECT_THROW(load_chinese_corpus((tmp / "nope.jsonl").string()), IoFailure);
    EXPECT_THROW(load_japanese_corpus((tmp / "nope.json").string()), IoFailure);
}

TEST(CorpusLoader, BrokenJapaneseDocumentIsIoFailure) {
    TempDir tmp;
    write_text(tmp / "broken.json", "{\"words\": [");
    EXPECT_THROW(load_japanese_corpus((tmp / "broken.json").string()), IoFailure);
}

TEST(CorpusLoader, KanjidicLiteralsAndSpellings) {
    TempDir tmp;
    write_text(tmp / "kanjidic.json",
               R"({"characters":[{"literal":"亜"},{"literal":"学"},{"nope":1},{"literal":"国"}]})");
    const auto lits = load_kanjidic_literals((tmp / "kanjidic.json").string());
    ASSERT_EQ(lits.size(), 3u);
    EXPECT_EQ(lits[1], "学");

    const JapaneseCorpus j = parse_japanese_document(kJmdictDoc);
    const auto spellings = collect_kanji_spellings(j);
    ASSERT_EQ(spellings.size(), 1u);
    EXPECT_EQ(spellings[0], "学生");
}

TEST(CorpusLoader, ChineseNumbersMustFitTheirFields) {
    const std::vector<std::string> lines = {
        R"({"simp":"一","trad":"一","statistics":{"frequency":1e30}})",
        R"({"simp":"二","trad":"二","statistics":{"frequency":-1e19}})",
        R"({"simp":"三","trad":"三","statistics":{"frequency":2.5}})",
        R"({"simp":"四","trad":"四","statistics":{"hskLevel":5000000000}})",
        R"({"simp":"五","trad":"五","statistics":{"frequency":18446744073709551615}})",
        R"({"simp":"六","trad":"六","statistics":{"frequency":3000.0,"hskLevel":2}})",
    };

    const ChineseCorpus c = parse_chinese_lines(lines, 2);
    ASSERT_EQ(c.entries.size(), 1u);
    EXPECT_EQ(c.stats.records_skipped, 5u);
    EXPECT_EQ(c.entries[0].simplified, "六");
    ASSERT_TRUE(c.entries[0].statistics.frequency.has_value());
    EXPECT_EQ(*c.entries[0].statistics.frequency, 3000);
    EXPECT_EQ(c.entries[0].statistics.hsk_level, 2);
}

TEST(CorpusLoader, BlankSpellingsAreSkipped) {
    const std::vector<std::string> zh = {
        R"({"simp":"  ","trad":"  "})",
        R"({"simp":"好","trad":"　"})",
        R"({"simp":"好","trad":"好"})",
    };
    const ChineseCorpus c = parse_chinese_lines(zh, 1);
    ASSERT_EQ(c.entries.size(), 1u);
    EXPECT_EQ(c.stats.records_skipped, 2u);

    const JapaneseCorpus j = parse_japanese_document(R"({"words":[
        {"id":"1","kana":[{"text":" "}]},
        {"id":"2","kanji":[{"text":"猫"}],"kana":[{"text":"ねこ"}]}
    ]})");
    ASSERT_EQ(j.entries.size(), 1u);
    EXPECT_EQ(j.entries[0].id, "2");
    EXPECT_EQ(j.stats.skipped_lines, (std::vector<std::uint64_t>{1}));
}

TEST(CorpusLoader, SkipsReportFileLineNumbers) {
    TempDir tmp;
    write_text(tmp / "zh.jsonl",
               R"({"simp":"一","trad":"一"})" "\n"
               "\n"
               "   \n"
               R"({"simp":"坏")" "\n"
               R"({"simp":"二","trad":"二"})" "\r\n"
               "\n"
               "still not json\n");

    const ChineseCorpus c = load_chinese_corpus((tmp / "zh.jsonl").string(), 3);
    EXPECT_EQ(c.entries.size(), 2u);
    EXPECT_EQ(c.stats.records_total, 4u);
    EXPECT_EQ(c.stats.records_skipped, 2u);
    EXPECT_EQ(c.stats.skipped_lines, (std::vector<std::uint64_t>{4, 7}));
}

TEST(CorpusLoader, ChineseCharacterLines) {
    const std::vector<std::string> lines = {
        R"({"_id":"c1","char":"学","codepoint":"5b66","strokeCount":8,"gloss":"learn","pinyinFrequencies":[{"pinyin":"xué","count":10}],"tradVariants":["學"],"statistics":{"hskLevel":1}})",
        R"({"char":"学习"})",
        R"({"char":" "})",
        R"({"char":"國","simpVariants":["国"],"strokeCount":1e40})",
        R"({"char":"国","simpVariants":[],"tradVariants":["國"]})",
    };

    const ChineseCharacterSet set = parse_chinese_character_lines(lines, 2);
    ASSERT_EQ(set.entries.size(), 2u);
    EXPECT_EQ(set.stats.skipped_lines, (std::vector<std::uint64_t>{2, 3, 4}));

    const ChineseCharacter& c = set.entries[0];
    EXPECT_EQ(c.id, "c1");
    EXPECT_EQ(c.character, "学");
    EXPECT_EQ(c.stroke_count, 8);
    EXPECT_EQ(c.pinyin, (std::vector<std::string>{"xué"}));
    EXPECT_EQ(c.trad_variants, (std::vector<std::string>{"學"}));
    EXPECT_EQ(c.hsk_level, 1);
    EXPECT_EQ(set.entries[1].character, "国");
}

TEST(CorpusLoader, KanjidicCharacters) {
    const KanjiSet set = parse_kanjidic_document(R"({"characters":[
        {"literal":"学",
         "codepoints":[{"type":"jis208","value":"1-19-56"},{"type":"ucs","value":"5b66"}],
         "misc":{"grade":1,"strokeCounts":[8,9],"frequency":63,"jlptLevel":4},
         "readingMeaning":{"nanori":["さと"],"groups":[{
            "readings":[{"type":"pinyin","value":"xue2"},{"type":"ja_on","value":"ガク"},{"type":"ja_kun","value":"まな.ぶ"}],
            "meanings":[{"lang":"en","value":"study"},{"lang":"fr","value":"étude"},{"value":"learning"}]}]}},
        {"literal":"ab"},
        {"literal":"亜","misc":{"strokeCounts":[]}}
    ]})");

    ASSERT_EQ(set.entries.size(), 2u);
    EXPECT_EQ(set.stats.records_total, 3u);
    EXPECT_EQ(set.stats.skipped_lines, (std::vector<std::uint64_t>{2}));

    const KanjiCharacter& k = set.entries[0];
    EXPECT_EQ(k.codepoint, "5b66");
    EXPECT_EQ(k.stroke_count, 8);
    EXPECT_EQ(k.grade, 1);
    EXPECT_EQ(k.jlpt_level, 4);
    EXPECT_EQ(k.frequency, 63);
    EXPECT_EQ(k.onyomi, (std::vector<std::string>{"ガク"}));
    EXPECT_EQ(k.kunyomi, (std::vector<std::string>{"まな.ぶ"}));
    EXPECT_EQ(k.nanori, (std::vector<std::string>{"さと"}));
    EXPECT_EQ(k.meanings, (std::vector<std::string>{"study", "learning"}));

    EXPECT_FALSE(set.entries[1].stroke_count.has_value());
    EXPECT_THROW(parse_kanjidic_document(R"({"kanji":[]})"), IoFailure);
}
