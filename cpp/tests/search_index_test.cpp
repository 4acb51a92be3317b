// cpp/tests/search_index_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fs_util.h"
#include "search_index.h"
#include "test_util.h"

namespace {

UnifiedEntry unified_student() {
    UnifiedEntry u;
    u.word = "學生";
    u.chinese_entry = make_chinese("学生", "學生", "xué sheng", {"student", "schoolchild"});
    u.chinese_entry->statistics.hsk_level = 1;
    u.japanese_entry = make_japanese("1206900", {"学生"}, {"がくせい"}, {"student"}, true);
    u.metadata = {true, 1, 1, KeySource::Chinese};
    return u;
}

} // namespace

TEST(SearchIndex, FlattensBothLanguages) {
    const auto rows = flatten_entry(unified_student());
    ASSERT_EQ(rows.size(), 3u);

    EXPECT_EQ(rows[0], (SearchIndexRow{"學生", "chinese", "student", "xué sheng", false}));
    EXPECT_EQ(rows[1], (SearchIndexRow{"學生", "chinese", "schoolchild", "xué sheng", false}));
    EXPECT_EQ(rows[2], (SearchIndexRow{"學生", "japanese", "student", "がくせい", true}));
}

TEST(SearchIndex, ChineseRowsAreNeverCommon) {
    UnifiedEntry u = unified_student();
    u.chinese_entry->statistics.hsk_level = 1;
    u.chinese_entry->statistics.frequency = 1000000;
    for (const auto& r : flatten_entry(u)) {
        if (r.language == "chinese") EXPECT_FALSE(r.is_common) << r.definition;
    }
}

TEST(SearchIndex, CommonFlagsPerLanguage) {
    UnifiedEntry u = unified_student();
    u.japanese_entry = make_japanese("1", {"学生"}, {"がくせい"}, {"student"}, false);

    for (const auto& r : flatten_entry(u)) {
        EXPECT_FALSE(r.is_common) << r.language;
    }

    // one common kana spelling is enough
    u.japanese_entry->kana.push_back({"がくしょう", true});
    const auto rows = flatten_entry(u);
    EXPECT_TRUE(rows.back().is_common);
}

TEST(SearchIndex, JapaneseWithoutKanaHasEmptyPronunciation) {
    UnifiedEntry u;
    u.word = "Ｘ線";
    u.japanese_entry = make_japanese("5", {"Ｘ線"}, {}, {"X-ray"});
    const auto rows = flatten_entry(u);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].pronunciation, "");
}

TEST(SearchIndex, CsvEscaping) {
    EXPECT_EQ(escape_csv_field("plain"), "plain");
    EXPECT_EQ(escape_csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(escape_csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(escape_csv_field("line\nbreak"), "\"line\nbreak\"");
    EXPECT_EQ(escape_csv_field("cr\rhere"), "\"cr\rhere\"");
    EXPECT_EQ(escape_csv_field(""), "");

    const SearchIndexRow r{"學生", "chinese", "to study, learn", "xué", false};
    EXPECT_EQ(format_csv_row(r), "學生,chinese,\"to study, learn\",xué,0");
}

TEST(SearchIndex, SqlEscaping) {
    EXPECT_EQ(escape_sql_literal("plain"), "'plain'");
    EXPECT_EQ(escape_sql_literal("it's"), "'it''s'");
    EXPECT_EQ(escape_sql_literal(std::string("a\0b", 3)), "'ab'");

    const SearchIndexRow r{"x", "japanese", "O'Neil", "", true};
    EXPECT_EQ(format_sql_values(r), "('x', 'japanese', 'O''Neil', '', 1)");
}

TEST(SearchIndex, FormatNames) {
    EXPECT_EQ(index_format_from_name("csv").value_or(IndexFormat::Sql), IndexFormat::Csv);
    EXPECT_EQ(index_format_from_name("sql").value_or(IndexFormat::Csv), IndexFormat::Sql);
    EXPECT_FALSE(index_format_from_name("tsv").has_value());
    EXPECT_STREQ(index_file_name(IndexFormat::Sql), "search_index.sql");
}

TEST(SearchIndex, WritesCsvFile) {
    TempDir tmp;
    const fs::path p = tmp / "search_index.csv";
    const SearchIndexReport rep = write_search_index({unified_student()}, p.string(), IndexFormat::Csv);

    EXPECT_EQ(rep.rows, 3u);
    EXPECT_EQ(rep.chinese_rows, 2u);
    EXPECT_EQ(rep.japanese_rows, 1u);
    EXPECT_FALSE(fs::exists(tmp / "search_index.csv.tmp"));

    const std::string text = read_file_bytes(p);
    EXPECT_EQ(text,
              "word,language,definition,pronunciation,is_common\n"
              "學生,chinese,student,xué sheng,0\n"
              "學生,chinese,schoolchild,xué sheng,0\n"
              "學生,japanese,student,がくせい,1\n");
    EXPECT_EQ(rep.bytes, text.size());
}

TEST(SearchIndex, WritesBatchedSql) {
    TempDir tmp;
    const fs::path p = tmp / "search_index.sql";
    const SearchIndexReport rep = write_search_index({unified_student()}, p.string(), IndexFormat::Sql, 2);

    EXPECT_EQ(rep.rows, 3u);
    EXPECT_EQ(rep.statements, 2u);

    const std::string prefix =
        "INSERT INTO dictionary_search (word, language, definition, pronunciation, is_common) VALUES\n";
    EXPECT_EQ(read_file_bytes(p),
              prefix +
              "('學生', 'chinese', 'student', 'xué sheng', 0),\n"
              "('學生', 'chinese', 'schoolchild', 'xué sheng', 0);\n" +
              prefix +
              "('學生', 'japanese', 'student', 'がくせい', 1);\n");
}

TEST(SearchIndex, EmptyCorpusStillHasHeader) {
    TempDir tmp;
    const fs::path p = tmp / "search_index.csv";
    const SearchIndexReport rep = write_search_index({}, p.string(), IndexFormat::Csv);
    EXPECT_EQ(rep.rows, 0u);
    EXPECT_EQ(read_file_bytes(p), "word,language,definition,pronunciation,is_common\n");
}
