#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "dict_types.h"

// spelling -> owning entry indices, insertion order, homographs kept
class SpellingIndex {
public:
    void add(const std::string& spelling, std::uint32_t entry_idx);

    // Empty vector when the spelling is unknown.
    const std::vector<std::uint32_t>& find(const std::string& spelling) const;

    std::size_t size() const { return by_spelling_.size(); }

private:
    std::unordered_map<std::string, std::vector<std::uint32_t>> by_spelling_;
};

struct LoadStats {
    std::uint64_t records_total   = 0;
    std::uint64_t records_loaded  = 0;
    std::uint64_t records_skipped = 0;
    std::vector<std::uint64_t> skipped_lines;  // file line or array position, first 50
};

struct ChineseCorpus {
    std::vector<ChineseEntry> entries;
    SpellingIndex index;   // simplified ∪ traditional
    LoadStats stats;
};

struct JapaneseCorpus {
    std::vector<JapaneseEntry> entries;
    SpellingIndex index;   // every kanji text ∪ every kana text
    LoadStats stats;
};

// Chinese word dictionary, one JSON object per line.
// Malformed lines are logged with their file line number and skipped; blank
// lines are not records. A missing file throws IoFailure.
ChineseCorpus load_chinese_corpus(const std::string& path, unsigned threads = 0);
ChineseCorpus parse_chinese_lines(const std::vector<std::string>& lines, unsigned threads = 0);

// JMdict-simplified document ({"words":[...]}) or, for *.jsonl, one word per line.
JapaneseCorpus load_japanese_corpus(const std::string& path, unsigned threads = 0);
JapaneseCorpus parse_japanese_document(const std::string& json_text);
JapaneseCorpus parse_japanese_lines(const std::vector<std::string>& lines, unsigned threads = 0);

struct ChineseCharacterSet {
    std::vector<ChineseCharacter> entries;
    LoadStats stats;
};

struct KanjiSet {
    std::vector<KanjiCharacter> entries;
    LoadStats stats;
};

// Chinese character dictionary, one JSON object per line.
ChineseCharacterSet load_chinese_characters(const std::string& path, unsigned threads = 0);
ChineseCharacterSet parse_chinese_character_lines(const std::vector<std::string>& lines, unsigned threads = 0);

// KANJIDIC2 document {"characters":[...]}. A file that is not valid JSON or
// has no "characters" array throws IoFailure; bad characters are skipped.
KanjiSet load_kanjidic(const std::string& path);
KanjiSet parse_kanjidic_document(const std::string& json_text);

// Every literal of load_kanjidic(path), input order.
std::vector<std::string> load_kanjidic_literals(const std::string& path);

// Every kanji spelling of the corpus (duplicates kept; Script Mapper dedups).
std::vector<std::string> collect_kanji_spellings(const JapaneseCorpus& corpus);
