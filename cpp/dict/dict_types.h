#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// ==================== Chinese (word dictionary, JSONL) ====================

enum class SimpTrad {
    Unspecified,
    SimplifiedOnly,  // "simp"
    TraditionalOnly, // "trad"
    Both,            // "both"
};

const char* simp_trad_name(SimpTrad st);
SimpTrad simp_trad_from_name(std::string_view s);

struct ChineseItem {
    std::string source;   // "cedict", "dong-chinese", "unicode", ...
    std::string pinyin;
    std::vector<std::string> definitions;
    SimpTrad simp_trad = SimpTrad::Unspecified;

    bool operator==(const ChineseItem&) const = default;
};

struct ChineseStatistics {
    std::optional<int> hsk_level;
    std::optional<std::int64_t> frequency;

    bool empty() const { return !hsk_level && !frequency; }
    bool operator==(const ChineseStatistics&) const = default;
};

struct ChineseEntry {
    std::string id;
    std::string simplified;
    std::string traditional;
    std::string gloss;
    std::vector<ChineseItem> items;
    ChineseStatistics statistics;

    bool operator==(const ChineseEntry&) const = default;
};

// Lower value = preferred when picking the primary Chinese entry.
int chinese_source_priority(std::string_view source);

// ==================== Japanese (JMdict words) ====================

struct JapaneseSpelling {
    std::string text;
    bool common = false;

    bool operator==(const JapaneseSpelling&) const = default;
};

struct JapaneseGloss {
    std::string text;
    std::string lang;

    bool operator==(const JapaneseGloss&) const = default;
};

struct JapaneseSense {
    std::vector<JapaneseGloss> gloss;
    std::set<std::string> part_of_speech;

    bool operator==(const JapaneseSense&) const = default;
};

struct JapaneseEntry {
    std::string id;
    std::vector<JapaneseSpelling> kanji;
    std::vector<JapaneseSpelling> kana;
    std::vector<JapaneseSense> sense;

    bool has_common_spelling() const;
    bool operator==(const JapaneseEntry&) const = default;
};

// ==================== unified ====================

enum class KeySource {
    Chinese,
    Japanese,
};

struct UnifiedMetadata {
    bool is_unified = false;
    std::uint32_t chinese_count = 0;
    std::uint32_t japanese_count = 0;
    KeySource key_source = KeySource::Chinese;

    bool operator==(const UnifiedMetadata&) const = default;
};

struct UnifiedEntry {
    std::string word;
    std::optional<ChineseEntry> chinese_entry;
    std::optional<JapaneseEntry> japanese_entry;
    UnifiedMetadata metadata;

    bool operator==(const UnifiedEntry&) const = default;
};

// ==================== characters ====================

// One line of the Chinese character dictionary.
struct ChineseCharacter {
    std::string id;
    std::string character;                 // exactly one code point
    std::string codepoint;                 // as given by the source, may be empty
    std::optional<int> stroke_count;
    std::string gloss;
    std::vector<std::string> pinyin;       // pinyinFrequencies[].pinyin, source order
    std::vector<std::string> simp_variants;
    std::vector<std::string> trad_variants;
    std::optional<int> hsk_level;

    bool operator==(const ChineseCharacter&) const = default;
};

// One KANJIDIC2 character, reduced to what the merged record carries.
struct KanjiCharacter {
    std::string literal;                   // exactly one code point
    std::string codepoint;                 // "ucs" codepoint value, may be empty
    std::optional<int> stroke_count;       // first of misc.strokeCounts
    std::optional<int> grade;
    std::optional<int> jlpt_level;
    std::optional<int> frequency;
    std::vector<std::string> onyomi;
    std::vector<std::string> kunyomi;
    std::vector<std::string> nanori;
    std::vector<std::string> meanings;     // English only

    bool operator==(const KanjiCharacter&) const = default;
};

enum class CharacterMatch {
    Direct,   // kanji literal is itself a Chinese character entry
    Mapping,  // found through the kanji -> hanzi mapping
    None,     // one side only
};

const char* character_match_name(CharacterMatch m);
CharacterMatch character_match_from_name(std::string_view s);

struct UnifiedCharacter {
    std::string character;
    std::string codepoint;                 // "U+4E00"
    std::optional<ChineseCharacter> chinese;
    std::optional<KanjiCharacter> japanese;
    CharacterMatch match = CharacterMatch::None;

    bool operator==(const UnifiedCharacter&) const = default;
};

// "U+XXXX" of the first code point; empty for an empty string.
std::string format_codepoint(std::string_view character);

// ==================== JSON (nlohmann) ====================
// Field names follow the source dumps so the serving side reads one schema.

void to_json(nlohmann::json& j, const ChineseItem& v);
void from_json(const nlohmann::json& j, ChineseItem& v);
void to_json(nlohmann::json& j, const ChineseStatistics& v);
void from_json(const nlohmann::json& j, ChineseStatistics& v);
void to_json(nlohmann::json& j, const ChineseEntry& v);
void from_json(const nlohmann::json& j, ChineseEntry& v);

void to_json(nlohmann::json& j, const JapaneseSpelling& v);
void from_json(const nlohmann::json& j, JapaneseSpelling& v);
void to_json(nlohmann::json& j, const JapaneseGloss& v);
void from_json(const nlohmann::json& j, JapaneseGloss& v);
void to_json(nlohmann::json& j, const JapaneseSense& v);
void from_json(const nlohmann::json& j, JapaneseSense& v);
void to_json(nlohmann::json& j, const JapaneseEntry& v);
void from_json(const nlohmann::json& j, JapaneseEntry& v);

void to_json(nlohmann::json& j, const UnifiedMetadata& v);
void from_json(const nlohmann::json& j, UnifiedMetadata& v);
void to_json(nlohmann::json& j, const UnifiedEntry& v);
void from_json(const nlohmann::json& j, UnifiedEntry& v);

void to_json(nlohmann::json& j, const ChineseCharacter& v);
void from_json(const nlohmann::json& j, ChineseCharacter& v);
void to_json(nlohmann::json& j, const KanjiCharacter& v);
void from_json(const nlohmann::json& j, KanjiCharacter& v);
void to_json(nlohmann::json& j, const UnifiedCharacter& v);
void from_json(const nlohmann::json& j, UnifiedCharacter& v);
