// cpp/dict/dict_types.cpp
#include "dict_types.h"

#include <cstdio>

#include "text_common.h"

using json = nlohmann::json;

const char* simp_trad_name(SimpTrad st) {
    switch (st) {
        case SimpTrad::SimplifiedOnly:  return "simp";
        case SimpTrad::TraditionalOnly: return "trad";
        case SimpTrad::Both:            return "both";
        default:                        return "";
    }
}

SimpTrad simp_trad_from_name(std::string_view s) {
    if (s == "simp") return SimpTrad::SimplifiedOnly;
    if (s == "trad") return SimpTrad::TraditionalOnly;
    if (s == "both") return SimpTrad::Both;
    return SimpTrad::Unspecified;
}

int chinese_source_priority(std::string_view source) {
    if (source == "cedict")       return 0;
    if (source == "dong-chinese") return 1;
    if (source == "unicode")      return 2;
    return 3;
}

bool JapaneseEntry::has_common_spelling() const {
    for (const auto& k : kanji) {
        if (k.common) return true;
    }
    for (const auto& k : kana) {
        if (k.common) return true;
    }
    return false;
}

const char* character_match_name(CharacterMatch m) {
    switch (m) {
        case CharacterMatch::Direct:  return "direct";
        case CharacterMatch::Mapping: return "mapping";
        default:                      return "none";
    }
}

CharacterMatch character_match_from_name(std::string_view s) {
    if (s == "direct") return CharacterMatch::Direct;
    if (s == "mapping") return CharacterMatch::Mapping;
    return CharacterMatch::None;
}

std::string format_codepoint(std::string_view character) {
    const std::vector<std::uint32_t> cps = utf8_code_points(character);
    if (cps.empty()) return {};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cps.front()));
    return buf;
}

// ==================== Chinese ====================

void to_json(json& j, const ChineseItem& v) {
    j = json::object();
    if (!v.source.empty()) j["source"] = v.source;
    if (!v.pinyin.empty()) j["pinyin"] = v.pinyin;
    if (v.simp_trad != SimpTrad::Unspecified) j["simpTrad"] = simp_trad_name(v.simp_trad);
    j["definitions"] = v.definitions;
}

void from_json(const json& j, ChineseItem& v) {
    v = ChineseItem{};
    if (j.contains("source")) v.source = j.at("source").get<std::string>();
    if (j.contains("pinyin")) v.pinyin = j.at("pinyin").get<std::string>();
    if (j.contains("simpTrad")) v.simp_trad = simp_trad_from_name(j.at("simpTrad").get<std::string>());
    if (j.contains("definitions")) v.definitions = j.at("definitions").get<std::vector<std::string>>();
}

void to_json(json& j, const ChineseStatistics& v) {
    j = json::object();
    if (v.hsk_level) j["hskLevel"] = *v.hsk_level;
    if (v.frequency) j["frequency"] = *v.frequency;
}

void from_json(const json& j, ChineseStatistics& v) {
    v = ChineseStatistics{};
    if (j.contains("hskLevel")) v.hsk_level = j.at("hskLevel").get<int>();
    if (j.contains("frequency")) v.frequency = j.at("frequency").get<std::int64_t>();
}

void to_json(json& j, const ChineseEntry& v) {
    j = json::object();
    if (!v.id.empty()) j["_id"] = v.id;
    j["simp"] = v.simplified;
    j["trad"] = v.traditional;
    if (!v.gloss.empty()) j["gloss"] = v.gloss;
    j["items"] = v.items;
    if (!v.statistics.empty()) j["statistics"] = v.statistics;
}

void from_json(const json& j, ChineseEntry& v) {
    v = ChineseEntry{};
    if (j.contains("_id")) v.id = j.at("_id").get<std::string>();
    v.simplified = j.at("simp").get<std::string>();
    v.traditional = j.at("trad").get<std::string>();
    if (j.contains("gloss")) v.gloss = j.at("gloss").get<std::string>();
    if (j.contains("items")) v.items = j.at("items").get<std::vector<ChineseItem>>();
    if (j.contains("statistics")) v.statistics = j.at("statistics").get<ChineseStatistics>();
}

// ==================== Japanese ====================

void to_json(json& j, const JapaneseSpelling& v) {
    j = json{{"text", v.text}, {"common", v.common}};
}

void from_json(const json& j, JapaneseSpelling& v) {
    v.text = j.at("text").get<std::string>();
    v.common = j.contains("common") ? j.at("common").get<bool>() : false;
}

void to_json(json& j, const JapaneseGloss& v) {
    j = json{{"text", v.text}, {"lang", v.lang}};
}

void from_json(const json& j, JapaneseGloss& v) {
    v.text = j.at("text").get<std::string>();
    v.lang = j.contains("lang") ? j.at("lang").get<std::string>() : std::string();
}

void to_json(json& j, const JapaneseSense& v) {
    j = json::object();
    j["gloss"] = v.gloss;
    j["partOfSpeech"] = v.part_of_speech;
}

void from_json(const json& j, JapaneseSense& v) {
    v = JapaneseSense{};
    if (j.contains("gloss")) v.gloss = j.at("gloss").get<std::vector<JapaneseGloss>>();
    if (j.contains("partOfSpeech")) v.part_of_speech = j.at("partOfSpeech").get<std::set<std::string>>();
}

void to_json(json& j, const JapaneseEntry& v) {
    j = json::object();
    j["id"] = v.id;
    j["kanji"] = v.kanji;
    j["kana"] = v.kana;
    j["sense"] = v.sense;
}

void from_json(const json& j, JapaneseEntry& v) {
    v = JapaneseEntry{};
    v.id = j.at("id").get<std::string>();
    if (j.contains("kanji")) v.kanji = j.at("kanji").get<std::vector<JapaneseSpelling>>();
    if (j.contains("kana")) v.kana = j.at("kana").get<std::vector<JapaneseSpelling>>();
    if (j.contains("sense")) v.sense = j.at("sense").get<std::vector<JapaneseSense>>();
}

// ==================== unified ====================

void to_json(json& j, const UnifiedMetadata& v) {
    j = json::object();
    j["is_unified"] = v.is_unified;
    j["chinese_count"] = v.chinese_count;
    j["japanese_count"] = v.japanese_count;
    j["key_source"] = (v.key_source == KeySource::Chinese) ? "chinese" : "japanese";
}

void from_json(const json& j, UnifiedMetadata& v) {
    v.is_unified = j.at("is_unified").get<bool>();
    v.chinese_count = j.at("chinese_count").get<std::uint32_t>();
    v.japanese_count = j.at("japanese_count").get<std::uint32_t>();
    const std::string ks = j.contains("key_source") ? j.at("key_source").get<std::string>() : "chinese";
    v.key_source = (ks == "japanese") ? KeySource::Japanese : KeySource::Chinese;
}

void to_json(json& j, const UnifiedEntry& v) {
    j = json::object();
    j["word"] = v.word;
    if (v.chinese_entry) j["chinese_entry"] = *v.chinese_entry;
    if (v.japanese_entry) j["japanese_entry"] = *v.japanese_entry;
    j["metadata"] = v.metadata;
}

void from_json(const json& j, UnifiedEntry& v) {
    v = UnifiedEntry{};
    v.word = j.at("word").get<std::string>();
    if (j.contains("chinese_entry")) v.chinese_entry = j.at("chinese_entry").get<ChineseEntry>();
    if (j.contains("japanese_entry")) v.japanese_entry = j.at("japanese_entry").get<JapaneseEntry>();
    v.metadata = j.at("metadata").get<UnifiedMetadata>();
}

// ==================== characters ====================

namespace {

template <class T>
void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template <class T>
void get_optional(const json& j, const char* key, std::optional<T>& v) {
    if (j.contains(key) && !j.at(key).is_null()) v = j.at(key).get<T>();
}

std::vector<std::string> get_strings(const json& j, const char* key) {
    if (!j.contains(key)) return {};
    return j.at(key).get<std::vector<std::string>>();
}

} // namespace

void to_json(json& j, const ChineseCharacter& v) {
    j = json::object();
    if (!v.id.empty()) j["_id"] = v.id;
    j["char"] = v.character;
    if (!v.codepoint.empty()) j["codepoint"] = v.codepoint;
    put_optional(j, "strokeCount", v.stroke_count);
    if (!v.gloss.empty()) j["gloss"] = v.gloss;
    j["pinyin"] = v.pinyin;
    j["simpVariants"] = v.simp_variants;
    j["tradVariants"] = v.trad_variants;
    put_optional(j, "hskLevel", v.hsk_level);
}

void from_json(const json& j, ChineseCharacter& v) {
    v = ChineseCharacter{};
    if (j.contains("_id")) v.id = j.at("_id").get<std::string>();
    v.character = j.at("char").get<std::string>();
    if (j.contains("codepoint")) v.codepoint = j.at("codepoint").get<std::string>();
    get_optional(j, "strokeCount", v.stroke_count);
    if (j.contains("gloss")) v.gloss = j.at("gloss").get<std::string>();
    v.pinyin = get_strings(j, "pinyin");
    v.simp_variants = get_strings(j, "simpVariants");
    v.trad_variants = get_strings(j, "tradVariants");
    get_optional(j, "hskLevel", v.hsk_level);
}

void to_json(json& j, const KanjiCharacter& v) {
    j = json::object();
    j["literal"] = v.literal;
    if (!v.codepoint.empty()) j["codepoint"] = v.codepoint;
    put_optional(j, "strokeCount", v.stroke_count);
    put_optional(j, "grade", v.grade);
    put_optional(j, "jlptLevel", v.jlpt_level);
    put_optional(j, "frequency", v.frequency);
    j["onyomi"] = v.onyomi;
    j["kunyomi"] = v.kunyomi;
    j["nanori"] = v.nanori;
    j["meanings"] = v.meanings;
}

void from_json(const json& j, KanjiCharacter& v) {
    v = KanjiCharacter{};
    v.literal = j.at("literal").get<std::string>();
    if (j.contains("codepoint")) v.codepoint = j.at("codepoint").get<std::string>();
    get_optional(j, "strokeCount", v.stroke_count);
    get_optional(j, "grade", v.grade);
    get_optional(j, "jlptLevel", v.jlpt_level);
    get_optional(j, "frequency", v.frequency);
    v.onyomi = get_strings(j, "onyomi");
    v.kunyomi = get_strings(j, "kunyomi");
    v.nanori = get_strings(j, "nanori");
    v.meanings = get_strings(j, "meanings");
}

void to_json(json& j, const UnifiedCharacter& v) {
    j = json::object();
    j["character"] = v.character;
    j["codepoint"] = v.codepoint;
    if (v.chinese) j["chinese"] = *v.chinese;
    if (v.japanese) j["japanese"] = *v.japanese;
    j["match"] = character_match_name(v.match);
}

void from_json(const json& j, UnifiedCharacter& v) {
    v = UnifiedCharacter{};
    v.character = j.at("character").get<std::string>();
    v.codepoint = j.at("codepoint").get<std::string>();
    if (j.contains("chinese")) v.chinese = j.at("chinese").get<ChineseCharacter>();
    if (j.contains("japanese")) v.japanese = j.at("japanese").get<KanjiCharacter>();
    v.match = character_match_from_name(j.value("match", std::string("none")));
}
