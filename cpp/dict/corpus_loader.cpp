// cpp/dict/corpus_loader.cpp
#include "corpus_loader.h"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string_view>
#include <utility>

#include <simdjson.h>

#include "fs_util.h"
#include "pipeline_error.h"
#include "text_common.h"
#include "worker_pool.h"

namespace {

using simdjson::dom::element;

constexpr std::uint64_t SKIP_LOG_LIMIT = 50;
constexpr std::uint64_t PROGRESS_EVERY = 10000;

struct SkippedRecord {
    std::uint64_t record_no;  // 1-based file line (JSONL) or array position
    std::string why;
};

// ==================== field helpers ====================
// absent or null -> true, out untouched; wrong type -> false + why

bool opt_string(element obj, const char* key, std::string& out, std::string& why) {
    element v;
    if (obj[key].get(v) || v.is_null()) return true;
    std::string_view sv;
    if (v.get(sv)) {
        why = std::string("field '") + key + "' is not a string";
        return false;
    }
    out.assign(sv.data(), sv.size());
    return true;
}

bool req_string(element obj, const char* key, std::string& out, std::string& why) {
    element v;
    if (obj[key].get(v) || v.is_null()) {
        why = std::string("missing field '") + key + "'";
        return false;
    }
    std::string_view sv;
    if (v.get(sv)) {
        // JMdict ids are strings, some dumps use integers
        std::int64_t n = 0;
        if (!v.get(n)) {
            out = std::to_string(n);
            return true;
        }
        why = std::string("field '") + key + "' is not a string";
        return false;
    }
    if (sv.empty()) {
        why = std::string("field '") + key + "' is empty";
        return false;
    }
    out.assign(sv.data(), sv.size());
    return true;
}

// req_string, and the value must still be non-empty as a match key
bool req_key_string(element obj, const char* key, std::string& out, std::string& why) {
    if (!req_string(obj, key, out, why)) return false;
    if (normalize_match_key(out).empty()) {
        why = std::string("field '") + key + "' is blank";
        return false;
    }
    return true;
}

// exactly one well-formed, non-space code point
bool req_character(element obj, const char* key, std::string& out, std::string& why) {
    if (!req_string(obj, key, out, why)) return false;

    const auto* data = reinterpret_cast<const unsigned char*>(out.data());
    std::size_t i = 0;
    std::uint32_t cp = 0;
    const bool ok = decode_utf8_cp(data, out.size(), i, cp);
    if (!ok || i != out.size() || is_key_space_cp(cp)) {
        why = std::string("field '") + key + "' is not a single character";
        return false;
    }
    return true;
}

bool opt_bool(element obj, const char* key, bool& out, std::string& why) {
    element v;
    if (obj[key].get(v) || v.is_null()) return true;
    if (v.get(out)) {
        why = std::string("field '") + key + "' is not a bool";
        return false;
    }
    return true;
}

bool opt_int(element obj, const char* key, std::optional<std::int64_t>& out, std::string& why) {
    element v;
    if (obj[key].get(v) || v.is_null()) return true;
    std::int64_t n = 0;
    if (!v.get(n)) {
        out = n;
        return true;
    }
    double d = 0.0;
    if (!v.get(d)) {
        // 2^63 is exact in a double; the int64 range is [-2^63, 2^63)
        constexpr double INT64_BOUND = 9223372036854775808.0;
        if (std::isfinite(d) && std::trunc(d) == d && d >= -INT64_BOUND && d < INT64_BOUND) {
            out = static_cast<std::int64_t>(d);
            return true;
        }
        why = std::string("field '") + key + "' is out of range";
        return false;
    }
    why = std::string("field '") + key + "' is not a number";
    return false;
}

bool opt_small_int(element obj, const char* key, std::optional<int>& out, std::string& why) {
    std::optional<std::int64_t> wide;
    if (!opt_int(obj, key, wide, why)) return false;
    if (!wide) return true;
    if (*wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max()) {
        why = std::string("field '") + key + "' is out of range";
        return false;
    }
    out = static_cast<int>(*wide);
    return true;
}

// absent/null -> empty array view via has=false
bool opt_array(element obj, const char* key, simdjson::dom::array& out, bool& has, std::string& why) {
    has = false;
    element v;
    if (obj[key].get(v) || v.is_null()) return true;
    if (v.get(out)) {
        why = std::string("field '") + key + "' is not an array";
        return false;
    }
    has = true;
    return true;
}

bool opt_string_array(element obj, const char* key, std::vector<std::string>& out, std::string& why) {
    simdjson::dom::array arr;
    bool has = false;
    if (!opt_array(obj, key, arr, has, why)) return false;
    if (!has) return true;
    for (element v : arr) {
        std::string_view sv;
        if (v.get(sv)) {
            why = std::string(key) + " element is not a string";
            return false;
        }
        out.emplace_back(sv);
    }
    return true;
}

// ==================== record parsers ====================

bool parse_chinese_record(element doc, ChineseEntry& e, std::string& why) {
    if (!doc.is_object()) {
        why = "record is not an object";
        return false;
    }

    if (!opt_string(doc, "_id", e.id, why)) return false;
    if (!req_key_string(doc, "simp", e.simplified, why)) return false;
    if (!req_key_string(doc, "trad", e.traditional, why)) return false;
    if (!opt_string(doc, "gloss", e.gloss, why)) return false;

    simdjson::dom::array items;
    bool has_items = false;
    if (!opt_array(doc, "items", items, has_items, why)) return false;
    if (has_items) {
        for (element it : items) {
            if (!it.is_object()) {
                why = "item is not an object";
                return false;
            }
            ChineseItem item;
            std::string simp_trad;
            if (!opt_string(it, "source", item.source, why)) return false;
            if (!opt_string(it, "pinyin", item.pinyin, why)) return false;
            if (!opt_string(it, "simpTrad", simp_trad, why)) return false;
            item.simp_trad = simp_trad_from_name(simp_trad);

            simdjson::dom::array defs;
            bool has_defs = false;
            if (!opt_array(it, "definitions", defs, has_defs, why)) return false;
            if (has_defs) {
                for (element d : defs) {
                    std::string_view sv;
                    if (d.get(sv)) {
                        why = "definition is not a string";
                        return false;
                    }
                    item.definitions.emplace_back(sv);
                }
            }
            e.items.push_back(std::move(item));
        }
    }

    element stats;
    if (!doc["statistics"].get(stats) && stats.is_object()) {
        if (!opt_small_int(stats, "hskLevel", e.statistics.hsk_level, why)) return false;

        if (!opt_int(stats, "frequency", e.statistics.frequency, why)) return false;
        if (!e.statistics.frequency) {
            if (!opt_int(stats, "movieWordCount", e.statistics.frequency, why)) return false;
        }
    }
    return true;
}

bool parse_spellings(element doc, const char* key, std::vector<JapaneseSpelling>& out, std::string& why) {
    simdjson::dom::array arr;
    bool has = false;
    if (!opt_array(doc, key, arr, has, why)) return false;
    if (!has) return true;

    for (element k : arr) {
        if (!k.is_object()) {
            why = std::string(key) + " element is not an object";
            return false;
        }
        JapaneseSpelling sp;
        if (!req_key_string(k, "text", sp.text, why)) return false;
        if (!opt_bool(k, "common", sp.common, why)) return false;
        out.push_back(std::move(sp));
    }
    return true;
}

bool parse_japanese_record(element doc, JapaneseEntry& e, std::string& why) {
    if (!doc.is_object()) {
        why = "record is not an object";
        return false;
    }

    if (!req_string(doc, "id", e.id, why)) return false;
    if (!parse_spellings(doc, "kanji", e.kanji, why)) return false;
    if (!parse_spellings(doc, "kana", e.kana, why)) return false;
    if (e.kanji.empty() && e.kana.empty()) {
        why = "no kanji or kana spelling";
        return false;
    }

    simdjson::dom::array senses;
    bool has_senses = false;
    if (!opt_array(doc, "sense", senses, has_senses, why)) return false;
    if (!has_senses) return true;

    for (element s : senses) {
        if (!s.is_object()) {
            why = "sense is not an object";
            return false;
        }
        JapaneseSense sense;

        simdjson::dom::array glosses;
        bool has_gloss = false;
        if (!opt_array(s, "gloss", glosses, has_gloss, why)) return false;
        if (has_gloss) {
            for (element g : glosses) {
                JapaneseGloss gl;
                if (!g.is_object()) {
                    why = "gloss is not an object";
                    return false;
                }
                if (!req_string(g, "text", gl.text, why)) return false;
                if (!opt_string(g, "lang", gl.lang, why)) return false;
                sense.gloss.push_back(std::move(gl));
            }
        }

        simdjson::dom::array pos;
        bool has_pos = false;
        if (!opt_array(s, "partOfSpeech", pos, has_pos, why)) return false;
        if (has_pos) {
            for (element p : pos) {
                std::string_view sv;
                if (p.get(sv)) {
                    why = "partOfSpeech tag is not a string";
                    return false;
                }
                sense.part_of_speech.emplace(sv);
            }
        }
        e.sense.push_back(std::move(sense));
    }
    return true;
}

bool parse_chinese_character_record(element doc, ChineseCharacter& c, std::string& why) {
    if (!doc.is_object()) {
        why = "record is not an object";
        return false;
    }

    if (!opt_string(doc, "_id", c.id, why)) return false;
    if (!req_character(doc, "char", c.character, why)) return false;
    if (!opt_string(doc, "codepoint", c.codepoint, why)) return false;
    if (!opt_small_int(doc, "strokeCount", c.stroke_count, why)) return false;
    if (!opt_string(doc, "gloss", c.gloss, why)) return false;
    if (!opt_string_array(doc, "simpVariants", c.simp_variants, why)) return false;
    if (!opt_string_array(doc, "tradVariants", c.trad_variants, why)) return false;

    simdjson::dom::array freqs;
    bool has_freqs = false;
    if (!opt_array(doc, "pinyinFrequencies", freqs, has_freqs, why)) return false;
    if (has_freqs) {
        for (element f : freqs) {
            if (!f.is_object()) {
                why = "pinyinFrequencies element is not an object";
                return false;
            }
            std::string py;
            if (!opt_string(f, "pinyin", py, why)) return false;
            if (!py.empty()) c.pinyin.push_back(std::move(py));
        }
    }

    element stats;
    if (!doc["statistics"].get(stats) && stats.is_object()) {
        if (!opt_small_int(stats, "hskLevel", c.hsk_level, why)) return false;
    }
    return true;
}

bool parse_kanji_readings(element rm, KanjiCharacter& k, std::string& why) {
    if (!opt_string_array(rm, "nanori", k.nanori, why)) return false;

    simdjson::dom::array groups;
    bool has_groups = false;
    if (!opt_array(rm, "groups", groups, has_groups, why)) return false;
    if (!has_groups) return true;

    for (element g : groups) {
        if (!g.is_object()) {
            why = "readingMeaning group is not an object";
            return false;
        }

        simdjson::dom::array readings;
        bool has_readings = false;
        if (!opt_array(g, "readings", readings, has_readings, why)) return false;
        if (has_readings) {
            for (element r : readings) {
                std::string type, value;
                if (!r.is_object()) {
                    why = "reading is not an object";
                    return false;
                }
                if (!opt_string(r, "type", type, why)) return false;
                if (!opt_string(r, "value", value, why)) return false;
                if (value.empty()) continue;
                if (type == "ja_on") k.onyomi.push_back(std::move(value));
                else if (type == "ja_kun") k.kunyomi.push_back(std::move(value));
            }
        }

        simdjson::dom::array meanings;
        bool has_meanings = false;
        if (!opt_array(g, "meanings", meanings, has_meanings, why)) return false;
        if (has_meanings) {
            for (element m : meanings) {
                std::string lang, value;
                if (!m.is_object()) {
                    why = "meaning is not an object";
                    return false;
                }
                if (!opt_string(m, "lang", lang, why)) return false;
                if (!opt_string(m, "value", value, why)) return false;
                if (value.empty()) continue;
                if (lang.empty() || lang == "en") k.meanings.push_back(std::move(value));
            }
        }
    }
    return true;
}

bool parse_kanji_record(element doc, KanjiCharacter& k, std::string& why) {
    if (!doc.is_object()) {
        why = "record is not an object";
        return false;
    }

    if (!req_character(doc, "literal", k.literal, why)) return false;

    simdjson::dom::array cps;
    bool has_cps = false;
    if (!opt_array(doc, "codepoints", cps, has_cps, why)) return false;
    if (has_cps) {
        for (element cp : cps) {
            std::string type, value;
            if (!cp.is_object()) {
                why = "codepoint is not an object";
                return false;
            }
            if (!opt_string(cp, "type", type, why)) return false;
            if (!opt_string(cp, "value", value, why)) return false;
            if (type == "ucs") {
                k.codepoint = std::move(value);
                break;
            }
        }
    }

    element misc;
    if (!doc["misc"].get(misc) && misc.is_object()) {
        if (!opt_small_int(misc, "grade", k.grade, why)) return false;
        if (!opt_small_int(misc, "jlptLevel", k.jlpt_level, why)) return false;
        if (!opt_small_int(misc, "frequency", k.frequency, why)) return false;

        simdjson::dom::array strokes;
        bool has_strokes = false;
        if (!opt_array(misc, "strokeCounts", strokes, has_strokes, why)) return false;
        if (has_strokes && strokes.size() > 0) {
            std::int64_t n = 0;
            if (strokes.at(0).get(n) || n < 0 || n > std::numeric_limits<int>::max()) {
                why = "strokeCounts[0] is not a stroke count";
                return false;
            }
            k.stroke_count = static_cast<int>(n);
        }
    }

    element rm;
    if (!doc["readingMeaning"].get(rm) && rm.is_object()) {
        if (!parse_kanji_readings(rm, k, why)) return false;
    }
    return true;
}

// ==================== shared driver ====================

template <class Entry>
struct RangeResult {
    std::vector<Entry> entries;
    std::vector<SkippedRecord> skipped;
    std::uint64_t records = 0;  // non-blank lines seen
};

bool is_blank_line(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t') return false;
    }
    return true;
}

template <class Entry, class ParseFn>
std::vector<RangeResult<Entry>> parse_lines_parallel(
    const std::vector<std::string>& lines,
    unsigned threads,
    ParseFn parse_record
) {
    const unsigned n_workers = choose_worker_count(threads, lines.size());
    std::vector<RangeResult<Entry>> results(n_workers);

    run_chunked(lines.size(), n_workers, [&](unsigned t, std::size_t start, std::size_t end) {
        RangeResult<Entry>& out = results[t];
        out.entries.reserve(end - start);

        simdjson::dom::parser parser;
        for (std::size_t i = start; i < end; ++i) {
            const std::string& line = lines[i];
            if (is_blank_line(line)) continue;
            ++out.records;

            element doc;
            auto err = parser.parse(line).get(doc);
            if (err) {
                out.skipped.push_back({i + 1, simdjson::error_message(err)});
                continue;
            }

            Entry e;
            std::string why;
            if (!parse_record(doc, e, why)) {
                out.skipped.push_back({i + 1, why});
                continue;
            }
            out.entries.push_back(std::move(e));
        }
    });

    return results;
}

void log_skips(const char* what, const char* unit, const std::vector<SkippedRecord>& skipped,
               std::uint64_t& logged) {
    for (const auto& s : skipped) {
        if (logged < SKIP_LOG_LIMIT) {
            std::cerr << "[corpus_loader] skip " << what << " " << unit << " " << s.record_no
                      << ": " << s.why << "\n";
        } else if (logged == SKIP_LOG_LIMIT) {
            std::cerr << "[corpus_loader] further " << what << " skips not shown\n";
        }
        ++logged;
    }
}

template <class Corpus, class Entry>
void merge_results(Corpus& corpus, std::vector<RangeResult<Entry>>& results, const char* what) {
    std::uint64_t logged = 0;
    for (auto& r : results) {
        log_skips(what, "line", r.skipped, logged);
        corpus.stats.records_total += r.records;
        corpus.stats.records_skipped += r.skipped.size();
        for (const auto& s : r.skipped) {
            if (corpus.stats.skipped_lines.size() < SKIP_LOG_LIMIT) {
                corpus.stats.skipped_lines.push_back(s.record_no);
            }
        }
        for (auto& e : r.entries) {
            corpus.entries.push_back(std::move(e));
        }
    }
    corpus.stats.records_loaded = corpus.entries.size();
}

// JSON array of records: 1-based positions, progress every PROGRESS_EVERY
template <class Set, class Entry, class ParseFn>
void parse_array_records(Set& set, simdjson::dom::array arr, ParseFn parse_record, const char* what) {
    std::uint64_t logged = 0;
    std::vector<SkippedRecord> skipped;

    std::uint64_t pos = 0;
    for (element rec : arr) {
        ++pos;
        Entry e;
        std::string why;
        if (!parse_record(rec, e, why)) {
            skipped.push_back({pos, why});
            continue;
        }
        set.entries.push_back(std::move(e));

        if (set.entries.size() % PROGRESS_EVERY == 0) {
            std::cout << "[corpus_loader] " << what << ": " << set.entries.size() << " records...\n";
        }
    }

    log_skips(what, "record", skipped, logged);
    set.stats.records_total = pos;
    set.stats.records_skipped = skipped.size();
    for (const auto& s : skipped) {
        if (set.stats.skipped_lines.size() < SKIP_LOG_LIMIT) set.stats.skipped_lines.push_back(s.record_no);
    }
    set.stats.records_loaded = set.entries.size();
}

void index_chinese(ChineseCorpus& corpus) {
    for (std::size_t i = 0; i < corpus.entries.size(); ++i) {
        const auto& e = corpus.entries[i];
        corpus.index.add(e.simplified, (std::uint32_t)i);
        corpus.index.add(e.traditional, (std::uint32_t)i);
    }
}

void index_japanese(JapaneseCorpus& corpus) {
    for (std::size_t i = 0; i < corpus.entries.size(); ++i) {
        const auto& e = corpus.entries[i];
        for (const auto& k : e.kanji) corpus.index.add(k.text, (std::uint32_t)i);
        for (const auto& k : e.kana) corpus.index.add(k.text, (std::uint32_t)i);
    }
}

void require_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IoFailure("input file not found", path);
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ==================== SpellingIndex ====================

void SpellingIndex::add(const std::string& spelling, std::uint32_t entry_idx) {
    if (spelling.empty()) return;
    auto& owners = by_spelling_[spelling];
    // simp == trad, or the same kana listed twice
    if (!owners.empty() && owners.back() == entry_idx) return;
    owners.push_back(entry_idx);
}

const std::vector<std::uint32_t>& SpellingIndex::find(const std::string& spelling) const {
    static const std::vector<std::uint32_t> empty;
    auto it = by_spelling_.find(spelling);
    if (it == by_spelling_.end()) return empty;
    return it->second;
}

// ==================== Chinese ====================

ChineseCorpus parse_chinese_lines(const std::vector<std::string>& lines, unsigned threads) {
    ChineseCorpus corpus;
    auto results = parse_lines_parallel<ChineseEntry>(lines, threads, parse_chinese_record);
    merge_results(corpus, results, "chinese");
    index_chinese(corpus);
    return corpus;
}

ChineseCorpus load_chinese_corpus(const std::string& path, unsigned threads) {
    require_file(path);
    std::vector<std::string> lines = read_lines(path);

    ChineseCorpus corpus = parse_chinese_lines(lines, threads);
    std::cout << "[corpus_loader] chinese: loaded=" << corpus.stats.records_loaded
              << " skipped=" << corpus.stats.records_skipped
              << " spellings=" << corpus.index.size()
              << " (" << path << ")\n";
    return corpus;
}

// ==================== Japanese ====================

JapaneseCorpus parse_japanese_lines(const std::vector<std::string>& lines, unsigned threads) {
    JapaneseCorpus corpus;
    auto results = parse_lines_parallel<JapaneseEntry>(lines, threads, parse_japanese_record);
    merge_results(corpus, results, "japanese");
    index_japanese(corpus);
    return corpus;
}

namespace {

JapaneseCorpus japanese_from_root(element root, const std::string& label) {
    simdjson::dom::array words;
    if (root["words"].get(words)) {
        throw IoFailure("japanese document has no 'words' array", label);
    }

    JapaneseCorpus corpus;
    parse_array_records<JapaneseCorpus, JapaneseEntry>(corpus, words, parse_japanese_record, "japanese");
    index_japanese(corpus);
    return corpus;
}

} // namespace

JapaneseCorpus parse_japanese_document(const std::string& json_text) {
    simdjson::dom::parser parser;
    element root;
    auto err = parser.parse(json_text).get(root);
    if (err) {
        throw IoFailure(std::string("cannot parse japanese document (") + simdjson::error_message(err) + ")",
                        "<memory>");
    }
    return japanese_from_root(root, "<memory>");
}

JapaneseCorpus load_japanese_corpus(const std::string& path, unsigned threads) {
    require_file(path);

    JapaneseCorpus corpus;
    if (ends_with(path, ".jsonl")) {
        corpus = parse_japanese_lines(read_lines(path), threads);
    } else {
        simdjson::dom::parser parser;
        element root;
        auto err = parser.load(path).get(root);
        if (err) {
            throw IoFailure(std::string("cannot parse japanese document (") + simdjson::error_message(err) + ")",
                            path);
        }
        corpus = japanese_from_root(root, path);
    }

    std::cout << "[corpus_loader] japanese: loaded=" << corpus.stats.records_loaded
              << " skipped=" << corpus.stats.records_skipped
              << " spellings=" << corpus.index.size()
              << " (" << path << ")\n";
    return corpus;
}

// ==================== character dictionaries ====================

ChineseCharacterSet parse_chinese_character_lines(const std::vector<std::string>& lines, unsigned threads) {
    ChineseCharacterSet set;
    auto results = parse_lines_parallel<ChineseCharacter>(lines, threads, parse_chinese_character_record);
    merge_results(set, results, "chinese character");
    return set;
}

ChineseCharacterSet load_chinese_characters(const std::string& path, unsigned threads) {
    require_file(path);
    ChineseCharacterSet set = parse_chinese_character_lines(read_lines(path), threads);
    std::cout << "[corpus_loader] chinese characters: loaded=" << set.stats.records_loaded
              << " skipped=" << set.stats.records_skipped
              << " (" << path << ")\n";
    return set;
}

namespace {

KanjiSet kanjidic_from_root(element root, const std::string& label) {
    simdjson::dom::array chars;
    if (root["characters"].get(chars)) {
        throw IoFailure("character dictionary has no 'characters' array", label);
    }
    KanjiSet set;
    parse_array_records<KanjiSet, KanjiCharacter>(set, chars, parse_kanji_record, "kanji");
    return set;
}

} // namespace

KanjiSet parse_kanjidic_document(const std::string& json_text) {
    simdjson::dom::parser parser;
    element root;
    auto err = parser.parse(json_text).get(root);
    if (err) {
        throw IoFailure(std::string("cannot parse character dictionary (") + simdjson::error_message(err) + ")",
                        "<memory>");
    }
    return kanjidic_from_root(root, "<memory>");
}

KanjiSet load_kanjidic(const std::string& path) {
    require_file(path);

    simdjson::dom::parser parser;
    element root;
    auto err = parser.load(path).get(root);
    if (err) {
        throw IoFailure(std::string("cannot parse character dictionary (") + simdjson::error_message(err) + ")",
                        path);
    }
    KanjiSet set = kanjidic_from_root(root, path);

    std::cout << "[corpus_loader] kanji: loaded=" << set.stats.records_loaded
              << " skipped=" << set.stats.records_skipped
              << " (" << path << ")\n";
    return set;
}

std::vector<std::string> load_kanjidic_literals(const std::string& path) {
    KanjiSet set = load_kanjidic(path);
    std::vector<std::string> out;
    out.reserve(set.entries.size());
    for (auto& k : set.entries) out.push_back(std::move(k.literal));
    return out;
}

std::vector<std::string> collect_kanji_spellings(const JapaneseCorpus& corpus) {
    std::vector<std::string> out;
    for (const auto& e : corpus.entries) {
        for (const auto& k : e.kanji) {
            if (!k.text.empty()) out.push_back(k.text);
        }
    }
    return out;
}
