// cpp/dict/unifier.cpp
#include "unifier.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

#include "pipeline_error.h"
#include "text_common.h"
#include "worker_pool.h"

namespace {

constexpr std::size_t SAMPLE_KEYS = 20;

// raw spellings that produced a key; candidates are looked up through them
struct KeyPlan {
    std::vector<std::string> zh_spellings;
    std::vector<std::string> ja_spellings;
};

void push_unique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

int best_source_priority(const ChineseEntry& e) {
    int best = chinese_source_priority("");
    for (const auto& it : e.items) {
        best = std::min(best, chinese_source_priority(it.source));
    }
    return best;
}

// (has statistics, best item source, input order); candidates are ascending
std::uint32_t pick_primary_chinese(const std::vector<ChineseEntry>& entries,
                                   const std::vector<std::uint32_t>& cands) {
    std::uint32_t best = cands.front();
    bool best_stats = !entries[best].statistics.empty();
    int best_prio = best_source_priority(entries[best]);

    for (std::size_t i = 1; i < cands.size(); ++i) {
        const ChineseEntry& e = entries[cands[i]];
        const bool stats = !e.statistics.empty();
        const int prio = best_source_priority(e);

        bool better = false;
        if (stats != best_stats) {
            better = stats;
        } else {
            better = prio < best_prio;
        }
        if (better) {
            best = cands[i];
            best_stats = stats;
            best_prio = prio;
        }
    }
    return best;
}

std::uint32_t pick_primary_japanese(const std::vector<JapaneseEntry>& entries,
                                    const std::vector<std::uint32_t>& cands) {
    for (std::uint32_t idx : cands) {
        if (entries[idx].has_common_spelling()) return idx;
    }
    return cands.front();
}

std::vector<std::uint32_t> collect_candidates(
    const SpellingIndex& index,
    const std::vector<std::string>& spellings,
    const std::vector<std::string>& entry_keys,
    const std::string& key
) {
    std::vector<std::uint32_t> out;
    for (const auto& s : spellings) {
        for (std::uint32_t idx : index.find(s)) {
            if (entry_keys[idx] == key) out.push_back(idx);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

// key plus the indexed spelling it came from
struct JapaneseKey {
    std::string key;
    const std::string* spelling = nullptr;
    bool from_kana = false;
};

// rendered kanji spellings in order, then kana; first non-blank result wins
JapaneseKey japanese_key(const JapaneseEntry& e, const CharacterMapping& mapping) {
    JapaneseKey k;
    for (const auto& sp : e.kanji) {
        k.key = normalize_match_key(mapping.render(sp.text));
        if (!k.key.empty()) {
            k.spelling = &sp.text;
            return k;
        }
    }
    for (const auto& sp : e.kana) {
        k.key = normalize_match_key(sp.text);
        if (!k.key.empty()) {
            k.spelling = &sp.text;
            k.from_kana = true;
            return k;
        }
    }
    return k;
}

template <class Key, class Entry, class KeyFn>
std::vector<Key> compute_keys(const std::vector<Entry>& entries, unsigned threads, KeyFn key_of) {
    std::vector<Key> keys(entries.size());
    const unsigned n_workers = choose_worker_count(threads, entries.size());
    run_chunked(entries.size(), n_workers, [&](unsigned, std::size_t start, std::size_t end) {
        for (std::size_t i = start; i < end; ++i) {
            keys[i] = key_of(entries[i]);
        }
    });
    return keys;
}

} // namespace

// ==================== keys ====================

std::string match_key_for_chinese(const ChineseEntry& e) {
    return normalize_match_key(e.traditional);
}

std::string match_key_for_japanese(const JapaneseEntry& e, const CharacterMapping& mapping) {
    return japanese_key(e, mapping).key;
}

// ==================== Unifier ====================

Unifier::Unifier(const ChineseCorpus& zh, const JapaneseCorpus& ja, const CharacterMapping& mapping)
    : zh_(zh), ja_(ja), mapping_(mapping) {}

std::vector<UnifiedEntry> Unifier::run(UnifyStats* stats, unsigned threads) const {
    UnifyStats st;
    st.chinese_entries  = zh_.entries.size();
    st.japanese_entries = ja_.entries.size();

    const std::vector<std::string> zh_keys = compute_keys<std::string>(zh_.entries, threads,
        [](const ChineseEntry& e) { return match_key_for_chinese(e); });
    const std::vector<JapaneseKey> ja_plan = compute_keys<JapaneseKey>(ja_.entries, threads,
        [this](const JapaneseEntry& e) { return japanese_key(e, mapping_); });

    std::vector<std::string> ja_keys;
    ja_keys.reserve(ja_plan.size());
    for (const auto& k : ja_plan) ja_keys.push_back(k.key);

    // key universe, byte-ordered
    std::map<std::string, KeyPlan> plans;

    for (std::size_t i = 0; i < zh_.entries.size(); ++i) {
        if (zh_keys[i].empty()) {
            throw InvariantViolation("chinese entry " + std::to_string(i) + " ('" +
                                     zh_.entries[i].traditional + "') has a blank match key");
        }
        push_unique(plans[zh_keys[i]].zh_spellings, zh_.entries[i].traditional);
    }
    for (std::size_t i = 0; i < ja_.entries.size(); ++i) {
        if (ja_keys[i].empty()) {
            throw InvariantViolation("japanese entry " + std::to_string(i) + " ('" +
                                     ja_.entries[i].id + "') has a blank match key");
        }
        push_unique(plans[ja_keys[i]].ja_spellings, *ja_plan[i].spelling);
        if (ja_plan[i].from_kana) ++st.kana_keyed;
    }

    std::vector<UnifiedEntry> out;
    out.reserve(plans.size());

    std::uint64_t zh_seen = 0;
    std::uint64_t ja_seen = 0;

    for (const auto& [key, plan] : plans) {
        const std::vector<std::uint32_t> zh_c =
            collect_candidates(zh_.index, plan.zh_spellings, zh_keys, key);
        const std::vector<std::uint32_t> ja_c =
            collect_candidates(ja_.index, plan.ja_spellings, ja_keys, key);

        if (zh_c.empty() && ja_c.empty()) {
            throw InvariantViolation("key '" + key + "' has no candidates");
        }
        if (!out.empty() && !(out.back().word < key)) {
            throw InvariantViolation("key '" + key + "' emitted twice");
        }

        UnifiedEntry u;
        u.word = key;
        if (!zh_c.empty()) {
            u.chinese_entry = zh_.entries[pick_primary_chinese(zh_.entries, zh_c)];
            st.chinese_dropped += zh_c.size() - 1;
        }
        if (!ja_c.empty()) {
            u.japanese_entry = ja_.entries[pick_primary_japanese(ja_.entries, ja_c)];
            st.japanese_dropped += ja_c.size() - 1;
        }
        u.metadata.chinese_count  = static_cast<std::uint32_t>(zh_c.size());
        u.metadata.japanese_count = static_cast<std::uint32_t>(ja_c.size());
        u.metadata.is_unified     = !zh_c.empty() && !ja_c.empty();
        u.metadata.key_source     = zh_c.empty() ? KeySource::Japanese : KeySource::Chinese;

        if (u.metadata.is_unified != (u.chinese_entry.has_value() && u.japanese_entry.has_value())) {
            throw InvariantViolation("is_unified mismatch for key '" + key + "'");
        }

        if (u.metadata.is_unified) {
            ++st.unified;
            if (st.unified_samples.size() < SAMPLE_KEYS) st.unified_samples.push_back(key);
        } else if (u.chinese_entry) {
            ++st.chinese_only;
        } else {
            ++st.japanese_only;
        }

        zh_seen += zh_c.size();
        ja_seen += ja_c.size();
        out.push_back(std::move(u));
    }

    // every entry must land in exactly one bucket
    if (zh_seen != zh_.entries.size()) {
        throw InvariantViolation("chinese candidates " + std::to_string(zh_seen) +
                                 " != entries " + std::to_string(zh_.entries.size()));
    }
    if (ja_seen != ja_.entries.size()) {
        throw InvariantViolation("japanese candidates " + std::to_string(ja_seen) +
                                 " != entries " + std::to_string(ja_.entries.size()));
    }

    st.total = out.size();
    if (stats) *stats = st;
    return out;
}

void log_unify_stats(const UnifyStats& st) {
    std::cout << "[unifier] chinese=" << st.chinese_entries
              << " japanese=" << st.japanese_entries
              << " -> entries=" << st.total << "\n";
    std::cout << "[unifier]   unified=" << st.unified
              << " chinese_only=" << st.chinese_only
              << " japanese_only=" << st.japanese_only
              << " kana_keyed=" << st.kana_keyed << "\n";
    std::cout << "[unifier]   dropped candidates: chinese=" << st.chinese_dropped
              << " japanese=" << st.japanese_dropped << "\n";
    if (!st.unified_samples.empty()) {
        std::cout << "[unifier]   samples:";
        for (const auto& k : st.unified_samples) std::cout << " " << k;
        std::cout << "\n";
    }
}
