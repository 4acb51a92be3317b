// cpp/dict/character_unifier.cpp
#include "character_unifier.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "pipeline_error.h"

namespace {

UnifiedCharacter make_character(const std::string& key) {
    UnifiedCharacter u;
    u.character = key;
    u.codepoint = format_codepoint(key);
    return u;
}

} // namespace

std::vector<UnifiedCharacter> merge_characters(
    const std::vector<ChineseCharacter>& chinese,
    const std::vector<KanjiCharacter>& kanji,
    const CharacterMapping& mapping,
    CharacterMergeStats* stats
) {
    CharacterMergeStats st;

    // first occurrence per character
    std::unordered_map<std::string, const ChineseCharacter*> zh_by_char;
    std::vector<const ChineseCharacter*> zh_order;
    for (const auto& c : chinese) {
        if (zh_by_char.emplace(c.character, &c).second) {
            zh_order.push_back(&c);
        } else {
            ++st.chinese_duplicates;
        }
    }

    std::unordered_set<std::string> literals;
    std::vector<UnifiedCharacter> out;
    out.reserve(kanji.size() + zh_order.size());

    for (const auto& k : kanji) {
        if (!literals.insert(k.literal).second) {
            ++st.kanji_duplicates;
            continue;
        }

        UnifiedCharacter u = make_character(k.literal);
        u.japanese = k;

        const ChineseCharacter* zh = nullptr;
        auto it = zh_by_char.find(k.literal);
        if (it != zh_by_char.end()) {
            zh = it->second;
            u.match = CharacterMatch::Direct;
        } else if (const std::string* mapped = mapping.find(k.literal)) {
            it = zh_by_char.find(*mapped);
            if (it != zh_by_char.end()) {
                zh = it->second;
                u.match = CharacterMatch::Mapping;
            }
        }

        if (zh) {
            u.chinese = *zh;
            if (u.match == CharacterMatch::Direct) ++st.direct;
            else ++st.mapping;
        } else {
            ++st.japanese_only;
        }
        out.push_back(std::move(u));
    }

    for (const ChineseCharacter* c : zh_order) {
        if (literals.count(c->character)) continue;
        UnifiedCharacter u = make_character(c->character);
        u.chinese = *c;
        out.push_back(std::move(u));
        ++st.chinese_only;
    }

    std::sort(out.begin(), out.end(),
              [](const UnifiedCharacter& a, const UnifiedCharacter& b) { return a.character < b.character; });

    for (std::size_t i = 1; i < out.size(); ++i) {
        if (!(out[i - 1].character < out[i].character)) {
            throw InvariantViolation("character '" + out[i].character + "' emitted twice");
        }
    }

    st.total = out.size();
    if (st.total != st.direct + st.mapping + st.japanese_only + st.chinese_only) {
        throw InvariantViolation("character total " + std::to_string(st.total) +
                                 " does not match its buckets");
    }

    if (stats) *stats = st;
    return out;
}

void log_character_stats(const CharacterMergeStats& st) {
    std::cout << "[characters] merged=" << st.total
              << " direct=" << st.direct
              << " mapping=" << st.mapping
              << " japanese_only=" << st.japanese_only
              << " chinese_only=" << st.chinese_only << "\n";
    if (st.chinese_duplicates > 0 || st.kanji_duplicates > 0) {
        std::cout << "[characters]   duplicates dropped: chinese=" << st.chinese_duplicates
                  << " kanji=" << st.kanji_duplicates << "\n";
    }
}
