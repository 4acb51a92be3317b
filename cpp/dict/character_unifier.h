#pragma once

#include <cstdint>
#include <vector>

#include "dict_types.h"
#include "script_mapper.h"

struct CharacterMergeStats {
    std::uint64_t total         = 0;
    std::uint64_t direct        = 0;   // kanji literal is a Chinese character
    std::uint64_t mapping       = 0;   // paired through the kanji mapping
    std::uint64_t japanese_only = 0;
    std::uint64_t chinese_only  = 0;
    std::uint64_t chinese_duplicates = 0;  // later records of a character already seen
    std::uint64_t kanji_duplicates   = 0;
};

// One UnifiedCharacter per kanji literal plus one per Chinese character that
// is not a kanji literal, sorted by key bytes. First record wins for repeated
// characters. A mapped kanji keeps its own literal as key; the Chinese
// character it paired with is still emitted on its own when it is not a
// kanji literal. Throws InvariantViolation on a repeated key or a total that
// does not add up.
std::vector<UnifiedCharacter> merge_characters(
    const std::vector<ChineseCharacter>& chinese,
    const std::vector<KanjiCharacter>& kanji,
    const CharacterMapping& mapping,
    CharacterMergeStats* stats = nullptr
);

void log_character_stats(const CharacterMergeStats& st);
