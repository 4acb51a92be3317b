#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "corpus_loader.h"
#include "dict_types.h"
#include "script_mapper.h"

struct UnifyStats {
    std::uint64_t chinese_entries  = 0;
    std::uint64_t japanese_entries = 0;

    std::uint64_t total          = 0;     // unified entries produced
    std::uint64_t unified        = 0;     // chinese + japanese
    std::uint64_t chinese_only   = 0;
    std::uint64_t japanese_only  = 0;
    std::uint64_t kana_keyed     = 0;     // japanese keys taken from a kana spelling

    // candidates that lost primary selection
    std::uint64_t chinese_dropped  = 0;
    std::uint64_t japanese_dropped = 0;

    std::vector<std::string> unified_samples;  // first 20 unified keys
};

std::string match_key_for_chinese(const ChineseEntry& e);

// First non-blank of: each kanji spelling rendered through the mapping, then
// each kana spelling. Empty only when every spelling is blank.
std::string match_key_for_japanese(const JapaneseEntry& e, const CharacterMapping& mapping);

// Merges both corpora into one UnifiedEntry per distinct MatchKey, sorted by
// key bytes. Holds references only; corpora and mapping must outlive it.
class Unifier {
public:
    Unifier(const ChineseCorpus& zh, const JapaneseCorpus& ja, const CharacterMapping& mapping);

    // Throws InvariantViolation on an entry with a blank key, an empty
    // bucket, a repeated key or an is_unified flag that disagrees with the
    // entry contents.
    std::vector<UnifiedEntry> run(UnifyStats* stats = nullptr, unsigned threads = 0) const;

private:
    const ChineseCorpus& zh_;
    const JapaneseCorpus& ja_;
    const CharacterMapping& mapping_;
};

void log_unify_stats(const UnifyStats& st);
