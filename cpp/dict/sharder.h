#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dict_types.h"

// Partition by number of Han code points in the word.
enum class Shard : std::uint8_t {
    NonHan   = 0,
    Han1Char = 1,
    Han2Char = 2,
    Han3Plus = 3,
};

constexpr std::size_t SHARD_COUNT = 4;
constexpr std::array<Shard, SHARD_COUNT> ALL_SHARDS = {
    Shard::NonHan, Shard::Han1Char, Shard::Han2Char, Shard::Han3Plus,
};

Shard shard_for_word(std::string_view word);

// "non-han", "han-1char", "han-2char", "han-3plus"
const char* shard_name(Shard s);
std::optional<Shard> shard_from_name(std::string_view name);

struct ShardCounts {
    std::array<std::uint64_t, SHARD_COUNT> n{};

    std::uint64_t& operator[](Shard s) { return n[static_cast<std::size_t>(s)]; }
    std::uint64_t operator[](Shard s) const { return n[static_cast<std::size_t>(s)]; }
    std::uint64_t total() const;
};

ShardCounts count_shards(const std::vector<UnifiedEntry>& entries);

// Partitions are disjoint by construction; a sum that differs from `total`
// means something was lost or counted twice.
void verify_shard_counts(const ShardCounts& counts, std::uint64_t total);

struct ShardSeparationReport {
    ShardCounts files;
    std::array<std::uint64_t, SHARD_COUNT> bytes{};
    std::uint64_t source_files = 0;
};

// Copies every regular file of `artifact_dir` into out_root/<shard-name>/.
// Sources are never removed. Per-shard copies are recounted on disk and
// checked against the source classification (InvariantViolation).
ShardSeparationReport separate_shards(
    const std::string& artifact_dir,
    const std::string& out_root,
    const std::string& artifact_suffix,
    unsigned threads = 0
);

void log_shard_report(const ShardSeparationReport& r);
