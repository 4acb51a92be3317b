#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dict_types.h"

// One file per unified word: <dir>/<word>.json holding the raw-deflate
// (no zlib/gzip wrapper) compressed canonical JSON of the entry. Merged
// characters use the same layout keyed by the character.

constexpr const char* ARTIFACT_SUFFIX = ".json";
constexpr int DEFAULT_DEFLATE_LEVEL = 9;

// Compact JSON, object keys sorted, absent optionals omitted.
std::string serialize_entry(const UnifiedEntry& e);
UnifiedEntry parse_artifact(std::string_view json_text);

std::string serialize_character(const UnifiedCharacter& c);
UnifiedCharacter parse_character_artifact(std::string_view json_text);

// zlib windowBits -15 both ways. Throws std::runtime_error on zlib errors.
std::string deflate_raw(std::string_view in, int level = DEFAULT_DEFLATE_LEVEL);
std::string inflate_raw(std::string_view in);

// nullopt when the word cannot be a single path component.
std::optional<std::string> artifact_filename(std::string_view word);

struct ArtifactReport {
    std::uint64_t written          = 0;
    std::uint64_t skipped          = 0;   // unaddressable words
    std::uint64_t bytes_raw        = 0;
    std::uint64_t bytes_compressed = 0;
};

// Writes every addressable entry into `dir` (created if missing). Worker
// failures are rethrown after all workers joined.
ArtifactReport write_artifacts(
    const std::vector<UnifiedEntry>& entries,
    const std::string& dir,
    unsigned threads = 0,
    int level = DEFAULT_DEFLATE_LEVEL
);

ArtifactReport write_character_artifacts(
    const std::vector<UnifiedCharacter>& chars,
    const std::string& dir,
    unsigned threads = 0,
    int level = DEFAULT_DEFLATE_LEVEL
);

// Inflated JSON text of one artifact. Missing file -> IoFailure.
std::string read_artifact_json(const std::string& dir, std::string_view word);

// Reads back `samples` evenly spaced entries and compares them structurally
// with the producing entry. Mismatch -> InvariantViolation. Returns the
// number of entries checked.
std::size_t verify_roundtrip_sample(
    const std::string& dir,
    const std::vector<UnifiedEntry>& entries,
    std::size_t samples
);

std::size_t verify_character_sample(
    const std::string& dir,
    const std::vector<UnifiedCharacter>& chars,
    std::size_t samples
);
