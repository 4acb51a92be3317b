#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "artifact_store.h"
#include "character_unifier.h"
#include "corpus_loader.h"
#include "pipeline_config.h"
#include "search_index.h"
#include "sharder.h"
#include "unifier.h"

struct PipelinePaths {
    std::string chinese_corpus;    // JSONL
    std::string japanese_corpus;   // JMdict JSON or JSONL
    std::string mapping;           // CharacterMapping JSON
    std::string out_dir;

    // Character merge runs only when both are set.
    std::string chinese_characters;  // JSONL
    std::string kanjidic;            // KANJIDIC2 JSON
};

struct CharacterBuild {
    LoadStats chinese_load;
    LoadStats kanji_load;
    CharacterMergeStats merge;
    ArtifactReport artifacts;
    std::size_t verified_samples = 0;
};

// Statistics of one run; written as build_meta.json. No timestamps.
struct BuildMeta {
    std::uint64_t mapping_entries = 0;
    LoadStats chinese_load;
    LoadStats japanese_load;
    UnifyStats unify;
    ShardCounts shards;
    ArtifactReport artifacts;
    std::size_t verified_samples = 0;
    SearchIndexReport search_index;
    std::optional<ShardSeparationReport> separation;
    std::optional<CharacterBuild> characters;

    IndexFormat index_format = IndexFormat::Csv;
    int deflate_level = DEFAULT_DEFLATE_LEVEL;
};

nlohmann::json build_meta_json(const BuildMeta& m);

// <out>/dictionary, <out>/shards/*, <out>/search_index.{csv,sql},
// <out>/characters (character merge only), <out>/build_meta.json,
// <out>/_COMPLETE (removed first, written last). Only one of the two
// character paths set -> IoFailure before anything is loaded.
BuildMeta run_pipeline(const PipelinePaths& paths, const PipelineConfig& cfg);

constexpr const char* DICTIONARY_DIR = "dictionary";
constexpr const char* SHARDS_DIR     = "shards";
constexpr const char* CHARACTERS_DIR = "characters";
constexpr const char* BUILD_META_FILE = "build_meta.json";
