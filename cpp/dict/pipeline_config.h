#pragma once

#include <cstddef>
#include <string>

#include "search_index.h"

struct PipelineConfig {
    unsigned    threads        = 0;      // 0 = hardware concurrency (<= 16)
    int         deflate_level  = 9;
    std::size_t verify_samples = 64;
    IndexFormat index_format   = IndexFormat::Csv;
    std::size_t sql_batch_rows = DEFAULT_SQL_BATCH_ROWS;
    bool        shard_copy     = true;

    std::string opencc_bin     = "opencc";
    std::string opencc_config  = "jp2t";
};

constexpr const char* PIPELINE_CONFIG_FILE = "pipeline_config.json";

// Defaults <- JSON file (when `path` is non-empty and exists) <- KIOKUN_* env,
// then clamped. An unreadable or malformed file -> IoFailure.
PipelineConfig load_pipeline_config(const std::string& path);

// Env overrides + clamps on an already populated config.
void apply_env_overrides(PipelineConfig& cfg);
void clamp_config(PipelineConfig& cfg);
