// cpp/dict_pipeline.cpp
// Full dictionary build: load -> unify -> {artifacts, search index} ->
// round-trip check -> shard copies -> character merge -> build_meta.json ->
// _COMPLETE.
//
// Usage:
//   dict_pipeline <chinese.jsonl> <jmdict.json> <mapping.json> <out_dir>
//                 [<chinese_chars.jsonl> <kanjidic.json>] [config.json]
//
// Input:
//   chinese.jsonl  one word per line: {"simp","trad","gloss","items":[...],"statistics":{...}}
//   jmdict.json    JMdict-simplified {"words":[...]} (or *.jsonl, one word per line)
//   mapping.json   {"<kanji>":"<traditional>", ...} (kanji_mapping_builder)
//   chinese_chars.jsonl  optional, with kanjidic.json: one character per line
//   kanjidic.json        KANJIDIC2 {"characters":[...]}
//   config.json    optional; default <out_dir>/pipeline_config.json
//
// Output:
//   <out_dir>/dictionary/<word>.json        raw deflate of the unified entry
//   <out_dir>/shards/<shard>/<word>.json    copies split by Han character count
//   <out_dir>/search_index.csv              (or .sql, batched INSERTs)
//   <out_dir>/characters/<char>.json        merged character records (raw deflate)
//   <out_dir>/build_meta.json               run statistics
//   <out_dir>/_COMPLETE                     written last; absent = unusable output
//
// Env knobs:
//   KIOKUN_THREADS         (int)   worker count (default: hw, <= 16)
//   KIOKUN_DEFLATE_LEVEL   (0..9)  default 9
//   KIOKUN_VERIFY_SAMPLES  (int)   artifacts read back after the build (default 64)
//   KIOKUN_INDEX_FORMAT    (csv|sql)
//   KIOKUN_SQL_BATCH_ROWS  (int)   rows per INSERT (default 500)
//   KIOKUN_SHARD_COPY      (0/1)   physical shard copies (default 1)
//
// Exit codes: 0 ok, 1 usage, 2 I/O or other runtime error,
//             3 converter contract violation, 4 invariant violation.

#include <iostream>
#include <string>

#include "fs_util.h"
#include "pipeline.h"
#include "pipeline_config.h"
#include "pipeline_error.h"

int main(int argc, char** argv) {
    if (argc < 5 || argc > 8) {
        std::cerr << "Usage: dict_pipeline <chinese.jsonl> <jmdict.json> <mapping.json> <out_dir>"
                     " [<chinese_chars.jsonl> <kanjidic.json>] [config.json]\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);

    PipelinePaths paths;
    paths.chinese_corpus  = argv[1];
    paths.japanese_corpus = argv[2];
    paths.mapping         = argv[3];
    paths.out_dir         = argv[4];

    // 6 or 8 arguments: the last one is the config file
    const bool with_characters = argc >= 7;
    if (with_characters) {
        paths.chinese_characters = argv[5];
        paths.kanjidic           = argv[6];
    }
    const bool with_config = (argc == 6 || argc == 8);
    const std::string config_path = with_config
        ? std::string(argv[argc - 1])
        : (fs::path(paths.out_dir) / PIPELINE_CONFIG_FILE).string();

    try {
        const PipelineConfig cfg = load_pipeline_config(config_path);
        std::cout << "[dict_pipeline] threads=" << cfg.threads
                  << " deflate_level=" << cfg.deflate_level
                  << " index=" << index_format_name(cfg.index_format)
                  << " verify_samples=" << cfg.verify_samples
                  << " shard_copy=" << (cfg.shard_copy ? 1 : 0) << "\n";

        const BuildMeta meta = run_pipeline(paths, cfg);

        std::cout << "[dict_pipeline] entries=" << meta.unify.total
                  << " unified=" << meta.unify.unified
                  << " artifacts=" << meta.artifacts.written
                  << " search_rows=" << meta.search_index.rows;
        if (meta.characters) std::cout << " characters=" << meta.characters->merge.total;
        std::cout << "\n";
    } catch (const OracleContractError& e) {
        std::cerr << "[dict_pipeline] ERROR: " << e.what() << "\n";
        return 3;
    } catch (const InvariantViolation& e) {
        std::cerr << "[dict_pipeline] ERROR: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[dict_pipeline] ERROR: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
