// cpp/dict/pipeline.cpp
#include "pipeline.h"

#include <exception>
#include <iostream>
#include <system_error>
#include <thread>

#include "fs_util.h"
#include "pipeline_error.h"
#include "script_mapper.h"

using json = nlohmann::json;

namespace {

json load_stats_json(const LoadStats& s) {
    return json{
        {"records_total", s.records_total},
        {"records_loaded", s.records_loaded},
        {"records_skipped", s.records_skipped},
    };
}

json shard_counts_json(const ShardCounts& c) {
    json j = json::object();
    for (Shard s : ALL_SHARDS) j[shard_name(s)] = c[s];
    return j;
}

void remove_dir(const fs::path& d) {
    std::error_code ec;
    fs::remove_all(d, ec);
    if (ec) throw IoFailure("cannot clear directory", d.string());
}

void recreate_dir(const fs::path& d) {
    remove_dir(d);
    std::error_code ec;
    fs::create_directories(d, ec);
    if (ec) throw IoFailure("cannot create directory", d.string());
}

CharacterBuild build_characters(const PipelinePaths& paths, const CharacterMapping& mapping,
                                const fs::path& chars_dir, const PipelineConfig& cfg) {
    CharacterBuild cb;

    const ChineseCharacterSet zh = load_chinese_characters(paths.chinese_characters, cfg.threads);
    const KanjiSet kanji = load_kanjidic(paths.kanjidic);
    cb.chinese_load = zh.stats;
    cb.kanji_load   = kanji.stats;

    const std::vector<UnifiedCharacter> chars = merge_characters(zh.entries, kanji.entries, mapping, &cb.merge);
    log_character_stats(cb.merge);

    recreate_dir(chars_dir);
    cb.artifacts = write_character_artifacts(chars, chars_dir.string(), cfg.threads, cfg.deflate_level);
    if (cb.artifacts.written + cb.artifacts.skipped != chars.size()) {
        throw InvariantViolation("character artifact count " + std::to_string(cb.artifacts.written) +
                                 " + skipped " + std::to_string(cb.artifacts.skipped) +
                                 " != characters " + std::to_string(chars.size()));
    }

    cb.verified_samples = verify_character_sample(chars_dir.string(), chars, cfg.verify_samples);
    std::cout << "[pipeline] characters written=" << cb.artifacts.written
              << " verified samples=" << cb.verified_samples << "\n";
    return cb;
}

} // namespace

json build_meta_json(const BuildMeta& m) {
    json j;
    j["mapping_entries"] = m.mapping_entries;
    j["chinese"]  = load_stats_json(m.chinese_load);
    j["japanese"] = load_stats_json(m.japanese_load);

    j["unify"] = {
        {"entries", m.unify.total},
        {"unified", m.unify.unified},
        {"chinese_only", m.unify.chinese_only},
        {"japanese_only", m.unify.japanese_only},
        {"kana_keyed", m.unify.kana_keyed},
        {"chinese_dropped", m.unify.chinese_dropped},
        {"japanese_dropped", m.unify.japanese_dropped},
    };

    j["shards"] = shard_counts_json(m.shards);

    j["artifacts"] = {
        {"written", m.artifacts.written},
        {"skipped", m.artifacts.skipped},
        {"bytes_raw", m.artifacts.bytes_raw},
        {"bytes_compressed", m.artifacts.bytes_compressed},
        {"deflate_level", m.deflate_level},
        {"verified_samples", m.verified_samples},
    };

    j["search_index"] = {
        {"format", index_format_name(m.index_format)},
        {"rows", m.search_index.rows},
        {"chinese_rows", m.search_index.chinese_rows},
        {"japanese_rows", m.search_index.japanese_rows},
        {"statements", m.search_index.statements},
        {"bytes", m.search_index.bytes},
    };

    if (m.separation) {
        json sep = json::object();
        for (Shard s : ALL_SHARDS) {
            const std::size_t k = static_cast<std::size_t>(s);
            sep[shard_name(s)] = {
                {"files", m.separation->files.n[k]},
                {"bytes", m.separation->bytes[k]},
            };
        }
        j["shard_copies"] = sep;
    }

    if (m.characters) {
        const CharacterBuild& c = *m.characters;
        j["characters"] = {
            {"chinese", load_stats_json(c.chinese_load)},
            {"kanji", load_stats_json(c.kanji_load)},
            {"merged", c.merge.total},
            {"direct", c.merge.direct},
            {"mapping", c.merge.mapping},
            {"japanese_only", c.merge.japanese_only},
            {"chinese_only", c.merge.chinese_only},
            {"chinese_duplicates", c.merge.chinese_duplicates},
            {"kanji_duplicates", c.merge.kanji_duplicates},
            {"written", c.artifacts.written},
            {"skipped", c.artifacts.skipped},
            {"bytes_compressed", c.artifacts.bytes_compressed},
            {"verified_samples", c.verified_samples},
        };
    }
    return j;
}

BuildMeta run_pipeline(const PipelinePaths& paths, const PipelineConfig& cfg) {
    const fs::path out_dir(paths.out_dir);
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) throw IoFailure("cannot create out_dir", out_dir.string());

    const bool with_characters = !paths.chinese_characters.empty() || !paths.kanjidic.empty();
    if (with_characters && (paths.chinese_characters.empty() || paths.kanjidic.empty())) {
        throw IoFailure("character merge needs both character dictionaries",
                        paths.chinese_characters.empty() ? paths.kanjidic : paths.chinese_characters);
    }

    clear_complete_marker(out_dir);

    BuildMeta meta;
    meta.index_format  = cfg.index_format;
    meta.deflate_level = cfg.deflate_level;

    // 1) mapping + corpora
    const CharacterMapping mapping = CharacterMapping::load_json(paths.mapping);
    meta.mapping_entries = mapping.size();
    std::cout << "[pipeline] mapping entries=" << mapping.size() << "\n";

    const ChineseCorpus zh = load_chinese_corpus(paths.chinese_corpus, cfg.threads);
    const JapaneseCorpus ja = load_japanese_corpus(paths.japanese_corpus, cfg.threads);
    meta.chinese_load  = zh.stats;
    meta.japanese_load = ja.stats;

    // 2) unify (synchronization point)
    const Unifier unifier(zh, ja, mapping);
    const std::vector<UnifiedEntry> entries = unifier.run(&meta.unify, cfg.threads);
    log_unify_stats(meta.unify);

    meta.shards = count_shards(entries);
    verify_shard_counts(meta.shards, entries.size());

    // 3) artifacts || search index
    const fs::path dict_dir = out_dir / DICTIONARY_DIR;
    recreate_dir(dict_dir);

    const fs::path index_path = out_dir / index_file_name(cfg.index_format);

    std::exception_ptr index_error;
    std::thread index_worker([&]() {
        try {
            meta.search_index = write_search_index(entries, index_path.string(),
                                                   cfg.index_format, cfg.sql_batch_rows);
        } catch (...) {
            index_error = std::current_exception();
        }
    });

    std::exception_ptr artifact_error;
    try {
        meta.artifacts = write_artifacts(entries, dict_dir.string(), cfg.threads, cfg.deflate_level);
    } catch (...) {
        artifact_error = std::current_exception();
    }
    index_worker.join();

    if (artifact_error) std::rethrow_exception(artifact_error);
    if (index_error) std::rethrow_exception(index_error);

    std::cout << "[pipeline] artifacts written=" << meta.artifacts.written
              << " skipped=" << meta.artifacts.skipped
              << " raw=" << meta.artifacts.bytes_raw
              << " compressed=" << meta.artifacts.bytes_compressed << "\n";

    if (meta.artifacts.written + meta.artifacts.skipped != entries.size()) {
        throw InvariantViolation("artifact count " + std::to_string(meta.artifacts.written) +
                                 " + skipped " + std::to_string(meta.artifacts.skipped) +
                                 " != entries " + std::to_string(entries.size()));
    }

    // 4) read-back sample
    meta.verified_samples = verify_roundtrip_sample(dict_dir.string(), entries, cfg.verify_samples);
    std::cout << "[pipeline] round-trip verified samples=" << meta.verified_samples << "\n";

    // 5) physical shard copies
    if (cfg.shard_copy) {
        ShardSeparationReport rep = separate_shards(
            dict_dir.string(), (out_dir / SHARDS_DIR).string(), ARTIFACT_SUFFIX, cfg.threads);
        if (rep.source_files != meta.artifacts.written) {
            throw InvariantViolation("shard copies cover " + std::to_string(rep.source_files) +
                                     " files, expected " + std::to_string(meta.artifacts.written));
        }
        log_shard_report(rep);
        meta.separation = rep;
    }

    // 6) character merge; a stale tree from an earlier run never survives
    const fs::path chars_dir = out_dir / CHARACTERS_DIR;
    if (with_characters) {
        meta.characters = build_characters(paths, mapping, chars_dir, cfg);
    } else {
        remove_dir(chars_dir);
    }

    // 7) meta, then marker
    write_file_atomic(out_dir / BUILD_META_FILE, build_meta_json(meta).dump(2) + "\n");
    write_complete_marker(out_dir, "entries=" + std::to_string(entries.size()) + "\n");

    std::cout << "[pipeline] done: " << out_dir.string() << "\n";
    return meta;
}
