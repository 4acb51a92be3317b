// cpp/dict/pipeline_config.cpp
#include "pipeline_config.h"

#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "env_util.h"
#include "fs_util.h"
#include "pipeline_error.h"

using json = nlohmann::json;

namespace {

constexpr int THREADS_HARD_MAX          = 256;
constexpr std::size_t VERIFY_HARD_MAX   = 100000;
constexpr std::size_t SQL_BATCH_HARD_MAX = 10000;

void parse_format(PipelineConfig& cfg, const std::string& name, const char* origin) {
    auto f = index_format_from_name(name);
    if (!f) {
        std::cerr << "[pipeline_config] " << origin << ": unknown index format '" << name
                  << "', keeping " << index_format_name(cfg.index_format) << "\n";
        return;
    }
    cfg.index_format = *f;
}

} // namespace

void clamp_config(PipelineConfig& cfg) {
    if (cfg.threads > (unsigned)THREADS_HARD_MAX) cfg.threads = THREADS_HARD_MAX;

    if (cfg.deflate_level < 0) cfg.deflate_level = 0;
    if (cfg.deflate_level > 9) cfg.deflate_level = 9;

    if (cfg.verify_samples > VERIFY_HARD_MAX) cfg.verify_samples = VERIFY_HARD_MAX;

    if (cfg.sql_batch_rows < 1) cfg.sql_batch_rows = 1;
    if (cfg.sql_batch_rows > SQL_BATCH_HARD_MAX) cfg.sql_batch_rows = SQL_BATCH_HARD_MAX;

    if (cfg.opencc_bin.empty()) cfg.opencc_bin = "opencc";
    if (cfg.opencc_config.empty()) cfg.opencc_config = "jp2t";
}

void apply_env_overrides(PipelineConfig& cfg) {
    const int threads = env_int("KIOKUN_THREADS", -1);
    if (threads >= 0) cfg.threads = static_cast<unsigned>(threads);

    cfg.deflate_level = env_int("KIOKUN_DEFLATE_LEVEL", cfg.deflate_level);

    const int samples = env_int("KIOKUN_VERIFY_SAMPLES", -1);
    if (samples >= 0) cfg.verify_samples = static_cast<std::size_t>(samples);

    const std::string fmt = env_str("KIOKUN_INDEX_FORMAT", "");
    if (!fmt.empty()) parse_format(cfg, fmt, "KIOKUN_INDEX_FORMAT");

    const int batch = env_int("KIOKUN_SQL_BATCH_ROWS", -1);
    if (batch >= 0) cfg.sql_batch_rows = static_cast<std::size_t>(batch);

    cfg.shard_copy    = env_bool("KIOKUN_SHARD_COPY", cfg.shard_copy);
    cfg.opencc_bin    = env_str("KIOKUN_OPENCC_BIN", cfg.opencc_bin);
    cfg.opencc_config = env_str("KIOKUN_OPENCC_CONFIG", cfg.opencc_config);
}

PipelineConfig load_pipeline_config(const std::string& path) {
    PipelineConfig cfg;

    std::error_code ec;
    if (!path.empty() && fs::is_regular_file(path, ec)) {
        json j;
        try {
            j = json::parse(read_file_bytes(path));
        } catch (const json::parse_error& e) {
            throw IoFailure(std::string("cannot parse config (") + e.what() + ")", path);
        }
        if (!j.is_object()) throw IoFailure("config is not a JSON object", path);

        try {
            if (j.contains("threads"))        cfg.threads        = j["threads"].get<unsigned>();
            if (j.contains("deflate_level"))  cfg.deflate_level  = j["deflate_level"].get<int>();
            if (j.contains("verify_samples")) cfg.verify_samples = j["verify_samples"].get<std::size_t>();
            if (j.contains("index_format"))   parse_format(cfg, j["index_format"].get<std::string>(), path.c_str());
            if (j.contains("sql_batch_rows")) cfg.sql_batch_rows = j["sql_batch_rows"].get<std::size_t>();
            if (j.contains("shard_copy"))     cfg.shard_copy     = j["shard_copy"].get<bool>();

            if (j.contains("opencc")) {
                const auto& o = j["opencc"];
                if (o.contains("bin"))    cfg.opencc_bin    = o["bin"].get<std::string>();
                if (o.contains("config")) cfg.opencc_config = o["config"].get<std::string>();
            }
        } catch (const json::type_error& e) {
            throw IoFailure(std::string("bad config value (") + e.what() + ")", path);
        }
    } else if (!path.empty()) {
        std::cout << "[pipeline_config] " << path << " not found, using defaults\n";
    }

    apply_env_overrides(cfg);
    clamp_config(cfg);
    return cfg;
}
