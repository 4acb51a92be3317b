// cpp/tests/pipeline_config_test.cpp
#include <gtest/gtest.h>

#include <cstdlib>

#include "pipeline_config.h"
#include "pipeline_error.h"
#include "test_util.h"

namespace {

const char* const kEnvKnobs[] = {
    "KIOKUN_THREADS", "KIOKUN_DEFLATE_LEVEL", "KIOKUN_VERIFY_SAMPLES", "KIOKUN_INDEX_FORMAT",
    "KIOKUN_SQL_BATCH_ROWS", "KIOKUN_SHARD_COPY", "KIOKUN_OPENCC_BIN", "KIOKUN_OPENCC_CONFIG",
};

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* k : kEnvKnobs) ::unsetenv(k);
    }
};

} // namespace

TEST_F(PipelineConfigTest, DefaultsWithoutFile) {
    const PipelineConfig cfg = load_pipeline_config("");
    EXPECT_EQ(cfg.threads, 0u);
    EXPECT_EQ(cfg.deflate_level, 9);
    EXPECT_EQ(cfg.index_format, IndexFormat::Csv);
    EXPECT_EQ(cfg.sql_batch_rows, 500u);
    EXPECT_TRUE(cfg.shard_copy);
    EXPECT_EQ(cfg.opencc_bin, "opencc");
    EXPECT_EQ(cfg.opencc_config, "jp2t");
}

TEST_F(PipelineConfigTest, FileValues) {
    TempDir tmp;
    write_text(tmp / "pipeline_config.json", R"({
        "threads": 3,
        "deflate_level": 6,
        "verify_samples": 10,
        "index_format": "sql",
        "sql_batch_rows": 250,
        "shard_copy": false,
        "opencc": {"bin": "/opt/opencc/bin/opencc", "config": "jp2t.json"}
    })");

    const PipelineConfig cfg = load_pipeline_config((tmp / "pipeline_config.json").string());
    EXPECT_EQ(cfg.threads, 3u);
    EXPECT_EQ(cfg.deflate_level, 6);
    EXPECT_EQ(cfg.verify_samples, 10u);
    EXPECT_EQ(cfg.index_format, IndexFormat::Sql);
    EXPECT_EQ(cfg.sql_batch_rows, 250u);
    EXPECT_FALSE(cfg.shard_copy);
    EXPECT_EQ(cfg.opencc_bin, "/opt/opencc/bin/opencc");
    EXPECT_EQ(cfg.opencc_config, "jp2t.json");
}

TEST_F(PipelineConfigTest, EnvOverridesFile) {
    TempDir tmp;
    write_text(tmp / "c.json", R"({"deflate_level": 6, "index_format": "sql"})");
    ::setenv("KIOKUN_DEFLATE_LEVEL", "1", 1);
    ::setenv("KIOKUN_INDEX_FORMAT", "csv", 1);
    ::setenv("KIOKUN_SHARD_COPY", "0", 1);

    const PipelineConfig cfg = load_pipeline_config((tmp / "c.json").string());
    EXPECT_EQ(cfg.deflate_level, 1);
    EXPECT_EQ(cfg.index_format, IndexFormat::Csv);
    EXPECT_FALSE(cfg.shard_copy);
}

TEST_F(PipelineConfigTest, ValuesAreClamped) {
    ::setenv("KIOKUN_DEFLATE_LEVEL", "42", 1);
    ::setenv("KIOKUN_SQL_BATCH_ROWS", "0", 1);
    ::setenv("KIOKUN_INDEX_FORMAT", "xml", 1);

    const PipelineConfig cfg = load_pipeline_config("");
    EXPECT_EQ(cfg.deflate_level, 9);
    EXPECT_EQ(cfg.sql_batch_rows, 1u);
    EXPECT_EQ(cfg.index_format, IndexFormat::Csv);
}

TEST_F(PipelineConfigTest, MalformedFileIsIoFailure) {
    TempDir tmp;
    write_text(tmp / "bad.json", "{ not json");
    EXPECT_THROW(load_pipeline_config((tmp / "bad.json").string()), IoFailure);

    write_text(tmp / "wrong_type.json", R"({"threads": "many"})");
    EXPECT_THROW(load_pipeline_config((tmp / "wrong_type.json").string()), IoFailure);
}

TEST_F(PipelineConfigTest, MissingFileFallsBackToDefaults) {
    TempDir tmp;
    const PipelineConfig cfg = load_pipeline_config((tmp / "absent.json").string());
    EXPECT_EQ(cfg.deflate_level, 9);
}
