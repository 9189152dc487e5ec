#include <gtest/gtest.h>
#include "pipeline/ingestion_pipeline.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace canon;

class PipelineConfigTest : public ::testing::Test {
protected:
    std::filesystem::path path;

    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("canon_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json");
    }

    void TearDown() override {
        std::filesystem::remove(path);
        unsetenv("CANON_EXTRACTOR_URL");
        unsetenv("CANON_EXTRACTOR_API_KEY");
        unsetenv("CANON_MAX_CONCURRENCY");
        unsetenv("CANON_OUTPUT_DIR");
    }
};

TEST_F(PipelineConfigTest, DefaultsAreValid) {
    PipelineConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_DOUBLE_EQ(config.resolver.high_threshold, 0.92);
    EXPECT_DOUBLE_EQ(config.resolver.mid_threshold, 0.78);
    EXPECT_EQ(config.gateway.max_attempts, 3);
    EXPECT_EQ(config.search.default_explore_depth, 1);
}

TEST_F(PipelineConfigTest, MissingSectionsKeepDefaults) {
    auto config = PipelineConfig::from_json(nlohmann::json{
        {"gateway", {{"max_concurrency", 8}}},
        {"resolver", {{"high_threshold", 0.95}}},
        {"verbose", true}
    });

    EXPECT_EQ(config.gateway.max_concurrency, 8u);
    EXPECT_EQ(config.gateway.max_attempts, 3);
    EXPECT_DOUBLE_EQ(config.resolver.high_threshold, 0.95);
    EXPECT_DOUBLE_EQ(config.resolver.mid_threshold, 0.78);
    EXPECT_EQ(config.merge.writer_shards, 4u);
    EXPECT_TRUE(config.verbose);
}

TEST_F(PipelineConfigTest, FileRoundTripRedactsApiKey) {
    PipelineConfig config;
    config.extractor.service_url = "http://ner.internal:9000";
    config.extractor.api_key = "secret-token";
    config.gateway.chunk_timeout_ms = 1234;
    config.to_json_file(path.string());

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str().find("secret-token"), std::string::npos);

    auto loaded = PipelineConfig::from_json_file(path.string());
    EXPECT_EQ(loaded.extractor.service_url, "http://ner.internal:9000");
    EXPECT_EQ(loaded.gateway.chunk_timeout_ms, 1234);
    EXPECT_TRUE(loaded.extractor.api_key.empty());
}

TEST_F(PipelineConfigTest, MissingFileThrows) {
    EXPECT_THROW(PipelineConfig::from_json_file("/nonexistent/canon.json"), std::runtime_error);
}

TEST_F(PipelineConfigTest, EnvironmentOverrides) {
    setenv("CANON_EXTRACTOR_URL", "http://env-host:8001", 1);
    setenv("CANON_EXTRACTOR_API_KEY", "env-key", 1);
    setenv("CANON_MAX_CONCURRENCY", "12", 1);
    setenv("CANON_OUTPUT_DIR", "/tmp/canon-out", 1);

    auto config = PipelineConfig::from_environment();
    EXPECT_EQ(config.extractor.service_url, "http://env-host:8001");
    EXPECT_EQ(config.extractor.api_key, "env-key");
    EXPECT_EQ(config.gateway.max_concurrency, 12u);
    EXPECT_EQ(config.output_directory, "/tmp/canon-out");
}

TEST_F(PipelineConfigTest, BadConcurrencyIsIgnored) {
    setenv("CANON_MAX_CONCURRENCY", "lots", 1);
    EXPECT_EQ(PipelineConfig::from_environment().gateway.max_concurrency, 4u);

    setenv("CANON_MAX_CONCURRENCY", "-3", 1);
    EXPECT_EQ(PipelineConfig::from_environment().gateway.max_concurrency, 4u);
}

TEST_F(PipelineConfigTest, ValidationCatchesEachSection) {
    std::string error;

    PipelineConfig no_url;
    no_url.extractor.service_url.clear();
    EXPECT_FALSE(no_url.validate(error));

    PipelineConfig thresholds;
    thresholds.resolver.mid_threshold = 0.99;
    EXPECT_FALSE(thresholds.validate(error));

    PipelineConfig shards;
    shards.merge.writer_shards = 0;
    EXPECT_FALSE(shards.validate(error));

    PipelineConfig attempts;
    attempts.gateway.max_attempts = 0;
    EXPECT_FALSE(attempts.validate(error));

    PipelineConfig search;
    search.search.hop_decay = 2.0;
    EXPECT_FALSE(search.validate(error));
    EXPECT_FALSE(error.empty());
}

TEST_F(PipelineConfigTest, PipelineRejectsInvalidConfig) {
    PipelineConfig config;
    config.merge.writer_shards = 0;
    EXPECT_THROW(IngestionPipeline pipeline(config), std::invalid_argument);
}
