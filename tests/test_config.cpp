#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

TEST(config, defaults_when_empty) {
    auto cfg = conductor::parse_config("");

    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.max_concurrency, 0u);
    EXPECT_EQ(cfg.run_timeout_seconds, 600u);
    EXPECT_EQ(cfg.agent_timeout_seconds, 300u);
    EXPECT_EQ(cfg.max_failures, 0u);
    EXPECT_EQ(cfg.stats_interval_seconds, 10);
    EXPECT_EQ(cfg.broker_history_limit, 1000u);
    EXPECT_EQ(cfg.context_shards, 16u);
    EXPECT_FALSE(cfg.analysis.deep_analysis);
    EXPECT_FALSE(cfg.analysis.include_deps);
    EXPECT_TRUE(cfg.analysis.parallel_execution);

    ASSERT_EQ(cfg.pipeline.size(), 4u);
    EXPECT_EQ(cfg.pipeline[0].name, "clone");
    EXPECT_EQ(cfg.pipeline[3].type, "reporter");
    EXPECT_EQ(cfg.pipeline[3].tolerate.size(), 2u);
}

TEST(config, scalar_overrides) {
    auto cfg = conductor::parse_config(R"(
log_level: debug
max_concurrency: 3
run_timeout_seconds: 0
agent_timeout_seconds: 5
max_failures: 2
stats_interval_seconds: 30
broker_history_limit: 50
context_shards: 4
analysis:
  deep_analysis: true
  parallel_execution: false
)");

    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.max_concurrency, 3u);
    EXPECT_EQ(cfg.run_timeout_seconds, 0u);
    EXPECT_EQ(cfg.agent_timeout_seconds, 5u);
    EXPECT_EQ(cfg.max_failures, 2u);
    EXPECT_EQ(cfg.stats_interval_seconds, 30);
    EXPECT_EQ(cfg.broker_history_limit, 50u);
    EXPECT_EQ(cfg.context_shards, 4u);
    EXPECT_TRUE(cfg.analysis.deep_analysis);
    EXPECT_FALSE(cfg.analysis.include_deps);
    EXPECT_FALSE(cfg.analysis.parallel_execution);
}

TEST(config, custom_pipeline) {
    auto cfg = conductor::parse_config(R"(
pipeline:
  - name: clone
    type: repo_cloner
  - name: scan
    type: security_scanner
    after: clone
    reads: ["{run}/repo/files"]
  - name: report
    type: reporter
    after: [scan]
    tolerate: [scan]
    optional: true
)");

    ASSERT_EQ(cfg.pipeline.size(), 3u);
    EXPECT_EQ(cfg.pipeline[1].after, std::vector<std::string>{"clone"});
    EXPECT_EQ(cfg.pipeline[1].reads, std::vector<std::string>{"{run}/repo/files"});
    EXPECT_EQ(cfg.pipeline[2].tolerate, std::vector<std::string>{"scan"});
    EXPECT_TRUE(cfg.pipeline[2].optional);
    EXPECT_FALSE(cfg.pipeline[1].optional);
}

TEST(config, invalid_values_are_rejected) {
    EXPECT_THROW(conductor::parse_config("log_level: loud"), std::runtime_error);
    EXPECT_THROW(conductor::parse_config("context_shards: 0"), std::runtime_error);
    EXPECT_THROW(conductor::parse_config("stats_interval_seconds: 0"), std::runtime_error);
    EXPECT_THROW(conductor::parse_config("analysis: 3"), std::runtime_error);
    EXPECT_THROW(conductor::parse_config("pipeline: {}"), std::runtime_error);
    EXPECT_THROW(conductor::parse_config("pipeline: []"), std::runtime_error);
}

TEST(config, invalid_pipeline_stages_are_rejected) {
    // missing type
    EXPECT_THROW(conductor::parse_config("pipeline:\n  - name: a\n"), std::runtime_error);

    // duplicate names
    EXPECT_THROW(conductor::parse_config(
        "pipeline:\n  - {name: a, type: reporter}\n  - {name: a, type: reporter}\n"),
        std::runtime_error);

    // tolerating something that is not a predecessor
    try {
        conductor::parse_config("pipeline:\n  - {name: a, type: reporter, tolerate: [b]}\n");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("config:", 0), 0u);
    }
}

TEST(config, load_from_file) {
    auto path = std::filesystem::temp_directory_path() / "conductor_test_config.yaml";
    {
        std::ofstream out(path);
        out << "max_failures: 7\nanalysis:\n  include_deps: true\n";
    }

    auto cfg = conductor::load_config(path.string());
    EXPECT_EQ(cfg.max_failures, 7u);
    EXPECT_TRUE(cfg.analysis.include_deps);

    std::filesystem::remove(path);
}

TEST(config, missing_file_throws) {
    EXPECT_ANY_THROW(conductor::load_config("/nonexistent/conductor.yaml"));
}

TEST(config, log_level_names) {
    EXPECT_EQ(conductor::parse_log_level("debug").value_or(spdlog::level::off), spdlog::level::debug);
    EXPECT_EQ(conductor::parse_log_level("warn").value_or(spdlog::level::off), spdlog::level::warn);
    EXPECT_EQ(conductor::parse_log_level("error").value_or(spdlog::level::off), spdlog::level::err);
    EXPECT_FALSE(conductor::parse_log_level("chatty").has_value());
}
