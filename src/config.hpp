#pragma once

#include "agent.hpp"
#include <spdlog/common.h>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace conductor {

// One agent of the pipeline, instantiated from the agent registry by `type`.
struct pipeline_stage {
    std::string name;
    std::string type;
    std::vector<std::string> after;
    std::vector<std::string> tolerate;  // subset of `after`
    std::vector<std::string> reads;     // may contain "{run}"
    bool optional = false;
};

struct config {
    // Operational
    std::string log_level = "info";
    int stats_interval_seconds = 10;

    // Worker pool size and default per-run concurrency cap (0 = hardware_concurrency)
    unsigned int max_concurrency = 0;

    // Timeouts (0 = disabled) and failure threshold (0 = unlimited)
    uint32_t run_timeout_seconds = 600;
    uint32_t agent_timeout_seconds = 300;
    uint32_t max_failures = 0;

    // Substrate sizing
    std::size_t broker_history_limit = 1000;
    std::size_t context_shards = 16;

    // Defaults applied to every submission
    analysis_options analysis;

    std::vector<pipeline_stage> pipeline = default_pipeline();

    // clone -> (security_scan, code_review) -> report
    static std::vector<pipeline_stage> default_pipeline();
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse config from YAML text. Throws on error.
config parse_config(const std::string& yaml);

// Parse a log level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace conductor
