#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace conductor {

namespace {

std::vector<std::string> string_list(const YAML::Node& node, const std::string& what) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence()) throw std::runtime_error("config: '" + what + "' must be a list");
    for (const auto& item : node) out.push_back(item.as<std::string>());
    return out;
}

pipeline_stage parse_stage(const YAML::Node& item) {
    if (!item.IsMap()) throw std::runtime_error("config: pipeline entries must be maps");

    pipeline_stage stage;
    if (auto n = item["name"]) {
        stage.name = n.as<std::string>();
    } else {
        throw std::runtime_error("config: pipeline stage without 'name'");
    }
    if (auto n = item["type"]) {
        stage.type = n.as<std::string>();
    } else {
        throw std::runtime_error("config: pipeline stage '" + stage.name + "' has no 'type'");
    }

    stage.after    = string_list(item["after"], stage.name + ".after");
    stage.tolerate = string_list(item["tolerate"], stage.name + ".tolerate");
    stage.reads    = string_list(item["reads"], stage.name + ".reads");
    if (auto n = item["optional"]) stage.optional = n.as<bool>();

    for (const auto& t : stage.tolerate) {
        if (std::find(stage.after.begin(), stage.after.end(), t) == stage.after.end()) {
            throw std::runtime_error("config: stage '" + stage.name + "' tolerates '" + t +
                                     "' which is not listed in 'after'");
        }
    }
    return stage;
}

config from_node(const YAML::Node& root) {
    config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("config: top level must be a map");

    // Operational
    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }

    // Scheduling
    if (auto n = root["max_concurrency"])       cfg.max_concurrency = n.as<unsigned int>();
    if (auto n = root["run_timeout_seconds"])   cfg.run_timeout_seconds = n.as<uint32_t>();
    if (auto n = root["agent_timeout_seconds"]) cfg.agent_timeout_seconds = n.as<uint32_t>();
    if (auto n = root["max_failures"])          cfg.max_failures = n.as<uint32_t>();

    // Substrate
    if (auto n = root["broker_history_limit"]) cfg.broker_history_limit = n.as<std::size_t>();
    if (auto n = root["context_shards"])       cfg.context_shards = n.as<std::size_t>();
    if (cfg.context_shards == 0) {
        throw std::runtime_error("config: 'context_shards' must be at least 1");
    }

    // Submission defaults
    if (auto a = root["analysis"]) {
        if (!a.IsMap()) throw std::runtime_error("config: 'analysis' must be a map");
        if (auto n = a["deep_analysis"])      cfg.analysis.deep_analysis = n.as<bool>();
        if (auto n = a["include_deps"])       cfg.analysis.include_deps = n.as<bool>();
        if (auto n = a["parallel_execution"]) cfg.analysis.parallel_execution = n.as<bool>();
    }

    // Pipeline (optional, replaces the built-in one)
    if (auto p = root["pipeline"]) {
        if (!p.IsSequence()) throw std::runtime_error("config: 'pipeline' must be a list");
        cfg.pipeline.clear();
        std::set<std::string> names;
        for (const auto& item : p) {
            auto stage = parse_stage(item);
            if (!names.insert(stage.name).second) {
                throw std::runtime_error("config: duplicate pipeline stage '" + stage.name + "'");
            }
            cfg.pipeline.push_back(std::move(stage));
        }
        if (cfg.pipeline.empty()) {
            throw std::runtime_error("config: 'pipeline' must not be empty");
        }
    }

    return cfg;
}

} // namespace

std::vector<pipeline_stage> config::default_pipeline() {
    const std::string files = "{run}/repo/files";
    return {
        {"clone", "repo_cloner", {}, {}, {}, false},
        {"security_scan", "security_scanner", {"clone"}, {}, {files}, false},
        {"code_review", "code_reviewer", {"clone"}, {}, {files}, false},
        {"report", "reporter", {"security_scan", "code_review"},
         {"security_scan", "code_review"}, {files}, false},
    };
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "trace")                return spdlog::level::trace;
    if (s == "debug")                return spdlog::level::debug;
    if (s == "info")                 return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error" || s == "err")  return spdlog::level::err;
    if (s == "off")                  return spdlog::level::off;
    return std::nullopt;
}

config load_config(const std::string& path) {
    return from_node(YAML::LoadFile(path));
}

config parse_config(const std::string& yaml) {
    return from_node(YAML::Load(yaml));
}

} // namespace conductor
