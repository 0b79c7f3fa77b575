#pragma once

#include "agent.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

enum class agent_state {
    pending,
    ready,
    running,
    succeeded,
    failed,
    skipped
};

std::string_view to_string(agent_state s);

inline bool is_terminal(agent_state s) {
    return s == agent_state::succeeded || s == agent_state::failed || s == agent_state::skipped;
}

struct agent_status {
    std::string name;
    agent_state state = agent_state::pending;
    bool optional = false;
    std::string error;   // task error, timeout, or skip reason
    nlohmann::json data; // payload of a successful task_result
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
};

// Immutable view of one run, published by the scheduling loop after every
// transition. The final snapshot of a run is its result.
struct run_snapshot {
    std::string run_id;
    run_options options;
    bool finished = false;
    bool success = false;
    std::string reason;                        // why a finished run failed, if not task errors
    std::vector<agent_status> agents;          // registration order
    std::vector<std::string> execution_order;  // order in which agents started running
    std::size_t peak_running = 0;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;

    const agent_status* find(const std::string& name) const;
    std::vector<std::string> in_state(agent_state s) const;
    std::size_t count(agent_state s) const;
};

using run_result = run_snapshot;

nlohmann::json to_json(const agent_status& a);
nlohmann::json to_json(const run_snapshot& r);

} // namespace conductor
