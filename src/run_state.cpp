#include "run_state.hpp"

namespace conductor {

std::string_view to_string(agent_state s) {
    switch (s) {
        case agent_state::pending:   return "pending";
        case agent_state::ready:     return "ready";
        case agent_state::running:   return "running";
        case agent_state::succeeded: return "succeeded";
        case agent_state::failed:    return "failed";
        case agent_state::skipped:   return "skipped";
    }
    return "unknown";
}

const agent_status* run_snapshot::find(const std::string& name) const {
    for (const auto& a : agents) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

std::vector<std::string> run_snapshot::in_state(agent_state s) const {
    std::vector<std::string> out;
    for (const auto& a : agents) {
        if (a.state == s) out.push_back(a.name);
    }
    return out;
}

std::size_t run_snapshot::count(agent_state s) const {
    std::size_t n = 0;
    for (const auto& a : agents) {
        if (a.state == s) ++n;
    }
    return n;
}

static int64_t epoch_ms(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

nlohmann::json to_json(const agent_status& a) {
    nlohmann::json j = {
        {"name", a.name},
        {"state", std::string(to_string(a.state))},
        {"optional", a.optional}
    };
    if (!a.error.empty()) j["error"] = a.error;
    if (!a.data.is_null()) j["data"] = a.data;
    if (a.started_at) j["started_at_ms"] = epoch_ms(*a.started_at);
    if (a.finished_at) j["finished_at_ms"] = epoch_ms(*a.finished_at);
    if (a.started_at && a.finished_at) {
        j["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            *a.finished_at - *a.started_at).count();
    }
    return j;
}

nlohmann::json to_json(const run_snapshot& r) {
    nlohmann::json agents = nlohmann::json::array();
    nlohmann::json errors = nlohmann::json::object();
    for (const auto& a : r.agents) {
        agents.push_back(to_json(a));
        if (!a.error.empty()) errors[a.name] = a.error;
    }

    nlohmann::json j = {
        {"run_id", r.run_id},
        {"repository", r.options.repository},
        {"options", {
            {"deep_analysis", r.options.analysis.deep_analysis},
            {"include_deps", r.options.analysis.include_deps},
            {"parallel_execution", r.options.analysis.parallel_execution},
            {"max_concurrency", r.options.max_concurrency}
        }},
        {"finished", r.finished},
        {"success", r.success},
        {"agents", std::move(agents)},
        {"succeeded", r.in_state(agent_state::succeeded)},
        {"failed", r.in_state(agent_state::failed)},
        {"skipped", r.in_state(agent_state::skipped)},
        {"errors", std::move(errors)},
        {"execution_order", r.execution_order},
        {"started_at_ms", epoch_ms(r.started_at)}
    };
    if (!r.reason.empty()) j["reason"] = r.reason;
    if (r.finished_at) j["finished_at_ms"] = epoch_ms(*r.finished_at);
    return j;
}

} // namespace conductor
