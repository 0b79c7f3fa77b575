#include "agent_registry.hpp"
#include "audit_agents.hpp"
#include "errors.hpp"
#include <algorithm>

namespace conductor {

void agent_registry::add(const std::string& type, factory make) {
    if (!make) throw setup_error("agent type '" + type + "' has no factory");
    if (!m_factories.emplace(type, std::move(make)).second) {
        throw setup_error("agent type '" + type + "' is already registered");
    }
}

bool agent_registry::contains(const std::string& type) const {
    return m_factories.count(type) > 0;
}

std::vector<std::string> agent_registry::types() const {
    std::vector<std::string> out;
    out.reserve(m_factories.size());
    for (const auto& [type, _] : m_factories) out.push_back(type);
    return out;
}

std::shared_ptr<agent> agent_registry::create(const std::string& type) const {
    auto it = m_factories.find(type);
    if (it == m_factories.end()) throw setup_error("unknown agent type '" + type + "'");
    return it->second();
}

agent_registry agent_registry::with_builtins() {
    agent_registry r;
    r.add("repo_cloner",      [] { return std::make_shared<repo_cloner>(); });
    r.add("security_scanner", [] { return std::make_shared<security_scanner>(); });
    r.add("code_reviewer",    [] { return std::make_shared<code_reviewer>(); });
    r.add("reporter",         [] { return std::make_shared<reporter>(); });
    return r;
}

std::vector<agent_descriptor> build_pipeline(const std::vector<pipeline_stage>& stages,
                                             const agent_registry& registry) {
    std::vector<agent_descriptor> out;
    out.reserve(stages.size());

    for (const auto& stage : stages) {
        agent_descriptor desc;
        desc.name = stage.name;
        desc.reads = stage.reads;
        desc.optional = stage.optional;
        desc.task = registry.create(stage.type);

        for (const auto& p : stage.after) {
            bool tolerant = std::find(stage.tolerate.begin(), stage.tolerate.end(), p)
                            != stage.tolerate.end();
            desc.after.push_back({p, tolerant});
        }
        out.push_back(std::move(desc));
    }
    return out;
}

} // namespace conductor
