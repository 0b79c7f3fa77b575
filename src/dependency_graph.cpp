#include "dependency_graph.hpp"
#include "errors.hpp"
#include <algorithm>
#include <functional>

namespace conductor {

dependency_graph::dependency_graph(const std::vector<agent_descriptor>& agents) {
    m_names.reserve(agents.size());
    for (const auto& a : agents) {
        if (a.name.empty()) throw setup_error("agent name must not be empty");
        if (!m_index.emplace(a.name, m_names.size()).second) {
            throw setup_error("duplicate agent name '" + a.name + "'");
        }
        m_names.push_back(a.name);
    }

    m_predecessors.resize(agents.size());
    m_dependents.resize(agents.size());
    for (std::size_t i = 0; i < agents.size(); ++i) {
        for (const auto& pred : agents[i].after) {
            auto it = m_index.find(pred.name);
            if (it == m_index.end()) {
                throw setup_error("agent '" + agents[i].name +
                                  "' depends on unknown agent '" + pred.name + "'");
            }
            if (it->second == i) {
                throw setup_error("agent '" + agents[i].name + "' depends on itself");
            }
            m_predecessors[i].push_back(it->second);
            m_dependents[it->second].push_back(i);
        }
    }

    check_cycles(agents);

    // Kahn's algorithm, always taking the lowest registration index available
    std::vector<std::size_t> indegree(agents.size());
    for (std::size_t i = 0; i < agents.size(); ++i) indegree[i] = m_predecessors[i].size();

    std::vector<std::size_t> available;
    for (std::size_t i = 0; i < agents.size(); ++i) {
        if (indegree[i] == 0) available.push_back(i);
    }
    while (!available.empty()) {
        auto min_it = std::min_element(available.begin(), available.end());
        auto idx = *min_it;
        available.erase(min_it);
        m_order.push_back(idx);
        for (auto dep : m_dependents[idx]) {
            if (--indegree[dep] == 0) available.push_back(dep);
        }
    }
}

std::size_t dependency_graph::index_of(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) throw setup_error("unknown agent '" + name + "'");
    return it->second;
}

void dependency_graph::check_cycles(const std::vector<agent_descriptor>& agents) const {
    enum class mark { none, active, done };
    std::vector<mark> marks(agents.size(), mark::none);
    std::vector<std::size_t> stack;

    std::function<void(std::size_t)> visit = [&](std::size_t idx) {
        marks[idx] = mark::active;
        stack.push_back(idx);
        for (auto pred : m_predecessors[idx]) {
            if (marks[pred] == mark::active) {
                // Report the cycle in dependency order: "a -> b -> a"
                auto start = std::find(stack.begin(), stack.end(), pred);
                std::string path;
                for (auto it = start; it != stack.end(); ++it) {
                    path += m_names[*it] + " -> ";
                }
                path += m_names[pred];
                throw setup_error("dependency cycle: " + path);
            }
            if (marks[pred] == mark::none) visit(pred);
        }
        stack.pop_back();
        marks[idx] = mark::done;
    };

    for (std::size_t i = 0; i < agents.size(); ++i) {
        if (marks[i] == mark::none) visit(i);
    }
}

} // namespace conductor
