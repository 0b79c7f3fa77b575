#pragma once

#include "agent.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace conductor {

// Predecessor graph over registered agents, indexed by registration order.
// Construction validates the graph and throws setup_error on duplicate or
// empty names, unknown predecessors, self-dependencies and cycles.
class dependency_graph {
public:
    explicit dependency_graph(const std::vector<agent_descriptor>& agents);

    std::size_t size() const { return m_names.size(); }
    const std::string& name(std::size_t idx) const { return m_names[idx]; }
    std::size_t index_of(const std::string& name) const;

    // Agents that list `idx` as a predecessor
    const std::vector<std::size_t>& dependents(std::size_t idx) const { return m_dependents[idx]; }

    // Predecessors before dependents; ties keep registration order.
    const std::vector<std::size_t>& topological_order() const { return m_order; }

private:
    void check_cycles(const std::vector<agent_descriptor>& agents) const;

    std::vector<std::string> m_names;
    std::unordered_map<std::string, std::size_t> m_index;
    std::vector<std::vector<std::size_t>> m_predecessors;
    std::vector<std::vector<std::size_t>> m_dependents;
    std::vector<std::size_t> m_order;
};

} // namespace conductor
