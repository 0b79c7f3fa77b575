#pragma once

#include "agent.hpp"
#include "config.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace conductor {

// Maps an agent type name (as used in the config pipeline) to a factory.
class agent_registry {
public:
    using factory = std::function<std::shared_ptr<agent>()>;

    // Throws setup_error if `type` is already registered.
    void add(const std::string& type, factory make);

    bool contains(const std::string& type) const;
    std::vector<std::string> types() const;

    // Throws setup_error for an unknown type.
    std::shared_ptr<agent> create(const std::string& type) const;

    // Registry holding repo_cloner, security_scanner, code_reviewer and reporter.
    static agent_registry with_builtins();

private:
    std::map<std::string, factory> m_factories;
};

// Instantiate every stage of a pipeline into agent descriptors.
std::vector<agent_descriptor> build_pipeline(const std::vector<pipeline_stage>& stages,
                                             const agent_registry& registry);

} // namespace conductor
