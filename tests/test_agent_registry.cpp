#include "agent_registry.hpp"
#include "audit_agents.hpp"
#include "dependency_graph.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

TEST(agent_registry, builtins_are_registered) {
    auto r = conductor::agent_registry::with_builtins();

    EXPECT_EQ(r.types(), (std::vector<std::string>{
        "code_reviewer", "reporter", "repo_cloner", "security_scanner"}));
    EXPECT_NE(std::dynamic_pointer_cast<conductor::repo_cloner>(r.create("repo_cloner")), nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<conductor::reporter>(r.create("reporter")), nullptr);
}

TEST(agent_registry, unknown_type_throws) {
    auto r = conductor::agent_registry::with_builtins();
    EXPECT_FALSE(r.contains("llm_oracle"));
    EXPECT_THROW(r.create("llm_oracle"), conductor::setup_error);
}

TEST(agent_registry, custom_types) {
    conductor::agent_registry r;
    r.add("noop", [] {
        return std::make_shared<conductor::function_agent>(
            [](conductor::task_context&) { return conductor::task_result::ok(); });
    });

    EXPECT_TRUE(r.contains("noop"));
    EXPECT_NE(r.create("noop"), nullptr);
    EXPECT_THROW(r.add("noop", [] { return nullptr; }), conductor::setup_error);
    EXPECT_THROW(r.add("empty", nullptr), conductor::setup_error);
}

TEST(agent_registry, default_pipeline_builds_valid_graph) {
    auto descs = conductor::build_pipeline(conductor::config::default_pipeline(),
                                           conductor::agent_registry::with_builtins());
    ASSERT_EQ(descs.size(), 4u);

    const auto& report = descs[3];
    EXPECT_EQ(report.name, "report");
    ASSERT_EQ(report.after.size(), 2u);
    EXPECT_TRUE(report.after[0].tolerate_failure);
    EXPECT_TRUE(report.after[1].tolerate_failure);
    EXPECT_FALSE(descs[1].after[0].tolerate_failure);
    EXPECT_EQ(descs[1].reads, std::vector<std::string>{"{run}/repo/files"});

    conductor::dependency_graph g(descs);
    EXPECT_EQ(g.name(g.topological_order().front()), "clone");
    EXPECT_EQ(g.name(g.topological_order().back()), "report");
}

TEST(agent_registry, pipeline_with_unknown_type_is_rejected) {
    std::vector<conductor::pipeline_stage> stages = {{"x", "mystery", {}, {}, {}, false}};
    EXPECT_THROW(conductor::build_pipeline(stages, conductor::agent_registry::with_builtins()),
                 conductor::setup_error);
}
