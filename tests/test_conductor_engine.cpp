#include "conductor_engine.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <asio/executor_work_guard.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

class conductor_engine_test : public ::testing::Test {
protected:
    void SetUp() override {
        repo = fs::temp_directory_path() / "conductor_engine_repo";
        fs::remove_all(repo);
        fs::create_directories(repo / "src");
        std::ofstream(repo / "src" / "app.py") << "print('hi')\n";
        std::ofstream(repo / "src" / "app_test.py") << "def test_app():\n    pass\n";
        std::ofstream(repo / ".env") << "TOKEN=x\n";
    }

    void start(const conductor::config& cfg) {
        engine = std::make_unique<conductor::conductor_engine>(ioc, cfg, log);
        engine->start();
        guard.emplace(asio::make_work_guard(ioc));
        loop = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        guard.reset();
        ioc.stop();
        if (loop.joinable()) loop.join();
        engine.reset();
        std::error_code ec;
        fs::remove_all(repo, ec);
    }

    fs::path repo;
    std::shared_ptr<spdlog::logger> log = make_log();
    asio::io_context ioc;
    std::unique_ptr<conductor::conductor_engine> engine;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> guard;
    std::thread loop;
};

TEST_F(conductor_engine_test, default_pipeline_audits_local_repository) {
    conductor::config cfg;
    cfg.max_concurrency = 2;
    start(cfg);

    auto id = engine->submit(repo.string());
    auto r = engine->wait(id);

    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->success) << conductor::to_json(*r).dump();
    EXPECT_EQ(r->execution_order.front(), "clone");
    EXPECT_EQ(r->execution_order.back(), "report");

    auto results = engine->results(id);
    ASSERT_TRUE(results.has_value());
    const auto& context = (*results)["context"];
    EXPECT_EQ(context["analysis_status"]["report"], "completed");
    EXPECT_EQ(context["report"]["executive_summary"]["total_files_analyzed"], 3);
    EXPECT_EQ(context["report"]["executive_summary"]["overall_risk_level"], "MEDIUM");
    EXPECT_EQ((*results)["run"]["run_id"], id);
}

TEST_F(conductor_engine_test, failed_clone_skips_the_rest) {
    start(conductor::config{});

    auto id = engine->submit((repo / "missing").string());
    auto r = engine->wait(id);

    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->success);
    EXPECT_EQ(r->find("clone")->state, conductor::agent_state::failed);
    EXPECT_EQ(r->find("security_scan")->state, conductor::agent_state::skipped);
    EXPECT_EQ(r->find("code_review")->state, conductor::agent_state::skipped);
    // report tolerates both analyzers but its context never appears
    EXPECT_EQ(r->find("report")->state, conductor::agent_state::skipped);
    EXPECT_NE(r->find("report")->error.find("never populated"), std::string::npos);
}

TEST_F(conductor_engine_test, submission_options_reach_agents) {
    conductor::config cfg;
    start(cfg);

    conductor::analysis_options analysis;
    analysis.deep_analysis = true;
    analysis.parallel_execution = false;
    auto id = engine->submit(repo.string(), analysis);
    auto r = engine->wait(id);

    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->options.analysis.deep_analysis);
    EXPECT_EQ(r->peak_running, 1u);

    auto summary = engine->context().get(id + "/security/summary");
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE((*summary)["deep_analysis"].get<bool>());
}

TEST_F(conductor_engine_test, release_tears_down_finished_run) {
    start(conductor::config{});

    auto first = engine->submit(repo.string());
    ASSERT_TRUE(engine->wait(first).has_value());
    auto second = engine->submit(repo.string());
    ASSERT_TRUE(engine->wait(second).has_value());
    ASSERT_TRUE(engine->context().has_subtree(first));

    EXPECT_TRUE(engine->release(first));
    EXPECT_FALSE(engine->context().has_subtree(first));
    EXPECT_EQ(engine->status(first), nullptr);
    EXPECT_FALSE(engine->results(first).has_value());
    EXPECT_FALSE(engine->release(first));

    // Other runs are untouched
    auto results = engine->results(second);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ((*results)["context"]["analysis_status"]["report"], "completed");
}

TEST_F(conductor_engine_test, unknown_runs_and_cancel) {
    start(conductor::config{});

    EXPECT_EQ(engine->status("run-42"), nullptr);
    EXPECT_FALSE(engine->results("run-42").has_value());
    EXPECT_FALSE(engine->cancel("run-42"));

    auto id = engine->submit(repo.string());
    engine->cancel(id);
    auto r = engine->wait(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->finished);
    for (const auto& a : r->agents) EXPECT_TRUE(conductor::is_terminal(a.state));
}

TEST_F(conductor_engine_test, pipeline_with_unknown_type_is_rejected) {
    conductor::config cfg;
    cfg.pipeline = {{"x", "mystery", {}, {}, {}, false}};
    EXPECT_THROW(conductor::conductor_engine(ioc, cfg, log), conductor::setup_error);
}

TEST_F(conductor_engine_test, cyclic_pipeline_is_rejected) {
    conductor::config cfg;
    cfg.pipeline = {
        {"a", "reporter", {"b"}, {}, {}, false},
        {"b", "reporter", {"a"}, {}, {}, false},
    };
    EXPECT_THROW(conductor::conductor_engine(ioc, cfg, log), conductor::setup_error);
}
