#pragma once

#include "agent_registry.hpp"
#include "config.hpp"
#include "context_store.hpp"
#include "message_broker.hpp"
#include "orchestrator.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace conductor {

// Submission front end: owns the context store, the broker and the
// orchestrator, and registers the configured pipeline on construction.
//
// The io_context must be run by one thread. Destroy the engine only after
// that thread has left ioc.run().
class conductor_engine {
public:
    // Throws setup_error if a pipeline stage has an unknown type or the
    // pipeline graph is invalid.
    conductor_engine(asio::io_context& ioc, const config& cfg,
                     std::shared_ptr<spdlog::logger> log,
                     const agent_registry& registry = agent_registry::with_builtins());
    ~conductor_engine();

    conductor_engine(const conductor_engine&) = delete;
    conductor_engine& operator=(const conductor_engine&) = delete;

    // Start the periodic stats loop.
    void start();

    // Schedule an audit of `repository`; analysis options default to the config.
    std::string submit(const std::string& repository,
                       orchestrator::completion_handler on_finished = {});
    std::string submit(const std::string& repository, const analysis_options& analysis,
                       orchestrator::completion_handler on_finished = {});

    // nullptr / nullopt / false for unknown run ids.
    std::shared_ptr<const run_snapshot> status(const std::string& run_id) const;
    std::optional<run_result> wait(const std::string& run_id) const;
    bool cancel(const std::string& run_id);

    // {"run": <run result>, "context": <dump of the run's context subtree>}
    std::optional<nlohmann::json> results(const std::string& run_id) const;

    // Tear down a finished run: drop its record and erase its context subtree.
    // Returns false if the run is unknown or still in flight.
    bool release(const std::string& run_id);

    // Cancel in-flight runs, join the workers and shut the broker down. Idempotent.
    void stop();

    context_store& context() { return m_ctx; }
    message_broker& broker() { return m_broker; }
    orchestrator& scheduler() { return *m_orch; }

private:
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    context_store m_ctx;
    message_broker m_broker;
    std::unique_ptr<orchestrator> m_orch;
    asio::steady_timer m_stats_timer;

    std::atomic<bool> m_stopped{false};
    std::atomic<uint64_t> m_submitted{0};
};

} // namespace conductor
