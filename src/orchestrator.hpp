#pragma once

#include "agent.hpp"
#include "context_store.hpp"
#include "dependency_graph.hpp"
#include "message_broker.hpp"
#include "run_state.hpp"
#include "worker_pool.hpp"
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace conductor {

struct orchestrator_settings {
    // Worker pool size and upper bound of any run's concurrency (0 = hardware_concurrency)
    unsigned int worker_threads = 0;
    std::chrono::seconds run_timeout{0};     // 0 = none
    std::chrono::seconds agent_timeout{0};   // 0 = none
    unsigned int max_failures = 0;           // 0 = unlimited
};

// Drives registered agents through Pending -> Ready -> Running -> terminal.
//
// All RunState transitions happen in handlers on the injected io_context,
// which must be run by exactly one thread; tasks execute on the worker pool
// and report back by posting to it. Status readers get immutable snapshots
// published RCU-style, so they never wait on the scheduling loop.
//
// Shutdown ordering: stop the io_context, then destroy (or shutdown()) the
// orchestrator, then the context store and broker it references.
class orchestrator {
public:
    using completion_handler = std::function<void(const run_result&)>;

    orchestrator(asio::io_context& ioc, context_store& ctx, message_broker& broker,
                 orchestrator_settings settings, std::shared_ptr<spdlog::logger> log);
    ~orchestrator();

    orchestrator(const orchestrator&) = delete;
    orchestrator& operator=(const orchestrator&) = delete;

    // Throws setup_error on a duplicate name, a missing task, or while a run is active.
    void register_agent(agent_descriptor desc);
    std::vector<std::string> agent_names() const;

    // Validate the graph and schedule a run. Throws setup_error before any
    // task starts if the registry is empty or the graph is invalid.
    // `on_finished` runs on the io_context thread once the run is terminal.
    std::string start_run(run_options options, completion_handler on_finished = {});

    // start_run + wait. Must not be called from the io_context thread.
    run_result run(run_options options);

    // Latest snapshot; nullptr for an unknown run id.
    std::shared_ptr<const run_snapshot> status(const std::string& run_id) const;

    // Block until the run is terminal. nullopt for an unknown run id.
    // Must not be called from the io_context thread.
    std::optional<run_result> wait(const std::string& run_id) const;
    std::optional<run_result> wait_for(const std::string& run_id,
                                       std::chrono::milliseconds timeout) const;

    // Mark every non-terminal agent Skipped and fail the run with `reason`.
    // Returns false if the run is unknown or already finished.
    bool cancel(const std::string& run_id, const std::string& reason = "cancelled");

    // Drop a finished run's record. Returns false if the run is unknown or
    // still in flight. Context written by the run is left to the caller.
    bool forget(const std::string& run_id);

    std::vector<std::string> run_ids() const;
    std::size_t active_runs() const { return m_active_runs.load(); }

    // Cancel outstanding tasks, stop the watch pumps and join the workers.
    // Runs still in flight are finalized as failed. Idempotent.
    void shutdown();

    worker_pool::stats pool_stats() const { return m_pool.get_stats(); }

private:
    struct agent_run {
        agent_status status;
        std::vector<predecessor> after;
        std::vector<std::string> reads;   // expanded for this run
        std::shared_ptr<agent> task;
        std::shared_ptr<task_context> ctx;            // while running
        std::unique_ptr<asio::steady_timer> timer;    // per-task timeout
        bool in_flight = false;   // job queued or executing on the pool
        bool draining = false;    // left Running while its job is still in flight
    };

    struct run_record {
        std::string id;
        run_options options;
        unsigned int concurrency = 1;
        std::unique_ptr<dependency_graph> graph;
        std::vector<agent_run> agents;
        std::vector<std::string> read_prefixes;   // union over agents, immutable

        // Scheduling-loop state
        std::deque<std::size_t> ready_queue;
        std::size_t running = 0;
        std::size_t draining = 0;   // abandoned jobs still holding a concurrency slot
        std::size_t peak_running = 0;
        std::size_t failures = 0;
        bool finished = false;
        bool success = false;
        std::string reason;
        std::vector<std::string> execution_order;
        std::chrono::system_clock::time_point started_at;
        std::optional<std::chrono::system_clock::time_point> finished_at;
        std::unique_ptr<asio::steady_timer> run_timer;
        completion_handler on_finished;

        // Context watch feeding readiness re-evaluation
        std::shared_ptr<watch_stream> watch;
        std::thread watch_pump;

        // Task contexts handed to workers, for shutdown from outside the loop
        std::mutex contexts_mutex;
        std::vector<std::weak_ptr<task_context>> contexts;

        // Cross-thread
        std::shared_ptr<const run_snapshot> snapshot;
        mutable std::mutex done_mutex;
        mutable std::condition_variable done_cv;
        bool done = false;
    };

    using run_ptr = std::shared_ptr<run_record>;

    run_ptr find_run(const std::string& run_id) const;

    // Scheduling loop (io_context thread only)
    void begin_run(const run_ptr& rec);
    void evaluate(const run_ptr& rec);
    bool skip_blocked(const run_ptr& rec);
    bool skip_stalled(const run_ptr& rec);
    void dispatch(const run_ptr& rec);
    void launch(const run_ptr& rec, std::size_t idx);
    void on_task_started(const run_ptr& rec, std::size_t idx,
                         const std::shared_ptr<task_context>& ctx);
    void on_task_finished(const run_ptr& rec, std::size_t idx,
                          const std::shared_ptr<task_context>& ctx, task_result result);
    void on_agent_timeout(const run_ptr& rec, std::size_t idx,
                          const std::shared_ptr<task_context>& ctx);
    void finish_agent(const run_ptr& rec, std::size_t idx, agent_state state,
                      std::string error, nlohmann::json data = {});
    void skip_agent(const run_ptr& rec, std::size_t idx, std::string reason);
    void cancel_run(const run_ptr& rec, const std::string& reason);
    void finalize(const run_ptr& rec);
    void publish_snapshot(const run_ptr& rec);
    void mark_done(const run_ptr& rec);

    void write_status(const run_ptr& rec, const std::string& agent_name, const std::string& status);
    void broadcast(const std::string& topic, nlohmann::json payload);
    void stop_watch(const run_ptr& rec);

    asio::io_context& m_ioc;
    context_store& m_ctx;
    message_broker& m_broker;
    orchestrator_settings m_settings;
    std::shared_ptr<spdlog::logger> m_log;
    worker_pool m_pool;

    mutable std::mutex m_registry_mutex;
    std::vector<agent_descriptor> m_agents;

    mutable std::mutex m_runs_mutex;
    std::map<std::string, run_ptr> m_runs;
    uint64_t m_next_run = 1;

    std::atomic<std::size_t> m_active_runs{0};
    std::atomic<bool> m_shut_down{false};
};

} // namespace conductor
