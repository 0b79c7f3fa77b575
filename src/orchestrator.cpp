#include "orchestrator.hpp"
#include "context_path.hpp"
#include "errors.hpp"
#include <asio/post.hpp>
#include <algorithm>
#include <exception>

namespace conductor {

orchestrator::orchestrator(asio::io_context& ioc, context_store& ctx, message_broker& broker,
                           orchestrator_settings settings, std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_ctx(ctx), m_broker(broker), m_settings(settings),
      m_log(std::move(log)),
      m_pool(settings.worker_threads, m_log)
{
    m_pool.start();
}

orchestrator::~orchestrator() {
    shutdown();
}

void orchestrator::register_agent(agent_descriptor desc) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    if (m_active_runs.load() > 0) {
        throw setup_error("cannot register agent '" + desc.name + "' while a run is in flight");
    }
    if (desc.name.empty()) {
        throw setup_error("agent name must not be empty");
    }
    if (!desc.task) {
        throw setup_error("agent '" + desc.name + "' has no task");
    }
    for (const auto& a : m_agents) {
        if (a.name == desc.name) throw setup_error("duplicate agent name '" + desc.name + "'");
    }

    m_log->info("Registered agent '{}' ({} predecessor(s), {} context read(s){})",
                desc.name, desc.after.size(), desc.reads.size(),
                desc.optional ? ", optional" : "");
    m_agents.push_back(std::move(desc));
}

std::vector<std::string> orchestrator::agent_names() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    std::vector<std::string> names;
    names.reserve(m_agents.size());
    for (const auto& a : m_agents) names.push_back(a.name);
    return names;
}

std::string orchestrator::start_run(run_options options, completion_handler on_finished) {
    if (m_shut_down.load()) {
        throw setup_error("orchestrator is shut down");
    }

    auto rec = std::make_shared<run_record>();
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        if (m_agents.empty()) throw setup_error("no agents registered");

        // Throws on cycles and unknown predecessors, before anything is scheduled
        rec->graph = std::make_unique<dependency_graph>(m_agents);

        {
            std::lock_guard<std::mutex> runs_lock(m_runs_mutex);
            rec->id = "run-" + std::to_string(m_next_run++);
        }

        rec->agents.reserve(m_agents.size());
        for (const auto& desc : m_agents) {
            agent_run a;
            a.status.name = desc.name;
            a.status.optional = desc.optional;
            a.after = desc.after;
            a.task = desc.task;
            for (const auto& r : desc.reads) {
                auto expanded = expand_run_placeholder(r, rec->id);
                a.reads.push_back(expanded);
                if (std::find(rec->read_prefixes.begin(), rec->read_prefixes.end(), expanded)
                        == rec->read_prefixes.end()) {
                    rec->read_prefixes.push_back(expanded);
                }
            }
            rec->agents.push_back(std::move(a));
        }

        m_active_runs.fetch_add(1);
    }

    unsigned int pool = m_pool.thread_count();
    if (!options.analysis.parallel_execution) {
        rec->concurrency = 1;
    } else if (options.max_concurrency == 0) {
        rec->concurrency = pool;
    } else {
        rec->concurrency = std::min(options.max_concurrency, pool);
    }
    rec->options = std::move(options);
    rec->on_finished = std::move(on_finished);
    rec->started_at = std::chrono::system_clock::now();

    publish_snapshot(rec);
    {
        std::lock_guard<std::mutex> lock(m_runs_mutex);
        m_runs[rec->id] = rec;
    }

    m_log->info("Run {} accepted for '{}' ({} agents, concurrency {})",
                rec->id, rec->options.repository, rec->agents.size(), rec->concurrency);

    asio::post(m_ioc, [this, rec] { begin_run(rec); });
    return rec->id;
}

run_result orchestrator::run(run_options options) {
    auto id = start_run(std::move(options));
    auto result = wait(id);
    // The run was just registered, so it can only vanish if we were shut down
    if (!result) throw setup_error("run " + id + " disappeared");
    return *result;
}

orchestrator::run_ptr orchestrator::find_run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(m_runs_mutex);
    auto it = m_runs.find(run_id);
    if (it == m_runs.end()) return nullptr;
    return it->second;
}

std::shared_ptr<const run_snapshot> orchestrator::status(const std::string& run_id) const {
    auto rec = find_run(run_id);
    if (!rec) return nullptr;
    return std::atomic_load(&rec->snapshot);
}

std::optional<run_result> orchestrator::wait(const std::string& run_id) const {
    auto rec = find_run(run_id);
    if (!rec) return std::nullopt;

    std::unique_lock<std::mutex> lock(rec->done_mutex);
    rec->done_cv.wait(lock, [&] { return rec->done; });
    return *std::atomic_load(&rec->snapshot);
}

std::optional<run_result> orchestrator::wait_for(const std::string& run_id,
                                                 std::chrono::milliseconds timeout) const {
    auto rec = find_run(run_id);
    if (!rec) return std::nullopt;

    std::unique_lock<std::mutex> lock(rec->done_mutex);
    if (!rec->done_cv.wait_for(lock, timeout, [&] { return rec->done; })) {
        return std::nullopt;
    }
    return *std::atomic_load(&rec->snapshot);
}

bool orchestrator::cancel(const std::string& run_id, const std::string& reason) {
    auto rec = find_run(run_id);
    if (!rec) return false;
    {
        std::lock_guard<std::mutex> lock(rec->done_mutex);
        if (rec->done) return false;
    }
    asio::post(m_ioc, [this, rec, reason] { cancel_run(rec, reason); });
    return true;
}

bool orchestrator::forget(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(m_runs_mutex);
    auto it = m_runs.find(run_id);
    if (it == m_runs.end()) return false;
    {
        std::lock_guard<std::mutex> done_lock(it->second->done_mutex);
        if (!it->second->done) return false;
    }
    m_runs.erase(it);
    m_log->debug("Run {} forgotten", run_id);
    return true;
}

std::vector<std::string> orchestrator::run_ids() const {
    std::lock_guard<std::mutex> lock(m_runs_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_runs.size());
    for (const auto& [id, rec] : m_runs) ids.push_back(id);
    return ids;
}

// --- scheduling loop ---

void orchestrator::begin_run(const run_ptr& rec) {
    if (rec->finished) return;

    if (m_settings.run_timeout.count() > 0) {
        rec->run_timer = std::make_unique<asio::steady_timer>(m_ioc, m_settings.run_timeout);
        rec->run_timer->async_wait([this, rec](const asio::error_code& ec) {
            if (ec) return;
            cancel_run(rec, "timed out after " + std::to_string(m_settings.run_timeout.count()) + "s");
        });
    }

    // Context writes under any declared read prefix trigger re-evaluation
    if (!rec->read_prefixes.empty()) {
        rec->watch = m_ctx.watch(common_prefix(rec->read_prefixes));
        rec->watch_pump = std::thread([this, rec, watch = rec->watch] {
            while (auto entry = watch->next()) {
                bool relevant = false;
                for (const auto& prefix : rec->read_prefixes) {
                    if (path_has_prefix(entry->path, prefix)) {
                        relevant = true;
                        break;
                    }
                }
                if (!relevant) continue;
                asio::post(m_ioc, [this, rec] {
                    if (!rec->finished) evaluate(rec);
                });
            }
        });
    }

    m_log->info("Run {} started", rec->id);
    evaluate(rec);
}

void orchestrator::evaluate(const run_ptr& rec) {
    if (rec->finished) return;

    while (skip_blocked(rec)) {}

    for (auto idx : rec->graph->topological_order()) {
        auto& a = rec->agents[idx];
        if (a.status.state != agent_state::pending) continue;

        bool preds_ok = std::all_of(a.after.begin(), a.after.end(), [&](const predecessor& p) {
            auto s = rec->agents[rec->graph->index_of(p.name)].status.state;
            return s == agent_state::succeeded ||
                   (p.tolerate_failure && (s == agent_state::failed || s == agent_state::skipped));
        });
        if (!preds_ok) continue;

        bool reads_ok = std::all_of(a.reads.begin(), a.reads.end(), [&](const std::string& prefix) {
            return m_ctx.has_subtree(prefix);
        });
        if (!reads_ok) continue;

        a.status.state = agent_state::ready;
        rec->ready_queue.push_back(idx);
        m_log->debug("Run {}: agent '{}' is ready", rec->id, a.status.name);
    }

    dispatch(rec);

    if (rec->running == 0 && rec->ready_queue.empty() && skip_stalled(rec)) {
        // Skipping may unblock tolerant dependents
        evaluate(rec);
        return;
    }

    bool all_terminal = std::all_of(rec->agents.begin(), rec->agents.end(),
        [](const agent_run& a) { return is_terminal(a.status.state); });

    if (all_terminal) {
        finalize(rec);
    } else {
        publish_snapshot(rec);
    }
}

// Skip Pending agents whose non-tolerant predecessor ended Failed or Skipped.
// Returns true if anything changed.
bool orchestrator::skip_blocked(const run_ptr& rec) {
    bool changed = false;
    for (auto idx : rec->graph->topological_order()) {
        auto& a = rec->agents[idx];
        if (a.status.state != agent_state::pending) continue;

        for (const auto& p : a.after) {
            if (p.tolerate_failure) continue;
            auto s = rec->agents[rec->graph->index_of(p.name)].status.state;
            if (s == agent_state::failed || s == agent_state::skipped) {
                skip_agent(rec, idx, "predecessor '" + p.name + "' " +
                                     std::string(to_string(s)));
                changed = true;
                break;
            }
        }
    }
    return changed;
}

// Nothing running or queued: Pending agents whose predecessors are settled
// can only be waiting on context nobody will write.
bool orchestrator::skip_stalled(const run_ptr& rec) {
    bool changed = false;
    for (auto idx : rec->graph->topological_order()) {
        auto& a = rec->agents[idx];
        if (a.status.state != agent_state::pending) continue;

        bool preds_settled = std::all_of(a.after.begin(), a.after.end(), [&](const predecessor& p) {
            return is_terminal(rec->agents[rec->graph->index_of(p.name)].status.state);
        });
        if (!preds_settled) continue;

        for (const auto& prefix : a.reads) {
            if (!m_ctx.has_subtree(prefix)) {
                skip_agent(rec, idx, "context dependency '" + prefix + "' never populated");
                changed = true;
                break;
            }
        }
    }
    return changed;
}

void orchestrator::dispatch(const run_ptr& rec) {
    while (rec->running + rec->draining < rec->concurrency && !rec->ready_queue.empty()) {
        auto idx = rec->ready_queue.front();
        rec->ready_queue.pop_front();
        launch(rec, idx);
    }
}

void orchestrator::launch(const run_ptr& rec, std::size_t idx) {
    auto& a = rec->agents[idx];
    a.status.state = agent_state::running;
    a.in_flight = true;
    rec->running += 1;
    rec->peak_running = std::max(rec->peak_running, rec->running + rec->draining);
    rec->execution_order.push_back(a.status.name);

    auto ctx = std::make_shared<task_context>(a.status.name, rec->id, rec->options, m_ctx, m_broker);
    a.ctx = ctx;
    {
        std::lock_guard<std::mutex> lock(rec->contexts_mutex);
        rec->contexts.push_back(ctx);
    }

    write_status(rec, a.status.name, "in_progress");
    m_log->info("Run {}: agent '{}' running", rec->id, a.status.name);

    m_pool.enqueue([this, rec, idx, ctx, task = a.task] {
        task_result result;
        if (ctx->cancelled()) {
            // Abandoned while queued behind other runs' jobs
            result = task_result::fail("cancelled before start");
            asio::post(m_ioc, [this, rec, idx, ctx, result = std::move(result)]() mutable {
                on_task_finished(rec, idx, ctx, std::move(result));
            });
            return;
        }
        asio::post(m_ioc, [this, rec, idx, ctx] { on_task_started(rec, idx, ctx); });
        try {
            result = task->run_task(*ctx);
        } catch (const std::exception& e) {
            result = task_result::fail(e.what());
        } catch (...) {
            result = task_result::fail("task raised a non-standard exception");
        }
        asio::post(m_ioc, [this, rec, idx, ctx, result = std::move(result)]() mutable {
            on_task_finished(rec, idx, ctx, std::move(result));
        });
    });
}

// A worker picked the job up: timing and the per-task timeout start here,
// not at dispatch, so time spent queued behind other runs is not charged.
void orchestrator::on_task_started(const run_ptr& rec, std::size_t idx,
                                   const std::shared_ptr<task_context>& ctx) {
    auto& a = rec->agents[idx];
    if (rec->finished || a.ctx != ctx || a.status.state != agent_state::running) return;

    a.status.started_at = std::chrono::system_clock::now();
    if (m_settings.agent_timeout.count() > 0) {
        a.timer = std::make_unique<asio::steady_timer>(m_ioc, m_settings.agent_timeout);
        a.timer->async_wait([this, rec, idx, ctx](const asio::error_code& ec) {
            if (ec) return;
            on_agent_timeout(rec, idx, ctx);
        });
    }
    publish_snapshot(rec);
}

void orchestrator::on_task_finished(const run_ptr& rec, std::size_t idx,
                                    const std::shared_ptr<task_context>& ctx,
                                    task_result result) {
    auto& a = rec->agents[idx];
    a.in_flight = false;

    if (a.draining) {
        // The agent already ended (timeout or cancellation); its slot frees now
        a.draining = false;
        rec->draining -= 1;
        m_log->debug("Run {}: abandoned task of agent '{}' returned", rec->id, a.status.name);
        evaluate(rec);
        return;
    }
    if (rec->finished || a.ctx != ctx || a.status.state != agent_state::running) {
        // Timed out or cancelled earlier; the late result is discarded
        m_log->debug("Run {}: discarding late result of agent '{}'", rec->id, a.status.name);
        return;
    }

    if (result.success) {
        finish_agent(rec, idx, agent_state::succeeded, {}, std::move(result.data));
    } else {
        if (result.error.empty()) result.error = "task reported failure";
        finish_agent(rec, idx, agent_state::failed, std::move(result.error), std::move(result.data));
    }

    if (m_settings.max_failures > 0 && rec->failures >= m_settings.max_failures) {
        cancel_run(rec, "failure threshold reached (" + std::to_string(rec->failures) + ")");
        return;
    }
    evaluate(rec);
}

void orchestrator::on_agent_timeout(const run_ptr& rec, std::size_t idx,
                                    const std::shared_ptr<task_context>& ctx) {
    auto& a = rec->agents[idx];
    if (rec->finished || a.ctx != ctx || a.status.state != agent_state::running) return;

    finish_agent(rec, idx, agent_state::failed,
                 "timed out after " + std::to_string(m_settings.agent_timeout.count()) + "s");

    if (m_settings.max_failures > 0 && rec->failures >= m_settings.max_failures) {
        cancel_run(rec, "failure threshold reached (" + std::to_string(rec->failures) + ")");
        return;
    }
    evaluate(rec);
}

void orchestrator::finish_agent(const run_ptr& rec, std::size_t idx, agent_state state,
                                std::string error, nlohmann::json data) {
    auto& a = rec->agents[idx];
    bool was_running = a.status.state == agent_state::running;

    a.status.state = state;
    a.status.error = std::move(error);
    a.status.data = std::move(data);
    a.status.finished_at = std::chrono::system_clock::now();

    if (was_running) {
        rec->running -= 1;
        if (a.in_flight) {
            a.draining = true;
            rec->draining += 1;
        }
        if (a.timer) {
            a.timer->cancel();
            a.timer.reset();
        }
        if (a.ctx) {
            a.ctx->cancel();
            a.ctx.reset();
        }
    }

    if (state == agent_state::failed) {
        rec->failures += 1;
        m_log->warn("Run {}: agent '{}' failed: {}", rec->id, a.status.name, a.status.error);
    } else if (state == agent_state::skipped) {
        m_log->info("Run {}: agent '{}' skipped: {}", rec->id, a.status.name, a.status.error);
    } else {
        m_log->info("Run {}: agent '{}' succeeded", rec->id, a.status.name);
    }

    if (state == agent_state::succeeded) {
        write_status(rec, a.status.name, "completed");
    } else if (state == agent_state::failed || was_running) {
        write_status(rec, a.status.name, "failed");
    }

    nlohmann::json payload = {
        {"run", rec->id},
        {"agent", a.status.name},
        {"state", std::string(to_string(state))}
    };
    if (!a.status.error.empty()) payload["error"] = a.status.error;
    broadcast("agent/" + a.status.name + "/status", std::move(payload));
}

void orchestrator::skip_agent(const run_ptr& rec, std::size_t idx, std::string reason) {
    finish_agent(rec, idx, agent_state::skipped, std::move(reason));
}

void orchestrator::cancel_run(const run_ptr& rec, const std::string& reason) {
    if (rec->finished) return;

    m_log->warn("Run {} cancelled: {}", rec->id, reason);
    rec->reason = reason;
    rec->ready_queue.clear();
    for (std::size_t idx = 0; idx < rec->agents.size(); ++idx) {
        if (!is_terminal(rec->agents[idx].status.state)) {
            skip_agent(rec, idx, reason);
        }
    }
    finalize(rec);
}

void orchestrator::finalize(const run_ptr& rec) {
    if (rec->finished) return;

    rec->finished = true;
    rec->finished_at = std::chrono::system_clock::now();
    rec->success = rec->reason.empty() &&
        std::all_of(rec->agents.begin(), rec->agents.end(), [](const agent_run& a) {
            return a.status.optional || a.status.state == agent_state::succeeded;
        });

    if (rec->run_timer) {
        rec->run_timer->cancel();
        rec->run_timer.reset();
    }
    stop_watch(rec);

    publish_snapshot(rec);
    auto snap = std::atomic_load(&rec->snapshot);

    m_log->info("Run {} finished: {} (succeeded={} failed={} skipped={})",
                rec->id, rec->success ? "succeeded" : "failed",
                snap->count(agent_state::succeeded),
                snap->count(agent_state::failed),
                snap->count(agent_state::skipped));

    nlohmann::json payload = {
        {"run", rec->id},
        {"success", rec->success},
        {"succeeded", snap->in_state(agent_state::succeeded)},
        {"failed", snap->in_state(agent_state::failed)},
        {"skipped", snap->in_state(agent_state::skipped)}
    };
    if (!rec->reason.empty()) payload["reason"] = rec->reason;
    broadcast("run/" + rec->id + "/status", std::move(payload));

    mark_done(rec);

    if (rec->on_finished) {
        try {
            rec->on_finished(*snap);
        } catch (const std::exception& e) {
            m_log->error("Run {}: completion handler raised: {}", rec->id, e.what());
        }
    }
}

void orchestrator::mark_done(const run_ptr& rec) {
    {
        std::lock_guard<std::mutex> lock(rec->done_mutex);
        if (rec->done) return;
        rec->done = true;
    }
    m_active_runs.fetch_sub(1);
    rec->done_cv.notify_all();
}

void orchestrator::publish_snapshot(const run_ptr& rec) {
    auto snap = std::make_shared<run_snapshot>();
    snap->run_id = rec->id;
    snap->options = rec->options;
    snap->finished = rec->finished;
    snap->success = rec->success;
    snap->reason = rec->reason;
    snap->execution_order = rec->execution_order;
    snap->peak_running = rec->peak_running;
    snap->started_at = rec->started_at;
    snap->finished_at = rec->finished_at;
    snap->agents.reserve(rec->agents.size());
    for (const auto& a : rec->agents) snap->agents.push_back(a.status);

    std::atomic_store(&rec->snapshot, std::shared_ptr<const run_snapshot>(std::move(snap)));
}

void orchestrator::write_status(const run_ptr& rec, const std::string& agent_name,
                                const std::string& status) {
    m_ctx.set(rec->id + "/analysis_status/" + agent_name, status, "orchestrator");
}

void orchestrator::broadcast(const std::string& topic, nlohmann::json payload) {
    try {
        m_broker.publish(topic, std::move(payload), "orchestrator");
    } catch (const broker_shutdown_error&) {
        m_log->debug("Lifecycle broadcast on '{}' not sent: broker is shut down", topic);
    }
}

void orchestrator::stop_watch(const run_ptr& rec) {
    if (rec->watch) rec->watch->cancel();
    if (rec->watch_pump.joinable()) rec->watch_pump.join();
    rec->watch.reset();
}

void orchestrator::shutdown() {
    if (m_shut_down.exchange(true)) return;

    std::vector<run_ptr> runs;
    {
        std::lock_guard<std::mutex> lock(m_runs_mutex);
        for (const auto& [id, rec] : m_runs) runs.push_back(rec);
    }

    for (const auto& rec : runs) {
        std::lock_guard<std::mutex> lock(rec->contexts_mutex);
        for (auto& weak : rec->contexts) {
            if (auto ctx = weak.lock()) ctx->cancel();
        }
    }

    // Tasks see their streams closed and return; queued jobs are dropped
    m_pool.stop();

    for (const auto& rec : runs) {
        stop_watch(rec);
        rec->run_timer.reset();
        for (auto& a : rec->agents) a.timer.reset();

        bool pending;
        {
            std::lock_guard<std::mutex> lock(rec->done_mutex);
            pending = !rec->done;
        }
        if (pending) {
            auto snap = std::make_shared<run_snapshot>(*std::atomic_load(&rec->snapshot));
            snap->finished = true;
            snap->success = false;
            snap->reason = "orchestrator shut down";
            snap->finished_at = std::chrono::system_clock::now();
            for (auto& a : snap->agents) {
                if (!is_terminal(a.state)) {
                    a.state = agent_state::skipped;
                    a.error = snap->reason;
                }
            }
            std::atomic_store(&rec->snapshot, std::shared_ptr<const run_snapshot>(std::move(snap)));
            mark_done(rec);
        }
    }

    m_log->info("Orchestrator shut down ({} run(s))", runs.size());
}

} // namespace conductor
