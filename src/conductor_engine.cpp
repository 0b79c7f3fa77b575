#include "conductor_engine.hpp"
#include "dependency_graph.hpp"
#include <asio/co_spawn.hpp>
#include <asio/error.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace conductor {

namespace {

orchestrator_settings settings_from(const config& cfg) {
    orchestrator_settings s;
    s.worker_threads = cfg.max_concurrency;
    s.run_timeout = std::chrono::seconds(cfg.run_timeout_seconds);
    s.agent_timeout = std::chrono::seconds(cfg.agent_timeout_seconds);
    s.max_failures = cfg.max_failures;
    return s;
}

} // namespace

conductor_engine::conductor_engine(asio::io_context& ioc, const config& cfg,
                                   std::shared_ptr<spdlog::logger> log,
                                   const agent_registry& registry)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_ctx(m_log, cfg.context_shards),
      m_broker(m_log, cfg.broker_history_limit),
      m_stats_timer(ioc)
{
    auto pipeline = build_pipeline(m_cfg.pipeline, registry);

    // Reject a bad pipeline now rather than on the first submission
    dependency_graph graph(pipeline);

    m_orch = std::make_unique<orchestrator>(m_ioc, m_ctx, m_broker, settings_from(m_cfg), m_log);
    for (auto& desc : pipeline) {
        m_orch->register_agent(std::move(desc));
    }
}

conductor_engine::~conductor_engine() {
    stop();
}

void conductor_engine::start() {
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    std::string stages;
    for (const auto& name : m_orch->agent_names()) {
        if (!stages.empty()) stages += ", ";
        stages += name;
    }
    m_log->info("Conductor engine started (pipeline: {}; {} worker(s))",
                stages, m_orch->pool_stats().threads);
}

std::string conductor_engine::submit(const std::string& repository,
                                     orchestrator::completion_handler on_finished) {
    return submit(repository, m_cfg.analysis, std::move(on_finished));
}

std::string conductor_engine::submit(const std::string& repository,
                                     const analysis_options& analysis,
                                     orchestrator::completion_handler on_finished) {
    run_options opts;
    opts.repository = repository;
    opts.analysis = analysis;
    opts.max_concurrency = m_cfg.max_concurrency;

    auto id = m_orch->start_run(std::move(opts), std::move(on_finished));
    m_submitted++;
    m_log->info("Submitted {} for '{}' (deep={}, include_deps={}, parallel={})",
                id, repository, analysis.deep_analysis, analysis.include_deps,
                analysis.parallel_execution);
    return id;
}

std::shared_ptr<const run_snapshot> conductor_engine::status(const std::string& run_id) const {
    return m_orch->status(run_id);
}

std::optional<run_result> conductor_engine::wait(const std::string& run_id) const {
    return m_orch->wait(run_id);
}

bool conductor_engine::cancel(const std::string& run_id) {
    return m_orch->cancel(run_id, "cancelled by user");
}

std::optional<nlohmann::json> conductor_engine::results(const std::string& run_id) const {
    auto snap = m_orch->status(run_id);
    if (!snap) return std::nullopt;
    return nlohmann::json{
        {"run", to_json(*snap)},
        {"context", m_ctx.dump(run_id)}
    };
}

bool conductor_engine::release(const std::string& run_id) {
    if (!m_orch->forget(run_id)) return false;
    auto erased = m_ctx.erase_subtree(run_id);
    m_log->info("Run {} released ({} context entries erased)", run_id, erased);
    return true;
}

void conductor_engine::stop() {
    if (m_stopped.exchange(true)) return;

    asio::post(m_ioc, [this] { m_stats_timer.cancel(); });
    if (m_orch) m_orch->shutdown();
    m_broker.shutdown();
    m_log->info("Conductor engine stopped ({} run(s) submitted)", m_submitted.load());
}

asio::awaitable<void> conductor_engine::stats_loop() {
    while (!m_stopped.load()) {
        m_stats_timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        asio::error_code ec;
        co_await m_stats_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || m_stopped.load()) co_return;

        auto cs = m_ctx.get_stats();
        auto bs = m_broker.get_stats();
        auto ps = m_orch->pool_stats();

        m_log->info("stats: runs={} active={} entries={} writes={} watches={} "
                    "published={} delivered={} dropped={} tasks={} queue_depth={}",
                    m_submitted.load(), m_orch->active_runs(),
                    cs.entries, cs.writes, cs.watches,
                    bs.published, bs.delivered, bs.dropped,
                    ps.executed, ps.queue_depth);
    }
}

} // namespace conductor
