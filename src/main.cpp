#include "config.hpp"
#include "conductor_engine.hpp"
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("agent_conductor",
        "Dependency-driven agent pipeline for repository audits");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("r,repo", "Local repository checkout to audit", cxxopts::value<std::string>())
        ("deep", "Scan file contents for secrets")
        ("include-deps", "Also walk vendored dependency directories")
        ("sequential", "Run one agent at a time")
        ("j,jobs", "Worker threads (overrides config)", cxxopts::value<unsigned int>())
        ("o,output", "Write the JSON result to this file", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("repo")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("conductor");

    // Load config
    conductor::config cfg;
    if (result.count("config")) {
        try {
            cfg = conductor::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    // CLI overrides
    if (result.count("deep"))         cfg.analysis.deep_analysis = true;
    if (result.count("include-deps")) cfg.analysis.include_deps = true;
    if (result.count("sequential"))   cfg.analysis.parallel_execution = false;
    if (result.count("jobs"))         cfg.max_concurrency = result["jobs"].as<unsigned int>();
    if (result.count("verbose"))      cfg.log_level = "debug";

    spdlog::set_level(conductor::parse_log_level(cfg.log_level).value_or(spdlog::level::info));

    unsigned int effective_workers = cfg.max_concurrency > 0
        ? cfg.max_concurrency
        : std::thread::hardware_concurrency();
    if (effective_workers == 0) effective_workers = 1;

    auto repo = result["repo"].as<std::string>();

    console->info("agent_conductor starting");
    console->info("  repository: {}", repo);
    console->info("  pipeline stages: {}", cfg.pipeline.size());
    console->info("  worker threads: {}", effective_workers);
    console->info("  timeouts: run={}s agent={}s", cfg.run_timeout_seconds, cfg.agent_timeout_seconds);

    // Single-threaded io_context (scheduling loop, timers, stats)
    asio::io_context ioc(1);

    std::unique_ptr<conductor::conductor_engine> engine;
    try {
        engine = std::make_unique<conductor::conductor_engine>(ioc, cfg, console);
    } catch (const std::exception& e) {
        console->error("Invalid pipeline: {}", e.what());
        return 1;
    }
    engine->start();

    std::string run_id;
    try {
        run_id = engine->submit(repo, [&ioc](const conductor::run_result&) { ioc.stop(); });
    } catch (const std::exception& e) {
        console->error("Failed to start run: {}", e.what());
        return 1;
    }

    // Graceful shutdown: cancel the run, its completion stops the loop
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        if (!engine->cancel(run_id)) ioc.stop();
    });

    // Run the event loop (single thread)
    ioc.run();

    auto results = engine->results(run_id);
    auto snap = engine->status(run_id);

    // Shutdown ordering: the loop is stopped, now join workers and close the broker
    engine->stop();

    if (!results || !snap) {
        console->error("No result for {}", run_id);
        return 1;
    }

    if (result.count("output")) {
        auto path = result["output"].as<std::string>();
        std::ofstream out(path);
        if (!out) {
            console->error("Cannot write '{}'", path);
            return 1;
        }
        out << results->dump(2) << std::endl;
        console->info("Result written to {}", path);
    } else {
        std::cout << (*results)["run"].dump(2) << std::endl;
    }

    if (snap->success) {
        console->info("{} succeeded ({} agent(s))", run_id, snap->agents.size());
    } else {
        console->warn("{} failed: {}", run_id,
                      snap->reason.empty() ? "required agent did not succeed" : snap->reason);
    }

    console->info("agent_conductor stopped");
    return snap->success ? 0 : 2;
}
