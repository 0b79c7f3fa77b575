#pragma once

#include "context_store.hpp"
#include "message_broker.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

struct task_result {
    bool success = false;
    nlohmann::json data;
    std::string error;

    static task_result ok(nlohmann::json data = nlohmann::json::object());
    static task_result fail(std::string error);
};

// Recognized submission options.
struct analysis_options {
    bool deep_analysis = false;
    bool include_deps = false;
    bool parallel_execution = true;
};

struct run_options {
    std::string repository;
    analysis_options analysis;
    // 0 = worker pool size; 1 = strictly sequential
    unsigned int max_concurrency = 0;
};

// Streams opened by one agent during one run. Closing the set cancels them
// all and makes later watch/subscribe calls return already-cancelled streams.
class stream_set {
public:
    void add(std::shared_ptr<watch_stream> w);
    void add(std::shared_ptr<subscription> s);
    void close();
    bool closed() const;

private:
    mutable std::mutex m_mutex;
    bool m_closed = false;
    std::vector<std::weak_ptr<watch_stream>> m_watches;
    std::vector<std::weak_ptr<subscription>> m_subscriptions;
};

// Context store seen through one agent: writes carry its name.
class context_handle {
public:
    context_handle(context_store& store, std::string writer, stream_set& streams);

    uint64_t set(const std::string& path, nlohmann::json value);
    std::optional<nlohmann::json> get(const std::string& path) const;
    std::map<std::string, nlohmann::json> get_subtree(const std::string& prefix) const;
    std::shared_ptr<watch_stream> watch(const std::string& prefix);

private:
    context_store& m_store;
    std::string m_writer;
    stream_set& m_streams;
};

// Message broker seen through one agent: messages carry its name as sender
// and subscriptions receive its point-to-point mail.
class broker_handle {
public:
    broker_handle(message_broker& broker, std::string name, stream_set& streams);

    void publish(const std::string& topic, nlohmann::json payload);
    void send(const std::string& recipient, const std::string& topic, nlohmann::json payload);

    // Point-to-point mail for this agent plus broadcasts on `topics`.
    std::shared_ptr<subscription> subscribe(const std::vector<std::string>& topics = {});

private:
    message_broker& m_broker;
    std::string m_name;
    stream_set& m_streams;
};

// Everything a task sees while it runs.
class task_context {
public:
    task_context(std::string agent_name, std::string run_id, run_options options,
                 context_store& store, message_broker& broker);

    const std::string& agent_name() const { return m_agent_name; }
    const std::string& run_id() const { return m_run_id; }
    const run_options& options() const { return m_options; }

    context_handle& context() { return m_context; }
    broker_handle& broker() { return m_broker; }

    // "{run}/repo/files" -> "run-3/repo/files"
    std::string run_path(const std::string& path) const;

    // Set by the orchestrator on cancellation or timeout. Long tasks should poll it.
    bool cancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    // Orchestrator side: flag cancellation and close every stream the task opened.
    void cancel();

private:
    std::string m_agent_name;
    std::string m_run_id;
    run_options m_options;
    std::atomic<bool> m_cancelled{false};
    stream_set m_streams;
    context_handle m_context;
    broker_handle m_broker;
};

// One pipeline stage. Implementations return a failed result or throw;
// the orchestrator treats both as a task failure.
class agent {
public:
    virtual ~agent() = default;
    virtual task_result run_task(task_context& ctx) = 0;
};

using task_fn = std::function<task_result(task_context&)>;

// Adapts a plain callable to the agent interface.
class function_agent : public agent {
public:
    explicit function_agent(task_fn fn) : m_fn(std::move(fn)) {}
    task_result run_task(task_context& ctx) override { return m_fn(ctx); }

private:
    task_fn m_fn;
};

struct predecessor {
    std::string name;
    // Still allows Ready when this predecessor ends Failed or Skipped
    bool tolerate_failure = false;
};

struct agent_descriptor {
    std::string name;
    std::vector<predecessor> after;
    // Context prefixes that must hold at least one entry; "{run}" is expanded
    std::vector<std::string> reads;
    // Optional agents do not affect the overall run result
    bool optional = false;
    std::shared_ptr<agent> task;
};

} // namespace conductor
