#include "agent.hpp"
#include "context_path.hpp"

namespace conductor {

task_result task_result::ok(nlohmann::json data) {
    task_result r;
    r.success = true;
    r.data = std::move(data);
    return r;
}

task_result task_result::fail(std::string error) {
    task_result r;
    r.success = false;
    r.error = std::move(error);
    return r;
}

// --- stream_set ---

void stream_set::add(std::shared_ptr<watch_stream> w) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_closed) {
        lock.unlock();
        w->cancel();
        return;
    }
    m_watches.push_back(w);
}

void stream_set::add(std::shared_ptr<subscription> s) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_closed) {
        lock.unlock();
        s->cancel();
        return;
    }
    m_subscriptions.push_back(s);
}

void stream_set::close() {
    std::vector<std::weak_ptr<watch_stream>> watches;
    std::vector<std::weak_ptr<subscription>> subs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return;
        m_closed = true;
        watches.swap(m_watches);
        subs.swap(m_subscriptions);
    }
    for (auto& w : watches) {
        if (auto p = w.lock()) p->cancel();
    }
    for (auto& s : subs) {
        if (auto p = s.lock()) p->cancel();
    }
}

bool stream_set::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

// --- context_handle ---

context_handle::context_handle(context_store& store, std::string writer, stream_set& streams)
    : m_store(store), m_writer(std::move(writer)), m_streams(streams)
{}

uint64_t context_handle::set(const std::string& path, nlohmann::json value) {
    return m_store.set(path, std::move(value), m_writer);
}

std::optional<nlohmann::json> context_handle::get(const std::string& path) const {
    return m_store.get(path);
}

std::map<std::string, nlohmann::json> context_handle::get_subtree(const std::string& prefix) const {
    return m_store.get_subtree(prefix);
}

std::shared_ptr<watch_stream> context_handle::watch(const std::string& prefix) {
    auto w = m_store.watch(prefix);
    m_streams.add(w);
    return w;
}

// --- broker_handle ---

broker_handle::broker_handle(message_broker& broker, std::string name, stream_set& streams)
    : m_broker(broker), m_name(std::move(name)), m_streams(streams)
{}

void broker_handle::publish(const std::string& topic, nlohmann::json payload) {
    m_broker.publish(topic, std::move(payload), m_name);
}

void broker_handle::send(const std::string& recipient, const std::string& topic,
                         nlohmann::json payload) {
    m_broker.publish(topic, std::move(payload), m_name, recipient);
}

std::shared_ptr<subscription> broker_handle::subscribe(const std::vector<std::string>& topics) {
    auto s = m_broker.subscribe(m_name, topics);
    m_streams.add(s);
    return s;
}

// --- task_context ---

task_context::task_context(std::string agent_name, std::string run_id, run_options options,
                           context_store& store, message_broker& broker)
    : m_agent_name(std::move(agent_name)),
      m_run_id(std::move(run_id)),
      m_options(std::move(options)),
      m_context(store, m_agent_name, m_streams),
      m_broker(broker, m_agent_name, m_streams)
{}

std::string task_context::run_path(const std::string& path) const {
    return expand_run_placeholder(path, m_run_id);
}

void task_context::cancel() {
    m_cancelled.store(true, std::memory_order_release);
    m_streams.close();
}

} // namespace conductor
