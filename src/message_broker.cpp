#include "message_broker.hpp"
#include "context_path.hpp"
#include "errors.hpp"

namespace conductor {

bool topic_matches(const std::string& pattern, const std::string& topic) {
    auto p = split_path(pattern);
    auto t = split_path(topic);

    for (std::size_t i = 0; i < p.size(); ++i) {
        if (p[i] == ">") return i == p.size() - 1 && t.size() > i;
        if (i >= t.size()) return false;
        if (p[i] != "*" && p[i] != t[i]) return false;
    }
    return p.size() == t.size();
}

message_broker::message_broker(std::shared_ptr<spdlog::logger> log, std::size_t history_limit)
    : m_log(std::move(log)),
      m_history_limit(history_limit),
      m_subscribers(std::make_shared<const subscriber_table>())
{}

message_broker::~message_broker() {
    shutdown();
}

void message_broker::publish(const std::string& topic, nlohmann::json payload,
                             const std::string& sender,
                             std::optional<std::string> recipient) {
    if (m_shut_down.load(std::memory_order_acquire)) {
        throw broker_shutdown_error();
    }

    message msg;
    msg.id = m_next_message_id.fetch_add(1, std::memory_order_relaxed);
    msg.topic = normalize_path(topic);
    msg.sender = sender;
    msg.recipient = std::move(recipient);
    msg.payload = std::move(payload);
    msg.published_at = std::chrono::system_clock::now();

    m_published.fetch_add(1, std::memory_order_relaxed);

    std::size_t delivered = 0;
    auto table = std::atomic_load(&m_subscribers);
    for (const auto& sub : *table) {
        bool wanted = false;
        if (msg.recipient) {
            wanted = sub.name == *msg.recipient;
        } else {
            for (const auto& pattern : sub.topics) {
                if (topic_matches(pattern, msg.topic)) {
                    wanted = true;
                    break;
                }
            }
        }
        if (!wanted) continue;

        auto stream = sub.stream.lock();
        if (stream && stream->push(msg)) ++delivered;
    }

    m_delivered.fetch_add(delivered, std::memory_order_relaxed);

    if (msg.recipient && delivered == 0) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        m_log->debug("broker: no subscriber for '{}', dropped message {} on '{}' from '{}'",
                     *msg.recipient, msg.id, msg.topic, msg.sender);
    } else {
        m_log->debug("broker: message {} on '{}' from '{}' delivered to {} subscriber(s)",
                     msg.id, msg.topic, msg.sender, delivered);
    }

    record(msg);
}

void message_broker::record(const message& msg) {
    if (m_history_limit == 0) return;
    std::lock_guard<std::mutex> lock(m_history_mutex);
    m_history.push_back(msg);
    while (m_history.size() > m_history_limit) m_history.pop_front();
}

std::shared_ptr<subscription> message_broker::subscribe(const std::string& key) {
    return add_subscriber(key, {key});
}

std::shared_ptr<subscription> message_broker::subscribe(const std::string& name,
                                                        const std::vector<std::string>& topics) {
    return add_subscriber(name, topics);
}

std::shared_ptr<subscription> message_broker::add_subscriber(std::string name,
                                                             std::vector<std::string> topics) {
    if (m_shut_down.load(std::memory_order_acquire)) {
        throw broker_shutdown_error();
    }

    for (auto& t : topics) t = normalize_path(t);

    std::lock_guard<std::mutex> lock(m_sub_mutex);
    uint64_t id = m_next_sub_id++;
    auto stream = std::make_shared<subscription>(id);
    stream->set_detach([this](uint64_t sub_id) { remove_subscriber(sub_id); });

    auto current = std::atomic_load(&m_subscribers);
    auto table = std::make_shared<subscriber_table>();
    table->reserve(current->size() + 1);
    for (const auto& sub : *current) {
        if (!sub.stream.expired()) table->push_back(sub);
    }
    m_log->debug("broker: subscription {} for '{}' ({} topic pattern(s))", id, name, topics.size());
    table->push_back({id, std::move(name), std::move(topics), stream});
    std::atomic_store(&m_subscribers, std::shared_ptr<const subscriber_table>(std::move(table)));

    return stream;
}

void message_broker::remove_subscriber(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_sub_mutex);
    auto current = std::atomic_load(&m_subscribers);
    auto table = std::make_shared<subscriber_table>();
    table->reserve(current->size());
    for (const auto& sub : *current) {
        if (sub.id != id && !sub.stream.expired()) table->push_back(sub);
    }
    std::atomic_store(&m_subscribers, std::shared_ptr<const subscriber_table>(std::move(table)));
    m_log->debug("broker: subscription {} cancelled", id);
}

std::vector<message> message_broker::history(const message_filter& filter) const {
    std::vector<message> out;
    std::lock_guard<std::mutex> lock(m_history_mutex);
    for (const auto& msg : m_history) {
        if (filter.recipient && msg.recipient != filter.recipient) continue;
        if (filter.sender && msg.sender != *filter.sender) continue;
        if (filter.topic && !topic_matches(*filter.topic, msg.topic)) continue;
        out.push_back(msg);
    }
    return out;
}

void message_broker::shutdown() {
    if (m_shut_down.exchange(true)) return;

    std::shared_ptr<const subscriber_table> table;
    {
        std::lock_guard<std::mutex> lock(m_sub_mutex);
        table = std::atomic_load(&m_subscribers);
        std::atomic_store(&m_subscribers, std::make_shared<const subscriber_table>());
    }

    // Cancel outside the lock: cancel() calls back into remove_subscriber()
    for (const auto& sub : *table) {
        if (auto stream = sub.stream.lock()) {
            stream->set_detach(nullptr);
            stream->cancel();
        }
    }
    m_log->info("broker: shut down ({} subscription(s) cancelled)", table->size());
}

bool message_broker::is_shut_down() const {
    return m_shut_down.load(std::memory_order_acquire);
}

message_broker::stats message_broker::get_stats() const {
    std::size_t subs = 0;
    for (const auto& sub : *std::atomic_load(&m_subscribers)) {
        if (!sub.stream.expired()) ++subs;
    }
    return {
        m_published.load(std::memory_order_relaxed),
        m_delivered.load(std::memory_order_relaxed),
        m_dropped.load(std::memory_order_relaxed),
        subs
    };
}

} // namespace conductor
