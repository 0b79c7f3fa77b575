#pragma once

#include "event_stream.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

struct message {
    uint64_t id = 0;                        // broker-assigned, increasing
    std::string topic;
    std::string sender;
    std::optional<std::string> recipient;   // nullopt = broadcast
    nlohmann::json payload;
    std::chrono::system_clock::time_point published_at;
};

// Topic patterns are slash-delimited. "*" matches one segment, a trailing
// ">" matches one or more remaining segments: "agent/*/status", "run/>".
bool topic_matches(const std::string& pattern, const std::string& topic);

using subscription = event_stream<message>;

struct message_filter {
    std::optional<std::string> recipient;
    std::optional<std::string> sender;
    std::optional<std::string> topic;   // pattern
};

// In-process publish/subscribe bus.
//
// Delivery is at most once per subscription per publish, best effort: a
// point-to-point message with no subscriber registered under the recipient
// name is dropped. Messages from one sender reach a given subscriber in
// publish order, even when the sender publishes from different threads. Subscriber tables are swapped RCU-style, so publish()
// never takes the registration mutex.
//
// Subscriptions reference the broker; the broker must outlive them.
class message_broker {
public:
    struct stats {
        uint64_t published = 0;
        uint64_t delivered = 0;
        uint64_t dropped = 0;
        std::size_t subscriptions = 0;
    };

    message_broker(std::shared_ptr<spdlog::logger> log, std::size_t history_limit = 1000);
    ~message_broker();

    message_broker(const message_broker&) = delete;
    message_broker& operator=(const message_broker&) = delete;

    // Fire-and-forget. Throws broker_shutdown_error after shutdown().
    void publish(const std::string& topic, nlohmann::json payload,
                 const std::string& sender,
                 std::optional<std::string> recipient = std::nullopt);

    // `key` is both a topic pattern (for broadcasts) and a recipient name
    // (for point-to-point messages).
    std::shared_ptr<subscription> subscribe(const std::string& key);

    // Point-to-point messages for `name`, plus broadcasts matching any of `topics`.
    std::shared_ptr<subscription> subscribe(const std::string& name,
                                            const std::vector<std::string>& topics);

    // Retained messages, oldest first.
    std::vector<message> history(const message_filter& filter = {}) const;

    // Cancel every subscription and refuse further traffic.
    void shutdown();
    bool is_shut_down() const;

    stats get_stats() const;

private:
    struct subscriber {
        uint64_t id;
        std::string name;                  // matched against recipient
        std::vector<std::string> topics;   // matched against broadcast topic
        std::weak_ptr<subscription> stream;
    };

    using subscriber_table = std::vector<subscriber>;

    std::shared_ptr<subscription> add_subscriber(std::string name,
                                                 std::vector<std::string> topics);
    void remove_subscriber(uint64_t id);
    void record(const message& msg);

    std::shared_ptr<spdlog::logger> m_log;
    std::size_t m_history_limit;

    std::mutex m_sub_mutex;
    std::shared_ptr<const subscriber_table> m_subscribers;
    uint64_t m_next_sub_id = 1;

    mutable std::mutex m_history_mutex;
    std::deque<message> m_history;

    std::atomic<bool> m_shut_down{false};
    std::atomic<uint64_t> m_next_message_id{1};
    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace conductor
