#pragma once

#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace conductor {

// Lazy pull-based sequence fed by a producer (context store or broker).
// Each watch/subscribe call owns one stream; there is exactly one consumer.
//
// Every push goes through one producer token under m_push_mutex, so items
// are dequeued in push order whichever thread pushed them. Once cancel()
// returns, next() never yields another item and the producer no longer
// sees the stream.
template <typename T>
class event_stream {
public:
    explicit event_stream(uint64_t id) : m_id(id) {}

    ~event_stream() { cancel(); }

    event_stream(const event_stream&) = delete;
    event_stream& operator=(const event_stream&) = delete;

    uint64_t id() const { return m_id; }

    // Block until an item arrives. Returns nullopt once cancelled.
    std::optional<T> next() {
        while (true) {
            if (auto item = next_for(std::chrono::milliseconds(100))) return item;
            if (cancelled()) return std::nullopt;
        }
    }

    // Block up to `timeout`. Returns nullopt on timeout or cancellation.
    template <typename Rep, typename Period>
    std::optional<T> next_for(std::chrono::duration<Rep, Period> timeout) {
        if (cancelled()) return std::nullopt;
        std::optional<T> item;
        if (!m_queue.wait_dequeue_timed(item, timeout)) return std::nullopt;
        // Empty optional = wake-up pill enqueued by cancel()
        if (!item || cancelled()) return std::nullopt;
        return item;
    }

    std::optional<T> try_next() {
        if (cancelled()) return std::nullopt;
        std::optional<T> item;
        if (!m_queue.try_dequeue(item) || !item || cancelled()) return std::nullopt;
        return item;
    }

    // Stop delivery and unregister from the producer.
    void cancel() {
        if (m_cancelled.exchange(true)) return;
        std::function<void(uint64_t)> detach;
        {
            std::lock_guard<std::mutex> lock(m_detach_mutex);
            detach.swap(m_detach);
        }
        if (detach) detach(m_id);
        std::lock_guard<std::mutex> lock(m_push_mutex);
        m_queue.enqueue(m_producer, std::optional<T>());
    }

    bool cancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    // Producer side. Returns false if the stream was cancelled.
    bool push(T item) {
        std::lock_guard<std::mutex> lock(m_push_mutex);
        if (cancelled()) return false;
        return m_queue.enqueue(m_producer, std::optional<T>(std::move(item)));
    }

    // Set by the producer before the stream is handed out, cleared on producer teardown.
    void set_detach(std::function<void(uint64_t)> detach) {
        std::lock_guard<std::mutex> lock(m_detach_mutex);
        m_detach = std::move(detach);
    }

    std::size_t pending() const { return m_queue.size_approx(); }

private:
    uint64_t m_id;
    std::atomic<bool> m_cancelled{false};
    std::mutex m_detach_mutex;
    std::function<void(uint64_t)> m_detach;
    std::mutex m_push_mutex;
    moodycamel::BlockingConcurrentQueue<std::optional<T>> m_queue;
    moodycamel::ProducerToken m_producer{m_queue};
};

} // namespace conductor
