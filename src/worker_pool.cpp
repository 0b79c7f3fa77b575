#include "worker_pool.hpp"
#include <chrono>
#include <exception>

namespace conductor {

worker_pool::worker_pool(unsigned int thread_count, std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_thread_count(thread_count > 0 ? thread_count : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->info("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Enqueue poison pills (empty jobs), one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(job{});
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->info("Worker pool stopped");
}

void worker_pool::enqueue(job j) {
    if (!j) return;
    m_queue.enqueue(std::move(j));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_executed.load(std::memory_order_relaxed),
        m_faulted.load(std::memory_order_relaxed),
        m_queue.size_approx(),
        m_thread_count
    };
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    job j;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(j, std::chrono::milliseconds(100));
        if (!got) continue;

        // Empty job = poison pill
        if (!j) break;

        try {
            j();
        } catch (const std::exception& e) {
            m_faulted.fetch_add(1, std::memory_order_relaxed);
            m_log->error("Worker {}: job raised: {}", worker_id, e.what());
        }
        m_executed.fetch_add(1, std::memory_order_relaxed);
        j = nullptr;
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace conductor
