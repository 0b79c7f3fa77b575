#pragma once

#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace conductor {

// Fixed set of threads executing agent tasks pulled from a shared queue.
// Jobs are dequeued in the order the scheduling loop enqueued them.
class worker_pool {
public:
    using job = std::function<void()>;

    struct stats {
        uint64_t executed = 0;
        uint64_t faulted = 0;    // job escaped with an exception
        std::size_t queue_depth = 0;
        unsigned int threads = 0;
    };

    // thread_count 0 = hardware_concurrency
    worker_pool(unsigned int thread_count, std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn the worker threads. Must be called once.
    void start();

    // Signal workers to stop and join threads. Jobs still queued are discarded.
    void stop();

    // Enqueue a job. Empty jobs are ignored.
    void enqueue(job j);

    std::size_t queue_depth() const;
    unsigned int thread_count() const { return m_thread_count; }

    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);

    std::shared_ptr<spdlog::logger> m_log;
    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<job> m_queue;
    std::vector<std::thread> m_threads;

    std::atomic<uint64_t> m_executed{0};
    std::atomic<uint64_t> m_faulted{0};
};

} // namespace conductor
