#include "worker_pool.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Wait until `pred` holds or two seconds pass.
template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST(worker_pool, zero_threads_means_hardware_concurrency) {
    conductor::worker_pool pool(0, make_log());
    EXPECT_GE(pool.thread_count(), 1u);
}

TEST(worker_pool, executes_all_jobs) {
    conductor::worker_pool pool(4, make_log());
    pool.start();

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.enqueue([&counter] { counter++; });
    }

    EXPECT_TRUE(eventually([&] { return counter.load() == 100; }));
    EXPECT_TRUE(eventually([&] { return pool.get_stats().executed == 100u; }));
    pool.stop();
}

TEST(worker_pool, runs_jobs_concurrently) {
    conductor::worker_pool pool(2, make_log());
    pool.start();

    std::mutex mutex;
    std::condition_variable cv;
    int arrived = 0;

    // Each job waits for the other: only completes if both run at once
    auto rendezvous = [&] {
        std::unique_lock<std::mutex> lock(mutex);
        ++arrived;
        cv.notify_all();
        cv.wait_for(lock, std::chrono::seconds(2), [&] { return arrived == 2; });
    };
    pool.enqueue(rendezvous);
    pool.enqueue(rendezvous);

    EXPECT_TRUE(eventually([&] { return pool.get_stats().executed == 2u; }));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(arrived, 2);
    pool.stop();
}

TEST(worker_pool, faulting_job_does_not_kill_worker) {
    conductor::worker_pool pool(1, make_log());
    pool.start();

    std::atomic<bool> ran_after{false};
    pool.enqueue([] { throw std::runtime_error("boom"); });
    pool.enqueue([&ran_after] { ran_after = true; });

    EXPECT_TRUE(eventually([&] { return ran_after.load(); }));
    EXPECT_EQ(pool.get_stats().faulted, 1u);
    pool.stop();
}

TEST(worker_pool, empty_job_is_ignored) {
    conductor::worker_pool pool(1, make_log());
    pool.start();

    pool.enqueue(conductor::worker_pool::job{});
    std::atomic<bool> ran{false};
    pool.enqueue([&ran] { ran = true; });

    EXPECT_TRUE(eventually([&] { return ran.load(); }));
    pool.stop();
}

TEST(worker_pool, stop_is_idempotent) {
    conductor::worker_pool pool(2, make_log());
    pool.start();
    pool.stop();
    pool.stop();
    EXPECT_EQ(pool.get_stats().threads, 2u);
}
