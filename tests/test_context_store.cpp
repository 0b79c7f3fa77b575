#include "context_store.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

constexpr std::chrono::milliseconds wait_time{2000};

} // namespace

TEST(context_store, set_then_get_round_trips) {
    conductor::context_store store(make_log());

    nlohmann::json files = {"a.py", "b.py"};
    EXPECT_EQ(store.set("repo/files", files, "clone"), 1u);

    auto v = store.get("repo/files");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, files);
}

TEST(context_store, get_unknown_path_is_empty) {
    conductor::context_store store(make_log());
    EXPECT_FALSE(store.get("nothing/here").has_value());
}

TEST(context_store, versions_increase_per_path) {
    conductor::context_store store(make_log());

    EXPECT_EQ(store.set("a", 1, "w"), 1u);
    EXPECT_EQ(store.set("a", 2, "w"), 2u);
    EXPECT_EQ(store.set("b", 1, "w"), 1u);

    auto entry = store.get_entry("a");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, 2u);
    EXPECT_EQ(entry->value, 2);
    EXPECT_EQ(entry->writer, "w");
}

TEST(context_store, last_writer_wins) {
    conductor::context_store store(make_log());

    store.set("shared/key", "first", "agent-a");
    store.set("shared/key", "second", "agent-b");

    auto entry = store.get_entry("shared/key");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value, "second");
    EXPECT_EQ(entry->writer, "agent-b");
}

TEST(context_store, paths_are_normalized) {
    conductor::context_store store(make_log());

    store.set("/repo//files/", 42, "w");
    EXPECT_EQ(store.get("repo/files").value_or(nullptr), 42);
    EXPECT_EQ(store.size(), 1u);
}

TEST(context_store, empty_path_is_rejected) {
    conductor::context_store store(make_log());
    EXPECT_THROW(store.set("", 1, "w"), std::invalid_argument);
    EXPECT_THROW(store.set("/", 1, "w"), std::invalid_argument);
    EXPECT_THROW(store.set("//", 1, "w"), std::invalid_argument);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.set("/a/", 1, "w"), 1u);
}

TEST(context_store, subtree_matches_whole_segments) {
    conductor::context_store store(make_log());

    store.set("repo/files", 1, "w");
    store.set("repo/languages", 2, "w");
    store.set("repository/name", 3, "w");

    auto sub = store.get_subtree("repo");
    ASSERT_EQ(sub.size(), 2u);
    EXPECT_EQ(sub.begin()->first, "repo/files");
    EXPECT_TRUE(store.has_subtree("repo"));
    EXPECT_TRUE(store.has_subtree("repo/files"));
    EXPECT_FALSE(store.has_subtree("repo/fil"));

    EXPECT_EQ(store.get_subtree("").size(), 3u);
}

TEST(context_store, erase_subtree_removes_only_prefix) {
    conductor::context_store store(make_log());

    store.set("run-1/a", 1, "w");
    store.set("run-1/b/c", 2, "w");
    store.set("run-10/a", 3, "w");

    EXPECT_EQ(store.erase_subtree("run-1"), 2u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.get("run-10/a").has_value());
}

TEST(context_store, dump_builds_nested_object) {
    conductor::context_store store(make_log());

    store.set("run-1/repo/path", "/src", "w");
    store.set("run-1/repo/files", nlohmann::json::array({"x"}), "w");
    store.set("run-1/report", nlohmann::json{{"risk", "LOW"}}, "w");

    auto d = store.dump("run-1");
    EXPECT_EQ(d["repo"]["path"], "/src");
    EXPECT_EQ(d["repo"]["files"][0], "x");
    EXPECT_EQ(d["report"]["risk"], "LOW");
}

TEST(context_store, dump_keeps_parent_value_under_value_key) {
    conductor::context_store store(make_log());

    store.set("a", 1, "w");
    store.set("a/b", 2, "w");

    auto d = store.dump();
    EXPECT_EQ(d["a"]["_value"], 1);
    EXPECT_EQ(d["a"]["b"], 2);
}

TEST(context_store, watch_observes_later_writes) {
    conductor::context_store store(make_log());
    auto w = store.watch("repo");

    store.set("repo/files", "v1", "clone");
    store.set("other/key", "ignored", "clone");

    auto e = w->next_for(wait_time);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->path, "repo/files");
    EXPECT_EQ(e->value, "v1");
    EXPECT_EQ(e->version, 1u);

    EXPECT_FALSE(w->try_next().has_value());
}

TEST(context_store, watch_replays_existing_entries) {
    conductor::context_store store(make_log());
    store.set("repo/files", "v1", "clone");
    store.set("repo/files", "v2", "clone");

    auto w = store.watch("repo");
    auto e = w->next_for(wait_time);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->value, "v2");
    EXPECT_EQ(e->version, 2u);
}

TEST(context_store, watch_versions_are_monotonic_under_concurrent_writers) {
    conductor::context_store store(make_log());
    auto w = store.watch("hot");

    constexpr int writers = 4;
    constexpr int per_writer = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < writers; ++t) {
        threads.emplace_back([&store] {
            for (int i = 0; i < per_writer; ++i) store.set("hot/key", i, "w");
        });
    }
    for (auto& t : threads) t.join();

    uint64_t last = 0;
    while (auto e = w->next_for(std::chrono::milliseconds(200))) {
        EXPECT_GT(e->version, last);
        last = e->version;
    }
    EXPECT_EQ(last, static_cast<uint64_t>(writers * per_writer));
}

TEST(context_store, cancelled_watch_stops_yielding) {
    conductor::context_store store(make_log());
    auto w = store.watch("");

    store.set("a", 1, "w");
    w->cancel();
    store.set("b", 2, "w");

    EXPECT_TRUE(w->cancelled());
    EXPECT_FALSE(w->next().has_value());
    EXPECT_EQ(store.get_stats().watches, 0u);
}

TEST(context_store, blocking_next_wakes_on_cancel) {
    conductor::context_store store(make_log());
    auto w = store.watch("never");

    std::thread canceller([w] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        w->cancel();
    });
    EXPECT_FALSE(w->next().has_value());
    canceller.join();
}

TEST(context_store, stats_count_writes_entries_and_watches) {
    conductor::context_store store(make_log(), 4);
    auto w = store.watch("x");

    store.set("x/1", 1, "w");
    store.set("x/1", 2, "w");
    store.set("y", 3, "w");

    auto s = store.get_stats();
    EXPECT_EQ(s.writes, 3u);
    EXPECT_EQ(s.entries, 2u);
    EXPECT_EQ(s.watches, 1u);
}
