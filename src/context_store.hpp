#pragma once

#include "event_stream.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace conductor {

struct context_entry {
    std::string path;
    nlohmann::json value;
    uint64_t version = 0;   // per-path, starts at 1
    std::string writer;
    std::chrono::system_clock::time_point updated_at;
};

// One watch subscription. Yields (path, value, version) for every write under
// the watched prefix, starting with a replay of the entries already present.
// Versions observed for a given path are strictly increasing: an event that
// arrives after a newer one for the same path is dropped.
class watch_stream {
public:
    watch_stream(std::string prefix, std::shared_ptr<event_stream<context_entry>> events);
    ~watch_stream();

    watch_stream(const watch_stream&) = delete;
    watch_stream& operator=(const watch_stream&) = delete;

    std::optional<context_entry> next();
    std::optional<context_entry> next_for(std::chrono::milliseconds timeout);
    std::optional<context_entry> try_next();

    void cancel();
    bool cancelled() const;

    const std::string& prefix() const { return m_prefix; }

private:
    bool is_fresh(const context_entry& entry);

    std::string m_prefix;
    std::shared_ptr<event_stream<context_entry>> m_events;
    // Consumer-only state
    std::unordered_map<std::string, uint64_t> m_last_seen;
};

// Hierarchical key/value store shared by all agents of all runs.
// Sharded by path: writers to different paths only contend when they hash
// to the same shard. The watch table is swapped RCU-style so dispatching a
// write never takes the registration mutex.
//
// Streams returned by watch() reference the store; the store must outlive them.
class context_store {
public:
    struct stats {
        uint64_t writes = 0;
        std::size_t entries = 0;
        std::size_t watches = 0;
    };

    explicit context_store(std::shared_ptr<spdlog::logger> log, std::size_t shard_count = 16);
    ~context_store();

    context_store(const context_store&) = delete;
    context_store& operator=(const context_store&) = delete;

    // Last writer wins. Returns the new version of the path.
    // Throws std::invalid_argument for the empty (root) path.
    uint64_t set(const std::string& path, nlohmann::json value, const std::string& writer);

    std::optional<nlohmann::json> get(const std::string& path) const;
    std::optional<context_entry> get_entry(const std::string& path) const;

    // All paths under the prefix (inclusive), ordered by path.
    std::map<std::string, nlohmann::json> get_subtree(const std::string& prefix) const;

    // Same question as !get_subtree(prefix).empty(), without copying values.
    bool has_subtree(const std::string& prefix) const;

    // Remove a subtree without notifying watches. Returns the number removed.
    std::size_t erase_subtree(const std::string& prefix);

    // Nested JSON object of the subtree, keyed by the segments below prefix.
    // A path that is both a value and a parent keeps its value under "_value".
    nlohmann::json dump(const std::string& prefix = "") const;

    std::shared_ptr<watch_stream> watch(const std::string& prefix);

    std::size_t size() const;
    stats get_stats() const;

private:
    struct shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, context_entry> entries;
    };

    struct watch_slot {
        uint64_t id;
        std::string prefix;
        std::weak_ptr<event_stream<context_entry>> stream;
    };

    using watch_table = std::vector<watch_slot>;

    shard& shard_for(const std::string& path) const;
    void notify_watches(const context_entry& entry) const;
    void remove_watch(uint64_t id);

    std::shared_ptr<spdlog::logger> m_log;
    std::vector<std::unique_ptr<shard>> m_shards;

    // Serializes watch registration; readers use atomic_load on m_watches.
    std::mutex m_watch_mutex;
    std::shared_ptr<const watch_table> m_watches;
    uint64_t m_next_watch_id = 1;

    std::atomic<uint64_t> m_writes{0};
};

} // namespace conductor
