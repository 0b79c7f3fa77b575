#include "context_store.hpp"
#include "context_path.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

namespace conductor {

// --- watch_stream ---

watch_stream::watch_stream(std::string prefix,
                           std::shared_ptr<event_stream<context_entry>> events)
    : m_prefix(std::move(prefix)), m_events(std::move(events))
{}

watch_stream::~watch_stream() {
    cancel();
}

bool watch_stream::is_fresh(const context_entry& entry) {
    auto& seen = m_last_seen[entry.path];
    if (entry.version <= seen) return false;
    seen = entry.version;
    return true;
}

std::optional<context_entry> watch_stream::next() {
    while (auto entry = m_events->next()) {
        if (is_fresh(*entry)) return entry;
    }
    return std::nullopt;
}

std::optional<context_entry> watch_stream::next_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

        auto entry = m_events->next_for(remaining);
        if (!entry) return std::nullopt;
        if (is_fresh(*entry)) return entry;
    }
}

std::optional<context_entry> watch_stream::try_next() {
    while (auto entry = m_events->try_next()) {
        if (is_fresh(*entry)) return entry;
    }
    return std::nullopt;
}

void watch_stream::cancel() {
    m_events->cancel();
}

bool watch_stream::cancelled() const {
    return m_events->cancelled();
}

// --- context_store ---

context_store::context_store(std::shared_ptr<spdlog::logger> log, std::size_t shard_count)
    : m_log(std::move(log)),
      m_watches(std::make_shared<const watch_table>())
{
    if (shard_count == 0) shard_count = 1;
    m_shards.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        m_shards.push_back(std::make_unique<shard>());
    }
}

context_store::~context_store() {
    // Outstanding streams keep their queues; detach them so they stop pointing here.
    auto table = std::atomic_load(&m_watches);
    for (const auto& slot : *table) {
        if (auto s = slot.stream.lock()) {
            s->set_detach(nullptr);
            s->cancel();
        }
    }
}

context_store::shard& context_store::shard_for(const std::string& path) const {
    return *m_shards[std::hash<std::string>{}(path) % m_shards.size()];
}

uint64_t context_store::set(const std::string& path, nlohmann::json value,
                            const std::string& writer) {
    auto key = normalize_path(path);
    if (key.empty()) {
        throw std::invalid_argument("context path must not be empty");
    }

    context_entry committed;
    {
        auto& sh = shard_for(key);
        std::unique_lock lock(sh.mutex);
        auto& entry = sh.entries[key];
        entry.path = key;
        entry.value = std::move(value);
        entry.version += 1;
        entry.writer = writer;
        entry.updated_at = std::chrono::system_clock::now();
        committed = entry;
    }

    m_writes.fetch_add(1, std::memory_order_relaxed);
    m_log->debug("context: '{}' set by '{}' (v{})", key, writer, committed.version);

    notify_watches(committed);
    return committed.version;
}

void context_store::notify_watches(const context_entry& entry) const {
    auto table = std::atomic_load(&m_watches);
    for (const auto& slot : *table) {
        if (!path_has_prefix(entry.path, slot.prefix)) continue;
        if (auto s = slot.stream.lock()) {
            s->push(entry);
        }
    }
}

std::optional<nlohmann::json> context_store::get(const std::string& path) const {
    auto entry = get_entry(path);
    if (!entry) return std::nullopt;
    return std::move(entry->value);
}

std::optional<context_entry> context_store::get_entry(const std::string& path) const {
    auto key = normalize_path(path);
    auto& sh = shard_for(key);
    std::shared_lock lock(sh.mutex);
    auto it = sh.entries.find(key);
    if (it == sh.entries.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, nlohmann::json> context_store::get_subtree(const std::string& prefix) const {
    auto key = normalize_path(prefix);
    std::map<std::string, nlohmann::json> out;
    for (const auto& sh : m_shards) {
        std::shared_lock lock(sh->mutex);
        for (const auto& [path, entry] : sh->entries) {
            if (path_has_prefix(path, key)) out.emplace(path, entry.value);
        }
    }
    return out;
}

bool context_store::has_subtree(const std::string& prefix) const {
    auto key = normalize_path(prefix);
    for (const auto& sh : m_shards) {
        std::shared_lock lock(sh->mutex);
        for (const auto& [path, entry] : sh->entries) {
            if (path_has_prefix(path, key)) return true;
        }
    }
    return false;
}

std::size_t context_store::erase_subtree(const std::string& prefix) {
    auto key = normalize_path(prefix);
    std::size_t removed = 0;
    for (auto& sh : m_shards) {
        std::unique_lock lock(sh->mutex);
        for (auto it = sh->entries.begin(); it != sh->entries.end();) {
            if (path_has_prefix(it->first, key)) {
                it = sh->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    m_log->debug("context: erased {} entries under '{}'", removed, key);
    return removed;
}

nlohmann::json context_store::dump(const std::string& prefix) const {
    auto key = normalize_path(prefix);
    auto root = nlohmann::json::object();

    // std::map ordering visits a parent before its children
    for (const auto& [path, value] : get_subtree(key)) {
        auto rel = key.empty() ? path : path.substr(std::min(path.size(), key.size() + 1));
        auto segments = split_path(rel);

        if (segments.empty()) {
            root["_value"] = value;
            continue;
        }

        nlohmann::json* node = &root;
        for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
            auto& child = (*node)[segments[i]];
            if (!child.is_object()) {
                auto leaf = std::move(child);
                child = nlohmann::json::object();
                if (!leaf.is_null()) child["_value"] = std::move(leaf);
            }
            node = &child;
        }
        (*node)[segments.back()] = value;
    }
    return root;
}

std::shared_ptr<watch_stream> context_store::watch(const std::string& prefix) {
    auto key = normalize_path(prefix);

    std::shared_ptr<event_stream<context_entry>> events;
    {
        std::lock_guard<std::mutex> lock(m_watch_mutex);
        uint64_t id = m_next_watch_id++;
        events = std::make_shared<event_stream<context_entry>>(id);
        events->set_detach([this](uint64_t watch_id) { remove_watch(watch_id); });

        auto table = std::make_shared<watch_table>();
        auto current = std::atomic_load(&m_watches);
        table->reserve(current->size() + 1);
        for (const auto& slot : *current) {
            if (!slot.stream.expired()) table->push_back(slot);
        }
        table->push_back({id, key, events});
        std::atomic_store(&m_watches, std::shared_ptr<const watch_table>(std::move(table)));
    }

    // Replay the latest value of everything already under the prefix.
    // A write racing with this replay may be delivered first; the stream
    // drops whichever copy turns out to be older.
    for (const auto& sh : m_shards) {
        std::shared_lock lock(sh->mutex);
        for (const auto& [path, entry] : sh->entries) {
            if (path_has_prefix(path, key)) events->push(entry);
        }
    }

    m_log->debug("context: watch {} registered on '{}'", events->id(), key);
    return std::make_shared<watch_stream>(key, std::move(events));
}

void context_store::remove_watch(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    auto current = std::atomic_load(&m_watches);
    auto table = std::make_shared<watch_table>();
    table->reserve(current->size());
    for (const auto& slot : *current) {
        if (slot.id != id && !slot.stream.expired()) table->push_back(slot);
    }
    std::atomic_store(&m_watches, std::shared_ptr<const watch_table>(std::move(table)));
    m_log->debug("context: watch {} cancelled", id);
}

std::size_t context_store::size() const {
    std::size_t total = 0;
    for (const auto& sh : m_shards) {
        std::shared_lock lock(sh->mutex);
        total += sh->entries.size();
    }
    return total;
}

context_store::stats context_store::get_stats() const {
    std::size_t watches = 0;
    for (const auto& slot : *std::atomic_load(&m_watches)) {
        if (!slot.stream.expired()) ++watches;
    }
    return {m_writes.load(std::memory_order_relaxed), size(), watches};
}

} // namespace conductor
