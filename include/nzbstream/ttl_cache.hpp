#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace nzbstream {

// Small thread-safe map whose entries expire a fixed time after insertion.
// Expired entries are invisible to get() and dropped by sweep().
template <typename K, typename V>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit TtlCache(Clock::duration ttl) : ttl_(ttl) {}

    std::optional<V> get(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.expires <= Clock::now()) return std::nullopt;
        return it->second.value;
    }

    void put(const K& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{std::move(value), Clock::now() + ttl_};
    }

    bool erase(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    // Returns the number of entries removed.
    size_t sweep() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.expires <= now) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void setTtl(Clock::duration ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        ttl_ = ttl;
    }

private:
    struct Entry {
        V value;
        Clock::time_point expires;
    };

    mutable std::mutex mutex_;
    Clock::duration ttl_;
    std::map<K, Entry> entries_;
};

} // namespace nzbstream
