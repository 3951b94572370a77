#include "meshgate/cache/response_cache.hpp"

namespace meshgate {

MemoryCache::MemoryCache(std::size_t max_entries)
    : max_entries_(max_entries)
{}

std::optional<std::string> MemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }

    const bool expired = (Clock::now() >= it->second.expires_at);
    if (expired) {
        erase_locked(it);
        misses_++;
        return std::nullopt;
    }

    hits_++;
    return it->second.value;
}

void MemoryCache::set(const std::string& key, std::string value, std::chrono::milliseconds ttl) {
    // Non-positive TTL means "do not cache"
    if (ttl.count() <= 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        erase_locked(existing);
    }

    const bool bounded = (max_entries_ > 0);
    while (bounded && entries_.size() >= max_entries_ && insertion_order_.empty() == false) {
        erase_locked(entries_.find(insertion_order_.front()));
    }

    insertion_order_.push_back(key);
    entries_.emplace(key, Entry{
        std::move(value),
        Clock::now() + ttl,
        std::prev(insertion_order_.end())
    });
}

void MemoryCache::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it != entries_.end()) {
        erase_locked(it);
    }
}

void MemoryCache::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

CacheStats MemoryCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CacheStats{hits_, misses_, entries_.size()};
}

std::size_t MemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemoryCache::erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
    insertion_order_.erase(it->second.order);
    entries_.erase(it);
}

}  // namespace meshgate
