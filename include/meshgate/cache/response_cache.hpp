#ifndef MESHGATE_CACHE_RESPONSE_CACHE_HPP
#define MESHGATE_CACHE_RESPONSE_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// ICache
// ─────────────────────────────────────────────────────────────────────────────
// Key/value store consulted by the router for GET responses. Keys have the
// form "<service>:<METHOD>:<path>", values are raw response bodies.
// Implementations are called from the request hot path and must not block on
// I/O for longer than a local lookup.

class ICache {
public:
    virtual ~ICache() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void set(const std::string& key, std::string value, std::chrono::milliseconds ttl) = 0;

    virtual void del(const std::string& key) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// MemoryCache
// ─────────────────────────────────────────────────────────────────────────────
// Process-local ICache with per-entry expiry. Expired entries are dropped on
// access. When max_entries is set, inserting into a full cache evicts the
// least recently written entry.

struct CacheStats {
    std::size_t hits{0};
    std::size_t misses{0};
    std::size_t keys{0};
};

class MemoryCache final : public ICache {
public:
    /// @param max_entries 0 = unbounded
    explicit MemoryCache(std::size_t max_entries = 0);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, std::string value, std::chrono::milliseconds ttl) override;
    void del(const std::string& key) override;

    void flush();

    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] std::size_t size() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string value;
        Clock::time_point expires_at;
        std::list<std::string>::iterator order;
    };

    void erase_locked(std::unordered_map<std::string, Entry>::iterator it);

    std::size_t max_entries_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> insertion_order_;  // oldest write first
    std::size_t hits_{0};
    std::size_t misses_{0};
};

}  // namespace meshgate

#endif  // MESHGATE_CACHE_RESPONSE_CACHE_HPP
