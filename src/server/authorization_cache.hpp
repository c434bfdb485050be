#pragma once

#include <storage/authorization_source.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace snapgate {

struct AuthorizationKey {
    std::string uid;
    std::string room;

    auto operator==(const AuthorizationKey&) const -> bool = default;
};

struct AuthorizationKeyHash {
    auto operator()(const AuthorizationKey& key) const noexcept -> size_t {
        const size_t h1 = std::hash<std::string>{}(key.uid);
        const size_t h2 = std::hash<std::string>{}(key.room);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t size = 0;
};

// Memoizes (uid, room) -> display name in front of the allow-list, with LRU
// eviction. "Not authorized" answers are memoized too; storage errors are not.
// Concurrent misses on the same key share one storage query.
class AuthorizationCache {
public:
    using LookupResult = Result<std::optional<std::string>>;

    AuthorizationCache(storage::AuthorizationSource& source, size_t capacity);

    AuthorizationCache(const AuthorizationCache&) = delete;
    AuthorizationCache& operator=(const AuthorizationCache&) = delete;

    [[nodiscard]] auto lookup(const std::string& uid, const std::string& room) -> LookupResult;

    [[nodiscard]] auto stats() const -> CacheStats;
    [[nodiscard]] auto capacity() const -> size_t { return m_capacity; }

private:
    struct Entry {
        std::optional<std::string> name;
        std::list<AuthorizationKey>::iterator order;
    };

    void insert_locked(const AuthorizationKey& key, std::optional<std::string> name);

    storage::AuthorizationSource& m_source;
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::list<AuthorizationKey> m_order; // front = most recently used
    std::unordered_map<AuthorizationKey, Entry, AuthorizationKeyHash> m_entries;
    std::unordered_map<AuthorizationKey, std::shared_future<LookupResult>, AuthorizationKeyHash>
        m_inflight;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
};

} // namespace snapgate
