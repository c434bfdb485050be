#include "authorization_cache.hpp"

namespace snapgate {

AuthorizationCache::AuthorizationCache(storage::AuthorizationSource& source, size_t capacity)
    : m_source(source), m_capacity(capacity == 0 ? 1 : capacity) {}

auto AuthorizationCache::lookup(const std::string& uid, const std::string& room)
    -> LookupResult {
    AuthorizationKey key{uid, room};

    std::unique_lock lock(m_mutex);
    if (auto it = m_entries.find(key); it != m_entries.end()) {
        ++m_hits;
        m_order.splice(m_order.begin(), m_order, it->second.order);
        return it->second.name;
    }

    if (auto pending = m_inflight.find(key); pending != m_inflight.end()) {
        auto shared = pending->second;
        ++m_hits;
        lock.unlock();
        return shared.get();
    }

    ++m_misses;
    std::promise<LookupResult> promise;
    m_inflight.emplace(key, promise.get_future().share());
    lock.unlock();

    LookupResult result = m_source.lookup_authorization(uid, room);

    lock.lock();
    if (result) {
        insert_locked(key, *result);
    }
    m_inflight.erase(key);
    lock.unlock();

    promise.set_value(result);
    return result;
}

void AuthorizationCache::insert_locked(const AuthorizationKey& key,
                                       std::optional<std::string> name) {
    if (auto it = m_entries.find(key); it != m_entries.end()) {
        it->second.name = std::move(name);
        m_order.splice(m_order.begin(), m_order, it->second.order);
        return;
    }

    while (m_entries.size() >= m_capacity && !m_order.empty()) {
        m_entries.erase(m_order.back());
        m_order.pop_back();
    }

    m_order.push_front(key);
    m_entries.emplace(key, Entry{std::move(name), m_order.begin()});
}

auto AuthorizationCache::stats() const -> CacheStats {
    std::lock_guard lock(m_mutex);
    return CacheStats{m_hits, m_misses, m_entries.size()};
}

} // namespace snapgate
