#pragma once

#include "sqlite.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

namespace snapgate::storage {

struct PoolOptions {
    std::filesystem::path database;
    size_t max_idle = 5;
    uint32_t busy_timeout_ms = 10000;
};

// Reusable SQLite connections. The pool caps how many idle connections are
// kept for reuse, not how many can be open at once: an empty pool opens a new
// connection on demand.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool* pool, SqliteHandle handle)
            : m_pool(pool), m_handle(std::move(handle)) {}
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&&) = delete;

        [[nodiscard]] auto get() const -> sqlite3* { return m_handle.get(); }

    private:
        ConnectionPool* m_pool;
        SqliteHandle m_handle;
    };

    explicit ConnectionPool(PoolOptions options);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    [[nodiscard]] auto acquire() -> Result<Lease>;

    // Closes every idle connection. Leased connections are unaffected.
    void drain();

    [[nodiscard]] auto idle_count() const -> size_t;
    [[nodiscard]] auto opened_count() const -> size_t;
    [[nodiscard]] auto options() const -> const PoolOptions& { return m_options; }

private:
    [[nodiscard]] auto open_connection() -> Result<SqliteHandle>;
    void release(SqliteHandle handle);

    PoolOptions m_options;
    mutable std::mutex m_mutex;
    std::vector<SqliteHandle> m_idle;
    size_t m_opened = 0;
};

} // namespace snapgate::storage
