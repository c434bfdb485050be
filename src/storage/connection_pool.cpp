#include "connection_pool.hpp"

#include <util/logging.hpp>

namespace snapgate::storage {

namespace {

constexpr const char* CONNECTION_PRAGMAS = "PRAGMA journal_mode=WAL;"
                                           "PRAGMA synchronous=NORMAL;"
                                           "PRAGMA cache_size=10000;";

constexpr const char* SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS captures (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    uid TEXT NOT NULL,
    room TEXT NOT NULL,
    name TEXT NOT NULL,
    image BLOB NOT NULL,
    image_hash TEXT NOT NULL,
    image_size INTEGER NOT NULL,
    timestamp TEXT NOT NULL,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE INDEX IF NOT EXISTS idx_captures_uid_room ON captures(uid, room);
CREATE INDEX IF NOT EXISTS idx_captures_timestamp ON captures(timestamp);
CREATE INDEX IF NOT EXISTS idx_captures_hash ON captures(image_hash);

CREATE TABLE IF NOT EXISTS authorizations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    uid TEXT NOT NULL,
    room TEXT NOT NULL,
    name TEXT NOT NULL,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    UNIQUE(uid, room)
);

CREATE INDEX IF NOT EXISTS idx_auth_uid_room ON authorizations(uid, room);
)sql";

} // namespace

ConnectionPool::Lease::~Lease() {
    if (m_pool != nullptr && m_handle) {
        m_pool->release(std::move(m_handle));
    }
}

ConnectionPool::ConnectionPool(PoolOptions options) : m_options(std::move(options)) {}

auto ConnectionPool::acquire() -> Result<Lease> {
    {
        std::lock_guard lock(m_mutex);
        if (!m_idle.empty()) {
            SqliteHandle handle = std::move(m_idle.back());
            m_idle.pop_back();
            return Lease{this, std::move(handle)};
        }
    }

    auto handle = SNAPGATE_TRY(open_connection());
    return Lease{this, std::move(handle)};
}

void ConnectionPool::release(SqliteHandle handle) {
    std::lock_guard lock(m_mutex);
    if (m_idle.size() < m_options.max_idle) {
        m_idle.push_back(std::move(handle));
    }
    // Otherwise the handle goes out of scope here and the connection closes.
}

void ConnectionPool::drain() {
    std::vector<SqliteHandle> closing;
    {
        std::lock_guard lock(m_mutex);
        closing.swap(m_idle);
    }
    if (!closing.empty()) {
        SNAPGATE_LOG_DEBUG("Closing {} pooled database connection(s)", closing.size());
    }
}

auto ConnectionPool::idle_count() const -> size_t {
    std::lock_guard lock(m_mutex);
    return m_idle.size();
}

auto ConnectionPool::opened_count() const -> size_t {
    std::lock_guard lock(m_mutex);
    return m_opened;
}

auto ConnectionPool::open_connection() -> Result<SqliteHandle> {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(m_options.database.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                       SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    SqliteHandle handle{raw};
    if (rc != SQLITE_OK) {
        std::string message = raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        return make_error<SqliteHandle>(ErrorCode::storage_error,
                                        "Failed to open database '" +
                                            m_options.database.string() + "': " + message);
    }

    sqlite3_busy_timeout(handle.get(), static_cast<int>(m_options.busy_timeout_ms));
    SNAPGATE_TRY(exec(handle.get(), CONNECTION_PRAGMAS));
    SNAPGATE_TRY(exec(handle.get(), SCHEMA));

    {
        std::lock_guard lock(m_mutex);
        ++m_opened;
    }
    SNAPGATE_LOG_DEBUG("Opened database connection to {}", m_options.database.string());
    return handle;
}

} // namespace snapgate::storage
