#pragma once

#include <util/error.hpp>

#include <memory>
#include <sqlite3.h>
#include <string>

namespace snapgate::storage {

struct SqliteDeleter {
    void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using SqliteHandle = std::unique_ptr<sqlite3, SqliteDeleter>;
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[nodiscard]] auto prepare(sqlite3* db, const char* sql) -> Result<Statement>;

// Runs one or more statements that return no rows.
[[nodiscard]] auto exec(sqlite3* db, const char* sql) -> Result<void>;

[[nodiscard]] auto bind_text(sqlite3_stmt* stmt, int index, const std::string& value)
    -> Result<void>;

[[nodiscard]] auto column_string(sqlite3_stmt* stmt, int index) -> std::string;

// Rolls back on destruction unless commit() succeeded.
class Transaction {
public:
    [[nodiscard]] static auto begin_immediate(sqlite3* db) -> Result<Transaction>;

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;

    [[nodiscard]] auto commit() -> Result<void>;

private:
    explicit Transaction(sqlite3* db) : m_db(db) {}

    sqlite3* m_db = nullptr;
};

} // namespace snapgate::storage
