#include "sqlite.hpp"

#include <util/logging.hpp>
#include <utility>

namespace snapgate::storage {

auto prepare(sqlite3* db, const char* sql) -> Result<Statement> {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return make_error<Statement>(ErrorCode::storage_error,
                                     std::string("Failed to prepare statement: ") +
                                         sqlite3_errmsg(db));
    }
    return Statement{raw};
}

auto exec(sqlite3* db, const char* sql) -> Result<void> {
    char* errmsg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg != nullptr ? errmsg : sqlite3_errmsg(db);
        sqlite3_free(errmsg);
        return make_error<void>(ErrorCode::storage_error, "SQL error: " + message);
    }
    return {};
}

auto bind_text(sqlite3_stmt* stmt, int index, const std::string& value) -> Result<void> {
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        return make_error<void>(ErrorCode::storage_error,
                                std::string("Failed to bind parameter: ") +
                                    sqlite3_errmsg(sqlite3_db_handle(stmt)));
    }
    return {};
}

auto column_string(sqlite3_stmt* stmt, int index) -> std::string {
    const auto* text = sqlite3_column_text(stmt, index);
    if (text == nullptr) {
        return {};
    }
    return {reinterpret_cast<const char*>(text),
            static_cast<size_t>(sqlite3_column_bytes(stmt, index))};
}

auto Transaction::begin_immediate(sqlite3* db) -> Result<Transaction> {
    SNAPGATE_TRY(exec(db, "BEGIN IMMEDIATE"));
    return Transaction{db};
}

Transaction::Transaction(Transaction&& other) noexcept
    : m_db(std::exchange(other.m_db, nullptr)) {}

Transaction::~Transaction() {
    if (m_db == nullptr) {
        return;
    }
    auto rollback = exec(m_db, "ROLLBACK");
    if (!rollback) {
        SNAPGATE_LOG_ERROR("Rollback failed: {}", rollback.error().message);
    }
}

auto Transaction::commit() -> Result<void> {
    SNAPGATE_TRY(exec(m_db, "COMMIT"));
    m_db = nullptr;
    return {};
}

} // namespace snapgate::storage
