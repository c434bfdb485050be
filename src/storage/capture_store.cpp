#include "capture_store.hpp"

#include <util/logging.hpp>

namespace snapgate::storage {

namespace {

[[nodiscard]] auto step_error(sqlite3* db, const char* what) -> Error {
    return Error{ErrorCode::storage_error, std::string(what) + ": " + sqlite3_errmsg(db)};
}

[[nodiscard]] auto find_existing(sqlite3* db, const NewCapture& capture)
    -> Result<std::optional<int64_t>> {
    auto stmt = SNAPGATE_TRY(
        prepare(db, "SELECT id FROM captures WHERE image_hash=? AND uid=? AND room=? LIMIT 1"));
    SNAPGATE_TRY(bind_text(stmt.get(), 1, capture.image_hash));
    SNAPGATE_TRY(bind_text(stmt.get(), 2, capture.uid));
    SNAPGATE_TRY(bind_text(stmt.get(), 3, capture.room));

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return std::optional<int64_t>{sqlite3_column_int64(stmt.get(), 0)};
    }
    if (rc != SQLITE_DONE) {
        return nonstd::make_unexpected(step_error(db, "Duplicate check failed"));
    }
    return std::optional<int64_t>{};
}

[[nodiscard]] auto insert_capture(sqlite3* db, const NewCapture& capture) -> Result<int64_t> {
    auto stmt = SNAPGATE_TRY(prepare(db, "INSERT INTO captures (uid, room, name, image, "
                                         "image_hash, image_size, timestamp) "
                                         "VALUES (?, ?, ?, ?, ?, ?, ?)"));
    SNAPGATE_TRY(bind_text(stmt.get(), 1, capture.uid));
    SNAPGATE_TRY(bind_text(stmt.get(), 2, capture.room));
    SNAPGATE_TRY(bind_text(stmt.get(), 3, capture.name));
    if (sqlite3_bind_blob64(stmt.get(), 4, capture.image.data(),
                            static_cast<sqlite3_uint64>(capture.image.size()),
                            SQLITE_STATIC) != SQLITE_OK) {
        return nonstd::make_unexpected(step_error(db, "Failed to bind image"));
    }
    SNAPGATE_TRY(bind_text(stmt.get(), 5, capture.image_hash));
    sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(capture.image.size()));
    SNAPGATE_TRY(bind_text(stmt.get(), 7, capture.timestamp));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return nonstd::make_unexpected(step_error(db, "Insert failed"));
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db));
}

} // namespace

auto CaptureStore::create(PoolOptions options) -> ResultPtr<CaptureStore> {
    auto store = std::unique_ptr<CaptureStore>(new CaptureStore(std::move(options)));

    // Opening the first connection applies the schema and surfaces an
    // unusable database path before the server starts.
    auto lease = store->m_pool.acquire();
    if (!lease) {
        return make_result_ptr_error<CaptureStore>(lease.error().code, lease.error().message);
    }

    return make_result_ptr(std::move(store));
}

auto CaptureStore::lookup_authorization(const std::string& uid, const std::string& room)
    -> Result<std::optional<std::string>> {
    auto lease = SNAPGATE_TRY(m_pool.acquire());
    sqlite3* db = lease.get();

    auto stmt = SNAPGATE_TRY(prepare(db, "SELECT name FROM authorizations WHERE uid=? AND room=?"));
    SNAPGATE_TRY(bind_text(stmt.get(), 1, uid));
    SNAPGATE_TRY(bind_text(stmt.get(), 2, room));

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return std::optional<std::string>{column_string(stmt.get(), 0)};
    }
    if (rc != SQLITE_DONE) {
        return nonstd::make_unexpected(step_error(db, "Authorization lookup failed"));
    }
    return std::optional<std::string>{};
}

auto CaptureStore::record_capture(const NewCapture& capture) -> Result<RecordOutcome> {
    if (capture.image_hash.empty() || capture.timestamp.empty()) {
        return make_error<RecordOutcome>(ErrorCode::storage_error,
                                         "Capture is missing its hash or timestamp");
    }

    auto lease = SNAPGATE_TRY(m_pool.acquire());
    sqlite3* db = lease.get();

    std::lock_guard lock(m_write_mutex);
    auto txn = SNAPGATE_TRY(Transaction::begin_immediate(db));

    auto existing = SNAPGATE_TRY(find_existing(db, capture));
    if (existing) {
        SNAPGATE_TRY(txn.commit());
        SNAPGATE_LOG_DEBUG("Capture {} already stored as row {}", capture.image_hash, *existing);
        return RecordOutcome{RecordStatus::duplicate, *existing};
    }

    const int64_t row_id = SNAPGATE_TRY(insert_capture(db, capture));
    SNAPGATE_TRY(txn.commit());
    return RecordOutcome{RecordStatus::stored, row_id};
}

auto CaptureStore::grant_authorization(const std::string& uid, const std::string& room,
                                       const std::string& name) -> Result<void> {
    if (uid.empty() || room.empty() || name.empty()) {
        return make_error<void>(ErrorCode::protocol_validation,
                                "uid, room and name must all be non-empty");
    }

    auto lease = SNAPGATE_TRY(m_pool.acquire());
    sqlite3* db = lease.get();

    auto stmt = SNAPGATE_TRY(prepare(db, "INSERT INTO authorizations (uid, room, name) "
                                         "VALUES (?, ?, ?) "
                                         "ON CONFLICT(uid, room) DO UPDATE SET name=excluded.name"));
    SNAPGATE_TRY(bind_text(stmt.get(), 1, uid));
    SNAPGATE_TRY(bind_text(stmt.get(), 2, room));
    SNAPGATE_TRY(bind_text(stmt.get(), 3, name));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return nonstd::make_unexpected(step_error(db, "Authorization upsert failed"));
    }
    return {};
}

auto CaptureStore::capture_count() -> Result<int64_t> {
    auto lease = SNAPGATE_TRY(m_pool.acquire());
    sqlite3* db = lease.get();

    auto stmt = SNAPGATE_TRY(prepare(db, "SELECT COUNT(*) FROM captures"));
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return nonstd::make_unexpected(step_error(db, "Count failed"));
    }
    return static_cast<int64_t>(sqlite3_column_int64(stmt.get(), 0));
}

auto CaptureStore::load_capture(int64_t id) -> Result<std::optional<StoredCapture>> {
    auto lease = SNAPGATE_TRY(m_pool.acquire());
    sqlite3* db = lease.get();

    auto stmt = SNAPGATE_TRY(prepare(db, "SELECT id, uid, room, name, image, image_hash, "
                                         "image_size, timestamp FROM captures WHERE id=?"));
    sqlite3_bind_int64(stmt.get(), 1, id);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::optional<StoredCapture>{};
    }
    if (rc != SQLITE_ROW) {
        return nonstd::make_unexpected(step_error(db, "Capture lookup failed"));
    }

    StoredCapture row;
    row.id = sqlite3_column_int64(stmt.get(), 0);
    row.uid = column_string(stmt.get(), 1);
    row.room = column_string(stmt.get(), 2);
    row.name = column_string(stmt.get(), 3);
    const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), 4));
    const auto blob_size = static_cast<size_t>(sqlite3_column_bytes(stmt.get(), 4));
    if (blob != nullptr) {
        row.image.assign(blob, blob + blob_size);
    }
    row.image_hash = column_string(stmt.get(), 5);
    row.image_size = sqlite3_column_int64(stmt.get(), 6);
    row.timestamp = column_string(stmt.get(), 7);
    return std::optional<StoredCapture>{std::move(row)};
}

} // namespace snapgate::storage
