#include "ferry/db/session_store.hpp"

#include <sqlite3.h>

#include <cstdlib>
#include <cstring>
#include <string>

#include "ferry/core/log.hpp"

namespace ferry::db {

using namespace ferry::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            id TEXT PRIMARY KEY,
            filename TEXT NOT NULL,
            mime_type TEXT NOT NULL DEFAULT '',
            expected_size INTEGER NOT NULL CHECK (expected_size >= 0),
            bytes_received INTEGER NOT NULL DEFAULT 0
                CHECK (bytes_received >= 0 AND bytes_received <= expected_size),
            storage_handle TEXT NOT NULL UNIQUE,
            status TEXT NOT NULL
                CHECK (status IN ('IN_PROGRESS', 'COMPLETED', 'FAILED', 'CANCELLED')),
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_upload_sessions_status ON upload_sessions(status);
        CREATE INDEX IF NOT EXISTS idx_upload_sessions_status_updated ON upload_sessions(status, updated_at);
    )SQL";

    constexpr const char* kSelectColumns =
        "SELECT id, filename, mime_type, expected_size, bytes_received, storage_handle, status, "
        "created_at, updated_at FROM upload_sessions ";

    [[nodiscard]] Status db_error(sqlite3* db, int rc) noexcept {
        const int ext = db ? sqlite3_extended_errcode(db) : rc;
        switch (ext) {
            case SQLITE_CONSTRAINT_PRIMARYKEY:
            case SQLITE_CONSTRAINT_UNIQUE:
                return make_status(StatusDomain::Db, StatusCode::Conflict, static_cast<u32>(ext));
            case SQLITE_CONSTRAINT_CHECK:
            case SQLITE_CONSTRAINT_NOTNULL:
                return make_status(StatusDomain::Db, StatusCode::Invalid, static_cast<u32>(ext));
            default:
                break;
        }
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return make_status(StatusDomain::Db, StatusCode::Busy, static_cast<u32>(rc));
            case SQLITE_FULL:
                return make_status(StatusDomain::Db, StatusCode::NoSpace, static_cast<u32>(rc));
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
                return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
            default:
                return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
        }
    }

    [[nodiscard]] Status not_open() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    [[nodiscard]] Status prepare(sqlite3* db, const std::string& sql, sqlite3_stmt** stmt) noexcept {
        const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, stmt, nullptr);
        if (rc != SQLITE_OK || *stmt == nullptr) {
            log_error("db: prepare failed: %s", sqlite3_errmsg(db));
            if (*stmt) {
                sqlite3_finalize(*stmt);
                *stmt = nullptr;
            }
            return db_error(db, rc);
        }
        return ok_status();
    }

    void bind_text(sqlite3_stmt* stmt, int idx, const std::string& v) noexcept {
        sqlite3_bind_text(stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }

    [[nodiscard]] std::string column_string(sqlite3_stmt* stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        if (text == nullptr) {
            return std::string{};
        }
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
    }

    [[nodiscard]] bool read_row(sqlite3_stmt* stmt, UploadSession* out) {
        out->id = column_string(stmt, 0);
        out->filename = column_string(stmt, 1);
        out->mime_type = column_string(stmt, 2);
        out->expected_size = static_cast<u64>(sqlite3_column_int64(stmt, 3));
        out->bytes_received = static_cast<u64>(sqlite3_column_int64(stmt, 4));
        out->storage_handle = column_string(stmt, 5);
        const std::string status = column_string(stmt, 6);
        out->created_at = sqlite3_column_int64(stmt, 7);
        out->updated_at = sqlite3_column_int64(stmt, 8);
        return upload_status_from_name(status.c_str(), &out->status);
    }

    // Steps a prepared SELECT to completion, appending every row.
    [[nodiscard]] Status collect_rows(sqlite3* db, sqlite3_stmt* stmt, std::vector<UploadSession>* out) {
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            UploadSession s;
            if (!read_row(stmt, &s)) {
                sqlite3_finalize(stmt);
                return make_status(StatusDomain::Db, StatusCode::Corrupt);
            }
            out->push_back(std::move(s));
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return db_error(db, rc);
        }
        return ok_status();
    }

    [[nodiscard]] Status fetch_one(sqlite3* db, sqlite3_stmt* stmt, UploadSession* out) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            const bool ok = read_row(stmt, out);
            sqlite3_finalize(stmt);
            return ok ? ok_status() : make_status(StatusDomain::Db, StatusCode::Corrupt);
        }
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        return db_error(db, rc);
    }

    [[nodiscard]] Status exec_write(sqlite3* db, sqlite3_stmt* stmt, int* changes) noexcept {
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return db_error(db, rc);
        }
        if (changes) {
            *changes = sqlite3_changes(db);
        }
        return ok_status();
    }

    // A conditional UPDATE touched nothing: tell missing rows from terminal ones.
    [[nodiscard]] Status classify_missing(sqlite3* db, const std::string& id, StatusCode terminal_code) {
        sqlite3_stmt* stmt = nullptr;
        Status s = prepare(db, "SELECT status FROM upload_sessions WHERE id = ?", &stmt);
        if (!is_ok(s)) {
            return s;
        }
        bind_text(stmt, 1, id);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return db_error(db, rc);
        }
        return make_status(StatusDomain::Db, terminal_code);
    }
} // namespace

SessionStore::~SessionStore() noexcept {
    close();
}

Status SessionStore::open(const std::string& path) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ != nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (path.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        log_error("db: cannot open %s: %s", path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        const Status s = db_error(db_, rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return s;
    }

    sqlite3_busy_timeout(db_, 5000);

    // Journal mode is overridable for filesystems without shared memory support.
    const char* journal_mode = std::getenv("FERRY_DB_JOURNAL_MODE");
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += (journal_mode && *journal_mode) ? journal_mode : "WAL";
    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (err_msg) {
        log_warn("db: %s failed: %s", journal_sql.c_str(), err_msg);
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);

    rc = sqlite3_exec(db_, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_error("db: schema setup failed: %s", err_msg ? err_msg : "unknown");
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        const Status s = db_error(db_, rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return s;
    }
    return ok_status();
}

void SessionStore::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionStore::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Status SessionStore::insert(const UploadSession& session) noexcept {
    const Status valid = check_session_invariants(session);
    if (!is_ok(valid)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid, valid.aux);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_,
        "INSERT INTO upload_sessions (id, filename, mime_type, expected_size, bytes_received, "
        "storage_handle, status, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
        &stmt);
    if (!is_ok(s)) {
        return s;
    }
    bind_text(stmt, 1, session.id);
    bind_text(stmt, 2, session.filename);
    bind_text(stmt, 3, session.mime_type);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(session.expected_size));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(session.bytes_received));
    bind_text(stmt, 6, session.storage_handle);
    sqlite3_bind_text(stmt, 7, upload_status_name(session.status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 8, session.created_at);
    sqlite3_bind_int64(stmt, 9, session.updated_at);
    return exec_write(db_, stmt, nullptr);
}

Status SessionStore::get(const std::string& id, UploadSession* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, std::string(kSelectColumns) + "WHERE id = ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    bind_text(stmt, 1, id);
    return fetch_one(db_, stmt, out);
}

Status SessionStore::get_by_handle(const std::string& handle, UploadSession* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, std::string(kSelectColumns) + "WHERE storage_handle = ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    bind_text(stmt, 1, handle);
    return fetch_one(db_, stmt, out);
}

Status SessionStore::list_by_status(UploadStatus status, std::vector<UploadSession>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, std::string(kSelectColumns) + "WHERE status = ? ORDER BY created_at, id", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_text(stmt, 1, upload_status_name(status), -1, SQLITE_STATIC);
    return collect_rows(db_, stmt, out);
}

Status SessionStore::list_all(std::vector<UploadSession>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, std::string(kSelectColumns) + "ORDER BY created_at, id", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    return collect_rows(db_, stmt, out);
}

Status SessionStore::list_stale(UploadStatus status, Timestamp cutoff, std::vector<UploadSession>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_,
        std::string(kSelectColumns) + "WHERE status = ? AND updated_at < ? ORDER BY updated_at, id", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_text(stmt, 1, upload_status_name(status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, cutoff);
    return collect_rows(db_, stmt, out);
}

Status SessionStore::find_active(Timestamp since, const std::string& exclude_id,
    UploadSession* out, bool* found) noexcept {
    if (out == nullptr || found == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *found = false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_,
        std::string(kSelectColumns) +
            "WHERE status = 'IN_PROGRESS' AND updated_at >= ? AND id != ? ORDER BY updated_at DESC LIMIT 1",
        &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, since);
    bind_text(stmt, 2, exclude_id);
    s = fetch_one(db_, stmt, out);
    if (s.code == StatusCode::NotFound) {
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }
    *found = true;
    return ok_status();
}

Status SessionStore::count_by_status(UploadStatus status, u64* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *out = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, "SELECT COUNT(*) FROM upload_sessions WHERE status = ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_text(stmt, 1, upload_status_name(status), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_ROW ? ok_status() : db_error(db_, rc);
}

Status SessionStore::update_progress(const std::string& id, u64 bytes_received, Timestamp now) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_,
        "UPDATE upload_sessions SET bytes_received = ?, updated_at = MAX(updated_at, ?) "
        "WHERE id = ? AND status = 'IN_PROGRESS'",
        &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bytes_received));
    sqlite3_bind_int64(stmt, 2, now);
    bind_text(stmt, 3, id);
    int changes = 0;
    s = exec_write(db_, stmt, &changes);
    if (!is_ok(s)) {
        return s;
    }
    if (changes == 0) {
        return classify_missing(db_, id, StatusCode::Gone);
    }
    return ok_status();
}

Status SessionStore::update_status(const std::string& id, UploadStatus to, Timestamp now) noexcept {
    if (to == UploadStatus::InProgress) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_,
        "UPDATE upload_sessions SET status = ?, updated_at = MAX(updated_at, ?) "
        "WHERE id = ? AND status = 'IN_PROGRESS'",
        &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_text(stmt, 1, upload_status_name(to), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, now);
    bind_text(stmt, 3, id);
    int changes = 0;
    s = exec_write(db_, stmt, &changes);
    if (!is_ok(s)) {
        return s;
    }
    if (changes == 0) {
        return classify_missing(db_, id, StatusCode::Conflict);
    }
    return ok_status();
}

Status SessionStore::remove(const std::string& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_, "DELETE FROM upload_sessions WHERE id = ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    bind_text(stmt, 1, id);
    int changes = 0;
    s = exec_write(db_, stmt, &changes);
    if (!is_ok(s)) {
        return s;
    }
    return changes > 0 ? ok_status() : make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status SessionStore::remove_finished_before(Timestamp cutoff, u64* removed) noexcept {
    if (removed == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *removed = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return not_open();
    }
    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(db_,
        "DELETE FROM upload_sessions WHERE status != 'IN_PROGRESS' AND updated_at < ?", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, cutoff);
    int changes = 0;
    s = exec_write(db_, stmt, &changes);
    if (!is_ok(s)) {
        return s;
    }
    *removed = static_cast<u64>(changes);
    return ok_status();
}

} // namespace ferry::db
