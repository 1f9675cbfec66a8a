#include "hoststore/db/db.hpp"
#include "hoststore/core/log.hpp"

#include <sqlite3.h>
#include <cstring>
#include <strings.h>
#include <string>
#include <utility>

namespace hoststore::db {

using namespace hoststore::core;

namespace {
    constexpr int kBusyTimeoutMs = 5000;

    constexpr const char* kJournalModes[] = {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};

    [[nodiscard]] const char* checked_journal_mode(const char* mode) noexcept {
        if (!mode || mode[0] == '\0') {
            return "WAL";
        }
        for (const char* known : kJournalModes) {
            if (strcasecmp(mode, known) == 0) {
                return known;
            }
        }
        HOSTSTORE_LOG_WARN("db", "unknown journal mode '%s', using WAL", mode);
        return "WAL";
    }

    [[nodiscard]] Status exec_logged(sqlite3* db, const char* sql) noexcept {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            HOSTSTORE_LOG_ERROR("db", "%s: %s", sql, err_msg ? err_msg : sqlite3_errstr(rc));
            sqlite3_free(err_msg);
            return status_from_sqlite(rc);
        }
        return ok_status();
    }
}

Status status_from_sqlite(int rc) noexcept {
    const u32 aux = static_cast<u32>(rc);
    switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
        return ok_status();
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return make_status(StatusDomain::Db, StatusCode::Busy, aux);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
        return make_status(StatusDomain::Db, StatusCode::Corrupt, aux);
    case SQLITE_CONSTRAINT:
        return make_status(StatusDomain::Db, StatusCode::Conflict, aux);
    case SQLITE_PERM:
    case SQLITE_READONLY:
    case SQLITE_AUTH:
        return make_status(StatusDomain::Db, StatusCode::PermissionDenied, aux);
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_FULL:
        return make_status(StatusDomain::Db, StatusCode::Io, aux);
    case SQLITE_MISUSE:
    case SQLITE_RANGE:
        return make_status(StatusDomain::Db, StatusCode::Invalid, aux);
    default:
        return make_status(StatusDomain::Db, StatusCode::Unknown, aux);
    }
}

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* path = cfg.path ? cfg.path : ":memory:";
    int flags = cfg.read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    if (cfg.create && !cfg.read_only) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* conn = nullptr;
    int rc = sqlite3_open_v2(path, &conn, flags, nullptr);
    if (rc != SQLITE_OK) {
        HOSTSTORE_LOG_ERROR("db", "cannot open %s: %s", path, conn ? sqlite3_errmsg(conn) : sqlite3_errstr(rc));
        sqlite3_close(conn);
        return status_from_sqlite(rc);
    }
    sqlite3_extended_result_codes(conn, 1);
    sqlite3_busy_timeout(conn, kBusyTimeoutMs);

    Status s = ok_status();
    if (!cfg.read_only) {
        // Journal mode is a request; in-memory databases keep "memory".
        std::string journal_sql = "PRAGMA journal_mode=";
        journal_sql += checked_journal_mode(cfg.journal_mode);
        char* err_msg = nullptr;
        rc = sqlite3_exec(conn, journal_sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            HOSTSTORE_LOG_DEBUG("db", "%s failed: %s", journal_sql.c_str(), err_msg ? err_msg : "");
            sqlite3_free(err_msg);
        }
        s = exec_logged(conn, "PRAGMA synchronous=NORMAL");
    }

    if (is_ok(s)) s = exec_logged(conn, "PRAGMA foreign_keys=ON");
    if (is_ok(s)) s = exec_logged(conn, "PRAGMA temp_store=MEMORY");
    if (!is_ok(s)) {
        sqlite3_close(conn);
        return s;
    }

    // A file that is not a database fails here rather than on first use.
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(conn, "SELECT count(*) FROM sqlite_master", -1, &stmt, nullptr);
    if (rc == SQLITE_OK) {
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        HOSTSTORE_LOG_ERROR("db", "%s is not a usable database: %s", path, sqlite3_errmsg(conn));
        s = status_from_sqlite(rc);
        sqlite3_close(conn);
        return s;
    }

    out->conn = conn;
    return ok_status();
}

Status db_close(DbHandle* db) noexcept {
    if (!db || !db_handle_valid(*db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const int rc = sqlite3_close(db->conn);
    if (rc != SQLITE_OK) {
        HOSTSTORE_LOG_ERROR("db", "close failed: %s", sqlite3_errmsg(db->conn));
        return status_from_sqlite(rc);
    }
    db->conn = nullptr;
    return ok_status();
}

Status db_exec(DbHandle db, const char* sql) noexcept {
    if (!db_handle_valid(db) || !sql) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    return exec_logged(db.conn, sql);
}

// ============================================================================
// Transaction Management
// ============================================================================

Status db_txn_begin(DbHandle db) noexcept {
    return db_exec(db, "BEGIN IMMEDIATE TRANSACTION");
}

Status db_txn_commit(DbHandle db) noexcept {
    return db_exec(db, "COMMIT");
}

Status db_txn_rollback(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (sqlite3_get_autocommit(db.conn)) {
        return ok_status();  // Nothing open
    }
    return exec_logged(db.conn, "ROLLBACK");
}

// ============================================================================
// Introspection
// ============================================================================

Status db_table_exists(DbHandle db, const char* table, bool* out) noexcept {
    if (!db_handle_valid(db) || !table || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db.conn,
                                "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return status_from_sqlite(rc);
    }
    sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return status_from_sqlite(rc);
    }
    *out = rc == SQLITE_ROW;
    return ok_status();
}

Status db_table_columns(DbHandle db, const char* table, std::vector<std::string>* out) noexcept {
    if (!db_handle_valid(db) || !table || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "PRAGMA table_info(";
    sql += quote_identifier(table);
    sql += ")";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db.conn, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return status_from_sqlite(rc);
    }

    std::vector<std::string> cols;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (name) {
            cols.emplace_back(name);
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return status_from_sqlite(rc);
    }
    *out = std::move(cols);
    return ok_status();
}

Status db_query_int(DbHandle db, const char* sql, i64* out) noexcept {
    if (!db_handle_valid(db) || !sql || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db.conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        HOSTSTORE_LOG_DEBUG("db", "%s: %s", sql, sqlite3_errmsg(db.conn));
        return status_from_sqlite(rc);
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
        return ok_status();
    }
    sqlite3_finalize(stmt);

    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return status_from_sqlite(rc);
}

Status db_count_rows(DbHandle db, const char* table, i64* out) noexcept {
    if (!table) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::string sql = "SELECT count(*) FROM ";
    sql += quote_identifier(table);
    return db_query_int(db, sql.c_str(), out);
}

Status db_set_foreign_keys(DbHandle db, bool on) noexcept {
    return db_exec(db, on ? "PRAGMA foreign_keys=ON" : "PRAGMA foreign_keys=OFF");
}

Status db_set_legacy_alter_table(DbHandle db, bool on) noexcept {
    return db_exec(db, on ? "PRAGMA legacy_alter_table=ON" : "PRAGMA legacy_alter_table=OFF");
}

i64 db_total_changes(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return 0;
    }
    return static_cast<i64>(sqlite3_total_changes64(db.conn));
}

Status db_schema_version(DbHandle db, i64* out) noexcept {
    return db_query_int(db, "PRAGMA schema_version", out);
}

// ============================================================================
// Online Backup
// ============================================================================

Status db_backup_to(DbHandle db, const char* dst_path) noexcept {
    if (!db_handle_valid(db) || !dst_path) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3* dst = nullptr;
    int rc = sqlite3_open_v2(dst_path, &dst, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        HOSTSTORE_LOG_ERROR("db", "cannot open backup target %s: %s", dst_path,
                            dst ? sqlite3_errmsg(dst) : sqlite3_errstr(rc));
        sqlite3_close(dst);
        return status_from_sqlite(rc);
    }

    sqlite3_backup* backup = sqlite3_backup_init(dst, "main", db.conn, "main");
    if (!backup) {
        HOSTSTORE_LOG_ERROR("db", "backup init failed: %s", sqlite3_errmsg(dst));
        Status s = status_from_sqlite(sqlite3_extended_errcode(dst));
        sqlite3_close(dst);
        return s;
    }

    do {
        rc = sqlite3_backup_step(backup, 256);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            sqlite3_sleep(20);
        }
    } while (rc == SQLITE_OK || rc == SQLITE_BUSY || rc == SQLITE_LOCKED);

    sqlite3_backup_finish(backup);
    if (rc != SQLITE_DONE) {
        HOSTSTORE_LOG_ERROR("db", "backup to %s failed: %s", dst_path, sqlite3_errstr(rc));
        sqlite3_close(dst);
        return status_from_sqlite(rc);
    }

    rc = sqlite3_close(dst);
    if (rc != SQLITE_OK) {
        return status_from_sqlite(rc);
    }
    return ok_status();
}

const char* db_errmsg(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return "invalid handle";
    }
    return sqlite3_errmsg(db.conn);
}

} // namespace hoststore::db
