#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"

struct sqlite3;

namespace hoststore::db {
    using i64 = hoststore::core::i64;

    struct DbConfig {
        const char* path{nullptr};          // nullptr opens ":memory:"
        const char* journal_mode{nullptr};  // nullptr means WAL
        bool create{true};
        bool read_only{false};              // inspection only: no journal or sync pragmas
    };

    // One connection. Copies alias the same connection; db_close releases it.
    struct DbHandle {
        sqlite3* conn{nullptr};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle db) noexcept {
        return db.conn != nullptr;
    }

    // Opens with journal_mode, synchronous=NORMAL, busy_timeout and foreign_keys=ON.
    // Read-only handles only get busy_timeout and foreign_keys.
    [[nodiscard]] hoststore::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    hoststore::core::Status db_close(DbHandle* db) noexcept;

    [[nodiscard]] hoststore::core::Status db_exec(DbHandle db, const char* sql) noexcept;

    [[nodiscard]] hoststore::core::Status db_txn_begin(DbHandle db) noexcept;
    [[nodiscard]] hoststore::core::Status db_txn_commit(DbHandle db) noexcept;
    hoststore::core::Status db_txn_rollback(DbHandle db) noexcept;

    // Introspection
    [[nodiscard]] hoststore::core::Status db_table_exists(DbHandle db, const char* table, bool* out) noexcept;
    [[nodiscard]] hoststore::core::Status db_table_columns(DbHandle db, const char* table,
                                                           std::vector<std::string>* out) noexcept;
    [[nodiscard]] hoststore::core::Status db_count_rows(DbHandle db, const char* table, i64* out) noexcept;

    // SELECT returning one integer (e.g. PRAGMA schema_version).
    [[nodiscard]] hoststore::core::Status db_query_int(DbHandle db, const char* sql, i64* out) noexcept;

    [[nodiscard]] hoststore::core::Status db_set_foreign_keys(DbHandle db, bool on) noexcept;
    [[nodiscard]] hoststore::core::Status db_set_legacy_alter_table(DbHandle db, bool on) noexcept;

    // Rows changed by INSERT/UPDATE/DELETE since the connection opened.
    [[nodiscard]] i64 db_total_changes(DbHandle db) noexcept;
    [[nodiscard]] hoststore::core::Status db_schema_version(DbHandle db, i64* out) noexcept;

    // Consistent copy of the main database into dst_path through the online backup API.
    [[nodiscard]] hoststore::core::Status db_backup_to(DbHandle db, const char* dst_path) noexcept;

    [[nodiscard]] const char* db_errmsg(DbHandle db) noexcept;

    // Maps a SQLite result code to {Db, code, aux=rc}.
    [[nodiscard]] hoststore::core::Status status_from_sqlite(int rc) noexcept;

    // Double-quoted SQL identifier.
    [[nodiscard]] std::string quote_identifier(const std::string& name);

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace hoststore::db
