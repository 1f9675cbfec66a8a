#include "hoststore/migrate/schema_migrator.hpp"
#include "hoststore/core/log.hpp"

#include <sqlite3.h>
#include <algorithm>
#include <strings.h>
#include <utility>

namespace hoststore::migrate {

using namespace hoststore::core;
using hoststore::db::DbHandle;
using hoststore::db::TableSpec;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

bool contains_column(const std::vector<std::string>& cols, const char* name) {
    return std::any_of(cols.begin(), cols.end(),
                       [name](const std::string& c) { return strcasecmp(c.c_str(), name) == 0; });
}

CellValue read_cell(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
        return CellValue{static_cast<i64>(sqlite3_column_int64(stmt, col))};
    case SQLITE_FLOAT:
        return CellValue{sqlite3_column_double(stmt, col)};
    case SQLITE_TEXT: {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        const int len = sqlite3_column_bytes(stmt, col);
        return CellValue{std::string(text ? text : "", static_cast<size_t>(len))};
    }
    case SQLITE_BLOB: {
        const auto* data = static_cast<const u8*>(sqlite3_column_blob(stmt, col));
        const int len = sqlite3_column_bytes(stmt, col);
        return CellValue{data ? Blob(data, data + len) : Blob{}};
    }
    default:
        return CellValue{};
    }
}

int bind_cell(sqlite3_stmt* stmt, int idx, const CellValue& v) {
    if (const auto* i = std::get_if<i64>(&v)) {
        return sqlite3_bind_int64(stmt, idx, *i);
    }
    if (const auto* d = std::get_if<double>(&v)) {
        return sqlite3_bind_double(stmt, idx, *d);
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        return sqlite3_bind_text(stmt, idx, s->data(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
    }
    if (const auto* b = std::get_if<Blob>(&v)) {
        return sqlite3_bind_blob(stmt, idx, b->data(), static_cast<int>(b->size()), SQLITE_TRANSIENT);
    }
    return sqlite3_bind_null(stmt, idx);
}

std::string build_insert_sql(const TableSpec& spec) {
    std::string sql = "INSERT INTO ";
    sql += hoststore::db::quote_identifier(spec.name);
    sql += " (";
    std::string params;
    for (size_t i = 0; i < spec.columns.size(); ++i) {
        if (i) {
            sql += ", ";
            params += ", ";
        }
        sql += spec.columns[i];
        params += "?";
    }
    sql += ") VALUES (";
    sql += params;
    sql += ")";
    return sql;
}

// Connection-local pragmas the rewrite flips; restored on every exit path.
struct RewritePragmas {
    DbHandle db;
    i64 foreign_keys{1};
    bool armed{false};

    Status arm() {
        Status s = hoststore::db::db_query_int(db, "PRAGMA foreign_keys", &foreign_keys);
        if (!is_ok(s)) return s;
        s = hoststore::db::db_set_foreign_keys(db, false);
        if (!is_ok(s)) return s;
        armed = true;
        return hoststore::db::db_set_legacy_alter_table(db, true);
    }

    Status restore() {
        if (!armed) return ok_status();
        armed = false;
        Status s = hoststore::db::db_set_legacy_alter_table(db, false);
        Status f = hoststore::db::db_set_foreign_keys(db, foreign_keys != 0);
        return is_ok(s) ? f : s;
    }
};

void restore_or_log(RewritePragmas& pragmas, const char* table) {
    Status s = pragmas.restore();
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("migrate", "cannot restore pragmas after %s: %s", table, status_code_name(s.code));
    }
}

// Streams the backup table into the freshly created canonical table.
Status copy_rows(DbHandle db, const TableSpec& spec, const std::string& backup, const std::string& now,
                 TableOutcome* outcome) {
    std::string select_sql = "SELECT * FROM " + hoststore::db::quote_identifier(backup);
    std::string insert_sql = build_insert_sql(spec);

    sqlite3_stmt* select = nullptr;
    sqlite3_stmt* insert = nullptr;
    int rc = sqlite3_prepare_v2(db.conn, select_sql.c_str(), -1, &select, nullptr);
    if (rc == SQLITE_OK) {
        rc = sqlite3_prepare_v2(db.conn, insert_sql.c_str(), -1, &insert, nullptr);
    }
    if (rc != SQLITE_OK) {
        HOSTSTORE_LOG_ERROR("migrate", "%s: %s", spec.name, sqlite3_errmsg(db.conn));
        sqlite3_finalize(select);
        sqlite3_finalize(insert);
        return hoststore::db::status_from_sqlite(rc);
    }

    const int ncols = sqlite3_column_count(select);
    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        const char* name = sqlite3_column_name(select, c);
        names.emplace_back(name ? name : "");
    }

    LegacyRow row;
    MappedRow mapped;
    i64 ordinal = 0;
    Status s = ok_status();

    while ((rc = sqlite3_step(select)) == SQLITE_ROW) {
        ++ordinal;
        row.clear();
        for (int c = 0; c < ncols; ++c) {
            row.set(names[static_cast<size_t>(c)], read_cell(select, c));
        }

        const CellValue* id = row.find("id");
        std::optional<i64> legacy_id = id ? safe_int(*id) : std::nullopt;

        RowSkip skip{};
        if (!map_row(spec.id, row, now, &mapped, &skip)) {
            skip.table = spec.name;
            skip.legacy_rowid = legacy_id ? *legacy_id : ordinal;
            HOSTSTORE_LOG_WARN("migrate", "%s row %lld skipped (%s): %s", spec.name,
                               static_cast<long long>(skip.legacy_rowid), row_skip_reason_name(skip.reason),
                               skip.detail.c_str());
            outcome->skipped.push_back(std::move(skip));
            continue;
        }

        sqlite3_reset(insert);
        sqlite3_clear_bindings(insert);
        for (size_t i = 0; i < mapped.values.size(); ++i) {
            rc = bind_cell(insert, static_cast<int>(i + 1), mapped.values[i]);
            if (rc != SQLITE_OK) break;
        }
        if (rc == SQLITE_OK) {
            rc = sqlite3_step(insert);
        }

        if (rc == SQLITE_DONE) {
            ++outcome->rows_migrated;
            continue;
        }
        if ((rc & 0xFF) == SQLITE_CONSTRAINT || (rc & 0xFF) == SQLITE_MISMATCH || (rc & 0xFF) == SQLITE_TOOBIG) {
            RowSkip rejected{};
            rejected.table = spec.name;
            rejected.legacy_rowid = legacy_id ? *legacy_id : ordinal;
            rejected.reason = RowSkipReason::Rejected;
            rejected.detail = sqlite3_errmsg(db.conn);
            HOSTSTORE_LOG_WARN("migrate", "%s row %lld skipped (%s): %s", spec.name,
                               static_cast<long long>(rejected.legacy_rowid),
                               row_skip_reason_name(rejected.reason), rejected.detail.c_str());
            outcome->skipped.push_back(std::move(rejected));
            continue;
        }

        HOSTSTORE_LOG_ERROR("migrate", "insert into %s failed: %s", spec.name, sqlite3_errmsg(db.conn));
        s = hoststore::db::status_from_sqlite(rc);
        break;
    }

    if (is_ok(s) && rc != SQLITE_DONE) {
        HOSTSTORE_LOG_ERROR("migrate", "reading %s failed: %s", backup.c_str(), sqlite3_errmsg(db.conn));
        s = hoststore::db::status_from_sqlite(rc);
    }

    sqlite3_finalize(select);
    sqlite3_finalize(insert);
    return s;
}

Status rewrite_table(DbHandle db, const TableSpec& spec, const std::string& now, TableOutcome* outcome) {
    const std::string backup = hoststore::db::legacy_backup_name(spec.name);
    const std::string quoted_backup = hoststore::db::quote_identifier(backup);
    const std::string quoted_table = hoststore::db::quote_identifier(spec.name);

    RewritePragmas pragmas{db};
    Status s = pragmas.arm();
    if (!is_ok(s)) {
        restore_or_log(pragmas, spec.name);
        return s;
    }

    s = hoststore::db::db_txn_begin(db);
    if (!is_ok(s)) {
        restore_or_log(pragmas, spec.name);
        return s;
    }

    s = hoststore::db::db_exec(db, ("DROP TABLE IF EXISTS " + quoted_backup).c_str());
    if (is_ok(s)) {
        s = hoststore::db::db_exec(db, ("ALTER TABLE " + quoted_table + " RENAME TO " + quoted_backup).c_str());
    }
    if (is_ok(s)) {
        s = hoststore::db::db_exec(db, spec.create_sql);
    }
    if (is_ok(s)) {
        s = copy_rows(db, spec, backup, now, outcome);
    }

    if (is_ok(s)) {
        i64 rows_after = 0;
        s = hoststore::db::db_count_rows(db, spec.name, &rows_after);
        if (is_ok(s)) {
            const i64 skipped = static_cast<i64>(outcome->skipped.size());
            if (rows_after + skipped != outcome->rows_before || rows_after != outcome->rows_migrated) {
                HOSTSTORE_LOG_ERROR("migrate", "%s: %lld rows + %lld skipped != %lld before", spec.name,
                                    static_cast<long long>(rows_after), static_cast<long long>(skipped),
                                    static_cast<long long>(outcome->rows_before));
                s = make_status(StatusDomain::Migrate, StatusCode::Corrupt);
            }
        }
    }

    if (is_ok(s)) {
        s = hoststore::db::db_exec(db, ("DROP TABLE " + quoted_backup).c_str());
    }
    if (is_ok(s)) {
        s = hoststore::db::db_txn_commit(db);
    }

    if (!is_ok(s)) {
        Status r = hoststore::db::db_txn_rollback(db);
        if (!is_ok(r)) {
            HOSTSTORE_LOG_ERROR("migrate", "rollback of %s failed: %s", spec.name, hoststore::db::db_errmsg(db));
        }
        outcome->rewritten = false;
        outcome->rows_migrated = 0;
        outcome->skipped.clear();
    } else {
        outcome->rewritten = true;
    }

    Status r = pragmas.restore();
    if (is_ok(s) && !is_ok(r)) {
        s = r;
    }
    return s;
}

} // namespace

// ========================================================================
// Public API Implementation
// ========================================================================

bool MigrationOutcome::changed() const noexcept {
    return std::any_of(tables.begin(), tables.end(), [](const TableOutcome& t) { return t.rewritten; });
}

i64 MigrationOutcome::rows_skipped() const noexcept {
    i64 n = 0;
    for (const TableOutcome& t : tables) {
        n += static_cast<i64>(t.skipped.size());
    }
    return n;
}

const TableOutcome* MigrationOutcome::find(const std::string& table) const noexcept {
    for (const TableOutcome& t : tables) {
        if (t.table == table) return &t;
    }
    return nullptr;
}

Status table_needs_rewrite(DbHandle db, const TableSpec& spec, bool* needs, TableOutcome* detail) noexcept {
    if (!needs || !detail) {
        return make_status(StatusDomain::Migrate, StatusCode::Invalid);
    }

    std::vector<std::string> cols;
    Status s = hoststore::db::db_table_columns(db, spec.name, &cols);
    if (!is_ok(s)) {
        return s;
    }

    detail->missing_columns.clear();
    detail->legacy_markers.clear();
    for (const char* c : spec.columns) {
        if (!contains_column(cols, c)) detail->missing_columns.emplace_back(c);
    }
    for (const char* m : spec.legacy_markers) {
        if (contains_column(cols, m)) detail->legacy_markers.emplace_back(m);
    }

    *needs = !detail->missing_columns.empty() || !detail->legacy_markers.empty();
    return ok_status();
}

Status migrate(DbHandle db, const MigrateOptions& opts, MigrationOutcome* out) noexcept {
    if (!hoststore::db::db_handle_valid(db) || !out) {
        return make_status(StatusDomain::Migrate, StatusCode::Invalid);
    }

    const std::string now = opts.now.empty() ? utc_now_iso8601() : opts.now;
    MigrationOutcome result;

    for (hoststore::db::TableId id : hoststore::db::managed_tables()) {
        const TableSpec& spec = hoststore::db::table_spec(id);
        TableOutcome outcome{};
        outcome.table = spec.name;

        Status s = hoststore::db::db_table_exists(db, spec.name, &outcome.present);
        if (!is_ok(s)) {
            return s;
        }
        if (!outcome.present) {
            result.tables.push_back(std::move(outcome));
            continue;
        }

        s = hoststore::db::db_count_rows(db, spec.name, &outcome.rows_before);
        if (!is_ok(s)) {
            return s;
        }

        bool needs = false;
        s = table_needs_rewrite(db, spec, &needs, &outcome);
        if (!is_ok(s)) {
            return s;
        }
        if (!needs) {
            outcome.rows_migrated = outcome.rows_before;
            result.tables.push_back(std::move(outcome));
            continue;
        }

        HOSTSTORE_LOG_INFO("migrate", "rewriting legacy table %s (%lld rows, %zu missing columns, %zu legacy columns)",
                           spec.name, static_cast<long long>(outcome.rows_before),
                           outcome.missing_columns.size(), outcome.legacy_markers.size());

        s = rewrite_table(db, spec, now, &outcome);
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("migrate", "rewrite of %s rolled back: %s", spec.name, status_code_name(s.code));
            return s;
        }

        HOSTSTORE_LOG_INFO("migrate", "%s: %lld rows migrated, %zu skipped", spec.name,
                           static_cast<long long>(outcome.rows_migrated), outcome.skipped.size());
        result.tables.push_back(std::move(outcome));
    }

    *out = std::move(result);
    return ok_status();
}

Status bootstrap(DbHandle db, MigrationOutcome* out) noexcept {
    if (!hoststore::db::db_handle_valid(db)) {
        return make_status(StatusDomain::Migrate, StatusCode::Invalid);
    }

    Status s = hoststore::db::schema_create_tables(db);
    if (!is_ok(s)) {
        return s;
    }

    MigrationOutcome outcome;
    s = migrate(db, MigrateOptions{}, &outcome);
    if (!is_ok(s)) {
        return s;
    }

    s = hoststore::db::schema_create_indexes(db);
    if (!is_ok(s)) {
        return s;
    }

    if (out) {
        *out = std::move(outcome);
    }
    return ok_status();
}

} // namespace hoststore::migrate
