#include <gtest/gtest.h>
#include "hoststore/db/db.hpp"
#include "hoststore/db/schema.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <sqlite3.h>
#include <string>
#include <vector>

using namespace hoststore::db;
using namespace hoststore::core;
using hoststore::test::TempDir;

namespace {

DbHandle open_memory() {
    DbConfig cfg{};
    DbHandle handle{};
    EXPECT_TRUE(is_ok(db_open(cfg, &handle)));
    return handle;
}

std::string query_text(DbHandle db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    std::string out;
    if (sqlite3_prepare_v2(db.conn, sql, -1, &stmt, nullptr) == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* t = sqlite3_column_text(stmt, 0);
        out = t ? reinterpret_cast<const char*>(t) : "";
    }
    sqlite3_finalize(stmt);
    return out;
}

} // namespace

//=============================================================================
// Database Lifecycle Tests
//=============================================================================

TEST(Database, OpenClose) {
    DbHandle handle = open_memory();
    EXPECT_TRUE(db_handle_valid(handle));

    Status s = db_close(&handle);
    EXPECT_TRUE(is_ok(s));
    EXPECT_FALSE(db_handle_valid(handle));
}

TEST(Database, OpenWithNullOut) {
    DbConfig cfg{};
    Status s = db_open(cfg, nullptr);
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(Database, CloseInvalidHandle) {
    DbHandle invalid{};
    EXPECT_EQ(db_close(&invalid).code, StatusCode::Invalid);
    EXPECT_EQ(db_close(nullptr).code, StatusCode::Invalid);
}

TEST(Database, FilePragmas) {
    TempDir tmp;
    const std::string path = tmp.sub("p.db");
    DbConfig cfg{};
    cfg.path = path.c_str();
    DbHandle db{};
    ASSERT_TRUE(is_ok(db_open(cfg, &db)));

    EXPECT_EQ(query_text(db, "PRAGMA journal_mode"), "wal");
    i64 v = -1;
    ASSERT_TRUE(is_ok(db_query_int(db, "PRAGMA foreign_keys", &v)));
    EXPECT_EQ(v, 1);
    ASSERT_TRUE(is_ok(db_query_int(db, "PRAGMA synchronous", &v)));
    EXPECT_EQ(v, 1);  // NORMAL
    ASSERT_TRUE(is_ok(db_query_int(db, "PRAGMA busy_timeout", &v)));
    EXPECT_EQ(v, 5000);
    db_close(&db);
}

TEST(Database, JournalModeWhitelist) {
    TempDir tmp;
    const std::string path = tmp.sub("j.db");
    DbConfig cfg{};
    cfg.path = path.c_str();
    cfg.journal_mode = "delete";
    DbHandle db{};
    ASSERT_TRUE(is_ok(db_open(cfg, &db)));
    EXPECT_EQ(query_text(db, "PRAGMA journal_mode"), "delete");
    db_close(&db);

    const std::string other = tmp.sub("k.db");
    cfg.path = other.c_str();
    cfg.journal_mode = "wal; DROP TABLE x";
    hoststore::test::LogCapture capture;
    ASSERT_TRUE(is_ok(db_open(cfg, &db)));
    EXPECT_EQ(query_text(db, "PRAGMA journal_mode"), "wal");
    EXPECT_EQ(capture.count(LogLevel::Warn, "unknown journal mode"), 1u);
    db_close(&db);
}

TEST(Database, MissingFileWithoutCreate) {
    TempDir tmp;
    const std::string path = tmp.sub("absent.db");
    DbConfig cfg{};
    cfg.path = path.c_str();
    cfg.create = false;
    DbHandle db{};
    Status s = db_open(cfg, &db);
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_FALSE(db_handle_valid(db));
    EXPECT_FALSE(hoststore::test::exists(path));
}

TEST(Database, GarbageFileIsCorrupt) {
    TempDir tmp;
    const std::string path = tmp.sub("garbage.db");
    hoststore::test::write_text(path, std::string(4096, 'z'));
    DbConfig cfg{};
    cfg.path = path.c_str();
    DbHandle db{};
    Status s = db_open(cfg, &db);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
}

TEST(Database, ReadOnlyDoesNotChangeJournalMode) {
    TempDir tmp;
    const std::string path = tmp.sub("ro.db");
    DbConfig cfg{};
    cfg.path = path.c_str();
    cfg.journal_mode = "DELETE";
    DbHandle db{};
    ASSERT_TRUE(is_ok(db_open(cfg, &db)));
    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE t(x)")));
    db_close(&db);

    DbConfig ro{};
    ro.path = path.c_str();
    ro.read_only = true;
    ASSERT_TRUE(is_ok(db_open(ro, &db)));
    EXPECT_EQ(query_text(db, "PRAGMA journal_mode"), "delete");
    Status s = db_exec(db, "INSERT INTO t VALUES (1)");
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    db_close(&db);
}

//=============================================================================
// Transaction Tests
//=============================================================================

TEST(Database, CommitAndRollback) {
    DbHandle db = open_memory();
    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE t(x INTEGER)")));

    ASSERT_TRUE(is_ok(db_txn_begin(db)));
    ASSERT_TRUE(is_ok(db_exec(db, "INSERT INTO t VALUES (1)")));
    ASSERT_TRUE(is_ok(db_txn_commit(db)));

    ASSERT_TRUE(is_ok(db_txn_begin(db)));
    ASSERT_TRUE(is_ok(db_exec(db, "INSERT INTO t VALUES (2)")));
    ASSERT_TRUE(is_ok(db_txn_rollback(db)));

    i64 n = 0;
    ASSERT_TRUE(is_ok(db_count_rows(db, "t", &n)));
    EXPECT_EQ(n, 1);

    // Nothing open: rollback is a no-op.
    EXPECT_TRUE(is_ok(db_txn_rollback(db)));
    db_close(&db);
}

TEST(Database, ExecErrorIsMapped) {
    DbHandle db = open_memory();
    hoststore::test::LogCapture capture;
    Status s = db_exec(db, "SELECT * FROM nope");
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_FALSE(is_ok(s));
    EXPECT_EQ(capture.count(LogLevel::Error, "no such table"), 1u);

    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE u(x UNIQUE)")));
    ASSERT_TRUE(is_ok(db_exec(db, "INSERT INTO u VALUES (1)")));
    s = db_exec(db, "INSERT INTO u VALUES (1)");
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.aux & 0xFF, static_cast<u32>(SQLITE_CONSTRAINT));
    db_close(&db);
}

//=============================================================================
// Introspection
//=============================================================================

TEST(Database, TableIntrospection) {
    DbHandle db = open_memory();
    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE \"odd\"\"name\"(a, b TEXT, c INTEGER)")));

    bool exists = false;
    ASSERT_TRUE(is_ok(db_table_exists(db, "odd\"name", &exists)));
    EXPECT_TRUE(exists);
    ASSERT_TRUE(is_ok(db_table_exists(db, "missing", &exists)));
    EXPECT_FALSE(exists);

    std::vector<std::string> cols;
    ASSERT_TRUE(is_ok(db_table_columns(db, "odd\"name", &cols)));
    EXPECT_EQ(cols, (std::vector<std::string>{"a", "b", "c"}));

    ASSERT_TRUE(is_ok(db_table_columns(db, "missing", &cols)));
    EXPECT_TRUE(cols.empty());
    db_close(&db);
}

TEST(Database, QueryIntNoRow) {
    DbHandle db = open_memory();
    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE t(x)")));
    i64 v = 0;
    EXPECT_EQ(db_query_int(db, "SELECT x FROM t", &v).code, StatusCode::NotFound);
    db_close(&db);
}

TEST(Database, ChangeCounters) {
    DbHandle db = open_memory();
    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE t(x)")));
    const i64 changes = db_total_changes(db);
    i64 version = 0;
    ASSERT_TRUE(is_ok(db_schema_version(db, &version)));

    ASSERT_TRUE(is_ok(db_exec(db, "INSERT INTO t VALUES (1), (2)")));
    EXPECT_EQ(db_total_changes(db), changes + 2);

    ASSERT_TRUE(is_ok(db_exec(db, "CREATE TABLE t2(y)")));
    i64 later = 0;
    ASSERT_TRUE(is_ok(db_schema_version(db, &later)));
    EXPECT_GT(later, version);
    db_close(&db);
}

TEST(Database, PragmaToggles) {
    DbHandle db = open_memory();
    i64 v = -1;
    ASSERT_TRUE(is_ok(db_set_foreign_keys(db, false)));
    ASSERT_TRUE(is_ok(db_query_int(db, "PRAGMA foreign_keys", &v)));
    EXPECT_EQ(v, 0);
    ASSERT_TRUE(is_ok(db_set_legacy_alter_table(db, true)));
    ASSERT_TRUE(is_ok(db_query_int(db, "PRAGMA legacy_alter_table", &v)));
    EXPECT_EQ(v, 1);
    db_close(&db);
}

//=============================================================================
// Online backup
//=============================================================================

TEST(Database, BackupCopiesContents) {
    TempDir tmp;
    DbHandle db = open_memory();
    ASSERT_TRUE(is_ok(schema_create_tables(db)));
    ASSERT_TRUE(is_ok(db_exec(db, "INSERT INTO prompts(positive_prompt) VALUES ('a'), ('b'), ('c')")));

    const std::string dst = tmp.sub("copy.db");
    ASSERT_TRUE(is_ok(db_backup_to(db, dst.c_str())));
    db_close(&db);

    DbConfig cfg{};
    cfg.path = dst.c_str();
    cfg.read_only = true;
    DbHandle copy{};
    ASSERT_TRUE(is_ok(db_open(cfg, &copy)));
    i64 n = 0;
    ASSERT_TRUE(is_ok(db_count_rows(copy, kPromptsTable, &n)));
    EXPECT_EQ(n, 3);
    db_close(&copy);
}

//=============================================================================
// Schema
//=============================================================================

TEST(Schema, CreatesCanonicalTables) {
    DbHandle db = open_memory();
    ASSERT_TRUE(is_ok(schema_create_tables(db)));
    ASSERT_TRUE(is_ok(schema_create_tables(db)));
    ASSERT_TRUE(is_ok(schema_create_indexes(db)));

    for (const char* table : {kPromptsTable, kImagesTable, kSettingsTable, kTrackingTable}) {
        bool exists = false;
        ASSERT_TRUE(is_ok(db_table_exists(db, table, &exists)));
        EXPECT_TRUE(exists) << table;
    }

    for (TableId id : managed_tables()) {
        const TableSpec& spec = table_spec(id);
        std::vector<std::string> cols;
        ASSERT_TRUE(is_ok(db_table_columns(db, spec.name, &cols)));
        ASSERT_EQ(cols.size(), spec.columns.size()) << spec.name;
        for (size_t i = 0; i < cols.size(); ++i) {
            EXPECT_EQ(cols[i], spec.columns[i]);
        }
        for (const char* marker : spec.legacy_markers) {
            EXPECT_EQ(std::find(cols.begin(), cols.end(), marker), cols.end()) << marker;
        }
    }

    i64 indexes = 0;
    ASSERT_TRUE(is_ok(db_query_int(db, "SELECT count(*) FROM sqlite_master WHERE type = 'index' AND name LIKE 'idx_%'",
                                   &indexes)));
    EXPECT_EQ(indexes, 11);
    db_close(&db);
}

TEST(Schema, ManagedOrderParentsFirst) {
    auto tables = managed_tables();
    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables[0], TableId::Prompts);
    EXPECT_EQ(tables[1], TableId::GeneratedImages);
    EXPECT_EQ(legacy_backup_name(kPromptsTable), "prompts__legacy_backup");
}

TEST(Schema, QuoteIdentifier) {
    EXPECT_EQ(quote_identifier("plain"), "\"plain\"");
    EXPECT_EQ(quote_identifier("a\"b"), "\"a\"\"b\"");
}

TEST(Schema, StatusFromSqlite) {
    EXPECT_TRUE(is_ok(status_from_sqlite(SQLITE_OK)));
    EXPECT_TRUE(is_ok(status_from_sqlite(SQLITE_DONE)));
    EXPECT_EQ(status_from_sqlite(SQLITE_BUSY).code, StatusCode::Busy);
    EXPECT_EQ(status_from_sqlite(SQLITE_NOTADB).code, StatusCode::Corrupt);
    EXPECT_EQ(status_from_sqlite(SQLITE_CONSTRAINT_UNIQUE).code, StatusCode::Conflict);
    EXPECT_EQ(status_from_sqlite(SQLITE_READONLY).code, StatusCode::PermissionDenied);
    EXPECT_EQ(status_from_sqlite(SQLITE_IOERR_WRITE).code, StatusCode::Io);
    EXPECT_EQ(status_from_sqlite(SQLITE_CONSTRAINT_UNIQUE).aux, static_cast<u32>(SQLITE_CONSTRAINT_UNIQUE));
    EXPECT_EQ(status_from_sqlite(SQLITE_ERROR).code, StatusCode::Unknown);
}
