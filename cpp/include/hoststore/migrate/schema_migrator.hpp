#pragma once

#include <string>
#include <vector>

#include "hoststore/core/errors.hpp"
#include "hoststore/db/db.hpp"
#include "hoststore/db/schema.hpp"
#include "hoststore/migrate/row_mapping.hpp"

namespace hoststore::migrate {

    struct TableOutcome {
        std::string table;
        bool present{false};
        bool rewritten{false};
        i64 rows_before{0};
        i64 rows_migrated{0};
        std::vector<RowSkip> skipped;
        std::vector<std::string> missing_columns;  // canonical columns the old layout lacked
        std::vector<std::string> legacy_markers;   // legacy-only columns it had
    };

    // Result of one migrate() run; returned and logged, never stored.
    struct MigrationOutcome {
        std::vector<TableOutcome> tables;

        [[nodiscard]] bool changed() const noexcept;
        [[nodiscard]] i64 rows_skipped() const noexcept;
        [[nodiscard]] const TableOutcome* find(const std::string& table) const noexcept;
    };

    struct MigrateOptions {
        std::string now;  // timestamp for absent timestamps; empty means the current UTC time
    };

    // Rewrites every managed table whose layout is legacy into the canonical
    // one, in place and one transaction per table. Canonical tables are left
    // untouched, so repeated runs write nothing.
    [[nodiscard]] hoststore::core::Status migrate(hoststore::db::DbHandle db, const MigrateOptions& opts,
                                                  MigrationOutcome* out) noexcept;

    // Creates absent canonical tables, migrates, then creates indexes.
    [[nodiscard]] hoststore::core::Status bootstrap(hoststore::db::DbHandle db, MigrationOutcome* out) noexcept;

    // Columns check only: does this table need a rewrite?
    [[nodiscard]] hoststore::core::Status table_needs_rewrite(hoststore::db::DbHandle db,
                                                              const hoststore::db::TableSpec& spec,
                                                              bool* needs,
                                                              TableOutcome* detail) noexcept;

} // namespace hoststore::migrate
