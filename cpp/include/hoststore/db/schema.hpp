#pragma once

#include <span>
#include <string>

#include "hoststore/core/errors.hpp"
#include "hoststore/db/db.hpp"

namespace hoststore::db {

    inline constexpr const char* kPromptsTable = "prompts";
    inline constexpr const char* kImagesTable = "generated_images";
    inline constexpr const char* kSettingsTable = "settings";
    inline constexpr const char* kTrackingTable = "prompt_tracking";

    // Name a table is renamed to while it is being rewritten.
    inline constexpr const char* kLegacyBackupSuffix = "__legacy_backup";

    enum class TableId : hoststore::core::u32 {
        Prompts = 1,
        GeneratedImages = 2,
    };

    // Canonical layout of a table the migrator manages.
    struct TableSpec {
        TableId id;
        const char* name;
        const char* create_sql;                        // CREATE TABLE IF NOT EXISTS ...
        std::span<const char* const> columns;          // canonical order, id first
        std::span<const char* const> legacy_markers;   // columns only old layouts have
    };

    [[nodiscard]] const TableSpec& table_spec(TableId id) noexcept;

    // Managed tables in rewrite order (parents first).
    [[nodiscard]] std::span<const TableId> managed_tables() noexcept;

    // Creates every canonical table that does not exist yet.
    [[nodiscard]] hoststore::core::Status schema_create_tables(DbHandle db) noexcept;

    [[nodiscard]] hoststore::core::Status schema_create_indexes(DbHandle db) noexcept;

    [[nodiscard]] std::string legacy_backup_name(const char* table);

} // namespace hoststore::db
