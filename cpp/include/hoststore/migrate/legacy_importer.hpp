#pragma once

#include <span>
#include <string>
#include <vector>

#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"
#include "hoststore/migrate/schema_migrator.hpp"
#include "hoststore/storage/data_dir.hpp"

namespace hoststore::migrate {

    inline constexpr const char* kMigratedSuffix = ".v1_migrated";
    inline constexpr const char* kBackupInfix = ".v1_backup_";
    inline constexpr const char* kPartialBackupSuffix = ".partial_backup";

    // Files older releases left in the host root.
    [[nodiscard]] std::span<const char* const> legacy_file_names() noexcept;

    // "*.db" or "prompts.db*".
    [[nodiscard]] bool is_database_name(const std::string& name) noexcept;

    // Name the file takes in the data directory (prompts backups become prompts.db).
    [[nodiscard]] std::string import_target_name(const std::string& name);

    struct ImportedFile {
        std::string file;
        std::string old_path;
        std::string new_path;
        std::string backup_path;
        std::string marked_path;   // legacy file after the .v1_migrated rename
        i64 prompts_migrated{-1};  // database files only
        MigrationOutcome migration;
    };

    struct SkippedFile {
        std::string file;
        std::string reason;
    };

    struct ImportError {
        std::string file;
        hoststore::core::Status status{};
        std::string message;
    };

    struct ImportReport {
        std::vector<ImportedFile> migrated;
        std::vector<SkippedFile> skipped;
        std::vector<ImportError> errors;
    };

    struct LegacyDbStats {
        i64 prompts{-1};
        i64 images{-1};
        i64 categories{-1};
    };

    struct LegacyFileInfo {
        std::string name;
        std::string path;
        hoststore::core::u64 size{0};
        hoststore::core::Timestamp modified{0};  // seconds since the epoch
        bool has_stats{false};
        LegacyDbStats stats;
    };

    struct LegacyScan {
        std::string root;
        std::vector<LegacyFileInfo> files;

        [[nodiscard]] bool found() const noexcept { return !files.empty(); }
    };

    // Brings stray files from the host root under the data directory. Database
    // files are copied online, bootstrapped to the canonical schema on their own
    // connection, and renamed into place; everything else is copied verbatim.
    class LegacyFileImporter {
    public:
        LegacyFileImporter(const storage::DataDirectoryManager& dirs, std::string journal_mode);

        [[nodiscard]] hoststore::core::Status import_legacy(ImportReport* out) noexcept;

        // Check only; nothing is written.
        [[nodiscard]] hoststore::core::Status scan_legacy(LegacyScan* out) const noexcept;

        // Imports one database file into target; appends to report.migrated or
        // report.skipped. Errors are returned, not recorded.
        [[nodiscard]] hoststore::core::Status import_database(const std::string& source,
                                                              const std::string& target,
                                                              ImportReport* report) noexcept;

    private:
        // Backup, online copy, schema upgrade and placement of one database file.
        hoststore::core::Status copy_database(const std::string& source, const std::string& target,
                                              ImportReport* report) noexcept;
        hoststore::core::Status import_plain_file(const std::string& source, const std::string& target,
                                                  ImportReport* report) noexcept;

        const storage::DataDirectoryManager& dirs_;
        std::string journal_mode_;
    };

} // namespace hoststore::migrate
