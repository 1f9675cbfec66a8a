#include "hoststore/migrate/legacy_importer.hpp"
#include "hoststore/db/db.hpp"
#include "hoststore/db/schema.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/core/log.hpp"

#include <string_view>
#include <sys/stat.h>
#include <utility>

namespace hoststore::migrate {

using namespace hoststore::core;
namespace fs_ops = hoststore::storage;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

constexpr const char* kLegacyFiles[] = {
    "prompts.db",
    "prompts.db.866_backup",
    "example_prompts.db",
    "promptmanager_settings.json",
    "prompt_manager_settings.json",
};

constexpr const char* kImportTempSuffix = ".import_tmp";
constexpr int kMaxBackupAttempts = 100;

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string describe_status(Status s) {
    std::string text = status_domain_name(s.domain);
    text += "/";
    text += status_code_name(s.code);
    if (s.aux != 0) {
        text += " (";
        text += std::to_string(s.aux);
        text += ")";
    }
    return text;
}

Status import_status(Status s) {
    if (is_ok(s) || s.domain == StatusDomain::Db || s.domain == StatusDomain::Migrate) return s;
    return make_status(StatusDomain::Import, s.code, s.aux);
}

Status count_prompts(const std::string& path, i64* out) {
    hoststore::db::DbConfig cfg{};
    cfg.path = path.c_str();
    cfg.read_only = true;
    hoststore::db::DbHandle db{};
    Status s = hoststore::db::db_open(cfg, &db);
    if (!is_ok(s)) return s;
    s = hoststore::db::db_count_rows(db, hoststore::db::kPromptsTable, out);
    hoststore::db::db_close(&db);
    return s;
}

// Renames from onto preferred, or onto a timestamped variant when preferred is taken.
Status place_aside(const std::string& from, const std::string& preferred, std::string* used) {
    Status s = fs_ops::rename_no_replace(from, preferred);
    if (is_ok(s)) {
        *used = preferred;
        return s;
    }
    if (s.code != StatusCode::Conflict) {
        return s;
    }
    std::string alt = preferred + "_" + local_backup_stamp();
    s = fs_ops::rename_no_replace(from, alt);
    if (is_ok(s)) {
        *used = alt;
    }
    return s;
}

void remove_database_files(const std::string& path) {
    static constexpr const char* kSidecars[] = {"", "-journal", "-wal", "-shm"};
    for (const char* suffix : kSidecars) {
        Status s = fs_ops::remove_file(path + suffix);
        if (!is_ok(s)) {
            HOSTSTORE_LOG_WARN("import", "cannot remove %s%s (errno %u)", path.c_str(), suffix, s.aux);
        }
    }
}

// Puts a set-aside partial target back after a failed import.
void restore_aside(const std::string& aside, const std::string& target) {
    Status s = fs_ops::rename_no_replace(aside, target);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("import", "cannot restore %s from %s: %s (errno %u)", target.c_str(), aside.c_str(),
                            status_code_name(s.code), s.aux);
        return;
    }
    HOSTSTORE_LOG_WARN("import", "import failed; restored %s", target.c_str());
}

void collect_stats(const std::string& path, LegacyFileInfo* info) {
    hoststore::db::DbConfig cfg{};
    cfg.path = path.c_str();
    cfg.read_only = true;
    hoststore::db::DbHandle db{};
    if (!is_ok(hoststore::db::db_open(cfg, &db))) {
        HOSTSTORE_LOG_ERROR("import", "cannot read legacy database stats from %s", path.c_str());
        return;
    }

    if (is_ok(hoststore::db::db_count_rows(db, hoststore::db::kPromptsTable, &info->stats.prompts))) {
        info->has_stats = true;
        // Optional in old layouts.
        if (!is_ok(hoststore::db::db_count_rows(db, hoststore::db::kImagesTable, &info->stats.images))) {
            info->stats.images = -1;
        }
        if (!is_ok(hoststore::db::db_query_int(
                db, "SELECT COUNT(DISTINCT category) FROM prompts WHERE category IS NOT NULL",
                &info->stats.categories))) {
            info->stats.categories = -1;
        }
    } else {
        info->stats.prompts = -1;
    }
    hoststore::db::db_close(&db);
}

} // namespace

// ========================================================================
// Public API Implementation
// ========================================================================

std::span<const char* const> legacy_file_names() noexcept {
    return kLegacyFiles;
}

bool is_database_name(const std::string& name) noexcept {
    return ends_with(name, ".db") || starts_with(name, "prompts.db");
}

std::string import_target_name(const std::string& name) {
    if (starts_with(name, "prompts.db") && name != "prompts.db" && ends_with(name, "_backup")) {
        return "prompts.db";
    }
    return name;
}

LegacyFileImporter::LegacyFileImporter(const storage::DataDirectoryManager& dirs, std::string journal_mode)
    : dirs_(dirs), journal_mode_(std::move(journal_mode)) {}

Status LegacyFileImporter::import_legacy(ImportReport* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Import, StatusCode::Invalid);
    }

    std::string data_dir;
    Status s = dirs_.data_dir(true, &data_dir);
    if (!is_ok(s)) {
        return s;
    }

    const std::string& root = dirs_.host_root().path;
    ImportReport report;

    for (const char* name : kLegacyFiles) {
        const std::string source = fs_ops::path_join(root, name);
        if (!fs_ops::is_regular_file(source)) {
            continue;
        }

        const std::string target = fs_ops::path_join(data_dir, import_target_name(name));
        s = is_database_name(name) ? import_database(source, target, &report)
                                   : import_plain_file(source, target, &report);
        if (!is_ok(s)) {
            ImportError err{};
            err.file = name;
            err.status = s;
            err.message = describe_status(s);
            HOSTSTORE_LOG_ERROR("import", "failed to import %s: %s", name, err.message.c_str());
            report.errors.push_back(std::move(err));
        }
    }

    HOSTSTORE_LOG_INFO("import", "legacy import: %zu migrated, %zu skipped, %zu errors", report.migrated.size(),
                       report.skipped.size(), report.errors.size());
    *out = std::move(report);
    return ok_status();
}

Status LegacyFileImporter::scan_legacy(LegacyScan* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Import, StatusCode::Invalid);
    }

    LegacyScan scan;
    scan.root = dirs_.host_root().path;

    for (const char* name : kLegacyFiles) {
        const std::string path = fs_ops::path_join(scan.root, name);
        struct stat st;
        if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }

        LegacyFileInfo info{};
        info.name = name;
        info.path = path;
        info.size = static_cast<u64>(st.st_size);
        info.modified = static_cast<Timestamp>(st.st_mtime);
        if (is_database_name(info.name)) {
            collect_stats(path, &info);
        }
        scan.files.push_back(std::move(info));
    }

    *out = std::move(scan);
    return ok_status();
}

Status LegacyFileImporter::import_database(const std::string& source, const std::string& target,
                                           ImportReport* report) noexcept {
    if (!report) {
        return make_status(StatusDomain::Import, StatusCode::Invalid);
    }
    if (!fs_ops::is_regular_file(source)) {
        return make_status(StatusDomain::Import, StatusCode::NotFound);
    }

    const std::string name = fs_ops::path_filename(source);

    // An existing target is either a finished import or a partial one.
    std::string aside;
    if (fs_ops::path_exists(target)) {
        i64 source_count = 0;
        i64 target_count = 0;
        Status cs = count_prompts(source, &source_count);
        if (is_ok(cs)) cs = count_prompts(target, &target_count);
        if (!is_ok(cs)) {
            HOSTSTORE_LOG_WARN("import", "cannot compare prompt counts of %s and %s", source.c_str(), target.c_str());
            report->skipped.push_back(SkippedFile{name, "Already exists in data directory"});
            return ok_status();
        }

        if (target_count * 10 >= source_count) {
            report->skipped.push_back(
                SkippedFile{name, "Already migrated (" + std::to_string(target_count) + " prompts)"});
            return ok_status();
        }

        Status s = place_aside(target, target + kPartialBackupSuffix, &aside);
        if (!is_ok(s)) {
            return import_status(s);
        }
        HOSTSTORE_LOG_INFO("import", "target has %lld prompts vs %lld in %s; kept partial copy as %s",
                           static_cast<long long>(target_count), static_cast<long long>(source_count),
                           name.c_str(), aside.c_str());
    }

    Status s = copy_database(source, target, report);
    if (!is_ok(s) && !aside.empty()) {
        restore_aside(aside, target);
    }
    return s;
}

Status LegacyFileImporter::copy_database(const std::string& source, const std::string& target,
                                         ImportReport* report) noexcept {
    const std::string name = fs_ops::path_filename(source);

    ImportedFile imported{};
    imported.file = name;
    imported.old_path = source;
    imported.new_path = target;

    Status s = fs_ops::make_directories(fs_ops::path_parent(target));
    if (!is_ok(s)) {
        return import_status(s);
    }

    // Timestamped byte copy of the untouched legacy file.
    std::string backups;
    s = dirs_.subdir(storage::DataSubdir::Backups, true, &backups);
    if (!is_ok(s)) {
        return s;
    }
    const std::string stem = fs_ops::path_join(backups, name + kBackupInfix + local_backup_stamp());
    std::string backup = stem;
    for (int attempt = 2; fs_ops::path_exists(backup) && attempt <= kMaxBackupAttempts; ++attempt) {
        backup = stem + "_" + std::to_string(attempt);
    }
    s = fs_ops::copy_file_contents(source.c_str(), backup.c_str(), nullptr);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("import", "cannot back up %s to %s", source.c_str(), backup.c_str());
        return import_status(s);
    }
    imported.backup_path = backup;

    const std::string tmp = target + kImportTempSuffix;
    remove_database_files(tmp);

    // Online copy, so a legacy file in WAL mode is read consistently.
    hoststore::db::DbConfig src_cfg{};
    src_cfg.path = source.c_str();
    src_cfg.read_only = true;
    hoststore::db::DbHandle src{};
    s = hoststore::db::db_open(src_cfg, &src);
    if (!is_ok(s)) {
        return s;
    }
    s = hoststore::db::db_backup_to(src, tmp.c_str());
    hoststore::db::db_close(&src);
    if (!is_ok(s)) {
        remove_database_files(tmp);
        return s;
    }

    // Canonical schema on a fresh connection bound to the copy.
    hoststore::db::DbConfig tmp_cfg{};
    tmp_cfg.path = tmp.c_str();
    tmp_cfg.journal_mode = journal_mode_.c_str();
    tmp_cfg.create = false;
    hoststore::db::DbHandle dst{};
    s = hoststore::db::db_open(tmp_cfg, &dst);
    if (is_ok(s)) {
        s = bootstrap(dst, &imported.migration);
        if (is_ok(s)) {
            s = hoststore::db::db_count_rows(dst, hoststore::db::kPromptsTable, &imported.prompts_migrated);
        }
        Status cs = hoststore::db::db_close(&dst);
        if (is_ok(s)) s = cs;
    }
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("import", "schema upgrade of %s failed: %s", name.c_str(), describe_status(s).c_str());
        remove_database_files(tmp);
        return s;
    }

    s = fs_ops::rename_no_replace(tmp, target);
    if (!is_ok(s)) {
        remove_database_files(tmp);
        return import_status(s);
    }

    s = place_aside(source, source + kMigratedSuffix, &imported.marked_path);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_WARN("import", "imported %s but could not mark it as migrated (errno %u)", source.c_str(), s.aux);
    }

    HOSTSTORE_LOG_INFO("import", "imported %s to %s (%lld prompts, backup %s)", source.c_str(), target.c_str(),
                       static_cast<long long>(imported.prompts_migrated), backup.c_str());
    report->migrated.push_back(std::move(imported));
    return ok_status();
}

Status LegacyFileImporter::import_plain_file(const std::string& source, const std::string& target,
                                             ImportReport* report) noexcept {
    const std::string name = fs_ops::path_filename(source);

    if (fs_ops::path_exists(target)) {
        report->skipped.push_back(SkippedFile{name, "Already exists in data directory"});
        return ok_status();
    }

    ImportedFile imported{};
    imported.file = name;
    imported.old_path = source;
    imported.new_path = target;

    const std::string tmp = target + kImportTempSuffix;
    Status s = fs_ops::remove_file(tmp);
    if (is_ok(s)) {
        s = fs_ops::copy_file_contents(source.c_str(), tmp.c_str(), nullptr);
    }
    if (is_ok(s)) {
        s = fs_ops::rename_no_replace(tmp, target);
        if (!is_ok(s)) {
            Status rs = fs_ops::remove_file(tmp);
            if (!is_ok(rs)) {
                HOSTSTORE_LOG_WARN("import", "cannot remove %s (errno %u)", tmp.c_str(), rs.aux);
            }
        }
    }
    if (!is_ok(s)) {
        return import_status(s);
    }

    std::string backups;
    s = dirs_.subdir(storage::DataSubdir::Backups, true, &backups);
    if (is_ok(s)) {
        imported.backup_path = fs_ops::path_join(backups, name + kBackupInfix + local_backup_stamp());
        s = fs_ops::copy_file_contents(source.c_str(), imported.backup_path.c_str(), nullptr);
    }
    if (!is_ok(s)) {
        HOSTSTORE_LOG_WARN("import", "copied %s but its backup failed: %s", name.c_str(), describe_status(s).c_str());
        imported.backup_path.clear();
    }

    s = place_aside(source, source + kMigratedSuffix, &imported.marked_path);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_WARN("import", "imported %s but could not mark it as migrated (errno %u)", source.c_str(), s.aux);
    }

    HOSTSTORE_LOG_INFO("import", "copied %s to %s", source.c_str(), target.c_str());
    report->migrated.push_back(std::move(imported));
    return ok_status();
}

} // namespace hoststore::migrate
