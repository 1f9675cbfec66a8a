#include "hoststore/settings/database_locator.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/core/log.hpp"

namespace hoststore::settings {

using namespace hoststore::core;

namespace {

DatabaseLocation default_location(const std::string& path) {
    return DatabaseLocation{path, false};
}

// Writable directory that already exists; load() must not create anything.
bool directory_usable(const std::string& dir) {
    return storage::is_directory(dir) && is_ok(storage::probe_writable(dir));
}

} // namespace

DatabaseLocator::DatabaseLocator(const storage::DataDirectoryManager& dirs, const SettingsStore& store)
    : dirs_(dirs), store_(store) {}

Status DatabaseLocator::persist(const DatabaseLocation& loc) noexcept {
    const std::string def = default_path();
    if (!loc.is_custom && loc.path != def) {
        return make_status(StatusDomain::Settings, StatusCode::Invalid);
    }

    SettingsDocument doc = store_.load();
    doc[kKeyDatabasePath] = loc.path;
    doc[kKeyDatabasePathCustom] = loc.is_custom;
    return store_.save(doc);
}

Status DatabaseLocator::load(DatabaseLocation* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Settings, StatusCode::Invalid);
    }

    const std::string def = default_path();
    SettingsDocument doc = store_.load();

    auto it = doc.find(kKeyDatabasePath);
    if (it == doc.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        if (it != doc.end() && !it->is_string()) {
            HOSTSTORE_LOG_WARN("settings", "%s is not a string; using the default database", kKeyDatabasePath);
        }
        *out = default_location(def);
        return ok_status();
    }

    const std::string stored = it->get<std::string>();
    bool is_custom = false;
    auto cit = doc.find(kKeyDatabasePathCustom);
    if (cit != doc.end() && cit->is_boolean()) {
        is_custom = cit->get<bool>();
    }

    const std::string resolved = storage::path_resolve(storage::path_absolute(stored, dirs_.path()));
    const std::string resolved_default = storage::path_resolve(def);

    // Default spelled differently or wrongly flagged custom.
    if (resolved == resolved_default) {
        if (stored != def || is_custom) {
            Status s = persist(default_location(def));
            if (!is_ok(s)) {
                HOSTSTORE_LOG_ERROR("settings", "cannot normalize database path: %s", status_code_name(s.code));
            }
        }
        *out = default_location(def);
        return ok_status();
    }

    // The pre-migration location in the host root is always a migration
    // candidate, even when flagged custom.
    const std::string legacy_root_db =
        storage::path_resolve(storage::path_join(dirs_.host_root().path, storage::kDatabaseFileName));
    const bool same_as_legacy = resolved == legacy_root_db;
    if (same_as_legacy || (!is_custom && !storage::path_is_within(resolved, dirs_.path()))) {
        if (same_as_legacy && is_custom) {
            HOSTSTORE_LOG_WARN("settings", "custom database path %s is the legacy host-root location; importing it",
                               resolved.c_str());
        } else {
            HOSTSTORE_LOG_WARN("settings", "database %s is outside the data directory; importing it to %s",
                               resolved.c_str(), def.c_str());
        }

        if (storage::path_exists(resolved) && handoff_) {
            Status s = handoff_(resolved, def);
            if (!is_ok(s)) {
                // Settings stay as they are so the next load retries the import.
                HOSTSTORE_LOG_ERROR("settings", "import of %s failed: %s/%s", resolved.c_str(),
                                    status_domain_name(s.domain), status_code_name(s.code));
                *out = default_location(def);
                return ok_status();
            }
        }

        Status s = persist(default_location(def));
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("settings", "cannot persist default database path: %s", status_code_name(s.code));
        }
        *out = default_location(def);
        return ok_status();
    }

    if (!directory_usable(storage::path_parent(resolved))) {
        HOSTSTORE_LOG_WARN("settings", "directory of custom database %s is not writable; using %s",
                           resolved.c_str(), def.c_str());
        *out = default_location(def);
        return ok_status();
    }

    DatabaseLocation loc{resolved, true};
    if (!is_custom || stored != resolved) {
        Status s = persist(loc);
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("settings", "cannot normalize database path: %s", status_code_name(s.code));
        }
    }
    *out = std::move(loc);
    return ok_status();
}

Status DatabaseLocator::set_custom_database_path(const std::string& path, DatabaseLocation* out) noexcept {
    const std::string def = default_path();

    if (path.empty()) {
        Status s = persist(default_location(def));
        if (!is_ok(s)) {
            return s;
        }
        if (out) *out = default_location(def);
        return ok_status();
    }

    std::string resolved = storage::path_resolve(storage::path_absolute(path, dirs_.path()));
    if (storage::is_directory(resolved)) {
        resolved = storage::path_join(resolved, storage::kDatabaseFileName);
    }

    DatabaseLocation loc{};
    if (resolved == storage::path_resolve(def)) {
        loc = default_location(def);
    } else {
        Status s = storage::probe_writable(storage::path_parent(resolved));
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("settings", "database directory for %s is not writable", resolved.c_str());
            return make_status(StatusDomain::Settings, s.code, s.aux);
        }
        loc = DatabaseLocation{resolved, true};
    }

    Status s = persist(loc);
    if (!is_ok(s)) {
        return s;
    }
    HOSTSTORE_LOG_INFO("settings", "database path set to %s%s", loc.path.c_str(), loc.is_custom ? " (custom)" : "");
    if (out) *out = std::move(loc);
    return ok_status();
}

} // namespace hoststore::settings
