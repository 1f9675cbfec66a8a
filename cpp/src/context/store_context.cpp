#include "hoststore/context/store_context.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/core/log.hpp"

#include <new>
#include <utility>

namespace hoststore::context {

using namespace hoststore::core;

namespace {

// Folds any write-ahead log into the main file so a byte copy carries every
// committed transaction. Nothing to do when no log is present.
Status checkpoint_wal(const std::string& path, const std::string& journal_mode) noexcept {
    if (!storage::path_exists(path + storage::kWalSuffix)) {
        return ok_status();
    }

    db::DbConfig dbc{};
    dbc.path = path.c_str();
    dbc.journal_mode = journal_mode.c_str();
    dbc.create = false;
    db::DbHandle handle{};
    Status s = db::db_open(dbc, &handle);
    if (!is_ok(s)) {
        return s;
    }

    // First column is 1 when a reader or writer kept the checkpoint from finishing.
    i64 busy = 0;
    s = db::db_query_int(handle, "PRAGMA wal_checkpoint(TRUNCATE)", &busy);
    if (is_ok(s) && busy != 0) {
        HOSTSTORE_LOG_ERROR("context", "cannot checkpoint %s: database in use", path.c_str());
        s = make_status(StatusDomain::Db, StatusCode::Busy);
    }
    db::db_close(&handle);
    return s;
}

} // namespace

StoreContext::StoreContext(const Config& cfg, storage::HostRoot root)
    : cfg_(cfg),
      dirs_(std::move(root), cfg_),
      store_(dirs_.settings_path()),
      locator_(dirs_, store_),
      importer_(dirs_, cfg_.journal_mode),
      relocator_(dirs_, [this](const std::string& new_path) {
          settings::DatabaseLocation loc;
          return locator_.set_custom_database_path(new_path, &loc);
      }) {
    locator_.set_legacy_handoff([this](const std::string& legacy_path, const std::string& target) {
        migrate::ImportReport report;
        return importer_.import_database(legacy_path, target, &report);
    });
}

Status StoreContext::create(const Config& cfg, std::unique_ptr<StoreContext>* out,
                            storage::DiscoveryReport* report) noexcept {
    if (!out) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    storage::HostRoot root;
    Status s = storage::resolve_host_root(cfg, &root, report);
    if (!is_ok(s)) {
        return s;
    }
    HOSTSTORE_LOG_INFO("context", "host root %s (%s)", root.path.c_str(), storage::discovery_step_name(root.step));

    std::unique_ptr<StoreContext> ctx;
    try {
        ctx.reset(new StoreContext(cfg, std::move(root)));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Core, StatusCode::Unknown);
    }

    s = ctx->dirs_.ensure_structure();
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("context", "cannot prepare data directory %s", ctx->dirs_.path().c_str());
        return s;
    }

    *out = std::move(ctx);
    return ok_status();
}

Status StoreContext::database_location(settings::DatabaseLocation* out) noexcept {
    return locator_.load(out);
}

Status StoreContext::open_database(db::DbHandle* db, migrate::MigrationOutcome* outcome) noexcept {
    if (!db) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    settings::DatabaseLocation loc;
    Status s = locator_.load(&loc);
    if (!is_ok(s)) {
        return s;
    }
    bool restored = false;
    s = relocator_.recover(loc.path, &restored);
    if (!is_ok(s)) {
        return s;
    }
    s = storage::make_directories(storage::path_parent(loc.path));
    if (!is_ok(s)) {
        return s;
    }

    db::DbConfig dbc{};
    dbc.path = loc.path.c_str();
    dbc.journal_mode = cfg_.journal_mode.c_str();
    db::DbHandle handle{};
    s = db::db_open(dbc, &handle);
    if (!is_ok(s)) {
        return s;
    }

    s = migrate::bootstrap(handle, outcome);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("context", "cannot bootstrap %s: %s", loc.path.c_str(), db::db_errmsg(handle));
        db::db_close(&handle);
        return s;
    }

    *db = handle;
    return ok_status();
}

Status StoreContext::relocate_database(const std::string& destination, storage::RelocationResult* out) noexcept {
    settings::DatabaseLocation loc;
    Status s = locator_.load(&loc);
    if (!is_ok(s)) {
        return s;
    }
    bool restored = false;
    s = relocator_.recover(loc.path, &restored);
    if (!is_ok(s)) {
        return s;
    }
    s = checkpoint_wal(loc.path, cfg_.journal_mode);
    if (!is_ok(s)) {
        return s;
    }
    return relocator_.relocate(loc.path, destination, out);
}

Status StoreContext::set_custom_database_path(const std::string& path, settings::DatabaseLocation* out) noexcept {
    return locator_.set_custom_database_path(path, out);
}

Status StoreContext::directory_info(storage::DirectoryInfo* out) noexcept {
    settings::DatabaseLocation loc;
    Status s = locator_.load(&loc);
    if (!is_ok(s)) {
        return s;
    }
    return dirs_.directory_info(loc.path, out);
}

Status StoreContext::import_legacy(migrate::ImportReport* out) noexcept {
    return importer_.import_legacy(out);
}

Status StoreContext::scan_legacy(migrate::LegacyScan* out) const noexcept {
    return importer_.scan_legacy(out);
}

} // namespace hoststore::context
