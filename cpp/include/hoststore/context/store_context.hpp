#pragma once

#include <memory>
#include <string>

#include "hoststore/core/config.hpp"
#include "hoststore/core/errors.hpp"
#include "hoststore/db/db.hpp"
#include "hoststore/migrate/legacy_importer.hpp"
#include "hoststore/migrate/schema_migrator.hpp"
#include "hoststore/settings/database_locator.hpp"
#include "hoststore/settings/settings_store.hpp"
#include "hoststore/storage/data_dir.hpp"
#include "hoststore/storage/relocator.hpp"
#include "hoststore/storage/root_resolver.hpp"

namespace hoststore::context {

    // Composition root: one per process, built at startup and handed to callers.
    // Members hold references to each other, so the context never moves.
    class StoreContext {
    public:
        // Resolves the host root and lays out the data directory. On a discovery
        // failure report (optional) lists every directory examined.
        [[nodiscard]] static hoststore::core::Status create(const hoststore::core::Config& cfg,
                                                            std::unique_ptr<StoreContext>* out,
                                                            storage::DiscoveryReport* report) noexcept;

        StoreContext(const StoreContext&) = delete;
        StoreContext& operator=(const StoreContext&) = delete;

        [[nodiscard]] const hoststore::core::Config& config() const noexcept { return cfg_; }
        [[nodiscard]] const storage::HostRoot& host_root() const noexcept { return dirs_.host_root(); }
        [[nodiscard]] const storage::DataDirectoryManager& directories() const noexcept { return dirs_; }
        [[nodiscard]] const settings::SettingsStore& settings_store() const noexcept { return store_; }

        // Normalized settings; may run the legacy hand-off.
        [[nodiscard]] hoststore::core::Status database_location(settings::DatabaseLocation* out) noexcept;

        // Opens the active database and brings it to the canonical schema.
        // *db is left closed on failure; outcome may be null.
        [[nodiscard]] hoststore::core::Status open_database(hoststore::db::DbHandle* db,
                                                            migrate::MigrationOutcome* outcome) noexcept;

        // Moves the active database; the caller must not hold a connection to it.
        [[nodiscard]] hoststore::core::Status relocate_database(const std::string& destination,
                                                                storage::RelocationResult* out) noexcept;

        [[nodiscard]] hoststore::core::Status set_custom_database_path(const std::string& path,
                                                                       settings::DatabaseLocation* out) noexcept;

        [[nodiscard]] hoststore::core::Status directory_info(storage::DirectoryInfo* out) noexcept;

        [[nodiscard]] hoststore::core::Status import_legacy(migrate::ImportReport* out) noexcept;
        [[nodiscard]] hoststore::core::Status scan_legacy(migrate::LegacyScan* out) const noexcept;

        void set_relocate_options(const storage::RelocateOptions& opts) noexcept { relocator_.set_options(opts); }

    private:
        StoreContext(const hoststore::core::Config& cfg, storage::HostRoot root);

        hoststore::core::Config cfg_;
        storage::DataDirectoryManager dirs_;
        settings::SettingsStore store_;
        settings::DatabaseLocator locator_;
        migrate::LegacyFileImporter importer_;
        storage::AtomicRelocator relocator_;
    };

} // namespace hoststore::context
