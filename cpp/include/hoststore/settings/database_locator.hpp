#pragma once

#include <functional>
#include <string>
#include <utility>

#include "hoststore/core/errors.hpp"
#include "hoststore/settings/settings_store.hpp"
#include "hoststore/storage/data_dir.hpp"

namespace hoststore::settings {

    struct DatabaseLocation {
        std::string path;
        bool is_custom{false};
    };

    // Brings a database found at a legacy location under management at target.
    using LegacyHandoff = std::function<hoststore::core::Status(const std::string& legacy_path,
                                                                const std::string& target)>;

    // Turns the settings document into the active database location and keeps
    // databasePath / databasePathCustom consistent: a non-custom document always
    // names the canonical default.
    class DatabaseLocator {
    public:
        DatabaseLocator(const storage::DataDirectoryManager& dirs, const SettingsStore& store);

        void set_legacy_handoff(LegacyHandoff handoff) { handoff_ = std::move(handoff); }

        [[nodiscard]] std::string default_path() const { return dirs_.default_database_path(); }

        // Loads and normalizes; may rewrite the settings document or run the
        // legacy hand-off. Falls back to the default when a custom location is
        // unusable.
        [[nodiscard]] hoststore::core::Status load(DatabaseLocation* out) noexcept;

        // Directories get prompts.db appended; the default is stored as
        // non-custom, anything else as custom after a writability probe of its
        // directory. Empty resets to the default.
        [[nodiscard]] hoststore::core::Status set_custom_database_path(const std::string& path,
                                                                       DatabaseLocation* out) noexcept;

        // Writes the location into the document, keeping every other key.
        [[nodiscard]] hoststore::core::Status persist(const DatabaseLocation& loc) noexcept;

    private:
        const storage::DataDirectoryManager& dirs_;
        const SettingsStore& store_;
        LegacyHandoff handoff_;
    };

} // namespace hoststore::settings
