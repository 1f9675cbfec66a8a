#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "hoststore/core/errors.hpp"

namespace hoststore::settings {

    // Arbitrary JSON object; only the two database keys below are owned here.
    using SettingsDocument = nlohmann::json;

    inline constexpr const char* kKeyDatabasePath = "databasePath";
    inline constexpr const char* kKeyDatabasePathCustom = "databasePathCustom";

    class SettingsStore {
    public:
        explicit SettingsStore(std::string path);

        [[nodiscard]] const std::string& path() const noexcept { return path_; }

        // Never fails: a missing, unreadable or corrupt file (including a
        // top-level value that is not an object) yields an empty object.
        [[nodiscard]] SettingsDocument load() const noexcept;

        // Writes a sibling temp file, fsyncs it and renames it over the document.
        [[nodiscard]] hoststore::core::Status save(const SettingsDocument& doc) const noexcept;

    private:
        std::string path_;
    };

} // namespace hoststore::settings
