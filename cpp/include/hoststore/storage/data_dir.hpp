#pragma once

#include <string>

#include "hoststore/core/config.hpp"
#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"
#include "hoststore/storage/root_resolver.hpp"

namespace hoststore::storage {

    inline constexpr const char* kDatabaseFileName = "prompts.db";
    inline constexpr const char* kSettingsFileName = "settings.json";
    inline constexpr const char* kReadmeFileName = "README.txt";

    enum class DataSubdir : hoststore::core::u8 {
        Backups = 0,
        Exports = 1,
        Logs = 2,
        Cache = 3,
    };

    [[nodiscard]] const char* data_subdir_name(DataSubdir which) noexcept;

    struct DirectoryInfo {
        std::string path;
        bool is_custom{false};
        bool exists{false};
        bool writable{false};
        hoststore::core::u64 total_size{0};
        hoststore::core::u64 file_count{0};
        hoststore::core::u64 free_space{0};
        std::string database_path;
    };

    // Owns the extension's data directory: <host_root>/user/default/<extension>/,
    // or <COMFYUI_USER_DIR>/default/<extension>/, or an accepted custom root.
    class DataDirectoryManager {
    public:
        DataDirectoryManager(HostRoot root, const hoststore::core::Config& cfg);

        // Active data directory; create=true makes it (and parents) idempotently.
        [[nodiscard]] hoststore::core::Status data_dir(bool create, std::string* out) const noexcept;

        // Path of the active directory without touching the filesystem.
        [[nodiscard]] const std::string& path() const noexcept {
            return custom_root_.empty() ? canonical_dir_ : custom_root_;
        }

        [[nodiscard]] const std::string& canonical_dir() const noexcept { return canonical_dir_; }
        [[nodiscard]] bool is_custom() const noexcept { return !custom_root_.empty(); }
        [[nodiscard]] const HostRoot& host_root() const noexcept { return root_; }

        // Accepts an absolute, plausible, writable directory as the data root.
        // Empty resets to the canonical directory. Rejections leave state untouched:
        // Invalid for relative/implausible paths, the probe's status when unwritable.
        [[nodiscard]] hoststore::core::Status set_custom_root(const std::string& dir) noexcept;

        [[nodiscard]] hoststore::core::Status subdir(DataSubdir which, bool create, std::string* out) const noexcept;

        // Creates every standard subdirectory and a README.txt when absent.
        [[nodiscard]] hoststore::core::Status ensure_structure() const noexcept;

        [[nodiscard]] std::string default_database_path() const;
        [[nodiscard]] std::string settings_path() const;

        [[nodiscard]] hoststore::core::Status directory_info(const std::string& database_path,
                                                             DirectoryInfo* out) const noexcept;

    private:
        HostRoot root_;
        std::string canonical_dir_;
        std::string custom_root_;
    };

} // namespace hoststore::storage
