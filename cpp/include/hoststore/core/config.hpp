#pragma once

#include <string>

#include "hoststore/core/errors.hpp"
#include "hoststore/core/log.hpp"
#include "hoststore/core/types.hpp"

namespace hoststore::core {

    inline constexpr const char* kEnvHostRoot = "COMFYUI_PATH";
    inline constexpr const char* kEnvUserDir = "COMFYUI_USER_DIR";
    inline constexpr const char* kEnvLogLevel = "HOSTSTORE_LOG_LEVEL";
    inline constexpr const char* kEnvJournalMode = "HOSTSTORE_DB_JOURNAL_MODE";

    inline constexpr const char* kDefaultExtensionName = "PromptManager";

    // How root discovery treats symlinks in the install path.
    enum class ScanStrategy : u8 {
        PreferSymlink = 0,   // unresolved scan first, resolved scan second
        PreserveSymlink = 1, // never collapse symlinks
        ResolveAll = 2,      // collapse symlinks before scanning
    };

    struct Config {
        std::string extension_name{kDefaultExtensionName};
        std::string install_path;      // where the host loaded the extension from, symlinks intact
        std::string cwd;               // working directory used by the last-resort heuristic
        std::string root_override;     // COMFYUI_PATH
        std::string user_dir_override; // COMFYUI_USER_DIR
        ScanStrategy strategy{ScanStrategy::PreferSymlink};
        std::string journal_mode{"WAL"};
        LogLevel log_level{LogLevel::Warn};
    };

    // Fills *out from the process environment. install_path may be null, in which
    // case discovery starts from the working directory.
    [[nodiscard]] Status config_from_env(const char* install_path, Config* out) noexcept;

    // Applies the configured log level process-wide.
    void config_apply_logging(const Config& cfg) noexcept;

} // namespace hoststore::core
