#pragma once

#include <string>
#include <vector>

#include "hoststore/core/config.hpp"
#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"

namespace hoststore::storage {

    // Which discovery step produced the root.
    enum class DiscoveryStep : hoststore::core::u8 {
        EnvOverride = 0,
        CustomNodesScan = 1,          // install path chain, symlinks intact
        ResolvedCustomNodesScan = 2,  // install path chain after realpath
        MarkerScan = 3,
        WorkingDirectory = 4,         // cwd holds both user/ and custom_nodes/
        CustomNodesWithUserDir = 5,   // custom_nodes ancestor whose parent holds user/
    };

    struct HostRoot {
        std::string path;
        DiscoveryStep step{DiscoveryStep::EnvOverride};
        bool symlinks_preserved{false};
    };

    // Filled on failure (and on success, for diagnostics): every directory examined.
    struct DiscoveryReport {
        std::string start;
        std::string cwd;
        std::vector<std::string> scanned;
    };

    inline constexpr const char* kCustomNodesDirName = "custom_nodes";
    inline constexpr const char* kUserDirName = "user";

    // A directory looks like the host root when it holds every entry of one marker set.
    [[nodiscard]] bool has_root_markers(const std::string& dir) noexcept;

    // Finds the host application root. Returns {Discovery, NotFound} when no
    // candidate qualifies; report (optional) then lists the scanned paths.
    [[nodiscard]] hoststore::core::Status resolve_host_root(const hoststore::core::Config& cfg,
                                                            HostRoot* out,
                                                            DiscoveryReport* report) noexcept;

    [[nodiscard]] const char* discovery_step_name(DiscoveryStep step) noexcept;

} // namespace hoststore::storage
