#include "hoststore/core/config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <unistd.h>
#include <utility>

namespace hoststore::core {

namespace {
    [[nodiscard]] const char* env_or_null(const char* name) noexcept {
        const char* v = std::getenv(name);
        if (!v || v[0] == '\0') {
            return nullptr;
        }
        return v;
    }
}

Status config_from_env(const char* install_path, Config* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    Config cfg{};

    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == nullptr) {
        return status_from_errno(StatusDomain::Core, errno);
    }
    cfg.cwd = buf;
    cfg.install_path = (install_path && install_path[0] != '\0') ? install_path : cfg.cwd;

    if (const char* v = env_or_null(kEnvHostRoot)) {
        cfg.root_override = v;
    }
    if (const char* v = env_or_null(kEnvUserDir)) {
        cfg.user_dir_override = v;
    }
    if (const char* v = env_or_null(kEnvJournalMode)) {
        cfg.journal_mode = v;
    }
    if (const char* v = env_or_null(kEnvLogLevel)) {
        LogLevel level{};
        if (parse_log_level(v, &level)) {
            cfg.log_level = level;
        } else {
            HOSTSTORE_LOG_WARN("config", "ignoring unknown %s=%s", kEnvLogLevel, v);
        }
    }

    *out = std::move(cfg);
    return ok_status();
}

void config_apply_logging(const Config& cfg) noexcept {
    set_log_level(cfg.log_level);
}

} // namespace hoststore::core
