#include "hoststore/storage/data_dir.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/core/log.hpp"

#include <errno.h>
#include <filesystem>
#include <sys/statvfs.h>
#include <utility>

namespace hoststore::storage {

using namespace hoststore::core;
namespace fs = std::filesystem;

namespace {

constexpr DataSubdir kAllSubdirs[] = {
    DataSubdir::Backups,
    DataSubdir::Exports,
    DataSubdir::Logs,
    DataSubdir::Cache,
};

std::string readme_text() {
    std::string text =
        "PromptManager data directory\n"
        "============================\n"
        "\n"
        "Everything the PromptManager extension stores lives here.\n"
        "\n"
        "Layout:\n"
        "- prompts.db: prompt database\n"
        "- settings.json: settings, including the active database location\n"
        "- backups/: automatic and manual backups\n"
        "- exports/: exported prompts\n"
        "- logs/: log files\n"
        "- cache/: disposable cache files\n"
        "\n"
        "Files found in the host root by older releases are imported here and\n"
        "renamed with a .v1_migrated suffix.\n"
        "\n"
        "Generated: ";
    text += utc_now_iso8601();
    text += "\n";
    return text;
}

// Custom roots must be absolute and must not collapse onto something the host
// owns: the filesystem root, ".." tricks, or the extension install tree.
Status check_plausible_root(const std::string& dir, const HostRoot& root) {
    if (!path_is_absolute(dir)) {
        return make_status(StatusDomain::Layout, StatusCode::Invalid);
    }
    for (const auto& part : fs::path(dir)) {
        if (part == "..") {
            return make_status(StatusDomain::Layout, StatusCode::Invalid);
        }
    }
    std::string normalized = path_absolute(dir, "/");
    if (normalized == "/") {
        return make_status(StatusDomain::Layout, StatusCode::Invalid);
    }
    if (path_exists(normalized) && !is_directory(normalized)) {
        return make_status(StatusDomain::Layout, StatusCode::Invalid, ENOTDIR);
    }
    if (!root.path.empty() && path_is_within(normalized, path_join(root.path, kCustomNodesDirName))) {
        return make_status(StatusDomain::Layout, StatusCode::Invalid);
    }
    return ok_status();
}

} // namespace

const char* data_subdir_name(DataSubdir which) noexcept {
    switch (which) {
    case DataSubdir::Backups: return "backups";
    case DataSubdir::Exports: return "exports";
    case DataSubdir::Logs: return "logs";
    case DataSubdir::Cache: return "cache";
    }
    return "";
}

DataDirectoryManager::DataDirectoryManager(HostRoot root, const Config& cfg)
    : root_(std::move(root)) {
    if (!cfg.user_dir_override.empty()) {
        std::string base = path_absolute(cfg.user_dir_override, cfg.cwd);
        canonical_dir_ = path_join(path_join(base, "default"), cfg.extension_name);
    } else {
        std::string user = path_join(path_join(root_.path, kUserDirName), "default");
        canonical_dir_ = path_join(user, cfg.extension_name);
    }
}

Status DataDirectoryManager::data_dir(bool create, std::string* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Layout, StatusCode::Invalid);
    }
    if (create) {
        Status s = make_directories(path());
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("layout", "cannot create %s: %s", path().c_str(), status_code_name(s.code));
            return make_status(StatusDomain::Layout, s.code, s.aux);
        }
    }
    *out = path();
    return ok_status();
}

Status DataDirectoryManager::set_custom_root(const std::string& dir) noexcept {
    if (dir.empty()) {
        custom_root_.clear();
        HOSTSTORE_LOG_INFO("layout", "data directory reset to %s", canonical_dir_.c_str());
        return ok_status();
    }

    Status s = check_plausible_root(dir, root_);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("layout", "rejected custom data directory %s", dir.c_str());
        return s;
    }

    std::string normalized = path_absolute(dir, "/");
    s = probe_writable(normalized);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("layout", "no write permission for %s", normalized.c_str());
        return make_status(StatusDomain::Layout, s.code, s.aux);
    }

    custom_root_ = std::move(normalized);
    HOSTSTORE_LOG_INFO("layout", "custom data directory %s", custom_root_.c_str());
    return ok_status();
}

Status DataDirectoryManager::subdir(DataSubdir which, bool create, std::string* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Layout, StatusCode::Invalid);
    }
    std::string dir = path_join(path(), data_subdir_name(which));
    if (create) {
        Status s = make_directories(dir);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Layout, s.code, s.aux);
        }
    }
    *out = std::move(dir);
    return ok_status();
}

Status DataDirectoryManager::ensure_structure() const noexcept {
    std::string base;
    Status s = data_dir(true, &base);
    if (!is_ok(s)) {
        return s;
    }

    for (DataSubdir which : kAllSubdirs) {
        std::string dir;
        s = subdir(which, true, &dir);
        if (!is_ok(s)) {
            return s;
        }
    }

    std::string readme = path_join(base, kReadmeFileName);
    if (!path_exists(readme)) {
        s = write_file_atomic(readme, readme_text());
        if (!is_ok(s)) {
            return make_status(StatusDomain::Layout, s.code, s.aux);
        }
    }
    return ok_status();
}

std::string DataDirectoryManager::default_database_path() const {
    return path_join(path(), kDatabaseFileName);
}

std::string DataDirectoryManager::settings_path() const {
    return path_join(path(), kSettingsFileName);
}

Status DataDirectoryManager::directory_info(const std::string& database_path, DirectoryInfo* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Layout, StatusCode::Invalid);
    }

    DirectoryInfo info{};
    info.path = path();
    info.is_custom = is_custom();
    info.exists = is_directory(info.path);
    info.database_path = database_path;

    if (info.exists) {
        info.writable = is_ok(probe_writable(info.path));

        std::error_code ec;
        fs::recursive_directory_iterator it(info.path, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code fec;
            if (!it->is_regular_file(fec) || fec) continue;
            u64 size = it->file_size(fec);
            if (fec) continue;
            info.total_size += size;
            ++info.file_count;
        }
        if (ec) {
            HOSTSTORE_LOG_WARN("layout", "walking %s stopped early: %s", info.path.c_str(), ec.message().c_str());
        }

        struct statvfs vfs;
        if (statvfs(info.path.c_str(), &vfs) == 0) {
            info.free_space = static_cast<u64>(vfs.f_bavail) * static_cast<u64>(vfs.f_frsize);
        }
    }

    *out = std::move(info);
    return ok_status();
}

} // namespace hoststore::storage
