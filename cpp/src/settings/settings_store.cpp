#include "hoststore/settings/settings_store.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/core/log.hpp"

#include <utility>

namespace hoststore::settings {

using namespace hoststore::core;

SettingsStore::SettingsStore(std::string path)
    : path_(std::move(path)) {}

SettingsDocument SettingsStore::load() const noexcept {
    if (!storage::path_exists(path_)) {
        return SettingsDocument::object();
    }

    std::string text;
    Status s = storage::read_file(path_, &text);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("settings", "cannot read %s: %s (errno %u)", path_.c_str(),
                            status_code_name(s.code), s.aux);
        return SettingsDocument::object();
    }

    SettingsDocument doc = SettingsDocument::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        HOSTSTORE_LOG_ERROR("settings", "%s is not valid JSON; using empty settings", path_.c_str());
        return SettingsDocument::object();
    }
    if (!doc.is_object()) {
        HOSTSTORE_LOG_ERROR("settings", "%s holds a JSON %s, expected an object; using empty settings",
                            path_.c_str(), doc.type_name());
        return SettingsDocument::object();
    }
    return doc;
}

Status SettingsStore::save(const SettingsDocument& doc) const noexcept {
    if (!doc.is_object()) {
        return make_status(StatusDomain::Settings, StatusCode::Invalid);
    }

    std::string dir = storage::path_parent(path_);
    Status s = storage::make_directories(dir);
    if (!is_ok(s)) {
        return make_status(StatusDomain::Settings, s.code, s.aux);
    }

    std::string text = doc.dump(2, ' ', false, SettingsDocument::error_handler_t::replace);
    text.push_back('\n');

    s = storage::write_file_atomic(path_, text);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("settings", "cannot write %s: %s (errno %u)", path_.c_str(),
                            status_code_name(s.code), s.aux);
        return make_status(StatusDomain::Settings, s.code, s.aux);
    }

    s = storage::fsync_directory(dir);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_DEBUG("settings", "fsync of %s failed (errno %u)", dir.c_str(), s.aux);
    }
    return ok_status();
}

} // namespace hoststore::settings
