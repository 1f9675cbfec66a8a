#include "hoststore/storage/relocator.hpp"
#include "hoststore/storage/hashing.hpp"
#include "hoststore/core/log.hpp"

#include <initializer_list>
#include <utility>

namespace hoststore::storage {

using namespace hoststore::core;

namespace {

Status relocate_status(Status s) {
    if (is_ok(s)) return s;
    return make_status(StatusDomain::Relocate, s.code, s.aux);
}

// Progress marker for rollback.
enum class Stage {
    BackupTaken,
    DestinationPlaced,
};

Status verify_copy(const std::string& backup, const std::string& tmp, bool verify_content) {
    u64 original_size = 0;
    u64 copied_size = 0;
    Status s = file_size(backup, &original_size);
    if (!is_ok(s)) return s;
    s = file_size(tmp, &copied_size);
    if (!is_ok(s)) return s;
    if (original_size != copied_size) {
        HOSTSTORE_LOG_ERROR("relocate", "copy size mismatch: %llu != %llu",
                            static_cast<unsigned long long>(copied_size),
                            static_cast<unsigned long long>(original_size));
        return make_status(StatusDomain::Relocate, StatusCode::Corrupt);
    }

    if (verify_content) {
        Hash256 a{};
        Hash256 b{};
        s = hash_file(backup, &a);
        if (!is_ok(s)) return s;
        s = hash_file(tmp, &b);
        if (!is_ok(s)) return s;
        if (!(a == b)) {
            HOSTSTORE_LOG_ERROR("relocate", "copy content mismatch: %s != %s",
                                hash_to_hex(b).c_str(), hash_to_hex(a).c_str());
            return make_status(StatusDomain::Relocate, StatusCode::Corrupt);
        }
    }
    return ok_status();
}

void roll_back(Stage stage, const std::string& current, const std::string& backup,
               const std::string& tmp, const std::string& destination) {
    Status s = remove_file(tmp);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("relocate", "cannot remove %s (errno %u)", tmp.c_str(), s.aux);
    }
    if (stage == Stage::DestinationPlaced) {
        s = remove_file(destination);
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("relocate", "cannot remove %s (errno %u)", destination.c_str(), s.aux);
        }
    }
    s = rename_path(backup, current);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("relocate", "cannot restore %s from %s (errno %u); the database is at the backup path",
                            current.c_str(), backup.c_str(), s.aux);
    }
}

} // namespace

AtomicRelocator::AtomicRelocator(const DataDirectoryManager& dirs, PersistLocationFn persist, RelocateOptions opts)
    : dirs_(dirs), persist_(std::move(persist)), opts_(opts) {}

Status AtomicRelocator::relocate(const std::string& current, const std::string& destination,
                                 RelocationResult* out) noexcept {
    if (!out || current.empty() || destination.empty() || !opts_.copy) {
        return make_status(StatusDomain::Relocate, StatusCode::Invalid);
    }

    const std::string source = path_absolute(current, dirs_.path());
    if (!is_regular_file(source)) {
        HOSTSTORE_LOG_ERROR("relocate", "database not found at %s", source.c_str());
        return make_status(StatusDomain::Relocate, StatusCode::NotFound);
    }

    std::string target = path_absolute(destination, dirs_.path());
    if (is_directory(target)) {
        target = path_join(target, path_filename(source));
    }

    // (1) Same file: nothing to do, nothing written.
    if (path_resolve(source) == path_resolve(target)) {
        *out = RelocationResult{source, target, false};
        return ok_status();
    }

    if (path_exists(target)) {
        HOSTSTORE_LOG_ERROR("relocate", "destination already has a database: %s", target.c_str());
        return make_status(StatusDomain::Relocate, StatusCode::Conflict);
    }

    const std::string backup = source + kMovingBackupSuffix;

    // An earlier run never finished; its backup is never overwritten.
    if (path_exists(backup)) {
        HOSTSTORE_LOG_ERROR("relocate", "backup of an unfinished move is still present: %s", backup.c_str());
        return make_status(StatusDomain::Relocate, StatusCode::Conflict);
    }

    // Commits still in the write-ahead log are not part of the main file.
    u64 wal_size = 0;
    if (is_ok(file_size(source + kWalSuffix, &wal_size)) && wal_size > 0) {
        HOSTSTORE_LOG_ERROR("relocate", "%s has %llu bytes of uncheckpointed write-ahead log", source.c_str(),
                            static_cast<unsigned long long>(wal_size));
        return make_status(StatusDomain::Relocate, StatusCode::Conflict);
    }

    Status s = make_directories(path_parent(target));
    if (!is_ok(s)) {
        return relocate_status(s);
    }

    const std::string tmp = target + kTempMoveSuffix;
    s = remove_file(tmp);
    if (!is_ok(s)) {
        return relocate_status(s);
    }

    HOSTSTORE_LOG_INFO("relocate", "moving database from %s to %s", source.c_str(), target.c_str());

    // (2) Reversible same-directory rename.
    s = rename_path(source, backup);
    if (!is_ok(s)) {
        return relocate_status(s);
    }

    // (3) Copy next to the destination.
    u64 copied = 0;
    s = opts_.copy(backup.c_str(), tmp.c_str(), &copied);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("relocate", "copy to %s failed: %s (errno %u)", tmp.c_str(),
                            status_code_name(s.code), s.aux);
        roll_back(Stage::BackupTaken, source, backup, tmp, target);
        return relocate_status(s);
    }

    // (4) Integrity check.
    s = verify_copy(backup, tmp, opts_.verify_content);
    if (!is_ok(s)) {
        roll_back(Stage::BackupTaken, source, backup, tmp, target);
        return relocate_status(s);
    }

    // (5) Publish under the final name, never replacing a newcomer.
    s = rename_no_replace(tmp, target);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("relocate", "cannot place %s: %s", target.c_str(), status_code_name(s.code));
        roll_back(Stage::BackupTaken, source, backup, tmp, target);
        return relocate_status(s);
    }
    s = fsync_directory(path_parent(target));
    if (!is_ok(s)) {
        HOSTSTORE_LOG_DEBUG("relocate", "fsync of %s failed (errno %u)", path_parent(target).c_str(), s.aux);
    }

    // (6) Persist the new location.
    if (persist_) {
        s = persist_(target);
        if (!is_ok(s)) {
            HOSTSTORE_LOG_ERROR("relocate", "cannot record new database location: %s/%s",
                                status_domain_name(s.domain), status_code_name(s.code));
            roll_back(Stage::DestinationPlaced, source, backup, tmp, target);
            return s;
        }
    }

    // (7) Only now drop the backup and the empty sidecars of the old name.
    s = remove_file(backup);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_WARN("relocate", "database moved but backup %s could not be removed (errno %u)",
                           backup.c_str(), s.aux);
    }
    for (const char* suffix : {kWalSuffix, kShmSuffix}) {
        const std::string sidecar = source + suffix;
        s = remove_file(sidecar);
        if (!is_ok(s)) {
            HOSTSTORE_LOG_WARN("relocate", "cannot remove %s (errno %u)", sidecar.c_str(), s.aux);
        }
    }

    HOSTSTORE_LOG_INFO("relocate", "database moved to %s (%llu bytes)", target.c_str(),
                       static_cast<unsigned long long>(copied));
    *out = RelocationResult{source, target, true};
    return ok_status();
}

Status AtomicRelocator::recover(const std::string& current, bool* restored) noexcept {
    if (!restored || current.empty()) {
        return make_status(StatusDomain::Relocate, StatusCode::Invalid);
    }
    *restored = false;

    const std::string source = path_absolute(current, dirs_.path());
    const std::string backup = source + kMovingBackupSuffix;
    if (!is_regular_file(backup)) {
        return ok_status();
    }
    if (path_exists(source)) {
        HOSTSTORE_LOG_WARN("relocate", "both %s and its backup exist; leaving both in place", source.c_str());
        return ok_status();
    }

    Status s = rename_no_replace(backup, source);
    if (!is_ok(s)) {
        HOSTSTORE_LOG_ERROR("relocate", "cannot restore %s from %s: %s (errno %u)", source.c_str(),
                            backup.c_str(), status_code_name(s.code), s.aux);
        return relocate_status(s);
    }
    s = fsync_directory(path_parent(source));
    if (!is_ok(s)) {
        HOSTSTORE_LOG_DEBUG("relocate", "fsync of %s failed (errno %u)", path_parent(source).c_str(), s.aux);
    }
    HOSTSTORE_LOG_WARN("relocate", "restored %s from the backup of an interrupted move", source.c_str());
    *restored = true;
    return ok_status();
}

} // namespace hoststore::storage
