#pragma once

#include <functional>
#include <string>

#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"
#include "hoststore/storage/data_dir.hpp"
#include "hoststore/storage/fs_ops.hpp"

namespace hoststore::storage {

    inline constexpr const char* kMovingBackupSuffix = ".moving_backup";
    inline constexpr const char* kTempMoveSuffix = ".tmp_move";
    inline constexpr const char* kWalSuffix = "-wal";
    inline constexpr const char* kShmSuffix = "-shm";

    // Byte copier used for the copy step; replaceable so the step can fail on demand.
    using CopyFn = hoststore::core::Status (*)(const char* src, const char* dst, u64* bytes_copied) noexcept;

    // Records the new database location once the file is in place.
    using PersistLocationFn = std::function<hoststore::core::Status(const std::string& new_path)>;

    struct RelocateOptions {
        CopyFn copy{copy_file_contents};
        bool verify_content{false};  // BLAKE3 of backup and copy must match
    };

    struct RelocationResult {
        std::string previous_path;
        std::string new_path;
        bool changed{false};
    };

    // Moves the database file with a same-directory backup and rolls back on any
    // failure between the copy and the settings update. Relative destinations are
    // taken against the data directory; an existing directory receives the
    // current file name.
    class AtomicRelocator {
    public:
        AtomicRelocator(const DataDirectoryManager& dirs, PersistLocationFn persist, RelocateOptions opts = {});

        void set_options(const RelocateOptions& opts) noexcept { opts_ = opts; }

        // NotFound when current is missing, Conflict when destination exists,
        // when a backup of an earlier run is still present or when the source
        // has an uncheckpointed write-ahead log. Corrupt when the copy does not
        // match. On any failure the file is back at current.
        [[nodiscard]] hoststore::core::Status relocate(const std::string& current,
                                                       const std::string& destination,
                                                       RelocationResult* out) noexcept;

        // Undoes a run that stopped between the backup rename and the final
        // cleanup: when current is gone and its backup is present, the backup
        // goes back to current. Sets *restored when it did so.
        [[nodiscard]] hoststore::core::Status recover(const std::string& current, bool* restored) noexcept;

    private:
        const DataDirectoryManager& dirs_;
        PersistLocationFn persist_;
        RelocateOptions opts_;
    };

} // namespace hoststore::storage
