#pragma once

#include <string>

#include "hoststore/core/errors.hpp"
#include "hoststore/core/types.hpp"

namespace hoststore::storage {

using u64 = hoststore::core::u64;

// ========================================================================
// Path helpers (lexical unless stated otherwise)
// ========================================================================

[[nodiscard]] bool path_is_absolute(const std::string& path);

// Lexically normalized absolute form; relative paths are taken against base.
[[nodiscard]] std::string path_absolute(const std::string& path, const std::string& base);

// Collapses symlinks in the existing prefix, keeps the rest lexical.
[[nodiscard]] std::string path_resolve(const std::string& path);

[[nodiscard]] std::string path_parent(const std::string& path);
[[nodiscard]] std::string path_filename(const std::string& path);
[[nodiscard]] std::string path_join(const std::string& base, const std::string& leaf);

// Extension without the dot ("png" for "a/b.png"), empty if none.
[[nodiscard]] std::string path_extension(const std::string& path);

// True when child equals dir or lies below it; both sides are resolved first.
[[nodiscard]] bool path_is_within(const std::string& child, const std::string& dir);

// ========================================================================
// Filesystem queries
// ========================================================================

// Anything at the name counts, including dangling symlinks.
[[nodiscard]] bool path_exists(const std::string& path) noexcept;
[[nodiscard]] bool is_directory(const std::string& path) noexcept;
[[nodiscard]] bool is_regular_file(const std::string& path) noexcept;

[[nodiscard]] hoststore::core::Status file_size(const std::string& path, u64* out) noexcept;

// ========================================================================
// Mutations
// ========================================================================

[[nodiscard]] hoststore::core::Status make_directories(const std::string& path) noexcept;

// Missing files are not an error.
[[nodiscard]] hoststore::core::Status remove_file(const std::string& path) noexcept;

// rename(2); replaces an existing target.
[[nodiscard]] hoststore::core::Status rename_path(const std::string& from, const std::string& to) noexcept;

// Atomic rename that fails with Conflict instead of replacing an existing target.
[[nodiscard]] hoststore::core::Status rename_no_replace(const std::string& from, const std::string& to) noexcept;

// Copies bytes, mode and timestamps into a newly created dst (O_EXCL) and fsyncs it.
// A partially written dst is removed on failure.
[[nodiscard]] hoststore::core::Status copy_file_contents(const char* src, const char* dst, u64* bytes_copied) noexcept;

// Writes data to path through a uniquely named sibling temp file and a rename.
// Readers see either the old or the new contents; the temp file never survives a failure.
[[nodiscard]] hoststore::core::Status write_file_atomic(const std::string& path, const std::string& data) noexcept;

[[nodiscard]] hoststore::core::Status read_file(const std::string& path, std::string* out) noexcept;

// Creates dir (and parents) if needed, then creates and deletes a probe file in it.
[[nodiscard]] hoststore::core::Status probe_writable(const std::string& dir) noexcept;

hoststore::core::Status fsync_directory(const std::string& dir) noexcept;

} // namespace hoststore::storage
