#include "hoststore/storage/fs_ops.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace hoststore::storage {

using namespace hoststore::core;
namespace fs = std::filesystem;

// ========================================================================
// Internal Helpers
// ========================================================================

static constexpr const char* kProbeFileName = ".pm_write_test";
static constexpr size_t kCopyChunk = 64 * 1024;

static std::string strip_trailing_separator(std::string p) {
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    return p;
}

static Status errno_status(int err) noexcept {
    return status_from_errno(StatusDomain::Core, err);
}

static Status write_all(int fd, const char* data, size_t len) noexcept {
    size_t written = 0;
    while (written < len) {
        ssize_t n = write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_status(errno);
        }
        written += static_cast<size_t>(n);
    }
    return ok_status();
}

// ========================================================================
// Path helpers
// ========================================================================

bool path_is_absolute(const std::string& path) {
    return !path.empty() && path.front() == '/';
}

std::string path_absolute(const std::string& path, const std::string& base) {
    fs::path p(path);
    if (!p.is_absolute()) {
        p = fs::path(base) / p;
    }
    return strip_trailing_separator(p.lexically_normal().string());
}

std::string path_resolve(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        return strip_trailing_separator(fs::path(path).lexically_normal().string());
    }
    return strip_trailing_separator(p.lexically_normal().string());
}

std::string path_parent(const std::string& path) {
    return fs::path(strip_trailing_separator(path)).parent_path().string();
}

std::string path_filename(const std::string& path) {
    return fs::path(strip_trailing_separator(path)).filename().string();
}

std::string path_join(const std::string& base, const std::string& leaf) {
    return (fs::path(base) / leaf).string();
}

std::string path_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return ext;
}

bool path_is_within(const std::string& child, const std::string& dir) {
    fs::path c(path_resolve(child));
    fs::path d(path_resolve(dir));
    auto mm = std::mismatch(d.begin(), d.end(), c.begin(), c.end());
    return mm.first == d.end();
}

// ========================================================================
// Filesystem queries
// ========================================================================

bool path_exists(const std::string& path) noexcept {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) noexcept {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string& path) noexcept {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

Status file_size(const std::string& path, u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return errno_status(errno);
    }
    *out = static_cast<u64>(st.st_size);
    return ok_status();
}

// ========================================================================
// Mutations
// ========================================================================

Status make_directories(const std::string& path) noexcept {
    if (path.empty()) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    std::error_code ec;
    fs::create_directories(fs::path(path), ec);
    if (ec) {
        return errno_status(ec.value());
    }
    if (!is_directory(path)) {
        return make_status(StatusDomain::Core, StatusCode::Conflict, ENOTDIR);
    }
    return ok_status();
}

Status remove_file(const std::string& path) noexcept {
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        return errno_status(errno);
    }
    return ok_status();
}

Status rename_path(const std::string& from, const std::string& to) noexcept {
    if (rename(from.c_str(), to.c_str()) != 0) {
        return errno_status(errno);
    }
    return ok_status();
}

Status rename_no_replace(const std::string& from, const std::string& to) noexcept {
    if (renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return ok_status();
    }
    if (errno != EINVAL && errno != ENOSYS) {
        return errno_status(errno);
    }

    // Filesystem without RENAME_NOREPLACE: a hard link is still exclusive.
    if (link(from.c_str(), to.c_str()) == 0) {
        if (unlink(from.c_str()) != 0) {
            return errno_status(errno);
        }
        return ok_status();
    }
    if (errno == EEXIST) {
        return errno_status(errno);
    }

    if (path_exists(to)) {
        return make_status(StatusDomain::Core, StatusCode::Conflict, EEXIST);
    }
    return rename_path(from, to);
}

Status copy_file_contents(const char* src, const char* dst, u64* bytes_copied) noexcept {
    if (!src || !dst) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    int in = open(src, O_RDONLY | O_CLOEXEC);
    if (in < 0) {
        return errno_status(errno);
    }

    struct stat st;
    if (fstat(in, &st) != 0) {
        Status s = errno_status(errno);
        close(in);
        return s;
    }

    int out = open(dst, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, st.st_mode & 0777);
    if (out < 0) {
        Status s = errno_status(errno);
        close(in);
        return s;
    }

    char buf[kCopyChunk];
    u64 total = 0;
    Status s = ok_status();
    for (;;) {
        ssize_t n = read(in, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            s = errno_status(errno);
            break;
        }
        if (n == 0) break;  // EOF
        s = write_all(out, buf, static_cast<size_t>(n));
        if (!is_ok(s)) break;
        total += static_cast<u64>(n);
    }

    if (is_ok(s) && fsync(out) != 0) {
        s = errno_status(errno);
    }
    if (is_ok(s)) {
        struct timespec times[2] = {st.st_atim, st.st_mtim};
        // Timestamps are best effort; the bytes are what matter.
        (void)futimens(out, times);
    }

    close(in);
    if (close(out) != 0 && is_ok(s)) {
        s = errno_status(errno);
    }

    if (!is_ok(s)) {
        unlink(dst);  // Cleanup partial write
        return s;
    }

    if (bytes_copied) {
        *bytes_copied = total;
    }
    return ok_status();
}

Status write_file_atomic(const std::string& path, const std::string& data) noexcept {
    // Unique per writer so concurrent saves never share a temp file.
    std::string tmp = path + ".tmp.XXXXXX";
    int fd = mkostemp(tmp.data(), O_CLOEXEC);
    if (fd < 0) {
        return errno_status(errno);
    }

    Status s = ok_status();
    if (fchmod(fd, 0644) != 0) {
        s = errno_status(errno);
    }
    if (is_ok(s)) {
        s = write_all(fd, data.data(), data.size());
    }
    if (is_ok(s) && fsync(fd) != 0) {
        s = errno_status(errno);
    }
    if (close(fd) != 0 && is_ok(s)) {
        s = errno_status(errno);
    }
    if (!is_ok(s)) {
        unlink(tmp.c_str());
        return s;
    }

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        s = errno_status(errno);
        unlink(tmp.c_str());
        return s;
    }
    return ok_status();
}

Status read_file(const std::string& path, std::string* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return errno_status(errno);
    }

    std::string data;
    char buf[8192];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            Status s = errno_status(errno);
            close(fd);
            return s;
        }
        if (n == 0) break;
        data.append(buf, static_cast<size_t>(n));
    }
    close(fd);

    *out = std::move(data);
    return ok_status();
}

Status probe_writable(const std::string& dir) noexcept {
    Status s = make_directories(dir);
    if (!is_ok(s)) {
        return s;
    }

    std::string probe = path_join(dir, kProbeFileName);
    int fd = open(probe.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_status(errno);
    }
    s = write_all(fd, "test", 4);
    close(fd);
    if (unlink(probe.c_str()) != 0 && is_ok(s)) {
        s = errno_status(errno);
    }
    return s;
}

Status fsync_directory(const std::string& dir) noexcept {
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return errno_status(errno);
    }
    Status s = ok_status();
    if (fsync(fd) != 0) {
        s = errno_status(errno);
    }
    close(fd);
    return s;
}

} // namespace hoststore::storage
