#include <gtest/gtest.h>

#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "hoststore/storage/fs_ops.hpp"
#include "test_support.hpp"

using namespace hoststore::storage;
using namespace hoststore::core;
using hoststore::test::TempDir;

//=============================================================================
// Path helpers
//=============================================================================

TEST(FsPaths, Absolute) {
    EXPECT_EQ(path_absolute("data/db", "/base"), "/base/data/db");
    EXPECT_EQ(path_absolute("/x/./y/../z/", "/base"), "/x/z");
    EXPECT_EQ(path_absolute("../up", "/base/inner"), "/base/up");
    EXPECT_TRUE(path_is_absolute("/a"));
    EXPECT_FALSE(path_is_absolute("a"));
    EXPECT_FALSE(path_is_absolute(""));
}

TEST(FsPaths, Components) {
    EXPECT_EQ(path_parent("/a/b/c.db"), "/a/b");
    EXPECT_EQ(path_parent("/a/b/"), "/a");
    EXPECT_EQ(path_filename("/a/b/c.db"), "c.db");
    EXPECT_EQ(path_join("/a", "b"), "/a/b");
    EXPECT_EQ(path_extension("/img/out.PNG"), "PNG");
    EXPECT_EQ(path_extension("/img/noext"), "");
}

TEST(FsPaths, Within) {
    TempDir tmp;
    hoststore::test::make_dirs(tmp.sub("a/b"));
    EXPECT_TRUE(path_is_within(tmp.sub("a/b"), tmp.sub("a")));
    EXPECT_TRUE(path_is_within(tmp.sub("a"), tmp.sub("a")));
    EXPECT_TRUE(path_is_within(tmp.sub("a/b/not_yet"), tmp.sub("a")));
    EXPECT_FALSE(path_is_within(tmp.sub("ab"), tmp.sub("a")));
    EXPECT_FALSE(path_is_within(tmp.sub("a"), tmp.sub("a/b")));
}

TEST(FsPaths, WithinFollowsSymlinks) {
    TempDir tmp;
    hoststore::test::make_dirs(tmp.sub("real/inner"));
    ASSERT_EQ(symlink(tmp.sub("real").c_str(), tmp.sub("link").c_str()), 0);
    EXPECT_TRUE(path_is_within(tmp.sub("link/inner"), tmp.sub("real")));
    EXPECT_EQ(path_resolve(tmp.sub("link/inner")), path_resolve(tmp.sub("real/inner")));
}

//=============================================================================
// Queries and mutations
//=============================================================================

TEST(FsOps, Queries) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("f"), "12345");
    EXPECT_TRUE(path_exists(tmp.sub("f")));
    EXPECT_TRUE(is_regular_file(tmp.sub("f")));
    EXPECT_FALSE(is_directory(tmp.sub("f")));
    EXPECT_TRUE(is_directory(tmp.path()));
    EXPECT_FALSE(path_exists(tmp.sub("missing")));

    u64 size = 0;
    ASSERT_TRUE(is_ok(file_size(tmp.sub("f"), &size)));
    EXPECT_EQ(size, 5u);
    EXPECT_EQ(file_size(tmp.sub("missing"), &size).code, StatusCode::NotFound);
}

TEST(FsOps, MakeDirectoriesIdempotent) {
    TempDir tmp;
    EXPECT_TRUE(is_ok(make_directories(tmp.sub("x/y/z"))));
    EXPECT_TRUE(is_ok(make_directories(tmp.sub("x/y/z"))));
    EXPECT_TRUE(is_directory(tmp.sub("x/y/z")));
}

TEST(FsOps, MakeDirectoriesOverFile) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("file"), "");
    Status s = make_directories(tmp.sub("file"));
    EXPECT_FALSE(is_ok(s));
}

TEST(FsOps, RemoveMissingIsOk) {
    TempDir tmp;
    EXPECT_TRUE(is_ok(remove_file(tmp.sub("nothing"))));
}

TEST(FsOps, RenameNoReplaceRefusesExistingTarget) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("from"), "new");
    hoststore::test::write_text(tmp.sub("to"), "old");

    Status s = rename_no_replace(tmp.sub("from"), tmp.sub("to"));
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(hoststore::test::read_text(tmp.sub("to")), "old");
    EXPECT_EQ(hoststore::test::read_text(tmp.sub("from")), "new");
}

TEST(FsOps, RenameNoReplaceMoves) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("from"), "payload");
    ASSERT_TRUE(is_ok(rename_no_replace(tmp.sub("from"), tmp.sub("to"))));
    EXPECT_FALSE(path_exists(tmp.sub("from")));
    EXPECT_EQ(hoststore::test::read_text(tmp.sub("to")), "payload");
}

TEST(FsOps, CopyKeepsBytesAndMode) {
    TempDir tmp;
    std::string data(150 * 1024, 'q');
    data[1234] = 'z';
    hoststore::test::write_text(tmp.sub("src"), data);
    ASSERT_EQ(chmod(tmp.sub("src").c_str(), 0640), 0);

    u64 copied = 0;
    ASSERT_TRUE(is_ok(copy_file_contents(tmp.sub("src").c_str(), tmp.sub("dst").c_str(), &copied)));
    EXPECT_EQ(copied, data.size());
    EXPECT_EQ(hoststore::test::read_text(tmp.sub("dst")), data);

    struct stat st;
    ASSERT_EQ(stat(tmp.sub("dst").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0640u);
}

TEST(FsOps, CopyRefusesExistingDestination) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("src"), "a");
    hoststore::test::write_text(tmp.sub("dst"), "b");
    Status s = copy_file_contents(tmp.sub("src").c_str(), tmp.sub("dst").c_str(), nullptr);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(hoststore::test::read_text(tmp.sub("dst")), "b");
}

TEST(FsOps, CopyMissingSource) {
    TempDir tmp;
    Status s = copy_file_contents(tmp.sub("none").c_str(), tmp.sub("dst").c_str(), nullptr);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_FALSE(path_exists(tmp.sub("dst")));
}

TEST(FsOps, AtomicWriteReplaces) {
    TempDir tmp;
    const std::string path = tmp.sub("settings.json");
    ASSERT_TRUE(is_ok(write_file_atomic(path, "one")));
    ASSERT_TRUE(is_ok(write_file_atomic(path, "two")));
    EXPECT_EQ(hoststore::test::read_text(path), "two");
    EXPECT_EQ(hoststore::test::dir_entries(tmp.path()), std::vector<std::string>{"settings.json"});

    std::string back;
    ASSERT_TRUE(is_ok(read_file(path, &back)));
    EXPECT_EQ(back, "two");
}

TEST(FsOps, AtomicWriteFailureRemovesTempFile) {
    TempDir tmp;
    // A directory cannot be replaced by a file, so the final rename fails.
    const std::string path = tmp.sub("settings.json");
    hoststore::test::make_dirs(path + "/inner");

    Status s = write_file_atomic(path, "payload");
    EXPECT_FALSE(is_ok(s));
    EXPECT_TRUE(is_directory(path));
    EXPECT_EQ(hoststore::test::dir_entries(tmp.path()), std::vector<std::string>{"settings.json"});

    EXPECT_FALSE(is_ok(write_file_atomic(tmp.sub("missing/settings.json"), "payload")));
    EXPECT_EQ(hoststore::test::dir_entries(tmp.path()), std::vector<std::string>{"settings.json"});
}

TEST(FsOps, ProbeWritableCreatesAndCleansUp) {
    TempDir tmp;
    ASSERT_TRUE(is_ok(probe_writable(tmp.sub("new/dir"))));
    EXPECT_TRUE(is_directory(tmp.sub("new/dir")));
    EXPECT_FALSE(path_exists(tmp.sub("new/dir/.pm_write_test")));
}

TEST(FsOps, FsyncDirectory) {
    TempDir tmp;
    EXPECT_TRUE(is_ok(fsync_directory(tmp.path())));
    EXPECT_FALSE(is_ok(fsync_directory(tmp.sub("missing"))));
}
