#include <gtest/gtest.h>

#include <string>

#include "hoststore/storage/data_dir.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "test_support.hpp"

using namespace hoststore::storage;
using namespace hoststore::core;
using hoststore::test::TempDir;

class DataDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        host_ = tmp_.sub("ComfyUI");
        hoststore::test::make_host_tree(host_);
        root_.path = host_;
        cfg_ = hoststore::test::config_for(host_);
    }

    TempDir tmp_;
    std::string host_;
    HostRoot root_;
    Config cfg_;
};

TEST_F(DataDirTest, CanonicalLocation) {
    DataDirectoryManager dirs(root_, cfg_);
    EXPECT_EQ(dirs.path(), host_ + "/user/default/PromptManager");
    EXPECT_FALSE(dirs.is_custom());
    EXPECT_EQ(dirs.default_database_path(), host_ + "/user/default/PromptManager/prompts.db");
    EXPECT_EQ(dirs.settings_path(), host_ + "/user/default/PromptManager/settings.json");
}

TEST_F(DataDirTest, LazyAndIdempotentCreation) {
    DataDirectoryManager dirs(root_, cfg_);
    std::string out;
    ASSERT_TRUE(is_ok(dirs.data_dir(false, &out)));
    EXPECT_FALSE(is_directory(out));

    ASSERT_TRUE(is_ok(dirs.data_dir(true, &out)));
    EXPECT_TRUE(is_directory(out));
    ASSERT_TRUE(is_ok(dirs.data_dir(true, &out)));
    EXPECT_TRUE(is_directory(out));
}

TEST_F(DataDirTest, UserDirOverride) {
    cfg_.user_dir_override = tmp_.sub("users");
    DataDirectoryManager dirs(root_, cfg_);
    EXPECT_EQ(dirs.path(), tmp_.sub("users") + "/default/PromptManager");
}

TEST_F(DataDirTest, SubdirsOnDemand) {
    DataDirectoryManager dirs(root_, cfg_);
    std::string backups;
    ASSERT_TRUE(is_ok(dirs.subdir(DataSubdir::Backups, true, &backups)));
    EXPECT_EQ(backups, dirs.path() + "/backups");
    EXPECT_TRUE(is_directory(backups));

    std::string cache;
    ASSERT_TRUE(is_ok(dirs.subdir(DataSubdir::Cache, false, &cache)));
    EXPECT_FALSE(is_directory(cache));
}

TEST_F(DataDirTest, EnsureStructure) {
    DataDirectoryManager dirs(root_, cfg_);
    ASSERT_TRUE(is_ok(dirs.ensure_structure()));
    for (DataSubdir which : {DataSubdir::Backups, DataSubdir::Exports, DataSubdir::Logs, DataSubdir::Cache}) {
        EXPECT_TRUE(is_directory(dirs.path() + "/" + data_subdir_name(which))) << data_subdir_name(which);
    }
    const std::string readme = hoststore::test::read_text(dirs.path() + "/README.txt");
    EXPECT_NE(readme.find("prompts.db"), std::string::npos);
    EXPECT_NE(readme.find("Generated: "), std::string::npos);

    // A second run leaves an existing README alone.
    hoststore::test::write_text(dirs.path() + "/README.txt", "edited");
    ASSERT_TRUE(is_ok(dirs.ensure_structure()));
    EXPECT_EQ(hoststore::test::read_text(dirs.path() + "/README.txt"), "edited");
}

//=============================================================================
// Custom roots
//=============================================================================

TEST_F(DataDirTest, AcceptsWritableAbsoluteRoot) {
    DataDirectoryManager dirs(root_, cfg_);
    ASSERT_TRUE(is_ok(dirs.set_custom_root(tmp_.sub("custom/data/"))));
    EXPECT_TRUE(dirs.is_custom());
    EXPECT_EQ(dirs.path(), tmp_.sub("custom/data"));
    EXPECT_TRUE(is_directory(dirs.path()));
    EXPECT_EQ(dirs.default_database_path(), tmp_.sub("custom/data/prompts.db"));

    ASSERT_TRUE(is_ok(dirs.set_custom_root("")));
    EXPECT_FALSE(dirs.is_custom());
    EXPECT_EQ(dirs.path(), dirs.canonical_dir());
}

TEST_F(DataDirTest, RejectsRelativeRoot) {
    DataDirectoryManager dirs(root_, cfg_);
    Status s = dirs.set_custom_root("relative/data");
    EXPECT_EQ(s.domain, StatusDomain::Layout);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_FALSE(dirs.is_custom());
    EXPECT_FALSE(path_exists(tmp_.sub("relative")));
}

TEST_F(DataDirTest, RejectsImplausibleRoots) {
    DataDirectoryManager dirs(root_, cfg_);
    hoststore::test::write_text(tmp_.sub("plain_file"), "x");

    EXPECT_EQ(dirs.set_custom_root("/").code, StatusCode::Invalid);
    EXPECT_EQ(dirs.set_custom_root(tmp_.sub("a/../b")).code, StatusCode::Invalid);
    EXPECT_EQ(dirs.set_custom_root(tmp_.sub("plain_file")).code, StatusCode::Invalid);
    EXPECT_EQ(dirs.set_custom_root(host_ + "/custom_nodes/PromptManager/data").code, StatusCode::Invalid);

    EXPECT_FALSE(dirs.is_custom());
    EXPECT_FALSE(path_exists(tmp_.sub("b")));
    EXPECT_FALSE(path_exists(host_ + "/custom_nodes/PromptManager/data"));
}

TEST_F(DataDirTest, DirectoryInfo) {
    DataDirectoryManager dirs(root_, cfg_);
    ASSERT_TRUE(is_ok(dirs.ensure_structure()));
    hoststore::test::write_text(dirs.path() + "/prompts.db", std::string(1000, 'a'));
    hoststore::test::write_text(dirs.path() + "/backups/old.db", std::string(24, 'b'));
    const u64 readme_size = hoststore::test::read_text(dirs.path() + "/README.txt").size();

    DirectoryInfo info;
    ASSERT_TRUE(is_ok(dirs.directory_info(dirs.default_database_path(), &info)));
    EXPECT_EQ(info.path, dirs.path());
    EXPECT_TRUE(info.exists);
    EXPECT_TRUE(info.writable);
    EXPECT_FALSE(info.is_custom);
    EXPECT_EQ(info.file_count, 3u);
    EXPECT_EQ(info.total_size, 1024u + readme_size);
    EXPECT_GT(info.free_space, 0u);
    EXPECT_EQ(info.database_path, dirs.default_database_path());
}

TEST_F(DataDirTest, DirectoryInfoBeforeCreation) {
    DataDirectoryManager dirs(root_, cfg_);
    DirectoryInfo info;
    ASSERT_TRUE(is_ok(dirs.directory_info("", &info)));
    EXPECT_FALSE(info.exists);
    EXPECT_FALSE(info.writable);
    EXPECT_EQ(info.file_count, 0u);
    EXPECT_FALSE(is_directory(dirs.path()));
}
