#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "hoststore/settings/settings_store.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "test_support.hpp"

using namespace hoststore::settings;
using namespace hoststore::core;
using hoststore::test::TempDir;

TEST(SettingsStore, MissingFileIsEmptyObject) {
    TempDir tmp;
    SettingsStore store(tmp.sub("settings.json"));
    SettingsDocument doc = store.load();
    EXPECT_TRUE(doc.is_object());
    EXPECT_TRUE(doc.empty());
}

TEST(SettingsStore, CorruptFileIsEmptyObjectAndLogged) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("settings.json"), "{\"databasePath\": ");
    SettingsStore store(tmp.sub("settings.json"));

    hoststore::test::LogCapture capture;
    SettingsDocument doc = store.load();
    EXPECT_TRUE(doc.is_object());
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(capture.count(LogLevel::Error, "not valid JSON"), 1u);
}

TEST(SettingsStore, NonObjectIsTreatedAsCorrupt) {
    TempDir tmp;
    hoststore::test::write_text(tmp.sub("settings.json"), "[1, 2, 3]");
    SettingsStore store(tmp.sub("settings.json"));

    hoststore::test::LogCapture capture;
    SettingsDocument doc = store.load();
    EXPECT_TRUE(doc.is_object());
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(capture.count(LogLevel::Error, "expected an object"), 1u);
}

TEST(SettingsStore, SaveThenLoad) {
    TempDir tmp;
    SettingsStore store(tmp.sub("nested/dir/settings.json"));

    SettingsDocument doc = SettingsDocument::object();
    doc[kKeyDatabasePath] = "/data/prompts.db";
    doc[kKeyDatabasePathCustom] = true;
    doc["theme"] = "dark";
    doc["gallery"] = {{"columns", 4}, {"showMeta", false}};
    ASSERT_TRUE(is_ok(store.save(doc)));

    EXPECT_EQ(hoststore::test::dir_entries(tmp.sub("nested/dir")), std::vector<std::string>{"settings.json"});
    SettingsDocument back = store.load();
    EXPECT_EQ(back, doc);
    EXPECT_EQ(back["gallery"]["columns"], 4);
}

TEST(SettingsStore, SavedFileIsPrettyJson) {
    TempDir tmp;
    SettingsStore store(tmp.sub("settings.json"));
    SettingsDocument doc = {{"a", 1}};
    ASSERT_TRUE(is_ok(store.save(doc)));
    EXPECT_EQ(hoststore::test::read_text(store.path()), "{\n  \"a\": 1\n}\n");
}

TEST(SettingsStore, SaveRejectsNonObject) {
    TempDir tmp;
    SettingsStore store(tmp.sub("settings.json"));
    Status s = store.save(SettingsDocument::array());
    EXPECT_EQ(s.domain, StatusDomain::Settings);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_FALSE(hoststore::storage::path_exists(store.path()));
}

TEST(SettingsStore, OverwriteKeepsDocumentParseable) {
    TempDir tmp;
    SettingsStore store(tmp.sub("settings.json"));
    for (int i = 0; i < 20; ++i) {
        SettingsDocument doc = {{"generation", i}};
        ASSERT_TRUE(is_ok(store.save(doc)));
        EXPECT_EQ(store.load()["generation"], i);
    }
}

TEST(SettingsStore, ConcurrentSavesNeverTearTheDocument) {
    TempDir tmp;
    SettingsStore store(tmp.sub("settings.json"));

    constexpr int kWriters = 4;
    constexpr int kSavesPerWriter = 50;
    constexpr std::size_t kPayloadSize = 2 * 1024 * 1024;

    auto document_for = [&](int writer) {
        return SettingsDocument{{"writer", writer},
                                {"payload", std::string(kPayloadSize, static_cast<char>('a' + writer))}};
    };
    ASSERT_TRUE(is_ok(store.save(document_for(0))));

    std::atomic<int> failed_saves{0};
    std::atomic<int> torn_reads{0};
    std::atomic<bool> writing{true};

    std::thread reader([&] {
        while (writing.load()) {
            SettingsDocument doc = store.load();
            if (!doc.contains("writer") || !doc.contains("payload")) {
                ++torn_reads;
                continue;
            }
            const int writer = doc["writer"].get<int>();
            const std::string& payload = doc["payload"].get_ref<const std::string&>();
            if (payload != std::string(kPayloadSize, static_cast<char>('a' + writer))) {
                ++torn_reads;
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            const SettingsDocument doc = document_for(w);
            for (int i = 0; i < kSavesPerWriter; ++i) {
                if (!is_ok(store.save(doc))) ++failed_saves;
            }
        });
    }
    for (auto& t : writers) t.join();
    writing.store(false);
    reader.join();

    EXPECT_EQ(failed_saves.load(), 0);
    EXPECT_EQ(torn_reads.load(), 0);
    EXPECT_EQ(hoststore::test::dir_entries(tmp.path()), std::vector<std::string>{"settings.json"});
    EXPECT_EQ(store.load()["payload"].get<std::string>().size(), kPayloadSize);
}
