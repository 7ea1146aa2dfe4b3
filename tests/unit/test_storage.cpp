#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/storage/file_store.hpp"
#include "../../src/storage/memory_store.hpp"

using namespace Prowl::Storage;
namespace fs = std::filesystem;

namespace {
size_t count_lines(const std::string& path) {
    std::ifstream in(path);
    std::string   line;
    size_t        n = 0;
    while (std::getline(in, line))
        ++n;
    return n;
}
}  // namespace

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }
};

TEST_F(StorageTest, MemoryStoreBasics) {
    MemoryStore store;
    EXPECT_FALSE(store.get("missing").has_value());

    store.put("a", "1");
    EXPECT_EQ(store.get("a").value(), "1");
    store.put("a", "2");
    EXPECT_EQ(store.get("a").value(), "2");

    EXPECT_FALSE(store.put_if_absent("a", "3"));
    EXPECT_EQ(store.get("a").value(), "2");
    EXPECT_TRUE(store.put_if_absent("b", "x"));

    EXPECT_TRUE(store.erase("a"));
    EXPECT_FALSE(store.erase("a"));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(StorageTest, ScanIsPrefixBoundedAndOrdered) {
    MemoryStore store;
    store.put("visited/j1/https://b.test/", "0");
    store.put("visited/j1/https://a.test/", "0");
    store.put("visited/j10/https://a.test/", "0");
    store.put("job/j1", "{}");

    auto rows = store.scan("visited/j1/");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, "visited/j1/https://a.test/");
    EXPECT_EQ(rows[1].first, "visited/j1/https://b.test/");
    EXPECT_TRUE(store.scan("nothing/").empty());
}

TEST_F(StorageTest, ConcurrentClaimHasOneWinner) {
    MemoryStore              store;
    std::atomic<int>         winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i]() {
            if (store.put_if_absent("visited/j/https://a.test/", std::to_string(i)))
                winners++;
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST_F(StorageTest, FileStoreSurvivesReopen) {
    {
        FileStore store("test_storage_out");
        store.put("job/1", R"({"id":"1"})");
        store.put("frontier/1", "queued");
        EXPECT_TRUE(store.put_if_absent("visited/1/https://a.test/", "0"));
        EXPECT_TRUE(store.erase("frontier/1"));
    }

    FileStore store("test_storage_out");
    EXPECT_EQ(store.get("job/1").value(), R"({"id":"1"})");
    EXPECT_FALSE(store.get("frontier/1").has_value());
    EXPECT_FALSE(store.put_if_absent("visited/1/https://a.test/", "5"));
    EXPECT_EQ(store.get("visited/1/https://a.test/").value(), "0");
}

TEST_F(StorageTest, FileStoreCompactsOnOpen) {
    std::string journal;
    {
        FileStore store("test_storage_out");
        journal = store.journal_path();
        for (int i = 0; i < 50; ++i)
            store.put("counter", std::to_string(i));
        store.put("gone", "x");
        store.erase("gone");
    }
    EXPECT_EQ(count_lines(journal), 52u);

    FileStore store("test_storage_out");
    EXPECT_EQ(count_lines(journal), 1u);
    EXPECT_EQ(store.get("counter").value(), "49");
}

TEST_F(StorageTest, FileStoreSkipsTornRecord) {
    std::string journal;
    {
        FileStore store("test_storage_out");
        journal = store.journal_path();
        store.put("kept", "yes");
    }
    {
        std::ofstream out(journal, std::ios::app);
        out << R"({"op":"put","k":"torn","v":"ha)";
    }

    FileStore store("test_storage_out");
    EXPECT_EQ(store.get("kept").value(), "yes");
    EXPECT_FALSE(store.get("torn").has_value());
}

TEST_F(StorageTest, FileStoreRejectsUnusableDirectory) {
    fs::create_directories("test_storage_out");
    std::ofstream("test_storage_out/blocker") << "file, not a directory";
    EXPECT_THROW(FileStore("test_storage_out/blocker/state"), StoreError);
}
