#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

#include "store/fs_object_store.h"

namespace cloudpulse {
namespace store {

namespace fs = std::filesystem;

class FsObjectStoreTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("cloudpulse_fs_store_" + std::to_string(rd()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

TEST_F(FsObjectStoreTest, PutThenGet) {
    FsObjectStore store(root);
    store.Put("a/b/c.json", "{\"x\":1}");
    EXPECT_EQ(store.Get("a/b/c.json"), "{\"x\":1}");
    EXPECT_TRUE(fs::exists(root / "a" / "b" / "c.json"));
}

TEST_F(FsObjectStoreTest, PutOverwrites) {
    FsObjectStore store(root);
    store.Put("k.json", "first");
    store.Put("k.json", "second");
    EXPECT_EQ(store.Get("k.json"), "second");
}

TEST_F(FsObjectStoreTest, GetMissingIsNotFound) {
    FsObjectStore store(root);
    try {
        store.Get("nope.json");
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), StoreError::Kind::NotFound);
    }
}

TEST_F(FsObjectStoreTest, ListIsPrefixFilteredAndSorted) {
    FsObjectStore store(root);
    store.Put("sensor-data/2024/03/01/hour=13/z.json", "1");
    store.Put("sensor-data/2024/03/01/hour=13/a.json", "2");
    store.Put("sensor-data/2024/03/01/hour=14/a.json", "3");
    store.Put("other/x.json", "4");

    auto keys = store.List("sensor-data/2024/03/01/hour=13/");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "sensor-data/2024/03/01/hour=13/a.json");
    EXPECT_EQ(keys[1], "sensor-data/2024/03/01/hour=13/z.json");

    EXPECT_EQ(store.List("sensor-data/").size(), 3u);
}

TEST_F(FsObjectStoreTest, ListOfAbsentPrefixIsEmpty) {
    FsObjectStore store(root);
    EXPECT_TRUE(store.List("sensor-data/2030/01/01/hour=00/").empty());
}

TEST_F(FsObjectStoreTest, RejectsKeysEscapingRoot) {
    FsObjectStore store(root);
    EXPECT_THROW(store.Put("../escape.json", "x"), StoreError);
    EXPECT_THROW(store.Get("/etc/passwd"), StoreError);
    EXPECT_THROW(store.Put("", "x"), StoreError);
}

} // namespace store
} // namespace cloudpulse
