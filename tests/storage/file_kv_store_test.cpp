#include "ferry/storage/file_kv_store.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

using ferry::storage::FileKeyValueStore;
namespace fs = std::filesystem;

class FileKeyValueStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = ferry::testing::create_temp_dir("kv") / "state";
        store_ = std::make_unique<FileKeyValueStore>(root_);
        ASSERT_TRUE(store_->open().is_ok());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_.parent_path(), ec);
    }

    fs::path root_;
    std::unique_ptr<FileKeyValueStore> store_;
};

TEST_F(FileKeyValueStoreTest, OpenCreatesDirectory) {
    EXPECT_TRUE(fs::is_directory(root_));
}

TEST_F(FileKeyValueStoreTest, PersistsAcrossInstances) {
    ASSERT_TRUE(store_->set("upload_job_abc", R"({"jobId":"abc"})").is_ok());

    FileKeyValueStore reopened(root_);
    ASSERT_TRUE(reopened.open().is_ok());
    auto value = reopened.get("upload_job_abc");
    ASSERT_TRUE(value.is_ok());
    ASSERT_TRUE(value.value().has_value());
    EXPECT_EQ(*value.value(), R"({"jobId":"abc"})");
}

TEST_F(FileKeyValueStoreTest, ReplaceLeavesNoTempFile) {
    ASSERT_TRUE(store_->set("k", "one").is_ok());
    ASSERT_TRUE(store_->set("k", "two").is_ok());

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(root_)) {
        EXPECT_EQ(entry.path().extension(), ".json");
        entries++;
    }
    EXPECT_EQ(entries, 1u);
    EXPECT_EQ(*store_->get("k").value(), "two");
}

TEST_F(FileKeyValueStoreTest, MissingKeyAndIdempotentRemove) {
    auto missing = store_->get("nothing");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().has_value());

    ASSERT_TRUE(store_->set("k", "v").is_ok());
    EXPECT_TRUE(store_->remove("k").is_ok());
    EXPECT_TRUE(store_->remove("k").is_ok());
    EXPECT_FALSE(store_->get("k").value().has_value());
}

TEST_F(FileKeyValueStoreTest, KeysWithSeparatorsStayInsideRoot) {
    const std::string key = "upload_job_../a/b c";
    ASSERT_TRUE(store_->set(key, "v").is_ok());

    auto keys = store_->list_keys("upload_job_");
    ASSERT_TRUE(keys.is_ok());
    ASSERT_EQ(keys.value().size(), 1u);
    EXPECT_EQ(keys.value()[0], key);
    EXPECT_FALSE(fs::exists(root_.parent_path() / "a"));
}

TEST_F(FileKeyValueStoreTest, ListSkipsForeignFiles) {
    ASSERT_TRUE(store_->set("upload_job_2", "{}").is_ok());
    ASSERT_TRUE(store_->set("upload_job_1", "{}").is_ok());
    ASSERT_TRUE(store_->set("other", "{}").is_ok());
    ferry::testing::write_file(root_ / "README.txt", "hello");
    ferry::testing::write_file(root_ / "bad%zz.json", "{}");

    auto keys = store_->list_keys("upload_job_");
    ASSERT_TRUE(keys.is_ok());
    EXPECT_EQ(keys.value(), (std::vector<std::string>{"upload_job_1", "upload_job_2"}));
}

TEST(FileKeyValueStoreKeyTest, EncodeDecode) {
    EXPECT_EQ(FileKeyValueStore::encode_key("upload_job_a-1.x"), "upload_job_a-1.x");
    EXPECT_EQ(FileKeyValueStore::encode_key("a/b c"), "a%2Fb%20c");
    EXPECT_EQ(FileKeyValueStore::decode_key("a%2Fb%20c"), std::optional<std::string>("a/b c"));
    EXPECT_FALSE(FileKeyValueStore::decode_key("bad%zz").has_value());
    EXPECT_FALSE(FileKeyValueStore::decode_key("trailing%4").has_value());
}
