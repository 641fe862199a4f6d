#include "kvsession/errors.hpp"
#include "kvsession/filesystem_store.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <unistd.h>

using namespace kvsession;
namespace fs = std::filesystem;

class FilesystemStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
            {
            root_ = fs::temp_directory_path() /
                    ("kvsession_fs_test_" + std::to_string(getpid()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(root_);
            store_ = std::make_unique<FilesystemStore>(root_);
            }

        void TearDown() override
            {
            store_.reset();
            std::error_code ec;
            fs::remove_all(root_, ec);
            }

        fs::path root_;
        std::unique_ptr<FilesystemStore> store_;
    };

TEST_F(FilesystemStoreTest, CreatesRootDirectory)
    {
    EXPECT_TRUE(fs::is_directory(root_));
    }

TEST_F(FilesystemStoreTest, PutAndGet)
    {
    EXPECT_EQ(store_->put("1a2b_3e8", "payload"), "1a2b_3e8");
    EXPECT_EQ(store_->get("1a2b_3e8"), "payload");
    EXPECT_TRUE(fs::exists(root_ / "1a2b_3e8"));
    }

TEST_F(FilesystemStoreTest, BinaryDataSurvives)
    {
    std::string data("a\0b\nc\xff", 6);
    store_->put("bin", data);
    EXPECT_EQ(store_->get("bin"), data);
    }

TEST_F(FilesystemStoreTest, PutOverwrites)
    {
    store_->put("k", "first");
    store_->put("k", "second, longer");
    EXPECT_EQ(store_->get("k"), "second, longer");
    }

TEST_F(FilesystemStoreTest, MissingKeyThrowsKeyNotFound)
    {
    EXPECT_THROW(store_->get("absent"), KeyNotFound);
    EXPECT_THROW(store_->get("../escape"), KeyNotFound);
    }

TEST_F(FilesystemStoreTest, InvalidKeysAreRejectedOnPut)
    {
    EXPECT_THROW(store_->put("../escape", "x"), std::invalid_argument);
    EXPECT_THROW(store_->put("a/b", "x"), std::invalid_argument);
    EXPECT_THROW(store_->put(".hidden", "x"), std::invalid_argument);
    EXPECT_THROW(store_->put("", "x"), std::invalid_argument);
    EXPECT_FALSE(fs::exists(root_.parent_path() / "escape"));
    }

TEST_F(FilesystemStoreTest, DeleteIsIdempotent)
    {
    store_->put("k", "x");
    EXPECT_NO_THROW(store_->del("k"));
    EXPECT_NO_THROW(store_->del("k"));
    EXPECT_NO_THROW(store_->del("../not-a-key"));
    EXPECT_THROW(store_->get("k"), KeyNotFound);
    }

TEST_F(FilesystemStoreTest, KeysSkipsTempFilesAndDirectories)
    {
    store_->put("b", "2");
    store_->put("a", "1");
    std::ofstream(root_ / ".a.tmp.1.0") << "partial";
    fs::create_directory(root_ / "subdir");

    auto keys = store_->keys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{ "a", "b" }));
    }

TEST_F(FilesystemStoreTest, ContentsOutliveTheStoreObject)
    {
    store_->put("persist_0", "kept");
    store_.reset();

    FilesystemStore reopened(root_);
    EXPECT_EQ(reopened.get("persist_0"), "kept");
    }
