#include <gtest/gtest.h>
#include "blob_store.h"
#include "fs.h"
#include "test_helpers.h"
#include <algorithm>

using namespace cloudless;
using cloudless::testing_support::TempDirectory;
using cloudless::testing_support::make_bytes;

class FileBlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.reset(new FileBlobStore(dir_.file("blobs")));
    }

    TempDirectory dir_;
    std::unique_ptr<FileBlobStore> store_;
};

TEST_F(FileBlobStoreTest, RootIsCreated) {
    EXPECT_TRUE(directory_exists(dir_.file("blobs")));
}

TEST_F(FileBlobStoreTest, CreateContainerReportsLocation) {
    std::string location;
    ASSERT_TRUE(store_->create_container("transfer-1", location));
    EXPECT_EQ(location, store_->get_container_path("transfer-1"));
    EXPECT_TRUE(store_->container_exists("transfer-1"));

    // Creating again is a no-op
    std::string again;
    EXPECT_TRUE(store_->create_container("transfer-1", again));
    EXPECT_EQ(again, location);
}

TEST_F(FileBlobStoreTest, ChunkWriteAndRead) {
    auto data = make_bytes(1000, 3);
    ASSERT_TRUE(store_->write_chunk("t1", 0, data));
    EXPECT_TRUE(file_exists(store_->get_chunk_path("t1", 0)));

    std::vector<uint8_t> read_back;
    ASSERT_TRUE(store_->read_chunk("t1", 0, read_back));
    EXPECT_EQ(read_back, data);
}

TEST_F(FileBlobStoreTest, ChunkPathIsZeroPadded) {
    std::string path = store_->get_chunk_path("t1", 42);
    EXPECT_NE(path.find("chunk_000042"), std::string::npos);
}

TEST_F(FileBlobStoreTest, RewriteOverwritesChunk) {
    ASSERT_TRUE(store_->write_chunk("t1", 1, make_bytes(10, 1)));
    auto replacement = make_bytes(6, 9);
    ASSERT_TRUE(store_->write_chunk("t1", 1, replacement));

    std::vector<uint8_t> read_back;
    ASSERT_TRUE(store_->read_chunk("t1", 1, read_back));
    EXPECT_EQ(read_back, replacement);
}

TEST_F(FileBlobStoreTest, ReadMissingChunkFails) {
    std::vector<uint8_t> data;
    EXPECT_FALSE(store_->read_chunk("t1", 0, data));
}

TEST_F(FileBlobStoreTest, DeleteContainerIsIdempotent) {
    ASSERT_TRUE(store_->write_chunk("t1", 0, make_bytes(5, 0)));
    ASSERT_TRUE(store_->write_chunk("t1", 1, make_bytes(5, 1)));

    EXPECT_TRUE(store_->delete_container("t1"));
    EXPECT_FALSE(store_->container_exists("t1"));
    EXPECT_TRUE(store_->delete_container("t1"));
}

TEST_F(FileBlobStoreTest, InvalidNamesAreRejected) {
    std::string location;
    EXPECT_FALSE(store_->create_container("../escape", location));
    EXPECT_FALSE(store_->create_container("", location));
    EXPECT_FALSE(store_->write_chunk("a/b", 0, make_bytes(1, 0)));
    EXPECT_FALSE(store_->delete_container(".."));
    EXPECT_FALSE(store_->container_exists(".."));
}

TEST_F(FileBlobStoreTest, ListContainersSkipsFiles) {
    std::string location;
    ASSERT_TRUE(store_->create_container("a", location));
    ASSERT_TRUE(store_->create_container("b", location));
    ASSERT_TRUE(create_file(combine_paths(store_->get_root_directory(), "stray.txt"), "x"));

    std::vector<std::string> names;
    ASSERT_TRUE(store_->list_containers(names));
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
}
