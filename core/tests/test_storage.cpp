#include "trigraph/file_storage.hpp"
#include "trigraph/memory_storage.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace trigraph;
using trigraph::test_support::TempDir;

// ============================================================================
// FileStorage
// ============================================================================

class FileStorageTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string path = dir.file("blob.bin");
};

TEST_F(FileStorageTest, CreateGrowWriteReopen) {
  {
    auto storage = FileStorage::open(path, OpenMode::Create);
    ASSERT_TRUE(storage.has_value()) << storage.error().describe();
    EXPECT_EQ((*storage)->size(), 0u);

    ASSERT_TRUE((*storage)->grow(128).has_value());
    EXPECT_EQ((*storage)->size(), 128u);

    std::vector<uint8_t> bytes = {1, 2, 3, 4};
    ASSERT_TRUE((*storage)->write(100, bytes).has_value());
    ASSERT_TRUE((*storage)->sync().has_value());
  } // Close

  auto reopened = FileStorage::open(path, OpenMode::ReadOnly);
  ASSERT_TRUE(reopened.has_value());
  EXPECT_EQ((*reopened)->size(), 128u);
  auto read = (*reopened)->read(100, 4);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, (std::vector<uint8_t>{1, 2, 3, 4}));
}

TEST_F(FileStorageTest, RegionSurvivesGrow) {
  auto storage = FileStorage::open(path, OpenMode::Create);
  ASSERT_TRUE(storage.has_value());
  ASSERT_TRUE((*storage)->grow(64).has_value());
  ASSERT_TRUE((*storage)->write(0, std::vector<uint8_t>{42}).has_value());

  auto region = (*storage)->map(0, 64);
  ASSERT_TRUE(region.has_value());
  ASSERT_TRUE((*storage)->grow(1 << 16).has_value());

  // The earlier view still reads the pre-grow bytes.
  EXPECT_EQ(region->bytes()[0], 42);
  EXPECT_EQ(region->size(), 64u);
}

TEST_F(FileStorageTest, MapOutOfRangeFails) {
  auto storage = FileStorage::open(path, OpenMode::Create);
  ASSERT_TRUE(storage.has_value());
  ASSERT_TRUE((*storage)->grow(16).has_value());

  auto r = (*storage)->map(8, 16);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Storage);

  auto rest = (*storage)->map(8, 0);
  ASSERT_TRUE(rest.has_value());
  EXPECT_EQ(rest->size(), 8u);
}

TEST_F(FileStorageTest, GrowAndTruncateDirections) {
  auto storage = FileStorage::open(path, OpenMode::Create);
  ASSERT_TRUE(storage.has_value());
  ASSERT_TRUE((*storage)->grow(64).has_value());

  EXPECT_FALSE((*storage)->grow(32).has_value());
  EXPECT_FALSE((*storage)->truncate(128).has_value());
  ASSERT_TRUE((*storage)->truncate(16).has_value());
  EXPECT_EQ((*storage)->size(), 16u);
  EXPECT_EQ(trigraph::test_support::file_size(path), 16u);
}

TEST_F(FileStorageTest, ReadOnlyRejectsWrites) {
  {
    auto storage = FileStorage::open(path, OpenMode::Create);
    ASSERT_TRUE(storage.has_value());
    ASSERT_TRUE((*storage)->grow(8).has_value());
  }
  auto storage = FileStorage::open(path, OpenMode::ReadOnly);
  ASSERT_TRUE(storage.has_value());
  EXPECT_TRUE((*storage)->read_only());

  auto w = (*storage)->write(0, std::vector<uint8_t>{1});
  ASSERT_FALSE(w.has_value());
  EXPECT_EQ(w.error().code, ErrorCode::ReadOnly);
  auto g = (*storage)->grow(16);
  ASSERT_FALSE(g.has_value());
  EXPECT_EQ(g.error().code, ErrorCode::ReadOnly);
}

TEST_F(FileStorageTest, MissingFileIsStorageError) {
  auto r = FileStorage::open(dir.file("absent.bin"), OpenMode::ReadWrite);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Storage);
}

TEST_F(FileStorageTest, CloseIsIdempotent) {
  auto storage = FileStorage::open(path, OpenMode::Create);
  ASSERT_TRUE(storage.has_value());
  (*storage)->close();
  (*storage)->close();
  EXPECT_FALSE((*storage)->map(0, 0).has_value());
}

TEST_F(FileStorageTest, ProviderRenameAndRemove) {
  FileStorageProvider provider;
  {
    auto s = provider.open(path, OpenMode::Create);
    ASSERT_TRUE(s.has_value());
  }
  EXPECT_TRUE(provider.exists(path));

  std::string moved = dir.file("moved.bin");
  ASSERT_TRUE(provider.rename(path, moved).has_value());
  EXPECT_FALSE(provider.exists(path));
  EXPECT_TRUE(provider.exists(moved));

  ASSERT_TRUE(provider.remove(moved).has_value());
  EXPECT_FALSE(provider.exists(moved));
}

// ============================================================================
// MemoryStorageProvider
// ============================================================================

TEST(MemoryStorage, SharedAcrossHandles) {
  MemoryStorageProvider provider;
  auto writer = provider.open("a", OpenMode::Create);
  ASSERT_TRUE(writer.has_value());
  ASSERT_TRUE((*writer)->grow(4).has_value());
  ASSERT_TRUE((*writer)->write(0, std::vector<uint8_t>{7, 8, 9, 10}).has_value());

  auto reader = provider.open("a", OpenMode::ReadOnly);
  ASSERT_TRUE(reader.has_value());
  auto bytes = (*reader)->read(0, 4);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, (std::vector<uint8_t>{7, 8, 9, 10}));
  EXPECT_EQ(provider.contents("a"), *bytes);
}

TEST(MemoryStorage, CreateTruncatesExisting) {
  MemoryStorageProvider provider;
  provider.put("a", {1, 2, 3});
  auto s = provider.open("a", OpenMode::Create);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ((*s)->size(), 0u);
}

TEST(MemoryStorage, MissingPath) {
  MemoryStorageProvider provider;
  EXPECT_FALSE(provider.exists("nope"));
  auto r = provider.open("nope", OpenMode::ReadWrite);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Storage);
}

TEST(MemoryStorage, RenameMovesContents) {
  MemoryStorageProvider provider;
  provider.put("from", {5});
  ASSERT_TRUE(provider.rename("from", "to").has_value());
  EXPECT_FALSE(provider.exists("from"));
  EXPECT_EQ(provider.contents("to"), (std::vector<uint8_t>{5}));
}
