#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "noted/util/filesystem.hpp"
#include "test_helpers.hpp"

using namespace noted::util;
using namespace noted::test;
using noted::ErrorCode;

class FileSystemTest : public TempDirTest {};

TEST_F(FileSystemTest, WriteAtomicCreatesAndReplaces) {
  auto path = temp_dir_ / "file.txt";

  ASSERT_OK(FileSystem::writeFileAtomic(path, "first"));
  EXPECT_EQ(FileSystem::readFile(path).value(), "first");

  ASSERT_OK(FileSystem::writeFileAtomic(path, "second"));
  EXPECT_EQ(FileSystem::readFile(path).value(), "second");

  EXPECT_EQ(countEntries(temp_dir_), 1u);
}

TEST_F(FileSystemTest, BinaryContentSurvives) {
  auto path = temp_dir_ / "blob.bin";
  std::string blob("\x00\x01\xFF\n\r\x00", 6);

  ASSERT_OK(FileSystem::writeFileAtomic(path, blob));
  EXPECT_EQ(FileSystem::readFile(path).value(), blob);
}

TEST_F(FileSystemTest, WriterWithoutCommitLeavesTargetAlone) {
  auto path = createFile("target.txt", "original");

  std::filesystem::path temp_path;
  {
    AtomicFileWriter writer(path);
    ASSERT_OK(writer.write("replacement"));
    temp_path = writer.tempPath();
    EXPECT_EQ(temp_path.parent_path(), path.parent_path());
    EXPECT_TRUE(std::filesystem::exists(temp_path));
  }

  EXPECT_FALSE(std::filesystem::exists(temp_path));
  EXPECT_EQ(FileSystem::readFile(path).value(), "original");
}

TEST_F(FileSystemTest, CancelRemovesTempFile) {
  auto path = temp_dir_ / "cancelled.txt";
  AtomicFileWriter writer(path);
  ASSERT_OK(writer.write("data"));

  writer.cancel();
  EXPECT_FALSE(std::filesystem::exists(writer.tempPath()));
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_ERROR(writer.commit(), ErrorCode::kIoError);
  EXPECT_ERROR(writer.write("more"), ErrorCode::kIoError);
}

TEST_F(FileSystemTest, CommitRules) {
  auto path = temp_dir_ / "rules.txt";
  AtomicFileWriter writer(path);

  EXPECT_ERROR(writer.commit(), ErrorCode::kIoError);

  ASSERT_OK(writer.write("data"));
  ASSERT_OK(writer.commit());
  EXPECT_ERROR(writer.commit(), ErrorCode::kIoError);
  EXPECT_EQ(FileSystem::readFile(path).value(), "data");
}

TEST_F(FileSystemTest, MissingParentIsIoError) {
  auto path = temp_dir_ / "no" / "such" / "dir.txt";
  EXPECT_ERROR(FileSystem::writeFileAtomic(path, "x"), ErrorCode::kIoError);
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "no"));
}

TEST_F(FileSystemTest, ReadErrors) {
  EXPECT_ERROR(FileSystem::readFile(temp_dir_ / "missing"), ErrorCode::kIoError);
  EXPECT_ERROR(FileSystem::readFile(temp_dir_), ErrorCode::kIoError);
}

TEST_F(FileSystemTest, CopyAndExists) {
  auto from = createFile("from.txt", "copy me");
  auto to = temp_dir_ / "to.txt";

  EXPECT_FALSE(FileSystem::exists(to));
  ASSERT_OK(FileSystem::copyFile(from, to));
  EXPECT_TRUE(FileSystem::exists(to));
  EXPECT_EQ(FileSystem::readFile(to).value(), "copy me");

  EXPECT_ERROR(FileSystem::copyFile(temp_dir_ / "missing", to), ErrorCode::kIoError);
}

TEST_F(FileSystemTest, CreateDirectories) {
  auto nested = temp_dir_ / "a" / "b" / "c";
  ASSERT_OK(FileSystem::createDirectories(nested));
  EXPECT_TRUE(std::filesystem::is_directory(nested));

  // Existing directory is fine
  EXPECT_OK(FileSystem::createDirectories(nested));
}
