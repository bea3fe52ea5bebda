#include <gtest/gtest.h>

#include <algorithm>

#include "upgate/util/filesystem.hpp"
#include "test_helpers.hpp"

using namespace upgate;
using namespace upgate::util;
using namespace upgate::test;

class FileSystemTest : public TempDirTest {};

TEST_F(FileSystemTest, ListFilesRecursiveWalksNestedDirectories) {
  TempDirectory tree;
  tree.createFile("a.txt", "a");
  tree.createFile("one/b.txt", "b");
  tree.createFile("one/two/c.txt", "c");
  tree.createSubdir("empty");
  std::filesystem::create_symlink(tree.path() / "missing.txt", tree.path() / "dangling");

  auto files = FileSystem::listFilesRecursive(tree.path());
  ASSERT_OK(files);
  ASSERT_EQ(files->size(), 3u);

  std::vector<std::string> names;
  for (const auto& file : *files) {
    names.push_back(file.filename().string());
  }
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "b.txt", "c.txt"}));
}

TEST_F(FileSystemTest, ListFilesRecursiveMissingDirectory) {
  EXPECT_ERROR(FileSystem::listFilesRecursive(temp_dir_ / "absent"),
               ErrorCode::kDirectoryNotFound);
}

TEST_F(FileSystemTest, ReadPrefixStopsAtLimit) {
  auto path = temp_dir_ / "data.bin";
  ASSERT_OK(FileSystem::writeFileAtomic(path, std::string(4096, 'x')));

  auto prefix = FileSystem::readPrefix(path, 1024);
  ASSERT_OK(prefix);
  EXPECT_EQ(prefix->size(), 1024u);

  auto whole = FileSystem::readFile(path);
  ASSERT_OK(whole);
  EXPECT_EQ(whole->size(), 4096u);
}
