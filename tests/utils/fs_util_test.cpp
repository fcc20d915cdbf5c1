#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "type/error.hpp"
#include "utils/fs/fs_util.hpp"

namespace archiver {
class FsUtilTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;

  void                  SetUp() override {
    dir_ = fsutil::Normalize(std::filesystem::temp_directory_path()) / "archiver_tests" /
           ::testing::UnitTest::GetInstance()->current_test_info()->name();
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }
};

TEST(FsUtilTest, PathRelations) {
  EXPECT_EQ(fsutil::Normalize("/a/b/../c/"), std::filesystem::path("/a/c"));
  EXPECT_TRUE(fsutil::IsSamePath("/a/b", "/a/./b/"));
  EXPECT_TRUE(fsutil::IsSubPath("/a", "/a/b/c"));
  EXPECT_FALSE(fsutil::IsSubPath("/a", "/a"));
  EXPECT_FALSE(fsutil::IsSubPath("/a/b", "/a/bc"));
  EXPECT_TRUE(fsutil::IsParentOrSamePath("/a", "/a"));
  EXPECT_TRUE(fsutil::IsParentOrSamePath("/", "/a"));
  EXPECT_FALSE(fsutil::IsParentOrSamePath("/a/b", "/a"));
}

TEST(FsUtilTest, Digits) {
  EXPECT_TRUE(fsutil::IsDigits("0123"));
  EXPECT_FALSE(fsutil::IsDigits(""));
  EXPECT_FALSE(fsutil::IsDigits("12a"));
}

TEST_F(FsUtilTests, ListChildrenReportsOwnType) {
  std::filesystem::create_directories(dir_ / "b_dir");
  std::ofstream(dir_ / "a_file") << "x";
  std::filesystem::create_directory_symlink(dir_ / "b_dir", dir_ / "c_link");

  auto children = fsutil::ListChildren(dir_);
  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0].name_, "a_file");
  EXPECT_FALSE(children[0].is_directory_);
  EXPECT_TRUE(children[1].is_directory_);
  EXPECT_FALSE(children[2].is_directory_);

  auto dirs = fsutil::ListDirectories(dir_);
  ASSERT_EQ(dirs.size(), 1u);
  EXPECT_EQ(dirs[0], "b_dir");
  EXPECT_TRUE(fsutil::ListChildren(dir_ / "missing").empty());
}

TEST_F(FsUtilTests, SafeLstatSeesBrokenLinks) {
  std::filesystem::create_symlink(dir_ / "nowhere", dir_ / "dangling");
  EXPECT_FALSE(fsutil::PathAccessible(dir_ / "dangling"));
  EXPECT_TRUE(fsutil::SafeLstat(dir_ / "dangling").has_value());
  EXPECT_FALSE(fsutil::SafeLstat(dir_ / "nothing").has_value());
}

TEST_F(FsUtilTests, RenameAndRemoveEmpty) {
  std::ofstream(dir_ / "from.txt") << "x";
  fsutil::Rename(dir_ / "from.txt", dir_ / "to.txt");
  EXPECT_TRUE(std::filesystem::exists(dir_ / "to.txt"));
  EXPECT_THROW(fsutil::Rename(dir_ / "from.txt", dir_ / "again.txt"), ArchiverError);

  fsutil::EnsureDir(dir_ / "empty");
  EXPECT_TRUE(fsutil::RemoveEmptyDirectory(dir_ / "empty"));
  EXPECT_FALSE(fsutil::RemoveEmptyDirectory(dir_ / "empty"));

  fsutil::EnsureFile(dir_ / "full" / "inner.txt");
  EXPECT_THROW(fsutil::RemoveEmptyDirectory(dir_ / "full"), ArchiverError);
}

TEST_F(FsUtilTests, DirectoryGuardRollsBackUnlessCommitted) {
  {
    fsutil::DirectoryGuard guard(dir_ / "rollback", fsutil::DirectoryGuard::Mode::CREATE_NEW);
    EXPECT_TRUE(guard.Created());
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "rollback"));
  }
  EXPECT_FALSE(std::filesystem::exists(dir_ / "rollback"));

  {
    fsutil::DirectoryGuard guard(dir_ / "kept", fsutil::DirectoryGuard::Mode::CREATE_NEW);
    guard.Commit();
  }
  EXPECT_TRUE(std::filesystem::is_directory(dir_ / "kept"));

  EXPECT_THROW(fsutil::DirectoryGuard(dir_ / "kept", fsutil::DirectoryGuard::Mode::CREATE_NEW),
               ArchiverError);
  {
    fsutil::DirectoryGuard guard(dir_ / "kept", fsutil::DirectoryGuard::Mode::CREATE_IF_MISSING);
    EXPECT_FALSE(guard.Created());
  }
  EXPECT_TRUE(std::filesystem::is_directory(dir_ / "kept"));
}

TEST_F(FsUtilTests, DirectoryGuardLeavesNonEmptyDirectory) {
  {
    fsutil::DirectoryGuard guard(dir_ / "slot", fsutil::DirectoryGuard::Mode::CREATE_NEW);
    std::ofstream(dir_ / "slot" / "partial") << "x";
  }
  EXPECT_TRUE(std::filesystem::exists(dir_ / "slot" / "partial"));
}
}  // namespace archiver
