#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "filesystem.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace dbdock::host {
namespace {

namespace fs = std::filesystem;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class LocalFilesystemTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    root_ = fs::temp_directory_path() /
            ("dbdock-fs-test-" + std::to_string(rd()));
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  std::string root() const { return root_.string(); }

  fs::path root_;
  LocalFilesystem filesystem_;
};

TEST(ResolvePath, NormalizesLexically) {
  auto resolved = resolve_path("/srv/./data//mysql/../pg/");
  ASSERT_TRUE(resolved);
  EXPECT_EQ(resolved.value(), "/srv/data/pg");

  auto root = resolve_path("");
  ASSERT_TRUE(root);
  EXPECT_EQ(root.value(), "/");

  auto above = resolve_path("/../../etc");
  ASSERT_TRUE(above);
  EXPECT_EQ(above.value(), "/etc");
}

TEST(DirectoryName, RejectsSeparatorsAndDotEntries) {
  EXPECT_TRUE(is_valid_directory_name("mariadb-data_01.v2"));
  EXPECT_FALSE(is_valid_directory_name("a/b"));
  EXPECT_FALSE(is_valid_directory_name(".."));
  EXPECT_FALSE(is_valid_directory_name("."));
  EXPECT_FALSE(is_valid_directory_name("with space"));
  EXPECT_FALSE(is_valid_directory_name(""));
}

TEST(Mode, AcceptsThreeOrFourOctalDigits) {
  EXPECT_TRUE(is_valid_mode("755"));
  EXPECT_TRUE(is_valid_mode("0750"));
  EXPECT_FALSE(is_valid_mode("75"));
  EXPECT_FALSE(is_valid_mode("789"));
  EXPECT_FALSE(is_valid_mode("rwx"));
}

TEST_F(LocalFilesystemTest, ListsOnlyDirectoriesSortedByName) {
  fs::create_directory(root_ / "zeta");
  fs::create_directory(root_ / "alpha");
  std::ofstream(root_ / "notes.txt") << "not a directory";

  auto listing = filesystem_.list_directories(root());
  ASSERT_TRUE(listing);
  EXPECT_EQ(listing.value().current_path, root());
  ASSERT_TRUE(listing.value().parent_path.has_value());
  EXPECT_EQ(*listing.value().parent_path, root_.parent_path().string());

  std::vector<std::string> names;
  for (const auto &entry : listing.value().directories) {
    names.push_back(entry.name);
  }
  EXPECT_THAT(names, ElementsAre("alpha", "zeta"));
  EXPECT_EQ(listing.value().directories[0].path, (root_ / "alpha").string());
}

TEST_F(LocalFilesystemTest, RootHasNoParent) {
  auto listing = filesystem_.list_directories("/");
  ASSERT_TRUE(listing);
  EXPECT_FALSE(listing.value().parent_path.has_value());
}

TEST_F(LocalFilesystemTest, ListingMissingOrFilePathFails) {
  auto missing = filesystem_.list_directories(root() + "/nope");
  ASSERT_FALSE(missing);
  EXPECT_TRUE(missing.error().is(FilesystemErrorKind::NotFound));

  std::ofstream(root_ / "file") << "x";
  auto file = filesystem_.list_directories(root() + "/file");
  ASSERT_FALSE(file);
  EXPECT_TRUE(file.error().is(FilesystemErrorKind::NotADirectory));
}

TEST_F(LocalFilesystemTest, StatReportsMissingPathWithoutError) {
  auto info = filesystem_.stat(root() + "/absent");
  ASSERT_TRUE(info);
  EXPECT_FALSE(info.value().exists);
  EXPECT_EQ(info.value().path, root() + "/absent");
}

TEST_F(LocalFilesystemTest, StatDescribesFiles) {
  std::ofstream(root_ / "data.bin") << "12345";

  auto info = filesystem_.stat(root() + "/data.bin");
  ASSERT_TRUE(info);
  EXPECT_TRUE(info.value().exists);
  EXPECT_TRUE(info.value().is_file);
  EXPECT_FALSE(info.value().is_directory);
  EXPECT_EQ(info.value().size, 5u);
  EXPECT_GT(info.value().modified, 0);
}

TEST_F(LocalFilesystemTest, MakeDirectoryAppliesMode) {
  MakeDirectoryOptions options;
  options.mode = "750";

  auto created = filesystem_.make_directory(root(), "pgdata", options);
  ASSERT_TRUE(created);
  EXPECT_EQ(created.value().path, (root_ / "pgdata").string());
  EXPECT_THAT(created.value().operations, ElementsAre("permissions set to 750"));
  EXPECT_TRUE(created.value().warnings.empty());

  struct stat st {};
  ASSERT_EQ(::stat(created.value().path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0750u);
}

TEST_F(LocalFilesystemTest, MakeDirectoryRejectsDuplicates) {
  ASSERT_TRUE(filesystem_.make_directory(root(), "data", {}));

  auto again = filesystem_.make_directory(root(), "data", {});
  ASSERT_FALSE(again);
  EXPECT_TRUE(again.error().is(FilesystemErrorKind::AlreadyExists));
}

TEST_F(LocalFilesystemTest, MakeDirectoryValidatesInput) {
  auto bad_name = filesystem_.make_directory(root(), "../escape", {});
  ASSERT_FALSE(bad_name);
  EXPECT_TRUE(bad_name.error().is(FilesystemErrorKind::InvalidName));
  EXPECT_FALSE(fs::exists(root_.parent_path() / "escape"));

  MakeDirectoryOptions options;
  options.mode = "999";
  auto bad_mode = filesystem_.make_directory(root(), "data", options);
  ASSERT_FALSE(bad_mode);
  EXPECT_TRUE(bad_mode.error().is(FilesystemErrorKind::InvalidMode));

  auto no_parent = filesystem_.make_directory(root() + "/missing", "data", {});
  ASSERT_FALSE(no_parent);
  EXPECT_TRUE(no_parent.error().is(FilesystemErrorKind::NotFound));

  auto empty = filesystem_.make_directory("", "data", {});
  ASSERT_FALSE(empty);
  EXPECT_THAT(empty.error().message(), HasSubstr("required"));
}

TEST_F(LocalFilesystemTest, UnknownOwnerIsAWarningNotAFailure) {
  MakeDirectoryOptions options;
  options.owner = "no-such-user-dbdock";

  auto created = filesystem_.make_directory(root(), "owned", options);
  ASSERT_TRUE(created);
  EXPECT_TRUE(fs::is_directory(root_ / "owned"));
  ASSERT_EQ(created.value().warnings.size(), 1u);
  EXPECT_THAT(created.value().warnings[0], HasSubstr("unknown user"));
}

TEST_F(LocalFilesystemTest, OutOfRangeNumericOwnerIsRejected) {
  MakeDirectoryOptions options;
  options.owner = "4294967296";
  options.group = "99999999999999999999999";

  auto created = filesystem_.make_directory(root(), "wrapped", options);
  ASSERT_TRUE(created);
  EXPECT_TRUE(fs::is_directory(root_ / "wrapped"));
  ASSERT_EQ(created.value().warnings.size(), 1u);
  EXPECT_THAT(created.value().warnings[0], HasSubstr("unknown user"));

  struct stat st {};
  ASSERT_EQ(::stat((root_ / "wrapped").c_str(), &st), 0);
  EXPECT_EQ(st.st_uid, ::geteuid());
}

} // namespace
} // namespace dbdock::host
