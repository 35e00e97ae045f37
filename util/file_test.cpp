#include "util/file.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <fstream>
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::IsEmpty;
using ::testing::StartsWith;
using ::testing::UnorderedElementsAre;

const std::string test_tmpdir = "/tmp/code_runner_testdir";

std::string Slurp(const std::string& path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

void Put(const std::string& path, const std::string& content) {
  std::ofstream out(path);
  out << content;
}

bool Present(const std::string& path) {
  struct stat st {};
  return lstat(path.c_str(), &st) == 0;
}

mode_t Mode(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return 0;
  return st.st_mode & 0777;
}

// Every test works in a fresh directory, removed at the end.
class FileTest : public ::testing::Test {
 protected:
  FileTest() : dir_(test_tmpdir + "/file") {}

  std::string In(const std::string& name) const {
    return dir_.Path() + "/" + name;
  }

  util::TempDir dir_;
};

// NOLINTNEXTLINE
TEST_F(FileTest, ListEntries) {
  Put(In("main.py"), "print(1)");
  Put(In("notes"), "");
  mkdir(In("sub").c_str(), S_IRWXU);
  Put(In("sub/hidden"), "");
  EXPECT_THAT(util::File::ListEntries(dir_.Path()),
              UnorderedElementsAre(In("main.py"), In("notes"), In("sub")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, ListEntriesOfMissingDirectory) {
  EXPECT_THAT(util::File::ListEntries(In("missing")), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadInChunks) {
  std::string content(util::kChunkSize + 10, 'r');
  Put(In("big"), content);
  auto producer = util::File::Read(In("big"));
  std::vector<size_t> sizes;
  std::string read;
  for (auto chunk = producer(); chunk.size() != 0; chunk = producer()) {
    sizes.push_back(chunk.size());
    read.append(chunk.asChars().begin(), chunk.size());
  }
  EXPECT_EQ(read, content);
  EXPECT_GE(sizes.size(), 2);
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadMissingFile) {
  EXPECT_THROW(util::File::Read(In("missing")), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteContentCreatesParents) {
  util::File::WriteContent(In("a/b/main.py"), "print('hi')\n");
  EXPECT_EQ(Slurp(In("a/b/main.py")), "print('hi')\n");
  EXPECT_THAT(util::File::ListEntries(In("a/b")),
              UnorderedElementsAre(In("a/b/main.py")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteContentLargerThanAChunk) {
  std::string content(util::kChunkSize * 2 + 1, 'w');
  util::File::WriteContent(In("big"), content);
  EXPECT_EQ(Slurp(In("big")), content);
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteContentKeepsExistingFile) {
  Put(In("main.py"), "old");
  EXPECT_THROW(util::File::WriteContent(In("main.py"), "new"),  // NOLINT
               std::system_error);
  EXPECT_EQ(Slurp(In("main.py")), "old");
  // No temporary file is left behind.
  EXPECT_THAT(util::File::ListEntries(dir_.Path()),
              UnorderedElementsAre(In("main.py")));

  util::File::WriteContent(In("main.py"), "new", /*overwrite=*/true);
  EXPECT_EQ(Slurp(In("main.py")), "new");
}

// NOLINTNEXTLINE
TEST_F(FileTest, MakeDirsIsIdempotent) {
  util::File::MakeDirs(In("x/y/z"));
  util::File::MakeDirs(In("x/y/z"));
  EXPECT_TRUE(Present(In("x/y/z")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, MakeDirsThroughAFile) {
  Put(In("plain"), "");
  EXPECT_THROW(util::File::MakeDirs(In("plain/sub")),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST_F(FileTest, RemoveTree) {
  mkdir(In("tree").c_str(), S_IRWXU);
  mkdir(In("tree/sub").c_str(), S_IRWXU);
  Put(In("tree/a"), "a");
  Put(In("tree/sub/b"), "b");
  util::File::RemoveTree(In("tree"));
  EXPECT_FALSE(Present(In("tree")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, RemoveTreeWithLockedDirectories) {
  mkdir(In("tree").c_str(), S_IRWXU);
  mkdir(In("tree/locked").c_str(), S_IRWXU);
  mkdir(In("tree/locked/deeper").c_str(), S_IRWXU);
  Put(In("tree/locked/deeper/file"), "data");
  Put(In("tree/locked/file"), "data");
  chmod(In("tree/locked/deeper").c_str(), 0);
  chmod(In("tree/locked").c_str(), 0);
  util::File::RemoveTree(In("tree"));
  EXPECT_FALSE(Present(In("tree")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, RemoveTreeDoesNotFollowSymlinks) {
  mkdir(In("outside").c_str(), S_IRWXU);
  Put(In("outside/keep"), "keep me");
  mkdir(In("tree").c_str(), S_IRWXU);
  ASSERT_EQ(symlink(In("outside").c_str(), In("tree/link").c_str()), 0);
  util::File::RemoveTree(In("tree"));
  EXPECT_FALSE(Present(In("tree")));
  EXPECT_EQ(Slurp(In("outside/keep")), "keep me");
  EXPECT_EQ(Mode(In("outside")), S_IRWXU);
}

// NOLINTNEXTLINE
TEST_F(FileTest, RemoveTreeOfMissingPath) {
  EXPECT_THROW(util::File::RemoveTree(In("missing/path")),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST_F(FileTest, MakeImmutable) {
  Put(In("main.py"), "x");
  util::File::MakeImmutable(In("main.py"));
  EXPECT_EQ(Mode(In("main.py")), S_IRUSR);
  EXPECT_THROW(util::File::MakeImmutable(In("missing")),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST_F(FileTest, Size) {
  Put(In("six"), "sixsix");
  EXPECT_EQ(util::File::Size(In("six")), 6);
  EXPECT_TRUE(util::File::Exists(In("six")));
  EXPECT_LT(util::File::Size(In("missing")), 0);
  EXPECT_FALSE(util::File::Exists(In("missing")));
}

// NOLINTNEXTLINE
TEST(Path, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("ws", "main.py"), "ws/main.py");
  EXPECT_EQ(util::File::JoinPath("/tmp/ws", "sub/main.py"),
            "/tmp/ws/sub/main.py");
  EXPECT_EQ(util::File::JoinPath("/tmp/ws", "/etc/passwd"), "/etc/passwd");
  EXPECT_EQ(util::File::JoinPath("/tmp/ws", ""), "/tmp/ws/");
}

// NOLINTNEXTLINE
TEST(Path, BaseDirAndBaseName) {
  EXPECT_EQ(util::File::BaseDir("/tmp/ws-1/main.py"), "/tmp/ws-1");
  EXPECT_EQ(util::File::BaseDir("main.py"), "");
  EXPECT_EQ(util::File::BaseName("/tmp/ws-1/main.py"), "main.py");
  EXPECT_EQ(util::File::BaseName("main.py"), "main.py");
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempDirIsRemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(dir_.Path(), "ws-");
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(In("ws-")));
    EXPECT_EQ(Mode(path), S_IRWXU);
    Put(path + "/main.py", "content");
  }
  EXPECT_FALSE(Present(path));
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempDirsAreUnique) {
  util::TempDir first(dir_.Path(), "ws-");
  util::TempDir second(dir_.Path(), "ws-");
  EXPECT_NE(first.Path(), second.Path());
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempDirRemoveIsIdempotent) {
  util::TempDir tmp(dir_.Path());
  tmp.Remove();
  EXPECT_TRUE(tmp.Removed());
  EXPECT_FALSE(Present(tmp.Path()));
  tmp.Remove();
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempDirMoveTransfersOwnership) {
  util::TempDir tmp(dir_.Path());
  std::string path = tmp.Path();
  {
    util::TempDir owner = std::move(tmp);
    EXPECT_EQ(owner.Path(), path);
    EXPECT_TRUE(Present(path));
  }
  EXPECT_FALSE(Present(path));
}

}  // namespace
