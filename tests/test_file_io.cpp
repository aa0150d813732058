// ============================================================
// test_file_io.cpp -- Root containment and partial-file writes
// ============================================================

#include <gtest/gtest.h>
#include "test_util.hpp"
#include "common/errors.hpp"
#include "common/file_io.hpp"

namespace fs = std::filesystem;
using testutil::TempDir;

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = file_io::canonical_root((dir_ / "out").string());
    }

    TempDir  dir_{"resolve"};
    fs::path root_;
};

TEST_F(ResolverTest, NestedPathStaysUnderRoot) {
    fs::path p = file_io::resolve_under_root(root_, "a/b/c.txt");
    EXPECT_EQ(p, root_ / "a" / "b" / "c.txt");
}

TEST_F(ResolverTest, InnerDotDotIsNormalised) {
    fs::path p = file_io::resolve_under_root(root_, "a/../b.txt");
    EXPECT_EQ(p, root_ / "b.txt");
}

TEST_F(ResolverTest, TraversalRejected) {
    EXPECT_THROW(file_io::resolve_under_root(root_, "../outside.txt"), PathSecurityViolation);
    EXPECT_THROW(file_io::resolve_under_root(root_, "a/../../x"), PathSecurityViolation);
    EXPECT_THROW(file_io::resolve_under_root(root_, ".."), PathSecurityViolation);
}

TEST_F(ResolverTest, AbsoluteRejected) {
    EXPECT_THROW(file_io::resolve_under_root(root_, "/etc/passwd"), PathSecurityViolation);
    EXPECT_THROW(file_io::resolve_under_root(root_, "\\windows\\x"), PathSecurityViolation);
}

TEST_F(ResolverTest, EmptyOrDirectoryOnlyRejected) {
    EXPECT_THROW(file_io::resolve_under_root(root_, ""), PathSecurityViolation);
    EXPECT_THROW(file_io::resolve_under_root(root_, "."), PathSecurityViolation);
    EXPECT_THROW(file_io::resolve_under_root(root_, "a/.."), PathSecurityViolation);
    EXPECT_THROW(file_io::resolve_under_root(root_, std::string("a\0b", 3)), PathSecurityViolation);
}

TEST_F(ResolverTest, SiblingWithSharedPrefixRejected) {
    // root is ".../out"; ".../out-evil" shares the string prefix only
    try {
        file_io::resolve_under_root(root_, "../out-evil/f.txt");
        FAIL() << "expected PathSecurityViolation";
    } catch (const PathSecurityViolation& e) {
        EXPECT_EQ(e.rel_path(), "../out-evil/f.txt");
    }
}

TEST_F(ResolverTest, SymlinkedDirectoryEscapeRejected) {
    fs::create_directories(dir_ / "elsewhere");
    std::error_code ec;
    fs::create_directory_symlink(dir_ / "elsewhere", root_ / "link", ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    EXPECT_THROW(file_io::resolve_under_root(root_, "link/f.txt"), PathSecurityViolation);
}

TEST_F(ResolverTest, SymlinkInsideRootAccepted) {
    fs::create_directories(root_ / "real");
    std::error_code ec;
    fs::create_directory_symlink(root_ / "real", root_ / "alias", ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    EXPECT_NO_THROW(file_io::resolve_under_root(root_, "alias/f.txt"));
}

TEST(CanonicalRoot, CreatesMissingDirectory) {
    TempDir dir("root");
    fs::path want = dir / "x/y/z";
    fs::path root = file_io::canonical_root(want.string());
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_TRUE(root.is_absolute());
}

TEST(PartialFile, CommitReplacesTarget) {
    TempDir dir("partial");
    fs::path target = dir / "f.txt";
    testutil::write_file(target, "old");

    fs::path temp;
    {
        file_io::PartialFile pf(target);
        temp = pf.temp_path();
        pf.write("new ", 4);
        pf.write("content", 7);
        EXPECT_EQ(pf.bytes_written(), 11u);
        EXPECT_EQ(testutil::read_file(target), "old");
        pf.commit();
    }
    EXPECT_EQ(testutil::read_file(target), "new content");
    EXPECT_FALSE(fs::exists(temp));
}

TEST(PartialFile, UncommittedLeavesTargetUntouched) {
    TempDir dir("partial");
    fs::path target = dir / "f.txt";
    testutil::write_file(target, "old");

    fs::path temp;
    {
        file_io::PartialFile pf(target);
        temp = pf.temp_path();
        pf.write("half", 4);
        EXPECT_TRUE(fs::exists(temp));
    }
    EXPECT_EQ(testutil::read_file(target), "old");
    EXPECT_FALSE(fs::exists(temp));
}

TEST(PartialFile, ConcurrentWritersUseSeparateTempFiles) {
    TempDir dir("partial");
    fs::path target = dir / "same.txt";

    file_io::PartialFile first(target);
    file_io::PartialFile second(target);
    EXPECT_NE(first.temp_path(), second.temp_path());

    first.write("first", 5);
    second.write("second", 6);
    first.commit();
    EXPECT_EQ(testutil::read_file(target), "first");
    second.commit();
    EXPECT_EQ(testutil::read_file(target), "second");

    for (const auto& de : fs::directory_iterator(dir.path())) {
        EXPECT_EQ(de.path().filename(), "same.txt") << "leftover " << de.path();
    }
}

TEST(PartialFile, MissingParentIsDiskError) {
    TempDir dir("partial");
    EXPECT_THROW(file_io::PartialFile pf(dir / "no/such/dir/f.txt"), DiskError);
}

TEST(FileIo, EnsureParentDirs) {
    TempDir dir("parents");
    fs::path target = dir / "a/b/c.txt";
    file_io::ensure_parent_dirs(target);
    EXPECT_TRUE(fs::is_directory(dir / "a/b"));
}

TEST(FileIo, ParentBlockedByFileIsDiskError) {
    TempDir dir("parents");
    testutil::write_file(dir / "a", "file, not dir");
    EXPECT_THROW(file_io::ensure_parent_dirs(dir / "a/b/c.txt"), DiskError);
}

TEST(FileIo, MmapReaderRejectsDirectory) {
    TempDir dir("mmap");
    EXPECT_THROW(file_io::MmapReader r(dir.path().string()), std::runtime_error);
}
