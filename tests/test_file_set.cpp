#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "keypack/file_set.hpp"
#include "temp_dir_test.hpp"

using keypack::FileSet;
using keypack::PackStatus;

namespace {

std::vector<std::string> RelativePaths(const FileSet& set) {
    std::vector<std::string> out;
    for (const auto& file : set.files) {
        out.push_back(file.relative_path);
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

class FileSetTest : public TempDirTest {};

TEST_F(FileSetTest, SingleFileUsesParentAsRoot) {
    WriteText("docs/report.txt", "12345");

    FileSet set;
    ASSERT_EQ(FileSet::Resolve(PathString("docs/report.txt"), true, "*.*", set), PackStatus::Ok);
    ASSERT_EQ(set.Count(), 1U);
    EXPECT_FALSE(set.target_is_directory);
    EXPECT_EQ(set.root, PathString("docs"));
    EXPECT_EQ(set.files[0].relative_path, "report.txt");
    EXPECT_EQ(set.files[0].size, 5U);
}

TEST_F(FileSetTest, DirectoryRecursesWhenAsked) {
    WriteText("in/a.txt", "hello");
    WriteText("in/b/c.txt", "world");

    FileSet set;
    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*.*", set), PackStatus::Ok);
    EXPECT_TRUE(set.target_is_directory);
    EXPECT_EQ(set.root, PathString("in"));
    EXPECT_EQ(RelativePaths(set), (std::vector<std::string>{"a.txt", "b/c.txt"}));
}

TEST_F(FileSetTest, DirectoryTopLevelOnlyWithoutRecursion) {
    WriteText("in/a.txt", "hello");
    WriteText("in/b/c.txt", "world");

    FileSet set;
    ASSERT_EQ(FileSet::Resolve(PathString("in"), false, "*", set), PackStatus::Ok);
    EXPECT_EQ(RelativePaths(set), (std::vector<std::string>{"a.txt"}));
}

TEST_F(FileSetTest, TrailingSeparatorIsIgnored) {
    WriteText("in/a.txt", "hello");

    FileSet set;
    ASSERT_EQ(FileSet::Resolve(PathString("in") + "/", true, "*.*", set), PackStatus::Ok);
    EXPECT_EQ(RelativePaths(set), (std::vector<std::string>{"a.txt"}));
}

TEST_F(FileSetTest, ExtensionFilterSelectsMatchingFiles) {
    WriteText("in/a.txt", "1");
    WriteText("in/b.bin", "2");
    WriteText("in/sub/c.TXT", "3");

    FileSet set;
    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*.txt", set), PackStatus::Ok);
    EXPECT_EQ(RelativePaths(set), (std::vector<std::string>{"a.txt", "sub/c.TXT"}));

    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*.*", set), PackStatus::Ok);
    EXPECT_EQ(set.Count(), 3U);

    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*", set), PackStatus::Ok);
    EXPECT_EQ(set.Count(), 3U);
}

TEST_F(FileSetTest, EmptyDirectoryIdentifiesNothing) {
    fs::create_directories(Path("empty"));

    FileSet set;
    EXPECT_EQ(FileSet::Resolve(PathString("empty"), true, "*.*", set), PackStatus::NoFilesIdentified);
    EXPECT_TRUE(set.Empty());
}

TEST_F(FileSetTest, FilterWithoutMatchesIdentifiesNothing) {
    WriteText("in/a.bin", "1");

    FileSet set;
    EXPECT_EQ(FileSet::Resolve(PathString("in"), true, "*.txt", set), PackStatus::NoFilesIdentified);
}

TEST_F(FileSetTest, MissingPathIsNotFound) {
    FileSet set;
    EXPECT_EQ(FileSet::Resolve(PathString("nothing-here"), true, "*.*", set), PackStatus::PathNotFound);
}

TEST(FileSetFilterTest, MatchesWildcards) {
    EXPECT_TRUE(FileSet::MatchesFilter("notes.txt", "*.txt"));
    EXPECT_TRUE(FileSet::MatchesFilter("NOTES.TXT", "*.txt"));
    EXPECT_FALSE(FileSet::MatchesFilter("notes.txt.bak", "*.txt"));
    EXPECT_TRUE(FileSet::MatchesFilter("data1.csv", "data?.csv"));
    EXPECT_FALSE(FileSet::MatchesFilter("data10.csv", "data?.csv"));
    EXPECT_TRUE(FileSet::MatchesFilter("a.b.c", "a*c"));
    EXPECT_TRUE(FileSet::MatchesFilter("noext", "*.*"));
    EXPECT_TRUE(FileSet::MatchesFilter("noext", ""));
    EXPECT_FALSE(FileSet::MatchesFilter("noext", "*.txt"));
}
