/**
 * @file test_nameindex.cpp
 * @brief Unit tests for NameIndex, IndexFilter and NameIndexer
 *
 * @see NameIndex
 * @see NameIndexer
 */

#include <gtest/gtest.h>
#include "testtree.hpp"
#include "nameindex.hpp"
#include "localfilesystem.hpp"

TEST(NameIndexTest, KeepsInsertionOrder) {
    NameIndex index;
    index.add("b.txt", "/r/1/b.txt");
    index.add("a.txt", "/r/1/a.txt");
    index.add("b.txt", "/r/2/b.txt");

    ASSERT_EQ(index.size(), 2u);
    EXPECT_EQ(index.groups()[0].name, "b.txt");
    EXPECT_EQ(index.groups()[1].name, "a.txt");

    const auto* group = index.find("b.txt");
    ASSERT_NE(group, nullptr);
    ASSERT_EQ(group->paths.size(), 2u);
    EXPECT_EQ(group->paths[0], "/r/1/b.txt");
    EXPECT_EQ(group->paths[1], "/r/2/b.txt");

    EXPECT_EQ(index.entryCount(), 3u);
    EXPECT_EQ(index.find("missing"), nullptr);
}

TEST(IndexFilterTest, NormalizesExtensions) {
    EXPECT_EQ(IndexFilter::normalizeExtension(".TXT"), ".txt");
    EXPECT_EQ(IndexFilter::normalizeExtension("jpg"), ".jpg");
    EXPECT_EQ(IndexFilter::normalizeExtension(" .Zip "), ".zip");
    EXPECT_EQ(IndexFilter::normalizeExtension(""), "");
}

TEST(IndexFilterTest, MatchesKindNameAndExtension) {
    Entry file("/r/Report.TXT", Entry::Kind::File, 1);
    Entry dir("/r/Report.TXT.d", Entry::Kind::Directory, 1);

    IndexFilter filter;
    EXPECT_TRUE(filter.matches(file));
    EXPECT_FALSE(filter.matches(dir));

    filter.extension = ".txt";
    EXPECT_TRUE(filter.matches(file));

    filter.name = "Report.TXT";
    EXPECT_TRUE(filter.matches(file));

    filter.name = "report.txt";  // names are case-sensitive
    EXPECT_FALSE(filter.matches(file));

    IndexFilter folders;
    folders.kind = Entry::Kind::Directory;
    EXPECT_TRUE(folders.matches(dir));
    EXPECT_FALSE(folders.matches(file));
}

class NameIndexerTest : public TempTreeTest {
protected:
    LocalFileSystem fs;
};

/**
 * @test GroupsEveryMatchOnce
 * @brief Verifies that every matching entry lands in exactly one group
 *
 * Three x.txt files in different directories form one group in walk order;
 * the unique y.txt forms its own group of one.
 */
TEST_F(NameIndexerTest, GroupsEveryMatchOnce) {
    createFile("a/x.txt");
    createFile("b/x.txt");
    createFile("b/sub/x.txt");
    createFile("c/y.txt");

    TreeWalker walker(fs);
    auto index = NameIndexer::build(walker, test_dir, IndexFilter{});

    ASSERT_EQ(index.size(), 2u);
    EXPECT_EQ(index.entryCount(), 4u);

    const auto* x = index.find("x.txt");
    ASSERT_NE(x, nullptr);
    ASSERT_EQ(x->paths.size(), 3u);
    EXPECT_EQ(x->paths[0], test_dir / "a/x.txt");
    EXPECT_EQ(x->paths[1], test_dir / "b/sub/x.txt");
    EXPECT_EQ(x->paths[2], test_dir / "b/x.txt");

    const auto* y = index.find("y.txt");
    ASSERT_NE(y, nullptr);
    EXPECT_EQ(y->paths.size(), 1u);
}

TEST_F(NameIndexerTest, FiltersByExtensionCaseInsensitively) {
    createFile("a/photo.JPG");
    createFile("b/photo.jpg");
    createFile("b/notes.txt");

    TreeWalker walker(fs);
    IndexFilter filter;
    filter.extension = IndexFilter::normalizeExtension(".jpg");

    auto index = NameIndexer::build(walker, test_dir, filter);

    EXPECT_EQ(index.size(), 2u);  // "photo.JPG" and "photo.jpg" are different names
    EXPECT_EQ(index.find("notes.txt"), nullptr);
}

TEST_F(NameIndexerTest, FolderModeIndexesDirectoriesOnly) {
    createFile("one/backup/a.txt");
    createFile("two/backup/b.txt");
    createFile("backup.txt");

    TreeWalker walker(fs);
    IndexFilter filter;
    filter.kind = Entry::Kind::Directory;

    auto index = NameIndexer::build(walker, test_dir, filter);

    const auto* backup = index.find("backup");
    ASSERT_NE(backup, nullptr);
    EXPECT_EQ(backup->paths.size(), 2u);
    EXPECT_EQ(index.find("backup.txt"), nullptr);
    EXPECT_EQ(index.find("a.txt"), nullptr);
}

TEST_F(NameIndexerTest, NameFilterKeepsExactMatches) {
    createFile("a/keep.txt");
    createFile("b/keep.txt");
    createFile("b/other.txt");

    TreeWalker walker(fs);
    IndexFilter filter;
    filter.name = "keep.txt";
    filter.extension = ".txt";

    auto index = NameIndexer::build(walker, test_dir, filter);

    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.groups()[0].name, "keep.txt");
    EXPECT_EQ(index.groups()[0].paths.size(), 2u);
}
