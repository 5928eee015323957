/**
 * @file test_consolidator.cpp
 * @brief Unit tests for the Consolidator class
 *
 * @see Consolidator
 */

#include <gtest/gtest.h>
#include "testtree.hpp"
#include "consolidator.hpp"
#include "localfilesystem.hpp"

#include <set>

/**
 * @brief LocalFileSystem whose reads fail for chosen file names
 */
class UnreadableFileSystem : public LocalFileSystem {
public:
    std::set<std::string> unreadable;

    std::error_code readText(const std::filesystem::path& file, std::string& content) const override {
        if (unreadable.count(file.filename().string())) {
            return std::make_error_code(std::errc::permission_denied);
        }
        return LocalFileSystem::readText(file, content);
    }
};

class ConsolidatorTest : public TempTreeTest {
protected:
    UnreadableFileSystem fs;
};

TEST(ConsolidatorStripTest, TrimsBothEnds) {
    EXPECT_EQ(Consolidator::strip("  hi \n"), "hi");
    EXPECT_EQ(Consolidator::strip("\t\r\n"), "");
    EXPECT_EQ(Consolidator::strip("a  b"), "a  b");
    EXPECT_EQ(Consolidator::strip(""), "");
}

TEST(ConsolidatorRenderTest, SeparatesWithBlankLine) {
    EXPECT_EQ(Consolidator::render({}), "");
    EXPECT_EQ(Consolidator::render({"one"}), "one");
    EXPECT_EQ(Consolidator::render({"one", "two"}), "one\n\ntwo");
}

/**
 * @test KeepsDistinctContentsInWalkOrder
 * @brief Three files "hi", "hi\n", "bye" merge into "hi" and "bye"
 */
TEST_F(ConsolidatorTest, KeepsDistinctContentsInWalkOrder) {
    createFile("a/one.txt", "hi");
    createFile("b/two.txt", "hi\n");
    createFile("c/three.txt", "bye");

    Consolidator consolidator(fs);
    auto result = consolidator.collect(TreeWalker(fs), test_dir, ".txt");

    EXPECT_EQ(result.filesRead, 3u);
    ASSERT_EQ(result.contents.size(), 2u);
    EXPECT_EQ(Consolidator::render(result.contents), "hi\n\nbye");
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(ConsolidatorTest, IgnoresOtherExtensionsAndBlankFiles) {
    createFile("notes.TXT", "upper");
    createFile("data.csv", "1,2,3");
    createFile("blank.txt", "  \n ");

    Consolidator consolidator(fs);
    auto result = consolidator.collect(TreeWalker(fs), test_dir, ".txt");

    EXPECT_EQ(result.filesRead, 2u);
    ASSERT_EQ(result.contents.size(), 1u);
    EXPECT_EQ(result.contents[0], "upper");
}

TEST_F(ConsolidatorTest, RecordsUnreadableFiles) {
    createFile("a.txt", "alpha");
    createFile("locked.txt", "secret");
    createFile("z.txt", "omega");
    fs.unreadable.insert("locked.txt");

    Consolidator consolidator(fs);
    auto result = consolidator.collect(TreeWalker(fs), test_dir, ".txt");

    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].path, test_dir / "locked.txt");
    EXPECT_FALSE(result.failures[0].message.empty());
    EXPECT_EQ(Consolidator::render(result.contents), "alpha\n\nomega");
}

TEST(ConsolidatorNewlineTest, NormalizesLineEnds) {
    EXPECT_EQ(Consolidator::normalizeNewlines("a\r\nb"), "a\nb");
    EXPECT_EQ(Consolidator::normalizeNewlines("a\rb\r"), "a\nb\n");
    EXPECT_EQ(Consolidator::normalizeNewlines("a\n\nb"), "a\n\nb");
}

TEST(ConsolidatorUtf8Test, RecognisesWellFormedText) {
    EXPECT_TRUE(Consolidator::isValidUtf8("plain"));
    EXPECT_TRUE(Consolidator::isValidUtf8("gr\xc3\xbc\xc3\x9f"));
    EXPECT_TRUE(Consolidator::isValidUtf8("\xe2\x82\xac \xf0\x9f\x98\x80"));
    EXPECT_FALSE(Consolidator::isValidUtf8("\xff"));
    EXPECT_FALSE(Consolidator::isValidUtf8("\xc3"));
    EXPECT_FALSE(Consolidator::isValidUtf8("\xc0\xaf"));
    EXPECT_FALSE(Consolidator::isValidUtf8("\xed\xa0\x80"));
}

/**
 * @test WindowsLineEndsMatchUnixText
 * @brief "a\r\nb" and "a\nb" are the same text and contribute once
 */
TEST_F(ConsolidatorTest, WindowsLineEndsMatchUnixText) {
    createFile("dos.txt", "a\r\nb\r\n");
    createFile("unix.txt", "a\nb\n");

    Consolidator consolidator(fs);
    auto result = consolidator.collect(TreeWalker(fs), test_dir, ".txt");

    EXPECT_EQ(result.filesRead, 2u);
    ASSERT_EQ(result.contents.size(), 1u);
    EXPECT_EQ(result.contents[0], "a\nb");
}

TEST_F(ConsolidatorTest, SkipsFilesThatAreNotUtf8) {
    createFile("binary.txt", std::string("\xff\xfe\x00z", 4));
    createFile("text.txt", "hello");

    Consolidator consolidator(fs);
    auto result = consolidator.collect(TreeWalker(fs), test_dir, ".txt");

    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].path, test_dir / "binary.txt");
    EXPECT_EQ(result.failures[0].message, "not valid UTF-8 text");
    EXPECT_EQ(result.filesRead, 1u);
    EXPECT_EQ(Consolidator::render(result.contents), "hello");
}
