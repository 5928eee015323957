/**
 * @file test_pathguard.cpp
 * @brief Unit tests for the PathGuard class
 *
 * This file contains Google Test unit tests that verify the checks run
 * before a move or delete: system path protection, user home directory
 * protection and mount point detection.
 *
 * @see PathGuard
 */

#include <gtest/gtest.h>
#include "testtree.hpp"
#include "pathguard.hpp"

#include <cstdlib>
#include <sstream>

/**
 * @class PathGuardTest
 * @brief Test fixture for PathGuard unit tests
 *
 * Builds on TempTreeTest and additionally points HOME at the scratch
 * directory for the duration of a test, so that home protection can be
 * checked without touching the real home directory. The previous value is
 * restored on teardown.
 */
class PathGuardTest : public TempTreeTest {
protected:
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        TempTreeTest::SetUp();

        const char* home = std::getenv("HOME");
        had_home = home != nullptr;
        if (had_home) {
            saved_home = home;
        }
        setenv("HOME", (test_dir / "home").c_str(), 1);
    }

    void TearDown() override {
        if (had_home) {
            setenv("HOME", saved_home.c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        TempTreeTest::TearDown();
    }
};

/**
 * @test BlocksSystemPaths
 * @brief Verifies that critical system directories are blocked
 *
 * Tested paths:
 * - / (root filesystem)
 * - /etc (system configuration)
 * - /usr/ (trailing slash is ignored)
 * - /var/../tmp (normalised before the check)
 *
 * Expected behavior: All return RemovalStatus::BlockedSystemPath
 *
 * @see PathGuard::checkRemoval()
 */
TEST_F(PathGuardTest, BlocksSystemPaths) {
    PathGuard guard(std::vector<PathGuard::MountInfo>{});

    EXPECT_EQ(guard.checkRemoval("/"), PathGuard::RemovalStatus::BlockedSystemPath);
    EXPECT_EQ(guard.checkRemoval("/etc"), PathGuard::RemovalStatus::BlockedSystemPath);
    EXPECT_EQ(guard.checkRemoval("/usr/"), PathGuard::RemovalStatus::BlockedSystemPath);
    EXPECT_EQ(guard.checkRemoval("/var/../tmp"), PathGuard::RemovalStatus::BlockedSystemPath);
}

/**
 * @test BlocksUserHome
 * @brief Verifies that the directory named by HOME is protected
 */
TEST_F(PathGuardTest, BlocksUserHome) {
    auto home = createDir("home");
    PathGuard guard(std::vector<PathGuard::MountInfo>{});

    EXPECT_EQ(guard.checkRemoval(home), PathGuard::RemovalStatus::BlockedHome);
    EXPECT_EQ(guard.checkRemoval(home / "documents"), PathGuard::RemovalStatus::Allowed);
}

TEST_F(PathGuardTest, BlocksMountPoints) {
    auto mounted = createDir("mnt/usb");
    PathGuard guard(std::vector<PathGuard::MountInfo>{{"/dev/sdb1", mounted.string(), "vfat"}});

    EXPECT_EQ(guard.checkRemoval(mounted), PathGuard::RemovalStatus::BlockedMountPoint);
    EXPECT_EQ(guard.checkRemoval(mounted / "photo.jpg"), PathGuard::RemovalStatus::Allowed);
}

/**
 * @test AllowsNormalFiles
 * @brief Verifies that ordinary files and directories pass every check
 */
TEST_F(PathGuardTest, AllowsNormalFiles) {
    auto file = createFile("a/test.txt");
    PathGuard guard(std::vector<PathGuard::MountInfo>{});

    EXPECT_EQ(guard.checkRemoval(file), PathGuard::RemovalStatus::Allowed);
    EXPECT_EQ(guard.checkRemoval(test_dir / "a"), PathGuard::RemovalStatus::Allowed);
}

/**
 * @test ParsesMountTable
 * @brief Verifies parsing of /proc/mounts lines
 *
 * The kernel writes a blank inside a mount point as "\040"; the parsed
 * mount point must contain the real blank. Malformed lines are skipped.
 */
TEST_F(PathGuardTest, ParsesMountTable) {
    std::istringstream table(
        "/dev/sda1 / ext4 rw,relatime 0 0\n"
        "/dev/sdb1 /media/My\\040Disk vfat rw 0 0\n"
        "broken\n");

    auto mounts = PathGuard::parseMounts(table);

    ASSERT_EQ(mounts.size(), 2u);
    EXPECT_EQ(mounts[0].device, "/dev/sda1");
    EXPECT_EQ(mounts[0].mountpoint, "/");
    EXPECT_EQ(mounts[0].fstype, "ext4");
    EXPECT_EQ(mounts[1].mountpoint, "/media/My Disk");

    PathGuard guard(mounts);
    EXPECT_TRUE(guard.isMountPoint("/media/My Disk"));
    EXPECT_FALSE(guard.isMountPoint("/media"));
}

/**
 * @test StatusMessages
 * @brief Verifies that messages name both the reason and the path
 */
TEST_F(PathGuardTest, StatusMessages) {
    auto msg = PathGuard::getStatusMessage(PathGuard::RemovalStatus::BlockedSystemPath, "/etc");
    EXPECT_NE(msg.find("system"), std::string::npos);
    EXPECT_NE(msg.find("/etc"), std::string::npos);

    msg = PathGuard::getStatusMessage(PathGuard::RemovalStatus::BlockedMountPoint, "/mnt/usb");
    EXPECT_NE(msg.find("mount point"), std::string::npos);
}

TEST_F(PathGuardTest, IsSystemPath) {
    EXPECT_TRUE(PathGuard::isSystemPath("/"));
    EXPECT_TRUE(PathGuard::isSystemPath("/etc"));
    EXPECT_FALSE(PathGuard::isSystemPath("/home/user/test"));
}
