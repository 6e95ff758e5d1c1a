#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/file-system.hh"
#include "tests/temp-rootfs.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <fcntl.h>

namespace debstrap {

using testing::_;

TEST(rootfsPath, joinsWithoutDoubleSlashes)
{
    ASSERT_EQ(rootfsPath("/r", "/tmp/x"), "/r/tmp/x");
    ASSERT_EQ(rootfsPath("/r", "//etc"), "/r/etc");
    ASSERT_EQ(rootfsPath("/r", "/"), "/r");
}

/* ----------------------------------------------------------------------------
 * safeCreateMountPoint against a real directory
 * --------------------------------------------------------------------------*/

class SafeCreateMountPointTest : public TempRootfsTest
{
protected:
    LocalFileSystem fs;
};

TEST_F(SafeCreateMountPointTest, createsMissingComponents)
{
    auto mountPoint = safeCreateMountPoint(fs, rootfs, "/var/cache/apt/archives");

    ASSERT_EQ(mountPoint, rootfs + "/var/cache/apt/archives");
    ASSERT_TRUE(pathExists(mountPoint));
}

TEST_F(SafeCreateMountPointTest, existingDirectoriesAreFine)
{
    ASSERT_NO_THROW(safeCreateMountPoint(fs, rootfs, "/tmp"));
    ASSERT_NO_THROW(safeCreateMountPoint(fs, rootfs, "/./etc/"));
}

TEST_F(SafeCreateMountPointTest, refusesSymlinkedIntermediateComponent)
{
    auto outside = tmpDir + "/outside";
    createDirs(outside);
    createSymlink(outside, rootfs + "/var");

    ASSERT_THROW(safeCreateMountPoint(fs, rootfs, "/var/cache/apt"), IsolationError);
    ASSERT_FALSE(pathExists(outside + "/cache"));
}

TEST_F(SafeCreateMountPointTest, refusesSymlinkedFinalComponent)
{
    auto outside = tmpDir + "/outside";
    createDirs(outside);
    createSymlink(outside, rootfs + "/mnt");

    ASSERT_THROW(safeCreateMountPoint(fs, rootfs, "/mnt"), IsolationError);
}

TEST_F(SafeCreateMountPointTest, refusesFileComponent)
{
    writeFile(rootfs + "/etc/hosts", "");

    ASSERT_THROW(safeCreateMountPoint(fs, rootfs, "/etc/hosts/x"), IsolationError);
}

TEST_F(SafeCreateMountPointTest, refusesSymlinkedRootfs)
{
    auto link = tmpDir + "/link";
    createSymlink(rootfs, link);

    ASSERT_THROW(safeCreateMountPoint(fs, link, "/proc"), IsolationError);
}

TEST_F(SafeCreateMountPointTest, refusesParentComponents)
{
    ASSERT_THROW(safeCreateMountPoint(fs, rootfs, "/tmp/../../escape"), IsolationError);
    ASSERT_FALSE(pathExists(tmpDir + "/escape"));
}

TEST_F(SafeCreateMountPointTest, missingRootfsIsAnIoError)
{
    ASSERT_THROW(safeCreateMountPoint(fs, tmpDir + "/missing", "/proc"), IoError);
}

class LocalFileSystemTest : public TempRootfsTest
{
protected:
    LocalFileSystem fs;
};

TEST_F(LocalFileSystemTest, createFileAtRefusesDanglingSymlink)
{
    auto outside = tmpDir + "/outside-file";
    createSymlink(outside, rootfs + "/etc/resolv.conf");

    auto etc = fs.openDirectory(rootfs + "/etc");
    try {
        fs.createFileAt(etc.get(), "resolv.conf", "nameserver 192.0.2.1\n", 0644);
        FAIL() << "expected a SysError";
    } catch (SysError & e) {
        ASSERT_EQ(e.errNo, EEXIST);
    }
    ASSERT_FALSE(pathExists(outside));
}

/* ----------------------------------------------------------------------------
 * safeCreateMountPoint against a scripted filesystem
 * --------------------------------------------------------------------------*/

class MockFileSystem : public FileSystem
{
public:
    MOCK_METHOD(AutoCloseFD, openDirectory, (const Path & path), (override));
    MOCK_METHOD(AutoCloseFD, openDirectoryAt, (int dirFd, const std::string & name), (override));
    MOCK_METHOD(void, createDirectoryAt, (int dirFd, const std::string & name, mode_t mode), (override));
    MOCK_METHOD(
        void, createFileAt, (int dirFd, const std::string & name, std::string_view contents, mode_t mode), (override));
    MOCK_METHOD(void, renameAt, (int dirFd, const std::string & from, const std::string & to), (override));
    MOCK_METHOD(void, removeAt, (int dirFd, const std::string & name), (override));
};

static AutoCloseFD someDirectory()
{
    return AutoCloseFD{::open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
}

TEST(safeCreateMountPoint, stopsAtSymlinkWithoutCreatingAnything)
{
    MockFileSystem fs;

    EXPECT_CALL(fs, openDirectory("/r")).WillOnce([](const Path &) { return someDirectory(); });
    EXPECT_CALL(fs, openDirectoryAt(_, "a")).WillOnce([](int, const std::string &) { return someDirectory(); });
    EXPECT_CALL(fs, openDirectoryAt(_, "b")).WillOnce([](int, const std::string &) -> AutoCloseFD {
        throw SysError(ELOOP, "opening 'b'");
    });
    EXPECT_CALL(fs, openDirectoryAt(_, "c")).Times(0);
    EXPECT_CALL(fs, createDirectoryAt(_, _, _)).Times(0);

    ASSERT_THROW(safeCreateMountPoint(fs, "/r", "/a/b/c"), IsolationError);
}

TEST(safeCreateMountPoint, createsMissingComponentThenOpensIt)
{
    MockFileSystem fs;
    testing::InSequence seq;

    EXPECT_CALL(fs, openDirectory("/r")).WillOnce([](const Path &) { return someDirectory(); });
    EXPECT_CALL(fs, openDirectoryAt(_, "mnt")).WillOnce([](int, const std::string &) -> AutoCloseFD {
        throw SysError(ENOENT, "opening 'mnt'");
    });
    EXPECT_CALL(fs, createDirectoryAt(_, "mnt", 0755));
    EXPECT_CALL(fs, openDirectoryAt(_, "mnt")).WillOnce([](int, const std::string &) { return someDirectory(); });

    ASSERT_EQ(safeCreateMountPoint(fs, "/r", "/mnt"), "/r/mnt");
}

TEST(safeCreateMountPoint, concurrentCreationIsNotAnError)
{
    MockFileSystem fs;
    testing::InSequence seq;

    EXPECT_CALL(fs, openDirectory("/r")).WillOnce([](const Path &) { return someDirectory(); });
    EXPECT_CALL(fs, openDirectoryAt(_, "mnt")).WillOnce([](int, const std::string &) -> AutoCloseFD {
        throw SysError(ENOENT, "opening 'mnt'");
    });
    EXPECT_CALL(fs, createDirectoryAt(_, "mnt", 0755)).WillOnce([](int, const std::string &, mode_t) {
        throw SysError(EEXIST, "creating 'mnt'");
    });
    EXPECT_CALL(fs, openDirectoryAt(_, "mnt")).WillOnce([](int, const std::string &) { return someDirectory(); });

    ASSERT_NO_THROW(safeCreateMountPoint(fs, "/r", "/mnt"));
}

TEST(safeCreateMountPoint, otherFailuresAreIoErrors)
{
    MockFileSystem fs;

    EXPECT_CALL(fs, openDirectory("/r")).WillOnce([](const Path &) { return someDirectory(); });
    EXPECT_CALL(fs, openDirectoryAt(_, "mnt")).WillOnce([](int, const std::string &) -> AutoCloseFD {
        throw SysError(EACCES, "opening 'mnt'");
    });

    ASSERT_THROW(safeCreateMountPoint(fs, "/r", "/mnt"), IoError);
}

}
