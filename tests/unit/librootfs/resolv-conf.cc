#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/resolv-conf.hh"
#include "debstrap/libutil/file-system.hh"
#include "tests/event-log.hh"
#include "tests/temp-rootfs.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>

namespace debstrap {

TEST(generateResolvConf, nameServersThenSearch)
{
    ASSERT_EQ(
        generateResolvConf({"8.8.8.8", "8.8.4.4"}, {"example.com"}),
        "nameserver 8.8.8.8\n"
        "nameserver 8.8.4.4\n"
        "search example.com\n");
}

TEST(generateResolvConf, noSearchLine)
{
    ASSERT_EQ(generateResolvConf({"2001:4860:4860::8888"}, {}), "nameserver 2001:4860:4860::8888\n");
}

TEST(ResolvConfConfig, copyOrNameServersRequired)
{
    ASSERT_THROW((ResolvConfConfig{}.validate()), ValidationError);
    ASSERT_THROW((ResolvConfConfig{.search = {"example.com"}}.validate()), ValidationError);
    ASSERT_NO_THROW((ResolvConfConfig{.copy = true}.validate()));
    ASSERT_NO_THROW((ResolvConfConfig{.nameServers = {"1.1.1.1"}}.validate()));
}

TEST(ResolvConfConfig, copyExcludesExplicitEntries)
{
    ASSERT_THROW((ResolvConfConfig{.copy = true, .nameServers = {"1.1.1.1"}}.validate()), ValidationError);
}

TEST(validateResolvEntries, limits)
{
    ASSERT_THROW(
        validateResolvEntries("resolv_conf", {"1.1.1.1", "1.0.0.1", "8.8.8.8", "8.8.4.4"}, {}),
        ValidationError);
    ASSERT_THROW(
        validateResolvEntries("resolv_conf", {"1.1.1.1"}, {"a", "b", "c", "d", "e", "f", "g"}),
        ValidationError);
    ASSERT_THROW(
        validateResolvEntries("resolv_conf", {"1.1.1.1"}, {std::string(257, 'a')}),
        ValidationError);
}

TEST(validateResolvEntries, malformedEntries)
{
    ASSERT_THROW(validateResolvEntries("resolv_conf", {"dns.google"}, {}), ValidationError);
    ASSERT_THROW(validateResolvEntries("resolv_conf", {"1.1.1.1"}, {"exa mple.com"}), ValidationError);
    ASSERT_THROW(validateResolvEntries("resolv_conf", {"1.1.1.1"}, {""}), ValidationError);
}

/* ----------------------------------------------------------------------------
 * RootfsResolvConf
 * --------------------------------------------------------------------------*/

class RootfsResolvConfTest : public TempRootfsTest
{
protected:
    LocalFileSystem fs;
    Path hostResolvConf;

    void SetUp() override
    {
        TempRootfsTest::SetUp();
        hostResolvConf = writeHostFile("host/resolv.conf", "nameserver 192.0.2.53\n");
    }

    Path backup() const
    {
        return rootfs + "/etc/" + std::string(resolvConfBackupName);
    }
};

TEST_F(RootfsResolvConfTest, generatedFileIsReplacedAndOriginalRestored)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");

    RootfsResolvConf resolv(
        rootfs, ResolvConfConfig{.nameServers = {"8.8.8.8"}, .search = {"example.com"}}, hostResolvConf, fs, false);

    resolv.setup();
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "nameserver 8.8.8.8\nsearch example.com\n");
    ASSERT_EQ(readFile(backup()), "original\n");

    resolv.teardown();
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_FALSE(pathExists(backup()));
}

TEST_F(RootfsResolvConfTest, copiesHostFile)
{
    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, false);

    resolv.setup();
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "nameserver 192.0.2.53\n");

    resolv.teardown();
    ASSERT_FALSE(pathExists(rootfs + "/etc/resolv.conf"));
}

TEST_F(RootfsResolvConfTest, preservesSymlinkedOriginal)
{
    createSymlink("../run/systemd/resolve/stub-resolv.conf", rootfs + "/etc/resolv.conf");

    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, false);
    resolv.setup();
    ASSERT_FALSE(isLink(rootfs + "/etc/resolv.conf"));

    resolv.teardown();
    ASSERT_TRUE(isLink(rootfs + "/etc/resolv.conf"));
    ASSERT_EQ(readLink(rootfs + "/etc/resolv.conf"), "../run/systemd/resolve/stub-resolv.conf");
}

TEST_F(RootfsResolvConfTest, teardownTwiceIsANoOp)
{
    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, false);
    resolv.setup();
    resolv.teardown();

    writeFile(rootfs + "/etc/resolv.conf", "written later\n");
    resolv.teardown();

    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "written later\n");
}

TEST_F(RootfsResolvConfTest, destructorRestores)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");
    {
        RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, false);
        resolv.setup();
    }
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
}

TEST_F(RootfsResolvConfTest, tooManyNameServersFailsBeforeWriting)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");

    RootfsResolvConf resolv(
        rootfs,
        ResolvConfConfig{.nameServers = {"1.1.1.1", "1.0.0.1", "8.8.8.8", "8.8.4.4"}},
        hostResolvConf,
        fs,
        false);

    ASSERT_THROW(resolv.setup(), ValidationError);
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_FALSE(pathExists(backup()));
}

TEST_F(RootfsResolvConfTest, refusesSymlinkedEtc)
{
    deletePath(rootfs + "/etc");
    auto outside = tmpDir + "/outside-etc";
    createDirs(outside);
    createSymlink(outside, rootfs + "/etc");

    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, false);

    ASSERT_THROW(resolv.setup(), IsolationError);
    ASSERT_FALSE(pathExists(outside + "/resolv.conf"));
}

TEST_F(RootfsResolvConfTest, refusesStaleBackup)
{
    writeFile(backup(), "left over\n");

    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, false);

    ASSERT_THROW(resolv.setup(), IsolationError);
    ASSERT_EQ(readFile(backup()), "left over\n");
}

TEST_F(RootfsResolvConfTest, missingHostFileLeavesRootfsUntouched)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");

    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, tmpDir + "/missing", fs, false);

    ASSERT_THROW(resolv.setup(), IoError);
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_FALSE(pathExists(backup()));
}

TEST_F(RootfsResolvConfTest, dryRunOnlyLogs)
{
    EventLog log;
    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fs, true);

    resolv.setup();
    resolv.teardown();

    ASSERT_FALSE(pathExists(rootfs + "/etc/resolv.conf"));
    ASSERT_TRUE(log.contains("dry run: would set up resolv.conf"));
    ASSERT_TRUE(log.contains("dry run: would restore resolv.conf"));
}

TEST_F(RootfsResolvConfTest, nothingConfiguredDoesNothing)
{
    RootfsResolvConf resolv(rootfs, std::nullopt, hostResolvConf, fs, false);
    ASSERT_TRUE(resolv.empty());

    resolv.setup();
    resolv.teardown();

    ASSERT_FALSE(pathExists(rootfs + "/etc/resolv.conf"));
}

/**
 * Creates the file and writes half of it, then fails like a full disk.
 */
class FullDiskFileSystem : public LocalFileSystem
{
public:
    void createFileAt(int dirFd, const std::string & name, std::string_view contents, mode_t mode) override
    {
        LocalFileSystem::createFileAt(dirFd, name, contents.substr(0, contents.size() / 2), mode);
        throw SysError(ENOSPC, "writing '%1%'", name);
    }
};

TEST_F(RootfsResolvConfTest, failedWriteRestoresTheOriginal)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");
    FullDiskFileSystem fullDisk;

    RootfsResolvConf resolv(
        rootfs, ResolvConfConfig{.nameServers = {"8.8.8.8"}}, hostResolvConf, fullDisk, false);

    try {
        resolv.setup();
        FAIL() << "expected an IoError";
    } catch (IoError & e) {
        ASSERT_EQ(e.errNo, ENOSPC);
        ASSERT_THAT(e.info().msg.str(), testing::HasSubstr("failed to write " + rootfs + "/etc/resolv.conf"));
    }

    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_FALSE(pathExists(backup()));

    resolv.teardown();
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
}

TEST_F(RootfsResolvConfTest, failedWriteWithoutOriginalLeavesNothing)
{
    FullDiskFileSystem fullDisk;

    RootfsResolvConf resolv(rootfs, ResolvConfConfig{.copy = true}, hostResolvConf, fullDisk, false);

    ASSERT_THROW(resolv.setup(), IoError);
    ASSERT_FALSE(pathExists(rootfs + "/etc/resolv.conf"));
    ASSERT_FALSE(pathExists(backup()));
}

}
