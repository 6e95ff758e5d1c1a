#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"

#include <cerrno>
#include <fcntl.h>
#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>

namespace debstrap {

static constexpr int dirOpenFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;

AutoCloseFD LocalFileSystem::openDirectory(const Path & path)
{
    AutoCloseFD fd{open(path.c_str(), dirOpenFlags)};
    if (!fd)
        throw SysError("opening directory '%1%'", path);
    return fd;
}

AutoCloseFD LocalFileSystem::openDirectoryAt(int dirFd, const std::string & name)
{
    AutoCloseFD fd{openat(dirFd, name.c_str(), dirOpenFlags)};
    if (!fd)
        throw SysError("opening directory '%1%'", name);
    return fd;
}

void LocalFileSystem::createDirectoryAt(int dirFd, const std::string & name, mode_t mode)
{
    if (mkdirat(dirFd, name.c_str(), mode) == -1)
        throw SysError("creating directory '%1%'", name);
}

void LocalFileSystem::createFileAt(int dirFd, const std::string & name, std::string_view contents, mode_t mode)
{
    AutoCloseFD fd{openat(dirFd, name.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode)};
    if (!fd)
        throw SysError("creating file '%1%'", name);
    writeFull(fd.get(), contents);
    fd.close();
}

void LocalFileSystem::renameAt(int dirFd, const std::string & from, const std::string & to)
{
    if (renameat(dirFd, from.c_str(), dirFd, to.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", from, to);
}

void LocalFileSystem::removeAt(int dirFd, const std::string & name)
{
    if (unlinkat(dirFd, name.c_str(), 0) == -1)
        throw SysError("removing '%1%'", name);
}

Path rootfsPath(const Path & rootfs, std::string_view target)
{
    while (target.starts_with('/'))
        target.remove_prefix(1);
    if (target.empty()) return rootfs;
    return rootfs + "/" + std::string(target);
}

[[noreturn]] static void rethrowTraversalError(const SysError & e, const Path & rootfs, const Path & at)
{
    if (e.errNo == ELOOP || e.errNo == ENOTDIR)
        throw IsolationError(
            "mount point path component '%s' in rootfs %s is a symlink or not a directory, "
            "refusing to traverse it",
            at, rootfs);
    throw IoError(fmt("failed to create mount point %s", rootfsPath(rootfs, at)), e.errNo);
}

Path safeCreateMountPoint(FileSystem & fs, const Path & rootfs, const Path & target)
{
    AutoCloseFD current;
    try {
        current = fs.openDirectory(rootfs);
    } catch (SysError & e) {
        if (e.errNo == ELOOP || e.errNo == ENOTDIR)
            throw IsolationError("rootfs %s is a symlink or not a directory", rootfs);
        throw IoError(fmt("failed to open rootfs %s", rootfs), e.errNo);
    }

    Path walked;
    for (auto & component : tokenizeString<Strings>(target, "/")) {
        if (component == ".") continue;
        if (component == "..")
            throw IsolationError("mount target '%s' contains '..' components", target);

        walked += "/" + component;

        AutoCloseFD next;
        try {
            next = fs.openDirectoryAt(current.get(), component);
        } catch (SysError & e) {
            if (e.errNo != ENOENT)
                rethrowTraversalError(e, rootfs, walked);

            try {
                fs.createDirectoryAt(current.get(), component, 0755);
                debug("created mount point directory %s", rootfsPath(rootfs, walked));
            } catch (SysError & e2) {
                // Someone else created it since we looked; opening again decides.
                if (e2.errNo != EEXIST)
                    rethrowTraversalError(e2, rootfs, walked);
            }

            try {
                next = fs.openDirectoryAt(current.get(), component);
            } catch (SysError & e3) {
                rethrowTraversalError(e3, rootfs, walked);
            }
        }

        current = std::move(next);
    }

    return rootfsPath(rootfs, target);
}

}
