#pragma once
///@file Symlink-refusing filesystem traversal inside a rootfs.

#include "debstrap/libutil/file-descriptor.hh"
#include "debstrap/libutil/types.hh"

#include <string_view>
#include <sys/types.h>

namespace debstrap {

/**
 * Component-wise directory access that never follows symlinks. All
 * methods throw `SysError` carrying the errno of the failed call.
 */
class FileSystem
{
public:
    virtual ~FileSystem() = default;

    /**
     * Open `path` as a directory. Fails with ELOOP if the last
     * component is a symlink, ENOTDIR if it is not a directory.
     */
    virtual AutoCloseFD openDirectory(const Path & path) = 0;

    /**
     * Open the directory `name` relative to `dirFd` with the same
     * rules as `openDirectory()`.
     */
    virtual AutoCloseFD openDirectoryAt(int dirFd, const std::string & name) = 0;

    /**
     * Create the directory `name` relative to `dirFd`.
     */
    virtual void createDirectoryAt(int dirFd, const std::string & name, mode_t mode) = 0;

    /**
     * Create the regular file `name` relative to `dirFd` and write
     * `contents` to it. Fails with EEXIST if anything, including a
     * dangling symlink, is already there. A failed write can leave a
     * partial file behind.
     */
    virtual void createFileAt(int dirFd, const std::string & name, std::string_view contents, mode_t mode) = 0;

    virtual void renameAt(int dirFd, const std::string & from, const std::string & to) = 0;

    /**
     * Remove the non-directory `name` relative to `dirFd`.
     */
    virtual void removeAt(int dirFd, const std::string & name) = 0;
};

/**
 * `FileSystem` backed by the `*at(2)` system calls.
 */
class LocalFileSystem : public FileSystem
{
public:
    AutoCloseFD openDirectory(const Path & path) override;
    AutoCloseFD openDirectoryAt(int dirFd, const std::string & name) override;
    void createDirectoryAt(int dirFd, const std::string & name, mode_t mode) override;
    void createFileAt(int dirFd, const std::string & name, std::string_view contents, mode_t mode) override;
    void renameAt(int dirFd, const std::string & from, const std::string & to) override;
    void removeAt(int dirFd, const std::string & name) override;
};

/**
 * Create the mount point `target` (an absolute path inside the rootfs)
 * below `rootfs`, one component at a time, refusing to traverse
 * symlinks.
 *
 * A symlink or non-directory anywhere on the way is an `IsolationError`;
 * other failures are `IoError`s. Nothing is created past the failing
 * component. Returns `rootfs` joined with `target`.
 */
Path safeCreateMountPoint(FileSystem & fs, const Path & rootfs, const Path & target);

/**
 * `rootfs` joined with the absolute in-rootfs path `target`.
 */
Path rootfsPath(const Path & rootfs, std::string_view target);

}
