#pragma once
/**
 * @file
 *
 * Paths and files on the host. Functions taking a `Path` throw
 * `SysError` when the underlying system call fails.
 */

#include "debstrap/libutil/types.hh"

#include <sys/stat.h>
#include <sys/types.h>

#include <optional>

namespace debstrap {

/**
 * Make `path` absolute against `dir` (default: the working directory)
 * and canonicalise it.
 */
Path absPath(Path path, std::optional<PathView> dir = {});

/**
 * Remove `.` and `..` components and repeated or trailing slashes from
 * an absolute path, without looking at the file system. `..` never
 * climbs above `/`.
 */
Path canonPath(PathView path);

void chmodPath(const Path & path, mode_t mode);

/**
 * Everything before the last `/`: `/` for the root and its children,
 * `.` for a path without slashes.
 */
Path dirOf(PathView path);

/**
 * Everything after the last `/`, ignoring one trailing slash.
 */
std::string_view baseNameOf(std::string_view path);

/**
 * `stat` or `lstat` that returns `std::nullopt` when the path (or one
 * of its parents) does not exist.
 */
std::optional<struct stat> maybeStat(const Path & path);
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * Whether `path` exists. A dangling symlink exists.
 */
bool pathExists(const Path & path);

Path readLink(const Path & path);

bool isLink(const Path & path);

std::string readFile(const Path & path);

/**
 * Create or truncate `path` and write `s` to it. `mode` only applies
 * to newly created files.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

/**
 * Delete `path`, recursively for directories. Symlinks are removed, not
 * followed. A missing path is not an error.
 */
void deletePath(const Path & path);

/**
 * Create `path` and any missing parents. Returns the directories that
 * were created, outermost first.
 */
Paths createDirs(const Path & path);

void createSymlink(const Path & target, const Path & link);

/**
 * Copy a regular file, or a symlink as a symlink, replacing `newPath`
 * if it exists.
 */
void copyFile(const Path & oldPath, const Path & newPath);

/**
 * Deletes a path when it goes out of scope.
 */
class AutoDelete
{
    Path path;
    bool del = false;
    bool recursive = true;

public:
    AutoDelete() = default;
    AutoDelete(const Path & p, bool recursive = true);
    AutoDelete(const AutoDelete &) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;
    ~AutoDelete();

    void cancel() { del = false; }
    void reset(const Path & p, bool recursive = true);

    operator Path() const { return path; }
    operator PathView() const { return path; }
};

/**
 * Create a fresh directory `<prefix>-<pid>-<n>` under `$TMPDIR` (or
 * `/tmp`), mode 0755.
 */
Path createTempDir(const Path & prefix = "debstrap");

}
