#include "debstrap/libutil/environment-variables.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/file-descriptor.hh"
#include "debstrap/libutil/file-system.hh"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace debstrap {

Path absPath(Path path, std::optional<PathView> dir)
{
    if (path.starts_with('/'))
        return canonPath(path);

    Path base;
    if (dir)
        base = *dir;
    else {
        std::error_code ec;
        base = fs::current_path(ec).string();
        if (ec)
            throw SysError(ec, "determining the working directory");
    }
    return canonPath(base + "/" + path);
}

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    Path res;
    while (true) {
        while (!path.empty() && path[0] == '/') path.remove_prefix(1);
        if (path.empty()) break;

        auto slash = path.find('/');
        auto component = path.substr(0, slash);
        path.remove_prefix(component.size());

        if (component == ".")
            continue;
        if (component == "..") {
            if (!res.empty()) res.erase(res.rfind('/'));
            continue;
        }
        res += '/';
        res += component;
    }

    return res.empty() ? "/" : res;
}

void chmodPath(const Path & path, mode_t mode)
{
    if (chmod(path.c_str(), mode) == -1)
        throw SysError("setting permissions on '%s'", path);
}

Path dirOf(PathView path)
{
    auto pos = path.rfind('/');
    if (pos == path.npos)
        return ".";
    return pos == 0 ? "/" : Path(path.substr(0, pos));
}

std::string_view baseNameOf(std::string_view path)
{
    if (path.empty())
        return "";

    auto last = path.size() - 1;
    if (path[last] == '/' && last > 0)
        last -= 1;

    auto pos = path.rfind('/', last);
    pos = pos == path.npos ? 0 : pos + 1;

    return path.substr(pos, last - pos + 1);
}

static std::optional<struct stat> existingOrThrow(int res, const struct stat & st, const Path & path)
{
    if (res == 0)
        return st;
    if (errno == ENOENT || errno == ENOTDIR)
        return std::nullopt;
    throw SysError("getting status of '%s'", path);
}

std::optional<struct stat> maybeStat(const Path & path)
{
    struct stat st;
    int res = ::stat(path.c_str(), &st);
    return existingOrThrow(res, st, path);
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    struct stat st;
    int res = ::lstat(path.c_str(), &st);
    return existingOrThrow(res, st, path);
}

bool pathExists(const Path & path)
{
    return maybeLstat(path).has_value();
}

Path readLink(const Path & path)
{
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec)
        throw SysError(ec, "reading symbolic link '%1%'", path);
    return target.string();
}

bool isLink(const Path & path)
{
    auto st = maybeLstat(path);
    return st && S_ISLNK(st->st_mode);
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd)
        throw SysError("opening file '%1%'", path);

    std::string res;
    std::array<char, 64 * 1024> buf;
    while (true) {
        ssize_t rd = read(fd.get(), buf.data(), buf.size());
        if (rd == -1) {
            if (errno == EINTR) continue;
            throw SysError("reading file '%1%'", path);
        }
        if (rd == 0) break;
        res.append(buf.data(), rd);
    }
    return res;
}

void writeFile(const Path & path, std::string_view s, mode_t mode)
{
    AutoCloseFD fd{open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode)};
    if (!fd)
        throw SysError("opening file '%1%'", path);

    try {
        writeFull(fd.get(), s);
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }

    /* Close explicitly so that a failing close() is reported. */
    fd.close();
}

void deletePath(const Path & path)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        throw SysError(ec, "deleting '%1%'", path);
}

Paths createDirs(const Path & path)
{
    Paths created;
    for (Path dir = canonPath(path); dir != "/"; dir = dirOf(dir)) {
        auto st = maybeStat(dir);
        if (st) {
            if (!S_ISDIR(st->st_mode))
                throw Error("'%1%' is not a directory", dir);
            break;
        }
        created.push_front(dir);
    }

    for (auto & dir : created)
        if (mkdir(dir.c_str(), 0777) == -1 && errno != EEXIST)
            throw SysError("creating directory '%1%'", dir);

    return created;
}

void createSymlink(const Path & target, const Path & link)
{
    if (symlink(target.c_str(), link.c_str()))
        throw SysError("creating symlink from '%1%' to '%2%'", link, target);
}

void copyFile(const Path & oldPath, const Path & newPath)
{
    std::error_code ec;
    fs::copy(oldPath, newPath, fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks, ec);
    if (ec)
        throw SysError(ec, "copying '%1%' to '%2%'", oldPath, newPath);
}

AutoDelete::AutoDelete(const Path & p, bool recursive)
    : path(p)
    , del(true)
    , recursive(recursive)
{ }

AutoDelete::~AutoDelete()
{
    try {
        if (!del) return;
        if (recursive)
            deletePath(path);
        else if (::remove(path.c_str()) == -1)
            throw SysError("removing '%1%'", path);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::reset(const Path & p, bool recursive)
{
    path = p;
    this->recursive = recursive;
    del = true;
}

Path createTempDir(const Path & prefix)
{
    static std::atomic<unsigned int> counter = 0;

    auto parent = absPath(getEnvNonEmpty("TMPDIR").value_or("/tmp"));
    while (true) {
        auto dir = fmt("%1%/%2%-%3%-%4%", parent, prefix, getpid(), counter++);
        if (mkdir(dir.c_str(), 0755) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", dir);
    }
}

}
