#include "debstrap/librootfs/resolv-conf.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>

namespace debstrap {

static bool isIpAddress(const std::string & s)
{
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, s.c_str(), buf) == 1 || inet_pton(AF_INET6, s.c_str(), buf) == 1;
}

void validateResolvEntries(std::string_view label, const Strings & nameServers, const Strings & search)
{
    if (nameServers.size() > maxResolvNameServers)
        throw ValidationError(
            "%s: at most %d name_servers are supported, got %d",
            Uncolored(label), maxResolvNameServers, nameServers.size());

    for (auto & ns : nameServers)
        if (!isIpAddress(ns))
            throw ValidationError("%s: invalid name server address '%s'", Uncolored(label), ns);

    if (search.size() > maxResolvSearchDomains)
        throw ValidationError(
            "%s: at most %d search domains are supported, got %d",
            Uncolored(label), maxResolvSearchDomains, search.size());

    for (auto & domain : search) {
        if (domain.empty())
            throw ValidationError("%s: search domains must not be empty", Uncolored(label));
        if (domain.find_first_of(" \t\r\n") != std::string::npos || domain.find('\0') != std::string::npos)
            throw ValidationError(
                "%s: search domain '%s' must not contain whitespace or null characters",
                Uncolored(label), domain);
    }

    auto searchLength = concatStringsSep(" ", search).size();
    if (searchLength > maxResolvSearchLength)
        throw ValidationError(
            "%s: search domains exceed %d characters (got %d)",
            Uncolored(label), maxResolvSearchLength, searchLength);
}

void ResolvConfConfig::validate() const
{
    bool generate = !nameServers.empty() || !search.empty();

    if (copy && generate)
        throw ValidationError("resolv_conf: 'copy' and 'name_servers'/'search' are mutually exclusive");
    if (!copy && nameServers.empty())
        throw ValidationError("resolv_conf: either 'copy' or 'name_servers' must be specified");

    validateResolvEntries("resolv_conf", nameServers, search);
}

std::string generateResolvConf(const Strings & nameServers, const Strings & search)
{
    std::string res;
    for (auto & ns : nameServers)
        res += "nameserver " + ns + "\n";
    if (!search.empty())
        res += "search " + concatStringsSep(" ", search) + "\n";
    return res;
}

RootfsResolvConf::RootfsResolvConf(
    Path rootfs,
    std::optional<ResolvConfConfig> config,
    Path hostResolvConf,
    FileSystem & fs,
    bool dryRun)
    : rootfs(std::move(rootfs))
    , config(std::move(config))
    , hostResolvConf(std::move(hostResolvConf))
    , fs(fs)
    , dryRun(dryRun)
{
}

RootfsResolvConf::~RootfsResolvConf()
{
    if (!active) return;
    try {
        teardown();
    } catch (Error & e) {
        printError(
            "failed to restore resolv.conf during cleanup: %s. Manual cleanup may be required: check %s",
            Uncolored(e.info().msg.str()),
            rootfs + "/etc");
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

static bool existsAt(int dirFd, const char * name)
{
    struct stat st;
    if (fstatat(dirFd, name, &st, AT_SYMLINK_NOFOLLOW) == 0)
        return true;
    if (errno == ENOENT)
        return false;
    throw IoError(fmt("failed to inspect %s", name), errno);
}

void RootfsResolvConf::setup()
{
    if (!config) return;

    config->validate();

    auto etcPath = rootfs + "/etc";

    if (dryRun) {
        printInfo(
            "dry run: would set up resolv.conf in %s (%s)",
            etcPath,
            config->copy ? "copy from " + hostResolvConf : "generate");
        return;
    }

    AutoCloseFD fd;
    try {
        fd = fs.openDirectory(etcPath);
    } catch (SysError & e) {
        if (e.errNo == ELOOP || e.errNo == ENOTDIR)
            throw IsolationError(
                "%s is a symlink or not a directory, refusing to write resolv.conf (possible symlink attack)",
                etcPath);
        throw IoError(fmt("failed to open %s", etcPath), e.errNo);
    }

    std::string backupName(resolvConfBackupName);
    if (existsAt(fd.get(), backupName.c_str()))
        throw IsolationError(
            "backup file %s/%s already exists, a previous run did not shut down cleanly; "
            "restore it to %s/resolv.conf or remove it",
            etcPath, backupName, etcPath);

    std::string content;
    if (config->copy) {
        try {
            content = readFile(hostResolvConf);
        } catch (SysError & e) {
            throw IoError(fmt("failed to read host resolv.conf %s", hostResolvConf), e.errNo);
        }
    } else
        content = generateResolvConf(config->nameServers, config->search);

    bool backedUp = false;
    if (existsAt(fd.get(), "resolv.conf")) {
        try {
            fs.renameAt(fd.get(), "resolv.conf", backupName);
        } catch (SysError & e) {
            throw IoError(fmt("failed to back up %s/resolv.conf", etcPath), e.errNo);
        }
        backedUp = true;
        debug("backed up %s/resolv.conf to %s", etcPath, backupName);
    }

    try {
        fs.createFileAt(fd.get(), "resolv.conf", content, 0644);
    } catch (SysError & e) {
        IoError error(fmt("failed to write %s/resolv.conf", etcPath), e.errNo);
        try {
            fs.removeAt(fd.get(), "resolv.conf");
        } catch (SysError & e2) {
            if (e2.errNo != ENOENT)
                error.addTrace(
                    "additionally, removing the partial %s/resolv.conf failed: %s", etcPath, Uncolored(e2.info().msg.str()));
        }
        if (backedUp) {
            try {
                fs.renameAt(fd.get(), backupName, "resolv.conf");
            } catch (SysError & e2) {
                error.addTrace(
                    "additionally, restoring %s/resolv.conf from %s failed: %s",
                    etcPath, backupName, Uncolored(e2.info().msg.str()));
            }
        }
        throw error;
    }

    printInfo(
        "installed temporary resolv.conf in %s (%s)", etcPath, config->copy ? "copied from host" : "generated");

    etcFd = std::move(fd);
    haveBackup = backedUp;
    active = true;
}

void RootfsResolvConf::teardown()
{
    if (!config) return;

    if (dryRun) {
        printInfo("dry run: would restore resolv.conf in %s/etc", rootfs);
        return;
    }

    if (!active) return;

    try {
        fs.removeAt(etcFd.get(), "resolv.conf");
    } catch (SysError & e) {
        if (e.errNo != ENOENT)
            throw IoError(fmt("failed to remove temporary %s/etc/resolv.conf", rootfs), e.errNo);
    }

    if (haveBackup) {
        std::string backupName(resolvConfBackupName);
        try {
            fs.renameAt(etcFd.get(), backupName, "resolv.conf");
        } catch (SysError & e) {
            throw IoError(fmt("failed to restore %s/etc/resolv.conf from %s", rootfs, backupName), e.errNo);
        }
        haveBackup = false;
    }

    printInfo("restored resolv.conf in %s/etc", rootfs);

    active = false;
    etcFd.close();
}

}
