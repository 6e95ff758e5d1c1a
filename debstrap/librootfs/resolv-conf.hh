#pragma once
///@file DNS configuration inside the rootfs while tasks run.

#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/file-descriptor.hh"
#include "debstrap/libutil/json-fwd.hh"
#include "debstrap/libutil/types.hh"

#include <optional>

namespace debstrap {

constexpr size_t maxResolvNameServers = 3;
constexpr size_t maxResolvSearchDomains = 6;
constexpr size_t maxResolvSearchLength = 256;

/**
 * Name of the backup of the rootfs' own resolv.conf, next to it in
 * `/etc`.
 */
constexpr std::string_view resolvConfBackupName = "resolv.conf.debstrap.bak";

struct ResolvConfConfig
{
    /**
     * Copy the host's resolv.conf (following symlinks) instead of
     * generating one.
     */
    bool copy = false;
    Strings nameServers;
    Strings search;

    bool operator==(const ResolvConfConfig &) const = default;

    /**
     * Throws `ValidationError` for conflicting modes, malformed
     * addresses or domains, and content beyond the resolver's limits.
     */
    void validate() const;
};

/**
 * Check name servers and search domains against the limits of the
 * glibc resolver. Shared by the prepare and assemble forms.
 */
void validateResolvEntries(std::string_view label, const Strings & nameServers, const Strings & search);

/**
 * `nameserver` lines followed by at most one `search` line.
 */
std::string generateResolvConf(const Strings & nameServers, const Strings & search);

/**
 * Installs a temporary `/etc/resolv.conf` in the rootfs and puts the
 * original back afterwards.
 *
 * `/etc` is opened once without following symlinks and every later
 * operation is relative to that descriptor.
 */
class RootfsResolvConf
{
    Path rootfs;
    std::optional<ResolvConfConfig> config;
    Path hostResolvConf;
    FileSystem & fs;
    bool dryRun;

    AutoCloseFD etcFd;
    bool active = false;
    bool haveBackup = false;

public:
    RootfsResolvConf(
        Path rootfs,
        std::optional<ResolvConfConfig> config,
        Path hostResolvConf,
        FileSystem & fs,
        bool dryRun);

    RootfsResolvConf(const RootfsResolvConf &) = delete;
    RootfsResolvConf & operator=(const RootfsResolvConf &) = delete;

    ~RootfsResolvConf();

    bool empty() const
    {
        return !config.has_value();
    }

    /**
     * Back up the existing resolv.conf and write the new one. A stale
     * backup from an earlier run is an `IsolationError`. If writing
     * fails the original is restored before the error propagates.
     */
    void setup();

    /**
     * Remove the temporary file and restore the backup, if any.
     * Idempotent.
     */
    void teardown();
};

}
