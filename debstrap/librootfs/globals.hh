#pragma once
///@file Global settings read from debstrap.conf.

#include "debstrap/libutil/config.hh"
#include "debstrap/libutil/types.hh"

#include <vector>

namespace debstrap {

class Settings : public Config
{
public:

    Settings();

    /**
     * The directory where system configuration files are stored.
     */
    Path debstrapConfDir;

    /**
     * User configuration files to load, highest priority first.
     */
    std::vector<Path> userConfFiles;

    Setting<Path> hostResolvConf{
        this,
        "/etc/resolv.conf",
        "host-resolv-conf",
        R"(
          The host file copied into the rootfs by a `resolv_conf` prepare
          task with `copy: true`. Symlinks are followed.
        )"};

    Setting<std::string> defaultShell{
        this,
        "/bin/sh",
        "default-shell",
        R"(
          The shell used by `shell` tasks that do not name one. It is
          looked up inside the rootfs.
        )"};
};

extern Settings settings;

/**
 * Load /etc/debstrap/debstrap.conf, then the user configuration files,
 * then `$DEBSTRAP_CONFIG`.
 */
void loadConfFile();

/**
 * `$DEBSTRAP_USER_CONF_FILES` if set, otherwise `debstrap/debstrap.conf`
 * in every XDG configuration directory.
 */
std::vector<Path> getUserConfigFiles();

}
