#pragma once
///@file Bootstrap backends that create the base rootfs.

#include "debstrap/librootfs/command.hh"
#include "debstrap/librootfs/privilege.hh"
#include "debstrap/libutil/json-fwd.hh"
#include "debstrap/libutil/types.hh"

#include <variant>

namespace debstrap {

/**
 * What a bootstrap backend produces.
 */
struct RootfsOutput
{
    struct Directory
    {
        Path path;
    };

    /**
     * An archive or image; tasks cannot run against it.
     */
    struct NonDirectory
    {
        std::string reason;
    };

    std::variant<Directory, NonDirectory> raw;

    const Path * directory() const
    {
        if (auto d = std::get_if<Directory>(&raw))
            return &d->path;
        return nullptr;
    }
};

struct MmdebstrapConfig
{
    std::string suite;
    std::string target;
    std::string mode = "auto";
    std::string format = "auto";
    std::string variant = "debootstrap";
    Strings architectures;
    Strings components;
    Strings include;
    Strings keyring;
    Strings aptopt;
    Strings dpkgopt;
    Strings setupHook;
    Strings extractHook;
    Strings essentialHook;
    Strings customizeHook;
    Strings mirrors;

    bool operator==(const MmdebstrapConfig &) const = default;

    Strings buildArgs(const Path & outputDir) const;

    RootfsOutput rootfsOutput(const Path & outputDir) const;

    static MmdebstrapConfig parse(const JSON & json);

    JSON toJSON() const;
};

struct DebootstrapConfig
{
    std::string suite;
    std::string target;
    std::string variant = "minbase";
    std::optional<std::string> arch;
    Strings components;
    Strings include;
    Strings exclude;
    std::optional<std::string> mirror;
    bool foreign = false;
    std::optional<bool> mergedUsr;
    bool noResolveDeps = false;
    bool verbose = false;
    bool printDebs = false;

    bool operator==(const DebootstrapConfig &) const = default;

    Strings buildArgs(const Path & outputDir) const;

    /**
     * debootstrap only ever produces a directory.
     */
    RootfsOutput rootfsOutput(const Path & outputDir) const;

    static DebootstrapConfig parse(const JSON & json);

    JSON toJSON() const;
};

struct Bootstrap
{
    using Raw = std::variant<MmdebstrapConfig, DebootstrapConfig>;

    Raw raw;

    /**
     * Privilege for running the bootstrap tool itself.
     */
    Privilege privilege;

    bool operator==(const Bootstrap &) const = default;

    std::string_view commandName() const;

    Strings buildArgs(const Path & outputDir) const;

    RootfsOutput rootfsOutput(const Path & outputDir) const;

    /**
     * The invocation of the tool, with the resolved privilege.
     */
    CommandSpec command(const Path & outputDir) const;

    static Bootstrap parse(const JSON & json);

    JSON toJSON() const;
};

}
