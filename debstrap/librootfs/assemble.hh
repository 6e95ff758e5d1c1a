#pragma once
///@file Tasks of the assemble phase.

#include "debstrap/librootfs/isolation.hh"
#include "debstrap/librootfs/privilege.hh"

#include <variant>

namespace debstrap {

/**
 * Writes the permanent `/etc/resolv.conf` of the image, either as a
 * symlink (`link`) or as generated content.
 */
struct AssembleResolvConfTask
{
    Privilege privilege;
    std::optional<std::string> link;
    Strings nameServers;
    Strings search;

    bool operator==(const AssembleResolvConfTask &) const = default;

    std::string_view name() const
    {
        return link ? "link" : "generate";
    }

    void validate() const;

    /**
     * All changes go through the context's executor with the resolved
     * privilege, so they work on a root-owned rootfs.
     */
    void execute(IsolationContext & context) const;

    static AssembleResolvConfTask parse(const JSON & json);

    JSON toJSON() const;
};

struct AssembleTask
{
    using Raw = std::variant<AssembleResolvConfTask>;

    Raw raw;

    bool operator==(const AssembleTask &) const = default;

    std::string name() const;

    std::string_view typeName() const;

    void validate() const;

    void execute(IsolationContext & context) const;

    void resolveSettings(const std::optional<PrivilegeDefaults> & privilegeDefaults);

    static AssembleTask parse(const JSON & json);

    JSON toJSON() const;
};

}
