#pragma once
///@file Per-command privilege escalation settings.

#include "debstrap/libutil/json-fwd.hh"

#include <optional>
#include <string_view>
#include <variant>

namespace debstrap {

enum class PrivilegeMethod {
    Sudo,
    Doas,
};

/**
 * The program that performs the escalation ("sudo" or "doas").
 */
std::string_view showPrivilegeMethod(PrivilegeMethod method);

std::optional<PrivilegeMethod> parsePrivilegeMethod(std::string_view s);

/**
 * `defaults.privilege` in a profile.
 */
struct PrivilegeDefaults
{
    PrivilegeMethod method;

    bool operator==(const PrivilegeDefaults &) const = default;
};

/**
 * Privilege setting of a task or bootstrap backend, as written in the
 * profile:
 *
 * - absent: `Inherit`, use the defaults when there are any
 * - `true`: `UseDefault`, the defaults must be configured
 * - `false`: `Disabled`
 * - `{"method": "sudo"}`: an explicit method
 *
 * `resolveInPlace()` collapses the setting to either `Disabled` or an
 * explicit method before anything runs.
 */
struct Privilege
{
    struct Inherit
    {
        bool operator==(const Inherit &) const = default;
    };
    struct UseDefault
    {
        bool operator==(const UseDefault &) const = default;
    };
    struct Disabled
    {
        bool operator==(const Disabled &) const = default;
    };

    using Raw = std::variant<Inherit, UseDefault, Disabled, PrivilegeMethod>;

    Raw raw = Inherit{};

    bool operator==(const Privilege &) const = default;

    /**
     * The terminal method for this setting given the profile defaults.
     * Throws `ValidationError` for `UseDefault` without defaults.
     */
    std::optional<PrivilegeMethod> resolve(const std::optional<PrivilegeDefaults> & defaults) const;

    void resolveInPlace(const std::optional<PrivilegeDefaults> & defaults);

    bool isResolved() const;

    /**
     * The method of a resolved setting. Throws `ConfigError` if
     * `resolveInPlace()` has not run.
     */
    std::optional<PrivilegeMethod> resolvedMethod() const;

    /**
     * Parse the profile representation. `null` is `Inherit`.
     */
    static Privilege parse(const JSON & json);

    JSON toJSON() const;
};

std::optional<PrivilegeDefaults> parsePrivilegeDefaults(const JSON & json);

}
