#pragma once
///@file Isolation backends commands are run in.

#include "debstrap/librootfs/command.hh"
#include "debstrap/libutil/json-fwd.hh"
#include "debstrap/libutil/types.hh"

#include <memory>
#include <variant>

namespace debstrap {

class IsolationContext;

/**
 * Creates isolation contexts for one backend.
 */
class IsolationProvider
{
public:
    virtual ~IsolationProvider() = default;

    virtual std::string_view name() const = 0;

    /**
     * Bind a fresh context to `rootfs`. The executor must outlive it.
     */
    virtual std::unique_ptr<IsolationContext>
    setup(const Path & rootfs, CommandExecutor & executor, bool dryRun) const = 0;
};

/**
 * A single-use handle that runs commands against a rootfs. Once torn
 * down it refuses to run anything.
 */
class IsolationContext
{
    Path rootfs_;
    CommandExecutor & executor_;
    bool dryRun_;
    bool tornDown = false;

protected:
    IsolationContext(Path rootfs, CommandExecutor & executor, bool dryRun)
        : rootfs_(std::move(rootfs))
        , executor_(executor)
        , dryRun_(dryRun)
    {
    }

    /**
     * The host-side invocation of `command` for this backend. `command`
     * is never empty.
     */
    virtual CommandSpec wrapCommand(const Strings & command, std::optional<PrivilegeMethod> privilege) const = 0;

public:
    IsolationContext(const IsolationContext &) = delete;
    IsolationContext & operator=(const IsolationContext &) = delete;

    virtual ~IsolationContext() = default;

    virtual std::string_view name() const = 0;

    const Path & rootfs() const
    {
        return rootfs_;
    }

    bool dryRun() const
    {
        return dryRun_;
    }

    CommandExecutor & executor() const
    {
        return executor_;
    }

    /**
     * Run `command` (program and arguments, as seen from inside the
     * rootfs). Throws `IsolationError` for an empty command or after
     * `teardown()`.
     */
    ExecutionResult execute(const Strings & command, std::optional<PrivilegeMethod> privilege);

    virtual void teardown();

    bool isTornDown() const
    {
        return tornDown;
    }
};

/**
 * Runs commands through `chroot <rootfs>`.
 */
class ChrootProvider : public IsolationProvider
{
public:
    std::string_view name() const override
    {
        return "chroot";
    }

    std::unique_ptr<IsolationContext>
    setup(const Path & rootfs, CommandExecutor & executor, bool dryRun) const override;
};

/**
 * Runs commands on the host, with absolute paths in the command
 * rewritten to point into the rootfs.
 */
class DirectProvider : public IsolationProvider
{
public:
    std::string_view name() const override
    {
        return "direct";
    }

    std::unique_ptr<IsolationContext>
    setup(const Path & rootfs, CommandExecutor & executor, bool dryRun) const override;
};

enum class IsolationType {
    Chroot,
};

/**
 * An explicitly configured isolation backend, `{"type": "chroot"}`.
 */
struct IsolationConfig
{
    IsolationType type = IsolationType::Chroot;

    bool operator==(const IsolationConfig &) const = default;

    std::unique_ptr<IsolationProvider> provider() const;

    std::string_view showType() const;

    static IsolationConfig parse(const JSON & json);

    JSON toJSON() const;
};

/**
 * Isolation setting of a task, in the same forms as `Privilege`:
 * absent, `true`, `false`, or an explicit backend. After
 * `resolveInPlace()` it is either `Disabled` or a backend.
 */
struct TaskIsolation
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

    using Raw = std::variant<Inherit, UseDefault, Disabled, IsolationConfig>;

    Raw raw = Inherit{};

    bool operator==(const TaskIsolation &) const = default;

    /**
     * The backend for this setting given the profile default, or
     * `std::nullopt` for no isolation.
     */
    std::optional<IsolationConfig> resolve(const IsolationConfig & defaults) const;

    void resolveInPlace(const IsolationConfig & defaults);

    bool isResolved() const;

    /**
     * Throws `ConfigError` if `resolveInPlace()` has not run.
     */
    std::optional<IsolationConfig> resolvedConfig() const;

    /**
     * The provider for a resolved setting: the configured backend, or
     * `DirectProvider` when isolation is disabled.
     */
    std::unique_ptr<IsolationProvider> provider() const;

    static TaskIsolation parse(const JSON & json);

    JSON toJSON() const;
};

}
