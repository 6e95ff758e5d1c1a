#include "debstrap/librootfs/isolation.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"

namespace debstrap {

ExecutionResult IsolationContext::execute(const Strings & command, std::optional<PrivilegeMethod> privilege)
{
    if (tornDown)
        throw IsolationError(
            "cannot execute command: %s context has already been torn down", Uncolored(name()));
    if (command.empty())
        throw IsolationError("cannot execute empty command");
    return executor_.execute(wrapCommand(command, privilege));
}

void IsolationContext::teardown()
{
    tornDown = true;
}

namespace {

class ChrootContext : public IsolationContext
{
protected:
    CommandSpec wrapCommand(const Strings & command, std::optional<PrivilegeMethod> privilege) const override
    {
        Strings args{rootfs()};
        args.insert(args.end(), command.begin(), command.end());
        return CommandSpec{.command = "chroot", .args = std::move(args), .privilege = privilege};
    }

public:
    ChrootContext(Path rootfs, CommandExecutor & executor, bool dryRun)
        : IsolationContext(std::move(rootfs), executor, dryRun)
    {
    }

    std::string_view name() const override
    {
        return "chroot";
    }
};

class DirectContext : public IsolationContext
{
protected:
    CommandSpec wrapCommand(const Strings & command, std::optional<PrivilegeMethod> privilege) const override
    {
        Strings translated;
        for (auto & arg : command) {
            if (arg.starts_with("/"))
                translated.push_back(rootfsPath(rootfs(), arg));
            else
                translated.push_back(arg);
        }
        auto program = translated.front();
        translated.pop_front();
        return CommandSpec{.command = std::move(program), .args = std::move(translated), .privilege = privilege};
    }

public:
    DirectContext(Path rootfs, CommandExecutor & executor, bool dryRun)
        : IsolationContext(std::move(rootfs), executor, dryRun)
    {
    }

    std::string_view name() const override
    {
        return "direct";
    }
};

}

std::unique_ptr<IsolationContext>
ChrootProvider::setup(const Path & rootfs, CommandExecutor & executor, bool dryRun) const
{
    debug("setting up chroot isolation for %s", rootfs);
    return std::make_unique<ChrootContext>(rootfs, executor, dryRun);
}

std::unique_ptr<IsolationContext>
DirectProvider::setup(const Path & rootfs, CommandExecutor & executor, bool dryRun) const
{
    debug("setting up direct execution for %s", rootfs);
    return std::make_unique<DirectContext>(rootfs, executor, dryRun);
}

std::unique_ptr<IsolationProvider> IsolationConfig::provider() const
{
    switch (type) {
    case IsolationType::Chroot:
        return std::make_unique<ChrootProvider>();
    }
    std::terminate();
}

std::string_view IsolationConfig::showType() const
{
    switch (type) {
    case IsolationType::Chroot:
        return "chroot";
    }
    std::terminate();
}

IsolationConfig IsolationConfig::parse(const JSON & json)
{
    checkObjectFields(json, "isolation settings", {"type"});
    auto type = optionalStringField(json, "type", "isolation settings").value_or("chroot");
    if (type == "chroot")
        return IsolationConfig{.type = IsolationType::Chroot};
    throw ConfigError("unknown isolation type '%s', expected 'chroot'", type);
}

JSON IsolationConfig::toJSON() const
{
    return JSON{{"type", std::string(showType())}};
}

std::optional<IsolationConfig> TaskIsolation::resolve(const IsolationConfig & defaults) const
{
    return std::visit(overloaded {
        [&](const Inherit &) -> std::optional<IsolationConfig> { return defaults; },
        [&](const UseDefault &) -> std::optional<IsolationConfig> { return defaults; },
        [](const Disabled &) -> std::optional<IsolationConfig> { return std::nullopt; },
        [](const IsolationConfig & config) -> std::optional<IsolationConfig> { return config; },
    }, raw);
}

void TaskIsolation::resolveInPlace(const IsolationConfig & defaults)
{
    if (auto config = resolve(defaults))
        raw = *config;
    else
        raw = Disabled{};
}

bool TaskIsolation::isResolved() const
{
    return std::holds_alternative<Disabled>(raw) || std::holds_alternative<IsolationConfig>(raw);
}

std::optional<IsolationConfig> TaskIsolation::resolvedConfig() const
{
    if (auto config = std::get_if<IsolationConfig>(&raw))
        return *config;
    if (std::holds_alternative<Disabled>(raw))
        return std::nullopt;
    throw ConfigError("isolation setting was used before it was resolved against the profile defaults");
}

std::unique_ptr<IsolationProvider> TaskIsolation::provider() const
{
    if (auto config = resolvedConfig())
        return config->provider();
    return std::make_unique<DirectProvider>();
}

TaskIsolation TaskIsolation::parse(const JSON & json)
{
    if (json.is_null())
        return TaskIsolation{Inherit{}};
    if (json.is_boolean())
        return json.get<bool>() ? TaskIsolation{UseDefault{}} : TaskIsolation{Disabled{}};
    if (json.is_object())
        return TaskIsolation{IsolationConfig::parse(json)};
    throw ConfigError("isolation must be a boolean or an object with a 'type' field, got %s", json.type_name());
}

JSON TaskIsolation::toJSON() const
{
    return std::visit(overloaded {
        [](const Inherit &) -> JSON { return nullptr; },
        [](const UseDefault &) -> JSON { return true; },
        [](const Disabled &) -> JSON { return false; },
        [](const IsolationConfig & config) -> JSON { return config.toJSON(); },
    }, raw);
}

}
