#include "debstrap/librootfs/provision.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/libutil/json.hh"

namespace debstrap {

std::string ProvisionTask::name() const
{
    return std::visit([](auto & t) { return t.name(); }, raw);
}

std::string_view ProvisionTask::typeName() const
{
    return std::visit(overloaded {
        [](const ShellTask &) { return std::string_view("shell"); },
        [](const MitamaeTask &) { return std::string_view("mitamae"); },
    }, raw);
}

const TaskIsolation & ProvisionTask::isolation() const
{
    return std::visit([](auto & t) -> const TaskIsolation & { return t.isolation; }, raw);
}

void ProvisionTask::validate() const
{
    std::visit([](auto & t) { t.validate(); }, raw);
}

void ProvisionTask::execute(IsolationContext & context) const
{
    std::visit([&](auto & t) { t.execute(context); }, raw);
}

void ProvisionTask::resolvePaths(const Path & baseDir)
{
    std::visit([&](auto & t) { t.resolvePaths(baseDir); }, raw);
}

void ProvisionTask::resolveSettings(
    const IsolationConfig & isolationDefaults,
    const std::optional<PrivilegeDefaults> & privilegeDefaults,
    const std::map<std::string, Path> & mitamaeBinaries,
    const std::string & arch)
{
    std::visit(overloaded {
        [&](ShellTask & t) {
            t.isolation.resolveInPlace(isolationDefaults);
            t.privilege.resolveInPlace(privilegeDefaults);
        },
        [&](MitamaeTask & t) {
            t.isolation.resolveInPlace(isolationDefaults);
            t.privilege.resolveInPlace(privilegeDefaults);
            t.resolveBinary(mitamaeBinaries, arch);
        },
    }, raw);
}

ProvisionTask ProvisionTask::parse(const JSON & json)
{
    auto type = stringField(json, "type", "provision task");
    if (type == "shell")
        return ProvisionTask{ShellTask::parse(json)};
    if (type == "mitamae")
        return ProvisionTask{MitamaeTask::parse(json)};
    throw ConfigError("unknown provision task type '%s', expected 'shell' or 'mitamae'", type);
}

JSON ProvisionTask::toJSON() const
{
    return std::visit([](auto & t) { return t.toJSON(); }, raw);
}

}
