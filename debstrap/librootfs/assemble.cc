#include "debstrap/librootfs/assemble.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/librootfs/resolv-conf.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"

#include <cerrno>
#include <fcntl.h>

namespace debstrap {

void AssembleResolvConfTask::validate() const
{
    bool generate = !nameServers.empty() || !search.empty();

    if (link && generate)
        throw ValidationError("assemble resolv_conf: 'link' and 'name_servers'/'search' are mutually exclusive");
    if (!link && !generate)
        throw ValidationError("assemble resolv_conf: either 'link' or 'name_servers' must be specified");

    if (link) {
        if (link->empty())
            throw ValidationError("assemble resolv_conf: 'link' must not be empty");
        if (link->find_first_of("\r\n") != std::string::npos)
            throw ValidationError("assemble resolv_conf: 'link' must not contain newline characters");
        if (link->find('\0') != std::string::npos)
            throw ValidationError("assemble resolv_conf: 'link' must not contain null characters");
    } else {
        if (nameServers.empty())
            throw ValidationError("assemble resolv_conf: either 'link' or 'name_servers' must be specified");
        validateResolvEntries("assemble resolv_conf", nameServers, search);
    }
}

static void runChecked(CommandExecutor & executor, CommandSpec spec)
{
    auto result = executor.execute(spec);
    if (!result.success())
        throw ExecutionError(spec.show(), result.showStatus());
}

void AssembleResolvConfTask::execute(IsolationContext & context) const
{
    auto & rootfs = context.rootfs();
    auto resolvConf = rootfsPath(rootfs, "/etc/resolv.conf");

    if (context.dryRun()) {
        if (link)
            printInfo("dry run: would create symlink %s -> %s", resolvConf, *link);
        else
            printInfo("dry run: would write resolv.conf to %s", resolvConf);
        return;
    }

    auto etcPath = rootfsPath(rootfs, "/etc");
    AutoCloseFD etcFd{open(etcPath.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC)};
    if (!etcFd) {
        if (errno == ELOOP || errno == ENOTDIR)
            throw IsolationError(
                "%s is a symlink or not a directory, refusing to write resolv.conf (possible symlink attack)",
                etcPath);
        throw IoError(fmt("failed to open %s", etcPath), errno);
    }

    auto & executor = context.executor();
    auto method = privilege.resolvedMethod();

    if (link) {
        runChecked(executor, {.command = "rm", .args = {"-f", resolvConf}, .privilege = method});
        runChecked(executor, {.command = "ln", .args = {"-sf", *link, resolvConf}, .privilege = method});
        printInfo("created symlink %s -> %s", resolvConf, *link);
    } else {
        AutoDelete tmpDir(createTempDir(), true);
        auto tmpFile = (Path) tmpDir + "/resolv.conf";
        try {
            writeFile(tmpFile, generateResolvConf(nameServers, search), 0644);
        } catch (SysError & e) {
            throw IoError(fmt("failed to write temporary file %s", tmpFile), e.errNo);
        }
        runChecked(executor, {.command = "cp", .args = {tmpFile, resolvConf}, .privilege = method});
        runChecked(executor, {.command = "chmod", .args = {"644", resolvConf}, .privilege = method});
        printInfo("wrote resolv.conf to %s", resolvConf);
    }
}

AssembleResolvConfTask AssembleResolvConfTask::parse(const JSON & json)
{
    checkObjectFields(json, "assemble resolv_conf task", {"type", "privilege", "link", "name_servers", "search"});
    auto privilege = get(json, "privilege");
    return AssembleResolvConfTask{
        .privilege = privilege ? Privilege::parse(*privilege) : Privilege{},
        .link = optionalStringField(json, "link", "assemble resolv_conf task"),
        .nameServers = stringListField(json, "name_servers", "assemble resolv_conf task"),
        .search = stringListField(json, "search", "assemble resolv_conf task"),
    };
}

JSON AssembleResolvConfTask::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "resolv_conf";
    if (auto p = privilege.toJSON(); !p.is_null())
        res["privilege"] = p;
    if (link)
        res["link"] = *link;
    if (!nameServers.empty())
        res["name_servers"] = nameServers;
    if (!search.empty())
        res["search"] = search;
    return res;
}

std::string AssembleTask::name() const
{
    return std::visit([](auto & t) { return std::string(t.name()); }, raw);
}

std::string_view AssembleTask::typeName() const
{
    return std::visit(overloaded {
        [](const AssembleResolvConfTask &) { return std::string_view("resolv_conf"); },
    }, raw);
}

void AssembleTask::validate() const
{
    std::visit([](auto & t) { t.validate(); }, raw);
}

void AssembleTask::execute(IsolationContext & context) const
{
    std::visit([&](auto & t) { t.execute(context); }, raw);
}

void AssembleTask::resolveSettings(const std::optional<PrivilegeDefaults> & privilegeDefaults)
{
    std::visit([&](auto & t) { t.privilege.resolveInPlace(privilegeDefaults); }, raw);
}

AssembleTask AssembleTask::parse(const JSON & json)
{
    auto type = stringField(json, "type", "assemble task");
    if (type == "resolv_conf")
        return AssembleTask{AssembleResolvConfTask::parse(json)};
    throw ConfigError("unknown assemble task type '%s', expected 'resolv_conf'", type);
}

JSON AssembleTask::toJSON() const
{
    return std::visit([](auto & t) { return t.toJSON(); }, raw);
}

}
