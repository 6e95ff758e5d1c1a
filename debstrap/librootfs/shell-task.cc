#include "debstrap/librootfs/shell-task.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/globals.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"

namespace debstrap {

void ShellTask::validate() const
{
    if (shell.empty())
        throw ValidationError("shell path must not be empty");
    if (!shell.starts_with("/"))
        throw ValidationError("shell path must be absolute (start with '/'): %s", shell);
    source.validate("shell script");
}

void ShellTask::execute(IsolationContext & context) const
{
    auto & rootfs = context.rootfs();
    auto dryRun = context.dryRun();

    if (!dryRun) {
        try {
            validateTmpDirectory(rootfs);
            validateShellInRootfs(shell, rootfs);
        } catch (Error & e) {
            e.addTrace("rootfs validation failed");
            throw;
        }
    }

    printInfo("running shell script: %s (isolation: %s)", name(), Uncolored(context.name()));
    debug("rootfs: %s, shell: %s, dry run: %s", rootfs, shell, dryRun ? "yes" : "no");

    auto scriptInRootfs = "/tmp/task-" + makeTempId() + ".sh";
    auto target = rootfsPath(rootfs, scriptInRootfs);

    TempFileGuard guard(target, dryRun);

    prepareFilesChecked(rootfs, dryRun, [&]() {
        prepareSourceFile(source, target, 0700, "shell script");
    });

    Strings command{shell, scriptInRootfs};
    auto result = executeInContext(context, command, "shell script", privilege.resolvedMethod());
    checkExecutionResult(result, command, context.name(), dryRun);

    printInfo("shell script completed successfully");
}

ShellTask ShellTask::parse(const JSON & json)
{
    checkObjectFields(json, "shell task", {"type", "script", "content", "shell", "isolation", "privilege"});
    auto isolation = get(json, "isolation");
    auto privilege = get(json, "privilege");
    return ShellTask{
        .source = ScriptSource::parse(json, "shell task"),
        .shell = optionalStringField(json, "shell", "shell task").value_or(settings.defaultShell.get()),
        .isolation = isolation ? TaskIsolation::parse(*isolation) : TaskIsolation{},
        .privilege = privilege ? Privilege::parse(*privilege) : Privilege{},
    };
}

JSON ShellTask::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "shell";
    source.toJSON(res);
    res["shell"] = shell;
    if (auto i = isolation.toJSON(); !i.is_null())
        res["isolation"] = i;
    if (auto p = privilege.toJSON(); !p.is_null())
        res["privilege"] = p;
    return res;
}

}
