#include "debstrap/librootfs/mitamae-task.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"

#include <sys/utsname.h>

namespace debstrap {

std::string debianArchOf(std::string_view machine)
{
    static const std::map<std::string, std::string, std::less<>> archs = {
        {"x86_64", "amd64"},
        {"aarch64", "arm64"},
        {"arm64", "arm64"},
        {"i386", "i386"},
        {"i686", "i386"},
        {"armv7l", "armhf"},
        {"ppc64le", "ppc64el"},
        {"riscv64", "riscv64"},
        {"s390x", "s390x"},
    };
    if (auto i = archs.find(machine); i != archs.end())
        return i->second;
    return std::string(machine);
}

std::string hostDebianArch()
{
    struct utsname un;
    if (uname(&un) == -1)
        throw SysError("getting the host architecture");
    return debianArchOf(un.machine);
}

void MitamaeTask::resolvePaths(const Path & baseDir)
{
    if (binary && !binary->empty() && !binary->starts_with("/"))
        binary = canonPath(baseDir + "/" + *binary);
    source.resolvePaths(baseDir);
}

void MitamaeTask::resolveBinary(const std::map<std::string, Path> & binaries, const std::string & arch)
{
    if (binary) return;
    if (auto i = binaries.find(arch); i != binaries.end())
        binary = i->second;
}

void MitamaeTask::validate() const
{
    if (!binary)
        throw ValidationError(
            "mitamae binary is not set: specify 'binary' in the task or defaults.mitamae.%s", hostDebianArch());
    if (binary->empty())
        throw ValidationError("mitamae binary path must not be empty");

    validateNoParentDirs(*binary, "mitamae binary");
    validateHostFileExists(*binary, "mitamae binary");

    source.validate("mitamae recipe");
}

void MitamaeTask::execute(IsolationContext & context) const
{
    auto & rootfs = context.rootfs();
    auto dryRun = context.dryRun();

    if (!binary)
        throw ConfigError("mitamae binary was used before it was resolved against the profile defaults");

    /* The binary comes from the host, so only the destination needs
       checking. */
    if (!dryRun) {
        try {
            validateTmpDirectory(rootfs);
        } catch (Error & e) {
            e.addTrace("rootfs validation failed");
            throw;
        }
    }

    printInfo("running mitamae recipe: %s (isolation: %s)", name(), Uncolored(context.name()));
    debug("rootfs: %s, binary: %s, dry run: %s", rootfs, *binary, dryRun ? "yes" : "no");

    auto id = makeTempId();
    auto binaryInRootfs = "/tmp/mitamae-" + id;
    auto recipeInRootfs = "/tmp/recipe-" + id + ".rb";
    auto targetBinary = rootfsPath(rootfs, binaryInRootfs);
    auto targetRecipe = rootfsPath(rootfs, recipeInRootfs);

    TempFileGuard binaryGuard(targetBinary, dryRun);
    TempFileGuard recipeGuard(targetRecipe, dryRun);

    prepareFilesChecked(rootfs, dryRun, [&]() {
        prepareSourceFile(ScriptSource{ScriptSource::Script{*binary}}, targetBinary, 0700, "mitamae binary");
        prepareSourceFile(source, targetRecipe, 0600, "recipe");
    });

    Strings command{binaryInRootfs, "local", recipeInRootfs};
    auto result = executeInContext(context, command, "mitamae", privilege.resolvedMethod());
    checkExecutionResult(result, command, context.name(), dryRun);

    printInfo("mitamae recipe completed successfully");
}

MitamaeTask MitamaeTask::parse(const JSON & json)
{
    checkObjectFields(json, "mitamae task", {"type", "script", "content", "binary", "isolation", "privilege"});
    auto isolation = get(json, "isolation");
    auto privilege = get(json, "privilege");
    return MitamaeTask{
        .source = ScriptSource::parse(json, "mitamae task"),
        .binary = optionalStringField(json, "binary", "mitamae task"),
        .isolation = isolation ? TaskIsolation::parse(*isolation) : TaskIsolation{},
        .privilege = privilege ? Privilege::parse(*privilege) : Privilege{},
    };
}

JSON MitamaeTask::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "mitamae";
    source.toJSON(res);
    if (binary)
        res["binary"] = *binary;
    if (auto i = isolation.toJSON(); !i.is_null())
        res["isolation"] = i;
    if (auto p = privilege.toJSON(); !p.is_null())
        res["privilege"] = p;
    return res;
}

}
