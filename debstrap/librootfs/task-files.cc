#include "debstrap/librootfs/task-files.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/isolation.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

namespace debstrap {

std::string ScriptSource::name() const
{
    return std::visit(overloaded {
        [](const Script & s) -> std::string { return s.path; },
        [](const Content &) -> std::string { return "<inline>"; },
    }, raw);
}

const Path * ScriptSource::scriptPath() const
{
    if (auto s = std::get_if<Script>(&raw))
        return &s->path;
    return nullptr;
}

void ScriptSource::resolvePaths(const Path & baseDir)
{
    if (auto s = std::get_if<Script>(&raw); s && !s->path.starts_with("/"))
        s->path = canonPath(baseDir + "/" + s->path);
}

void ScriptSource::validate(std::string_view label) const
{
    std::visit(overloaded {
        [&](const Script & s) {
            validateNoParentDirs(s.path, label);
            validateHostFileExists(s.path, label);
        },
        [&](const Content & c) {
            if (trim(c.text).empty())
                throw ValidationError("inline %s content must not be empty", Uncolored(label));
        },
    }, raw);
}

ScriptSource ScriptSource::parse(const JSON & json, std::string_view what)
{
    auto script = optionalStringField(json, "script", what);
    auto content = optionalStringField(json, "content", what);
    if (script && content)
        throw ConfigError("%s: 'script' and 'content' are mutually exclusive", Uncolored(what));
    if (script)
        return ScriptSource{Script{*script}};
    if (content)
        return ScriptSource{Content{*content}};
    throw ConfigError("%s: either 'script' or 'content' must be specified", Uncolored(what));
}

void ScriptSource::toJSON(JSON & json) const
{
    std::visit(overloaded {
        [&](const Script & s) { json["script"] = s.path; },
        [&](const Content & c) { json["content"] = c.text; },
    }, raw);
}

void validateNoParentDirs(std::string_view path, std::string_view label)
{
    for (auto & component : tokenizeString<Strings>(path, "/"))
        if (component == "..")
            throw ValidationError(
                "%s path '%s' contains '..' components, which is not allowed for security reasons",
                Uncolored(label), path);
}

void validateHostFileExists(const Path & path, std::string_view label)
{
    struct stat st;
    if (::lstat(path.c_str(), &st) == -1)
        throw IoError(fmt("failed to read %s metadata: %s", label, path), errno);
    if (S_ISLNK(st.st_mode))
        throw ValidationError(
            "%s path '%s' is a symlink, which is not allowed for security reasons", Uncolored(label), path);
    if (!S_ISREG(st.st_mode))
        throw ValidationError("%s is not a file: %s", Uncolored(label), path);
}

void validateTmpDirectory(const Path & rootfs)
{
    auto tmpDir = rootfsPath(rootfs, "/tmp");
    struct stat st;
    if (::lstat(tmpDir.c_str(), &st) == -1) {
        if (errno == ENOENT)
            throw ValidationError(
                "/tmp directory not found in rootfs at %s. The rootfs may not be properly bootstrapped.",
                tmpDir);
        throw IoError(fmt("failed to read /tmp metadata at %s", tmpDir), errno);
    }
    if (S_ISLNK(st.st_mode))
        throw ValidationError(
            "/tmp in rootfs is a symlink, which is not allowed for security reasons. "
            "An attacker could use this to write files outside the chroot.");
    if (!S_ISDIR(st.st_mode))
        throw ValidationError(
            "/tmp in rootfs is not a directory: %s. The rootfs may not be properly bootstrapped.", tmpDir);
}

void validateShellInRootfs(std::string_view shell, const Path & rootfs)
{
    validateNoParentDirs(shell, "shell");

    auto shellInRootfs = rootfsPath(rootfs, shell);
    struct stat st;
    if (::stat(shellInRootfs.c_str(), &st) == -1) {
        if (errno == ENOENT)
            throw ValidationError("shell '%s' does not exist in rootfs at %s", shell, shellInRootfs);
        throw IoError(fmt("failed to read shell metadata for '%s' at %s", shell, shellInRootfs), errno);
    }
    if (S_ISDIR(st.st_mode))
        throw ValidationError(
            "shell path '%s' points to a directory, not a file: %s", shell, shellInRootfs);
    if (!S_ISREG(st.st_mode))
        throw ValidationError("shell '%s' is not a regular file in rootfs at %s", shell, shellInRootfs);
}

TempFileGuard::~TempFileGuard()
{
    if (dryRun) return;
    if (unlink(path.c_str()) == 0)
        debug("cleaned up temp file: %s", path);
    else if (errno == ENOENT)
        debug("temp file already removed: %s", path);
    else
        printError("failed to clean up temp file %s: %s", path, strerror(errno));
}

void prepareSourceFile(const ScriptSource & source, const Path & target, mode_t mode, std::string_view label)
{
    std::visit(overloaded {
        [&](const ScriptSource::Script & s) {
            printInfo("copying %s from %s to rootfs", Uncolored(label), s.path);
            try {
                copyFile(s.path, target);
            } catch (Error & e) {
                e.addTrace("while copying %s %s to %s", Uncolored(label), s.path, target);
                throw;
            }
        },
        [&](const ScriptSource::Content & c) {
            printInfo("writing inline %s to rootfs", Uncolored(label));
            try {
                writeFile(target, c.text, 0600);
            } catch (Error & e) {
                e.addTrace("while writing inline %s to %s", Uncolored(label), target);
                throw;
            }
        },
    }, source.raw);
    chmodPath(target, mode);
}

void prepareFilesChecked(const Path & rootfs, bool dryRun, const std::function<void()> & prepare)
{
    if (dryRun) return;
    try {
        validateTmpDirectory(rootfs);
    } catch (Error & e) {
        e.addTrace("while re-checking /tmp before writing files");
        throw;
    }
    prepare();
}

std::string makeTempId()
{
    static boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

static bool isTypedError(const Error & e)
{
    return dynamic_cast<const ValidationError *>(&e)
        || dynamic_cast<const ExecutionError *>(&e)
        || dynamic_cast<const IsolationError *>(&e)
        || dynamic_cast<const ConfigError *>(&e)
        || dynamic_cast<const CommandNotFoundError *>(&e)
        || dynamic_cast<const IoError *>(&e);
}

ExecutionResult executeInContext(
    IsolationContext & context,
    const Strings & command,
    std::string_view label,
    std::optional<PrivilegeMethod> privilege)
{
    try {
        return context.execute(command, privilege);
    } catch (Error & e) {
        if (!isTypedError(e))
            e.addTrace("failed to execute %s", Uncolored(label));
        throw;
    }
}

void checkExecutionResult(
    const ExecutionResult & result, const Strings & command, std::string_view contextName, bool dryRun)
{
    auto shown = fmt("%s (in %s)", concatStringsSep(" ", command), contextName);
    if (result.status && !result.success())
        throw ExecutionError(shown, result.showStatus());
    if (!result.status && !dryRun)
        throw ExecutionError(shown, "process exited without status (possibly killed by signal)");
}

}
