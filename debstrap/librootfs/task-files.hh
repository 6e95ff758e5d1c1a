#pragma once
///@file Helpers shared by tasks that place files into the rootfs.

#include "debstrap/librootfs/command.hh"
#include "debstrap/libutil/json-fwd.hh"
#include "debstrap/libutil/types.hh"

#include <sys/types.h>
#include <functional>
#include <variant>

namespace debstrap {

class IsolationContext;

/**
 * Where a task's script comes from: a file on the host or inline
 * content in the profile.
 */
struct ScriptSource
{
    struct Script
    {
        Path path;

        bool operator==(const Script &) const = default;
    };

    struct Content
    {
        std::string text;

        bool operator==(const Content &) const = default;
    };

    using Raw = std::variant<Script, Content>;

    Raw raw;

    bool operator==(const ScriptSource &) const = default;

    /**
     * The script path, or `<inline>`.
     */
    std::string name() const;

    const Path * scriptPath() const;

    /**
     * Make a relative script path absolute against `baseDir`.
     */
    void resolvePaths(const Path & baseDir);

    /**
     * @param label Used in error messages, e.g. "shell script".
     */
    void validate(std::string_view label) const;

    /**
     * Read the mutually exclusive `script` and `content` fields of a
     * task object.
     */
    static ScriptSource parse(const JSON & json, std::string_view what);

    /**
     * Adds the `script` or `content` field to `json`.
     */
    void toJSON(JSON & json) const;
};

/**
 * Throws `ValidationError` if `path` has a `..` component.
 */
void validateNoParentDirs(std::string_view path, std::string_view label);

/**
 * Throws unless `path` is a regular file on the host and not a symlink.
 */
void validateHostFileExists(const Path & path, std::string_view label);

/**
 * Throws `ValidationError` unless `<rootfs>/tmp` is a real directory.
 */
void validateTmpDirectory(const Path & rootfs);

/**
 * Throws `ValidationError` unless `shell` (a path inside the rootfs)
 * resolves to a regular file.
 */
void validateShellInRootfs(std::string_view shell, const Path & rootfs);

/**
 * Deletes a file placed in the rootfs when it goes out of scope. Does
 * nothing in dry-run mode.
 */
class TempFileGuard
{
    Path path;
    bool dryRun;

public:
    TempFileGuard(Path path, bool dryRun)
        : path(std::move(path))
        , dryRun(dryRun)
    {
    }

    TempFileGuard(const TempFileGuard &) = delete;
    TempFileGuard & operator=(const TempFileGuard &) = delete;

    ~TempFileGuard();
};

/**
 * Copy or write `source` to `target` and set its mode.
 */
void prepareSourceFile(const ScriptSource & source, const Path & target, mode_t mode, std::string_view label);

/**
 * Re-check `<rootfs>/tmp` right before writing into it, then run
 * `prepare`. Does nothing in dry-run mode.
 */
void prepareFilesChecked(const Path & rootfs, bool dryRun, const std::function<void()> & prepare);

/**
 * A random identifier for temporary file names.
 */
std::string makeTempId();

/**
 * Run `command` in `context`. Errors that are not already one of ours
 * get a trace naming `label`.
 */
ExecutionResult executeInContext(
    IsolationContext & context,
    const Strings & command,
    std::string_view label,
    std::optional<PrivilegeMethod> privilege);

/**
 * Throws `ExecutionError` if `result` is a failure, or carries no
 * status outside of dry-run mode.
 */
void checkExecutionResult(
    const ExecutionResult & result, const Strings & command, std::string_view contextName, bool dryRun);

}
