#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/globals.hh"
#include "debstrap/librootfs/provision.hh"
#include "debstrap/librootfs/safe-fs.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/terminal.hh"
#include "tests/recording-executor.hh"
#include "tests/temp-rootfs.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>

#include <sys/stat.h>

namespace debstrap {

using testing::HasSubstr;
using testing::StartsWith;

/* ----------------------------------------------------------------------------
 * Parsing
 * --------------------------------------------------------------------------*/

TEST(ShellTask, parseDefaultsToConfiguredShell)
{
    auto task = ProvisionTask::parse(json::parse(R"({"type": "shell", "content": "apt-get update"})"));

    auto & shell = std::get<ShellTask>(task.raw);
    ASSERT_EQ(shell.shell, settings.defaultShell.get());
    ASSERT_EQ(shell.source, ScriptSource{ScriptSource::Content{"apt-get update"}});
    ASSERT_EQ(shell.isolation, TaskIsolation{});
    ASSERT_EQ(task.typeName(), "shell");
    ASSERT_EQ(task.name(), "<inline>");
}

TEST(ShellTask, parseRejectsAmbiguousSources)
{
    ASSERT_THROW(
        ProvisionTask::parse(json::parse(R"({"type": "shell", "script": "a.sh", "content": "true"})")),
        ConfigError);
    ASSERT_THROW(ProvisionTask::parse(json::parse(R"({"type": "shell"})")), ConfigError);
    ASSERT_THROW(
        ProvisionTask::parse(json::parse(R"({"type": "shell", "content": "true", "user": "root"})")),
        ConfigError);
    ASSERT_THROW(ProvisionTask::parse(json::parse(R"({"type": "ansible", "content": "true"})")), ConfigError);
}

TEST(ShellTask, validate)
{
    ShellTask task{.source = ScriptSource{ScriptSource::Content{"true"}}, .shell = "/bin/sh"};
    ASSERT_NO_THROW(task.validate());

    task.shell = "";
    ASSERT_THROW(task.validate(), ValidationError);

    task.shell = "bin/sh";
    ASSERT_THROW(task.validate(), ValidationError);

    task.shell = "/bin/sh";
    task.source = ScriptSource{ScriptSource::Content{"  \n"}};
    ASSERT_THROW(task.validate(), ValidationError);

    task.source = ScriptSource{ScriptSource::Script{"/nonexistent/debstrap/script.sh"}};
    ASSERT_THROW(task.validate(), ValidationError);
}

TEST(ProvisionTask, resolveSettingsAppliesDefaults)
{
    auto task = ProvisionTask::parse(json::parse(R"({"type": "mitamae", "content": "package 'vim'"})"));

    task.resolveSettings(IsolationConfig{}, PrivilegeDefaults{PrivilegeMethod::Doas}, {{"arm64", "/opt/mitamae"}}, "arm64");

    auto & mitamae = std::get<MitamaeTask>(task.raw);
    ASSERT_EQ(mitamae.binary, "/opt/mitamae");
    ASSERT_EQ(mitamae.privilege, Privilege{PrivilegeMethod::Doas});
    ASSERT_EQ(mitamae.isolation, TaskIsolation{IsolationConfig{}});
}

TEST(debianArchOf, mapsKernelMachineNames)
{
    ASSERT_EQ(debianArchOf("x86_64"), "amd64");
    ASSERT_EQ(debianArchOf("aarch64"), "arm64");
    ASSERT_EQ(debianArchOf("armv7l"), "armhf");
    ASSERT_EQ(debianArchOf("loongarch64"), "loongarch64");
}

TEST(MitamaeTask, missingBinaryIsAValidationError)
{
    MitamaeTask task{.source = ScriptSource{ScriptSource::Content{"package 'vim'"}}};

    try {
        task.validate();
        FAIL() << "expected a ValidationError";
    } catch (ValidationError & e) {
        ASSERT_THAT(filterANSIEscapes(e.msg(), true), HasSubstr("mitamae binary is not set"));
    }
}

/* ----------------------------------------------------------------------------
 * Execution
 * --------------------------------------------------------------------------*/

class TaskExecutionTest : public TempRootfsTest
{
protected:
    RecordingExecutor executor;
};

TEST_F(TaskExecutionTest, shellScriptIsStagedWithExecutableMode)
{
    auto script = writeHostFile("scripts/setup.sh", "echo hello\n");

    ShellTask task{
        .source = ScriptSource{ScriptSource::Script{script}},
        .shell = "/bin/sh",
        .isolation = TaskIsolation{IsolationConfig{}},
        .privilege = Privilege{PrivilegeMethod::Sudo},
    };

    mode_t seenMode = 0;
    std::string seenContents;
    executor.handler = [&](const CommandSpec & spec) {
        auto staged = rootfsPath(rootfs, spec.args.back());
        struct stat st;
        if (stat(staged.c_str(), &st) == 0) seenMode = st.st_mode & 07777;
        seenContents = readFile(staged);
        return ExecutionResult{.status = exitStatus(0)};
    };

    auto context = task.isolation.provider()->setup(rootfs, executor, false);
    task.execute(*context);

    ASSERT_EQ(seenMode, 0700);
    ASSERT_EQ(seenContents, "echo hello\n");
    ASSERT_EQ(executor.calls[0].privilege, PrivilegeMethod::Sudo);
    ASSERT_FALSE(pathExists(rootfsPath(rootfs, executor.calls[0].args.back())));
}

TEST_F(TaskExecutionTest, failingScriptNamesCommandAndContext)
{
    ShellTask task{
        .source = ScriptSource{ScriptSource::Content{"exit 3"}},
        .shell = "/bin/sh",
        .isolation = TaskIsolation{IsolationConfig{}},
        .privilege = Privilege{Privilege::Disabled{}},
    };
    executor.handler = [](const CommandSpec &) { return ExecutionResult{.status = exitStatus(3)}; };

    auto context = task.isolation.provider()->setup(rootfs, executor, false);
    try {
        task.execute(*context);
        FAIL() << "expected an ExecutionError";
    } catch (ExecutionError & e) {
        ASSERT_THAT(e.command, StartsWith("/bin/sh /tmp/task-"));
        ASSERT_THAT(e.command, HasSubstr("(in chroot)"));
    }
}

TEST_F(TaskExecutionTest, symlinkedTmpIsRefused)
{
    deletePath(rootfs + "/tmp");
    createSymlink("/tmp", rootfs + "/tmp");

    ShellTask task{
        .source = ScriptSource{ScriptSource::Content{"true"}},
        .shell = "/bin/sh",
        .isolation = TaskIsolation{TaskIsolation::Disabled{}},
        .privilege = Privilege{Privilege::Disabled{}},
    };

    auto context = task.isolation.provider()->setup(rootfs, executor, false);
    ASSERT_THROW(task.execute(*context), ValidationError);
    ASSERT_TRUE(executor.calls.empty());
}

TEST_F(TaskExecutionTest, mitamaeStagesBinaryAndRecipe)
{
    auto binary = writeHostFile("bin/mitamae", "ELF", 0755);

    MitamaeTask task{
        .source = ScriptSource{ScriptSource::Content{"package 'vim'"}},
        .binary = binary,
        .isolation = TaskIsolation{IsolationConfig{}},
        .privilege = Privilege{Privilege::Disabled{}},
    };

    std::string seenRecipe;
    executor.handler = [&](const CommandSpec & spec) {
        seenRecipe = readFile(rootfsPath(rootfs, spec.args.back()));
        return ExecutionResult{.status = exitStatus(0)};
    };

    auto context = task.isolation.provider()->setup(rootfs, executor, false);
    task.execute(*context);

    ASSERT_EQ(executor.calls.size(), 1);
    auto & args = executor.calls[0].args;
    ASSERT_EQ(args.size(), 4);
    ASSERT_THAT(*std::next(args.begin()), StartsWith("/tmp/mitamae-"));
    ASSERT_EQ(*std::next(args.begin(), 2), "local");
    ASSERT_EQ(seenRecipe, "package 'vim'");
    ASSERT_TRUE(std::filesystem::is_empty(rootfs + "/tmp"));
}

}
