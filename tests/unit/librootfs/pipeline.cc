#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/pipeline.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/terminal.hh"
#include "tests/event-log.hh"
#include "tests/recording-executor.hh"
#include "tests/temp-rootfs.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>

namespace debstrap {

using testing::HasSubstr;
using testing::StartsWith;

static ProvisionTask inlineShellTask(std::string script)
{
    return ProvisionTask{ShellTask{
        .source = ScriptSource{ScriptSource::Content{std::move(script)}},
        .shell = "/bin/sh",
        .isolation = TaskIsolation{IsolationConfig{}},
        .privilege = Privilege{Privilege::Disabled{}},
    }};
}

static PrepareTask mountTask()
{
    return PrepareTask{MountTask{
        .mounts = {
            {.source = "proc", .target = "/proc"},
            {.source = "devtmpfs", .target = "/dev"},
        },
    }};
}

static PrepareTask resolvConfTask()
{
    return PrepareTask{ResolvConfTask{.config = {.nameServers = {"192.0.2.1"}}}};
}

/* ----------------------------------------------------------------------------
 * Pipeline::validate
 * --------------------------------------------------------------------------*/

TEST(Pipeline, mountMustComeBeforeResolvConf)
{
    std::vector<PrepareTask> prepare{resolvConfTask(), mountTask()};
    std::vector<ProvisionTask> provision;
    std::vector<AssembleTask> assemble;

    ASSERT_THROW(Pipeline(prepare, provision, assemble).validate(), ValidationError);

    std::reverse(prepare.begin(), prepare.end());
    ASSERT_NO_THROW(Pipeline(prepare, provision, assemble).validate());
}

TEST(Pipeline, atMostOneOfEachPrepareTask)
{
    std::vector<ProvisionTask> provision;
    std::vector<AssembleTask> assemble;

    std::vector<PrepareTask> twoMounts{mountTask(), mountTask()};
    ASSERT_THROW(Pipeline(twoMounts, provision, assemble).validate(), ValidationError);

    std::vector<PrepareTask> twoResolv{resolvConfTask(), resolvConfTask()};
    ASSERT_THROW(Pipeline(twoResolv, provision, assemble).validate(), ValidationError);
}

TEST(Pipeline, taskErrorsNameThePhaseAndIndex)
{
    std::vector<PrepareTask> prepare;
    std::vector<ProvisionTask> provision{inlineShellTask("true"), inlineShellTask("true")};
    std::get<ShellTask>(provision[1].raw).shell = "bin/sh";
    std::vector<AssembleTask> assemble;

    try {
        Pipeline(prepare, provision, assemble).validate();
        FAIL() << "expected a ValidationError";
    } catch (ValidationError & e) {
        ASSERT_THAT(filterANSIEscapes(e.msg(), true), HasSubstr("provision 2 validation failed"));
    }
}

TEST(Pipeline, emptyPipelineRunsNothing)
{
    std::vector<PrepareTask> prepare;
    std::vector<ProvisionTask> provision;
    std::vector<AssembleTask> assemble;
    Pipeline pipeline(prepare, provision, assemble);

    RecordingExecutor executor;
    LocalFileSystem fs;
    PipelineEnvironment env{.executor = executor, .fs = fs, .hostResolvConf = "/etc/resolv.conf", .dryRun = false};

    ASSERT_TRUE(pipeline.empty());
    pipeline.run("/nonexistent", env);
    ASSERT_TRUE(executor.calls.empty());
}

/* ----------------------------------------------------------------------------
 * Pipeline::run, dry run
 * --------------------------------------------------------------------------*/

class DryRunPipelineTest : public ::testing::Test
{
protected:
    EventLog log;
    RecordingExecutor executor;
    LocalFileSystem fs;
    Path rootfs = "/nonexistent/rootfs";

    std::vector<PrepareTask> prepare{mountTask(), resolvConfTask()};
    std::vector<ProvisionTask> provision{inlineShellTask("echo one"), inlineShellTask("echo two")};
    std::vector<AssembleTask> assemble;

    PipelineEnvironment env{
        .executor = executor,
        .fs = fs,
        .hostResolvConf = "/etc/resolv.conf",
        .dryRun = true,
    };

    DryRunPipelineTest()
    {
        executor.events = &log;
    }

    long at(std::string_view needle)
    {
        auto i = log.indexOf(needle);
        EXPECT_NE(i, -1) << "no event containing '" << needle << "'";
        return i;
    }
};

TEST_F(DryRunPipelineTest, bracketsSurroundTheProvisionPhase)
{
    Pipeline(prepare, provision, assemble).run(rootfs, env);

    auto mountProc = at("exec: mount -t proc proc " + rootfs + "/proc");
    auto mountDev = at("exec: mount -t devtmpfs devtmpfs " + rootfs + "/dev");
    auto dnsSetup = at("dry run: would set up resolv.conf");
    auto task1 = at("running provision 1/2");
    auto task2 = at("running provision 2/2");
    auto dnsTeardown = at("dry run: would restore resolv.conf");
    auto umountDev = at("exec: umount " + rootfs + "/dev");
    auto umountProc = at("exec: umount " + rootfs + "/proc");

    ASSERT_LT(mountProc, mountDev);
    ASSERT_LT(mountDev, dnsSetup);
    ASSERT_LT(dnsSetup, task1);
    ASSERT_LT(task1, task2);
    ASSERT_LT(task2, dnsTeardown);
    ASSERT_LT(dnsTeardown, umountDev);
    ASSERT_LT(umountDev, umountProc);

    ASSERT_EQ(executor.calls.size(), 6);
    ASSERT_EQ(executor.calls[2].command, "chroot");
    ASSERT_THAT(commandLine(executor.calls[2]), StartsWith("chroot " + rootfs + " /bin/sh /tmp/task-"));
}

TEST_F(DryRunPipelineTest, failingTaskStopsThePhaseButNotTheTeardown)
{
    executor.handler = [](const CommandSpec & spec) {
        if (spec.command == "chroot")
            return ExecutionResult{.status = exitStatus(1)};
        return ExecutionResult{.status = exitStatus(0)};
    };

    std::string message;
    try {
        Pipeline(prepare, provision, assemble).run(rootfs, env);
        FAIL() << "expected an ExecutionError";
    } catch (ExecutionError & e) {
        message = filterANSIEscapes(e.msg(), true);
    }

    ASSERT_THAT(message, HasSubstr("failed to run provision 1"));
    ASSERT_EQ(log.indexOf("running provision 2/2"), -1);

    auto dnsTeardown = at("dry run: would restore resolv.conf");
    auto umountProc = at("exec: umount " + rootfs + "/proc");
    ASSERT_LT(dnsTeardown, umountProc);

    size_t chroots = 0;
    for (auto & spec : executor.calls)
        if (spec.command == "chroot") ++chroots;
    ASSERT_EQ(chroots, 1);
}

TEST_F(DryRunPipelineTest, unmountFailureIsAttachedToTheTaskFailure)
{
    executor.handler = [](const CommandSpec & spec) {
        if (spec.command == "chroot" || spec.command == "umount")
            return ExecutionResult{.status = exitStatus(1)};
        return ExecutionResult{.status = exitStatus(0)};
    };

    try {
        Pipeline(prepare, provision, assemble).run(rootfs, env);
        FAIL() << "expected an ExecutionError";
    } catch (ExecutionError & e) {
        auto message = filterANSIEscapes(e.msg(), true);
        ASSERT_THAT(message, HasSubstr("additionally, unmounting failed"));
        ASSERT_THAT(message, HasSubstr("failed to unmount 2 filesystem(s)"));
    }
}

TEST_F(DryRunPipelineTest, unmountFailureAfterSuccessSurfaces)
{
    executor.handler = [](const CommandSpec & spec) {
        if (spec.command == "umount")
            return ExecutionResult{.status = exitStatus(1)};
        return ExecutionResult{.status = exitStatus(0)};
    };

    try {
        Pipeline(prepare, provision, assemble).run(rootfs, env);
        FAIL() << "expected an IsolationError";
    } catch (IsolationError & e) {
        ASSERT_THAT(
            filterANSIEscapes(e.msg(), true),
            HasSubstr("failed to unmount filesystems after the provision phase completed successfully"));
    }
    ASSERT_NE(log.indexOf("running provision 2/2"), -1);
}

TEST_F(DryRunPipelineTest, failedMountSkipsEverythingElse)
{
    executor.handler = [](const CommandSpec & spec) {
        if (spec.command == "mount" && spec.args.back().ends_with("/dev"))
            return ExecutionResult{.status = exitStatus(32)};
        return ExecutionResult{.status = exitStatus(0)};
    };

    ASSERT_THROW(Pipeline(prepare, provision, assemble).run(rootfs, env), ExecutionError);

    ASSERT_EQ(log.indexOf("dry run: would set up resolv.conf"), -1);
    ASSERT_EQ(log.indexOf("running provision"), -1);
    ASSERT_EQ(commandLine(executor.calls.back()), "umount " + rootfs + "/proc");
}

/* ----------------------------------------------------------------------------
 * Pipeline::run on a scratch rootfs
 * --------------------------------------------------------------------------*/

class PipelineTest : public TempRootfsTest
{
protected:
    RecordingExecutor executor;
    LocalFileSystem fs;

    std::vector<PrepareTask> prepare{mountTask(), resolvConfTask()};
    std::vector<ProvisionTask> provision{inlineShellTask("echo one"), inlineShellTask("echo two")};
    std::vector<AssembleTask> assemble;

    PipelineEnvironment environment()
    {
        return PipelineEnvironment{
            .executor = executor,
            .fs = fs,
            .mountPrivilege = PrivilegeMethod::Sudo,
            .hostResolvConf = "/etc/resolv.conf",
            .dryRun = false,
        };
    }
};

TEST_F(PipelineTest, tasksSeeTheTemporaryResolvConfAndTheirScript)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");

    std::vector<std::string> seenResolvConf;
    std::vector<std::string> seenScripts;
    executor.handler = [&](const CommandSpec & spec) {
        if (spec.command == "chroot") {
            seenResolvConf.push_back(readFile(rootfs + "/etc/resolv.conf"));
            seenScripts.push_back(readFile(rootfsPath(rootfs, spec.args.back())));
        }
        return ExecutionResult{.status = exitStatus(0)};
    };

    auto env = environment();
    Pipeline(prepare, provision, assemble).run(rootfs, env);

    ASSERT_EQ(seenResolvConf, (std::vector<std::string>{"nameserver 192.0.2.1\n", "nameserver 192.0.2.1\n"}));
    ASSERT_EQ(seenScripts, (std::vector<std::string>{"echo one", "echo two"}));
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_TRUE(pathExists(rootfs + "/proc"));

    for (auto & spec : executor.calls) {
        if (spec.command == "mount" || spec.command == "umount")
            ASSERT_EQ(spec.privilege, PrivilegeMethod::Sudo);
        else
            ASSERT_EQ(spec.privilege, std::nullopt);
    }
}

TEST_F(PipelineTest, scriptsAreRemovedAfterEachTask)
{
    auto env = environment();
    Pipeline(prepare, provision, assemble).run(rootfs, env);

    ASSERT_TRUE(std::filesystem::is_empty(rootfs + "/tmp"));
}

TEST_F(PipelineTest, failingTaskRestoresResolvConf)
{
    writeFile(rootfs + "/etc/resolv.conf", "original\n");
    executor.handler = [](const CommandSpec & spec) {
        if (spec.command == "chroot")
            return ExecutionResult{.status = exitStatus(2)};
        return ExecutionResult{.status = exitStatus(0)};
    };

    auto env = environment();
    ASSERT_THROW(Pipeline(prepare, provision, assemble).run(rootfs, env), ExecutionError);

    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_FALSE(pathExists(rootfs + "/etc/" + std::string(resolvConfBackupName)));
    ASSERT_EQ(commandLine(executor.calls.back()), "umount " + rootfs + "/proc");
}

TEST_F(PipelineTest, missingShellFailsBeforeRunning)
{
    deletePath(rootfs + "/bin/sh");

    auto env = environment();
    ASSERT_THROW(Pipeline(prepare, provision, assemble).run(rootfs, env), ValidationError);

    for (auto & spec : executor.calls)
        ASSERT_NE(spec.command, "chroot");
    ASSERT_EQ(commandLine(executor.calls.back()), "umount " + rootfs + "/proc");
}

/* ----------------------------------------------------------------------------
 * Pipeline::run with failing teardown steps
 * --------------------------------------------------------------------------*/

/**
 * Runs commands like the chroot backend, but can be told to fail while
 * setting up or tearing down.
 */
class FaultyContext : public IsolationContext
{
    bool failTeardown;

protected:
    CommandSpec wrapCommand(const Strings & command, std::optional<PrivilegeMethod> privilege) const override
    {
        Strings args{rootfs()};
        args.insert(args.end(), command.begin(), command.end());
        return CommandSpec{.command = "chroot", .args = std::move(args), .privilege = privilege};
    }

public:
    FaultyContext(const Path & rootfs, CommandExecutor & executor, bool dryRun, bool failTeardown)
        : IsolationContext(rootfs, executor, dryRun)
        , failTeardown(failTeardown)
    {
    }

    std::string_view name() const override
    {
        return "faulty";
    }

    void teardown() override
    {
        IsolationContext::teardown();
        if (failTeardown)
            throw IsolationError("cannot release the faulty context");
    }
};

class FaultyProvider : public IsolationProvider
{
    bool failSetup;
    bool failTeardown;

public:
    FaultyProvider(bool failSetup, bool failTeardown)
        : failSetup(failSetup)
        , failTeardown(failTeardown)
    {
    }

    std::string_view name() const override
    {
        return "faulty";
    }

    std::unique_ptr<IsolationContext>
    setup(const Path & rootfs, CommandExecutor & executor, bool dryRun) const override
    {
        if (failSetup)
            throw IsolationError("no faulty context available");
        return std::make_unique<FaultyContext>(rootfs, executor, dryRun, failTeardown);
    }
};

/**
 * Fails to move the backup back into place.
 */
class BrokenRestoreFileSystem : public LocalFileSystem
{
public:
    void renameAt(int dirFd, const std::string & from, const std::string & to) override
    {
        if (to == "resolv.conf")
            throw SysError(EIO, "renaming '%1%' to '%2%'", from, to);
        LocalFileSystem::renameAt(dirFd, from, to);
    }
};

class PipelineTeardownTest : public PipelineTest
{
protected:
    BrokenRestoreFileSystem brokenFs;
    bool restoreFails = false;
    bool setupFails = false;
    bool teardownFails = false;

    void SetUp() override
    {
        PipelineTest::SetUp();
        writeFile(rootfs + "/etc/resolv.conf", "original\n");
    }

    void failTask()
    {
        executor.handler = [](const CommandSpec & spec) {
            if (spec.command == "chroot")
                return ExecutionResult{.status = exitStatus(2)};
            return ExecutionResult{.status = exitStatus(0)};
        };
    }

    void failUnmount()
    {
        executor.handler = [](const CommandSpec & spec) {
            if (spec.command == "umount")
                return ExecutionResult{.status = exitStatus(1)};
            return ExecutionResult{.status = exitStatus(0)};
        };
    }

    /**
     * Run the pipeline and return the rendered message of the `E` it
     * must throw.
     */
    template<typename E>
    std::string runExpecting()
    {
        PipelineEnvironment env{
            .executor = executor,
            .fs = restoreFails ? static_cast<FileSystem &>(brokenFs) : static_cast<FileSystem &>(fs),
            .mountPrivilege = PrivilegeMethod::Sudo,
            .hostResolvConf = "/etc/resolv.conf",
            .dryRun = false,
            .providerFor = [this](const TaskIsolation &) -> std::unique_ptr<IsolationProvider> {
                return std::make_unique<FaultyProvider>(setupFails, teardownFails);
            },
        };
        try {
            Pipeline(prepare, provision, assemble).run(rootfs, env);
        } catch (E & e) {
            return filterANSIEscapes(e.msg(), true);
        }
        ADD_FAILURE() << "the pipeline did not fail as expected";
        return "";
    }

    size_t taskRuns() const
    {
        return std::count_if(executor.calls.begin(), executor.calls.end(), [](const CommandSpec & spec) {
            return spec.command == "chroot";
        });
    }
};

TEST_F(PipelineTeardownTest, setupFailureStopsThePhase)
{
    setupFails = true;

    auto message = runExpecting<IsolationError>();

    ASSERT_THAT(message, HasSubstr("no faulty context available"));
    ASSERT_THAT(message, HasSubstr("failed to setup isolation context"));
    ASSERT_THAT(message, HasSubstr("failed to run provision 1"));
    ASSERT_EQ(taskRuns(), 0);
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
    ASSERT_EQ(commandLine(executor.calls.back()), "umount " + rootfs + "/proc");
}

TEST_F(PipelineTeardownTest, contextTeardownFailureAfterSuccessfulTask)
{
    teardownFails = true;

    auto message = runExpecting<IsolationError>();

    ASSERT_THAT(message, HasSubstr("cannot release the faulty context"));
    ASSERT_THAT(message, HasSubstr("failed to teardown isolation context"));
    ASSERT_THAT(message, HasSubstr("failed to run provision 1"));
    ASSERT_EQ(taskRuns(), 1);
    ASSERT_EQ(readFile(rootfs + "/etc/resolv.conf"), "original\n");
}

TEST_F(PipelineTeardownTest, taskFailureStaysPrimaryOverContextTeardownFailure)
{
    failTask();
    teardownFails = true;

    auto message = runExpecting<ExecutionError>();

    ASSERT_THAT(message, HasSubstr("additionally, teardown failed: cannot release the faulty context"));
    ASSERT_THAT(message, testing::Not(HasSubstr("failed to teardown isolation context")));
    ASSERT_EQ(taskRuns(), 1);
}

TEST_F(PipelineTeardownTest, restoreFailureAfterSuccessSurfacesAndStillUnmounts)
{
    restoreFails = true;

    auto message = runExpecting<IoError>();

    ASSERT_THAT(message, HasSubstr("failed to restore"));
    ASSERT_THAT(message, HasSubstr("failed to restore resolv.conf after the provision phase completed successfully"));
    ASSERT_EQ(taskRuns(), 2);
    ASSERT_EQ(commandLine(executor.calls.back()), "umount " + rootfs + "/proc");
}

TEST_F(PipelineTeardownTest, restoreAndUnmountFailuresAfterSuccess)
{
    restoreFails = true;
    failUnmount();

    auto message = runExpecting<IoError>();

    ASSERT_THAT(message, HasSubstr("failed to restore resolv.conf after the provision phase completed successfully"));
    ASSERT_THAT(message, HasSubstr("additionally, unmounting failed"));
}

TEST_F(PipelineTeardownTest, taskFailureStaysPrimaryOverRestoreAndUnmountFailures)
{
    restoreFails = true;
    executor.handler = [](const CommandSpec & spec) {
        if (spec.command == "chroot" || spec.command == "umount")
            return ExecutionResult{.status = exitStatus(1)};
        return ExecutionResult{.status = exitStatus(0)};
    };
    EventLog log;

    auto message = runExpecting<ExecutionError>();

    ASSERT_THAT(message, HasSubstr("failed to run provision 1"));
    ASSERT_THAT(message, HasSubstr("additionally, restoring resolv.conf failed"));
    ASSERT_THAT(message, HasSubstr("additionally, unmounting failed"));
    ASSERT_TRUE(log.contains("failed to restore resolv.conf after an earlier failure"));
    ASSERT_TRUE(log.contains("failed to unmount filesystems after an earlier failure"));
}

}
