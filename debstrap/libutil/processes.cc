#include "debstrap/libutil/environment-variables.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/file-descriptor.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/processes.hh"
#include "debstrap/libutil/strings.hh"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <vector>

#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace debstrap {

std::optional<Path> findExecutable(std::string_view name)
{
    auto isExecutable = [](const Path & path) {
        auto st = maybeStat(path);
        return st && S_ISREG(st->st_mode) && access(path.c_str(), X_OK) == 0;
    };

    if (name.empty()) return std::nullopt;

    if (name.find('/') != name.npos) {
        Path path{name};
        if (isExecutable(path)) return path;
        return std::nullopt;
    }

    auto searchPath = getEnv("PATH").value_or("/usr/local/bin:/usr/bin:/bin");
    for (auto & dir : tokenizeString<Strings>(searchPath, ":")) {
        auto candidate = dir + "/" + std::string(name);
        if (isExecutable(candidate)) return candidate;
    }
    return std::nullopt;
}

namespace {

/**
 * A forked child that is killed and reaped if still running when this
 * goes out of scope.
 */
class Child
{
    pid_t pid;

public:
    explicit Child(pid_t pid) : pid(pid) { }
    Child(const Child &) = delete;

    ~Child()
    {
        if (pid == -1) return;
        debug("killing process %1%", pid);
        if (::kill(pid, SIGKILL) != 0)
            printError("killing process %1%: %2%", pid, std::strerror(errno));
        try {
            wait();
        } catch (...) {
            ignoreExceptionInDestructor();
        }
    }

    int wait()
    {
        while (true) {
            int status;
            if (waitpid(pid, &status, 0) == pid) {
                pid = -1;
                return status;
            }
            if (errno != EINTR)
                throw SysError("cannot get exit status of PID %d", pid);
        }
    }
};

struct Pipe
{
    AutoCloseFD readSide, writeSide;

    Pipe()
    {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) throw SysError("creating pipe");
        readSide = AutoCloseFD{fds[0]};
        writeSide = AutoCloseFD{fds[1]};
    }
};

/**
 * Splits output from one child stream into lines and forwards them.
 */
struct LineSplitter
{
    const LineSink & sink;
    std::string pending;

    void feed(std::string_view data)
    {
        pending.append(data);
        size_t start = 0;
        for (size_t nl; (nl = pending.find('\n', start)) != std::string::npos; start = nl + 1)
            sink(std::string_view(pending).substr(start, nl - start));
        pending.erase(0, start);
    }

    void flush()
    {
        if (!pending.empty()) sink(pending);
        pending.clear();
    }
};

}

/* Runs in the forked child; never returns. */
[[noreturn]] static void execChild(const RunOptions & options, Pipe & out, Pipe & err)
{
    try {
        if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
            throw SysError("setting death signal");

        for (auto & [name, value] : options.extraEnvironment)
            if (setenv(name.c_str(), value.c_str(), 1) == -1)
                throw SysError("setting environment variable '%1%'", name);

        if (dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
            throw SysError("dupping stdout");
        if (dup2(err.writeSide.get(), STDERR_FILENO) == -1)
            throw SysError("dupping stderr");

        if (options.chdir && chdir(options.chdir->c_str()) == -1)
            throw SysError("chdir to '%1%' failed", *options.chdir);

        std::vector<char *> argv;
        argv.push_back(const_cast<char *>(options.program.c_str()));
        for (auto & arg : options.args)
            argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);

        if (options.searchPath)
            execvp(options.program.c_str(), argv.data());
        else
            execv(options.program.c_str(), argv.data());

        throw SysError("executing '%1%'", options.program);
    } catch (std::exception & e) {
        std::cerr << e.what() << "\n";
    }
    _exit(1);
}

int runProgram(const RunOptions & options, const LineSink & onStdout, const LineSink & onStderr)
{
    Pipe out, err;

    printMsg(lvlChatty, "running command: %s", concatMapStringsSep(" ", options.args, shellEscape));

    pid_t pid = fork();
    if (pid == -1) throw SysError("unable to fork");
    if (pid == 0)
        execChild(options, out, err);
    Child child{pid};

    out.writeSide.close();
    err.writeSide.close();

    LineSplitter stdoutLines{onStdout, {}};
    LineSplitter stderrLines{onStderr, {}};

    struct pollfd fds[2] = {
        {.fd = out.readSide.get(), .events = POLLIN, .revents = 0},
        {.fd = err.readSide.get(), .events = POLLIN, .revents = 0},
    };
    LineSplitter * splitters[2] = {&stdoutLines, &stderrLines};

    std::array<char, 8192> buf;
    while (fds[0].fd != -1 || fds[1].fd != -1) {
        if (poll(fds, 2, -1) == -1) {
            if (errno == EINTR) continue;
            throw SysError("waiting for output of '%1%'", options.program);
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd == -1 || !fds[i].revents) continue;
            ssize_t n = read(fds[i].fd, buf.data(), buf.size());
            if (n == -1) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw SysError("reading output of '%1%'", options.program);
            }
            if (n == 0) {
                splitters[i]->flush();
                fds[i].fd = -1;
                continue;
            }
            splitters[i]->feed(std::string_view(buf.data(), n));
        }
    }

    return child.wait();
}

std::string statusToString(int status)
{
    if (WIFEXITED(status)) {
        if (WEXITSTATUS(status) == 0) return "succeeded";
        return fmt("failed with exit code %1%", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        return fmt("failed due to signal %1% (%2%)", sig, strsignal(sig));
    }
    return "died abnormally";
}

bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}
