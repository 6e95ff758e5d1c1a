#include "debstrap/libmain/shared.hh"
#include "debstrap/libmain/loggers.hh"
#include "debstrap/librootfs/globals.hh"
#include "debstrap/libutil/ansicolor.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/exit.hh"
#include "debstrap/libutil/file-system.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"

#include <iostream>

#include <signal.h>
#include <sys/stat.h>

namespace debstrap {

void initDebstrap()
{
    loadConfFile();

    /* Reset SIGCHLD to its default, so that waiting on the bootstrap
       tool and the task shells works even if our parent ignored it. */
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;
    act.sa_handler = SIG_DFL;
    if (sigaction(SIGCHLD, &act, 0))
        throw SysError("resetting SIGCHLD");

    /* Files staged into the rootfs get explicit modes; everything else
       should be readable by the tools running inside it. */
    umask(0022);
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% %2%", programName, DEBSTRAP_VERSION) << std::endl;
    std::cout << "System configuration file: " << settings.debstrapConfDir + "/debstrap.conf" << "\n";
    std::cout << "User configuration files: "
              << concatStringsSep(":", settings.userConfFiles)
              << "\n";
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    try {
        fun();
        return 0;
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1%' for more information.", programName + " --help");
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return 1;
    } catch (const std::bad_alloc & e) {
        printError(ANSI_RED "error:" ANSI_NORMAL " out of memory");
        return 1;
    }
    // Other std exceptions are left to the terminate handler, which
    // reports them with a usable core dump.
}

}
