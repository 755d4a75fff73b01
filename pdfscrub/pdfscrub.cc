#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/ScrubJob.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <cstring>
#include <iostream>

using namespace pdfscrub;

static char const* whoami = nullptr;

static void
usageExit(std::string const& msg)
{
    std::cerr << std::endl
              << whoami << ": " << msg << std::endl
              << std::endl
              << "For help:" << std::endl
              << "  " << whoami << " --help" << std::endl
              << std::endl;
    exit(ScrubJob::EXIT_USAGE);
}

int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);
    QUtil::setLineBuf(stdout);

    // Remove prefix added by libtool for consistency during testing.
    if (strncmp(whoami, "lt-", 3) == 0) {
        whoami += 3;
    }

    ScrubJob j;
    j.setMessagePrefix(whoami);
    try {
        j.initializeFromArgv(argv);
        j.run();
    } catch (ScrubUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        return ScrubJob::EXIT_DETECTED;
    }
    return j.getExitCode();
}

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}
