#include "util/log.hpp"
#include "util/unix.hpp"

extern "C" {
#include <fcntl.h>
#include <time.h>
#include <unistd.h>
}

bool Verbose = false;
bool Debug = false;

static TFile LogFile;

static const char *LevelPrefix(ELogLevel level) {
    switch (level) {
    case ELogLevel::Debug:
        return "DBG";
    case ELogLevel::Warning:
        return "WRN";
    case ELogLevel::Error:
        return "ERR";
    case ELogLevel::Action:
        return "ACT";
    case ELogLevel::System:
        return "SYS";
    case ELogLevel::Network:
        return "NET";
    case ELogLevel::Verbose:
    case ELogLevel::Info:
        break;
    }
    return "   ";
}

void OpenLog() {
    if (LogFile.Fd > STDERR_FILENO)
        LogFile.Close();
    LogFile.SetFd = STDERR_FILENO;
}

TError OpenLog(const TPath &path) {
    TFile file;
    TError error;

    error = file.Open(path, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC |
                            O_NOFOLLOW | O_NOCTTY, 0644);
    if (error)
        return error;

    /* keep log away from stdio descriptors */
    if (file.Fd <= STDERR_FILENO) {
        int fd = fcntl(file.Fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
        if (fd < 0)
            return TError::Io("dup log {}", path);
        file.Close();
        file.SetFd = fd;
    }

    error = file.Chmod(0644);
    if (error)
        return error;

    OpenLog();
    LogFile.Swap(file);
    /* stderr must stay open */
    if (file.Fd == STDERR_FILENO)
        file.SetFd = -1;

    return OK;
}

bool LogEnabled(ELogLevel level) {
    if (level == ELogLevel::Debug)
        return Debug;
    if (level == ELogLevel::Verbose)
        return Verbose;
    return true;
}

void WriteLog(ELogLevel level, const std::string &text) {
    struct timespec ts;

    if (!LogFile)
        return;

    clock_gettime(CLOCK_REALTIME, &ts);

    std::string line = fmt::format("{}.{:03} {}[{}]: {} {}\n",
                                   FormatTime(ts.tv_sec), ts.tv_nsec / 1000000,
                                   GetTaskName(), GetTid(), LevelPrefix(level), text);

    /* nowhere to report failed log write */
    (void)LogFile.WriteAll(line);
}
