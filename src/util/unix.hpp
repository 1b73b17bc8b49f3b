#pragma once

#include <string>

#include "common.hpp"
#include "util/path.hpp"

extern "C" {
#include <sys/types.h>
#include <time.h>
}

pid_t GetTid();

/* comm of current thread */
std::string GetTaskName();

void SetDieOnParentExit(int sig);

std::string FormatTime(time_t t, const char *fmt = "%F %T");
std::string FormatExitStatus(int status);

/* exit code for status from waitpid, signals map to EXIT_SIGNALED */
int ExitCodeFromStatus(int status);

/* waitpid retried on EINTR */
TError WaitPid(pid_t pid, int &status);

/* stream socket pair between forked processes, close-on-exec */
class TUnixSocket : public TNonCopyable {
    TFile Sock;

public:
    static TError SocketPair(TUnixSocket &sock1, TUnixSocket &sock2);

    void Close() { Sock.Close(); }

    TError SendInt(int val) const;
    TError RecvInt(int &val) const;

    TError SendError(const TError &error) const;

    /* false if peer closed socket without sending anything */
    bool RecvError(TError &error) const;

    /* error, and exit code if there is no error */
    TError SendResult(const TError &error, int exitCode) const;
    bool RecvResult(TError &error, int &exitCode) const;
};
