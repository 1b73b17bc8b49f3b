#include "util/unix.hpp"
#include "util/string.hpp"

#include <fmt/format.h>

extern "C" {
#include <errno.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
}

pid_t GetTid() {
    return syscall(SYS_gettid);
}

std::string GetTaskName() {
    char name[17];

    memset(name, 0, sizeof(name));
    if (prctl(PR_GET_NAME, name) < 0)
        return program_invocation_short_name;

    return name;
}

void SetDieOnParentExit(int sig) {
    (void)prctl(PR_SET_PDEATHSIG, sig, 0, 0, 0);
}

std::string FormatTime(time_t t, const char *fmt) {
    struct tm tm;
    char buf[256];

    localtime_r(&t, &tm);
    if (!strftime(buf, sizeof(buf), fmt, &tm))
        return std::to_string(t);

    return buf;
}

std::string FormatExitStatus(int status) {
    if (WIFSIGNALED(status))
        return fmt::format("exit signal: {} ({}){}", WTERMSIG(status),
                           strsignal(WTERMSIG(status)),
                           WCOREDUMP(status) ? " (core dumped)" : "");
    return fmt::format("exit code: {}", WEXITSTATUS(status));
}

int ExitCodeFromStatus(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return EXIT_SIGNALED;
}

TError WaitPid(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return TError::System("waitpid {}", pid);
    }
    return OK;
}

TError TUnixSocket::SocketPair(TUnixSocket &sock1, TUnixSocket &sock2) {
    int fds[2];

    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds))
        return TError::System("socketpair(AF_UNIX)");

    sock1.Close();
    sock1.Sock.SetFd = fds[0];
    sock2.Close();
    sock2.Sock.SetFd = fds[1];

    return OK;
}

TError TUnixSocket::SendInt(int val) const {
    return Sock.WriteAll(reinterpret_cast<const char *>(&val), sizeof(val));
}

TError TUnixSocket::RecvInt(int &val) const {
    char *ptr = reinterpret_cast<char *>(&val);
    size_t done = 0;

    while (done < sizeof(val)) {
        ssize_t ret = read(Sock.Fd, ptr + done, sizeof(val) - done);
        if (ret < 0 && errno == EINTR)
            continue;
        if (ret < 0)
            return TError::System("recv int");
        if (ret == 0)
            return TError(EError::Unknown, "recv int: peer closed socket");
        done += ret;
    }

    return OK;
}

TError TUnixSocket::SendError(const TError &error) const {
    return error.Serialize(Sock.Fd);
}

bool TUnixSocket::RecvError(TError &error) const {
    return TError::Deserialize(Sock.Fd, error);
}

TError TUnixSocket::SendResult(const TError &error, int exitCode) const {
    TError error2 = SendError(error);
    if (error2 || error)
        return error2;

    std::string code = std::to_string(exitCode);
    return Sock.WriteAll(code);
}

bool TUnixSocket::RecvResult(TError &error, int &exitCode) const {
    if (!RecvError(error))
        return false;
    if (error)
        return true;

    /* exit code is the rest of stream */
    std::string code;
    uint64_t val = 0;

    error = Sock.ReadAll(code, 16);
    if (!error)
        error = StringToUint64(code, val);
    if (!error && val > 255)
        error = TError(EError::Unknown, "Exit code out of range: {}", code);
    if (error)
        error = TError(error, "Cannot receive exit code");
    else
        exitCode = val;

    return true;
}
