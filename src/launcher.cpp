#include "launcher.hpp"
#include "sandbox.hpp"
#include "docker.hpp"
#include "config.hpp"
#include "util/unix.hpp"
#include "util/string.hpp"
#include "util/log.hpp"

extern "C" {
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sched.h>
#include <sys/wait.h>
}

TError THostIsolation::EnterRoot(const TPath &root) {
    TError error;

    error = root.Chroot();
    if (!error)
        error = TPath("/").Chdir();

    if (error && error.Errno == EPERM)
        return TError(EError::PermissionError, error, "Cannot enter root {}", root);
    if (error)
        return TError(EError::IoError, error, "Cannot enter root {}", root);

    return OK;
}

TError THostIsolation::UnsharePid() {
    L_ACT("unshare(CLONE_NEWPID)");

    if (unshare(CLONE_NEWPID)) {
        if (errno == EPERM)
            return TError(EError::PermissionError, errno, "unshare(CLONE_NEWPID)");
        return TError(EError::IoError, errno, "unshare(CLONE_NEWPID)");
    }

    return OK;
}

std::string TLauncher::StateName(ELaunchState state) {
    switch (state) {
    case ELaunchState::Created:
        return "created";
    case ELaunchState::RootBuilt:
        return "root built";
    case ELaunchState::ImagePulled:
        return "image pulled";
    case ELaunchState::RootEntered:
        return "root entered";
    case ELaunchState::NamespaceIsolated:
        return "namespace isolated";
    case ELaunchState::ChildRunning:
        return "child running";
    case ELaunchState::Exited:
        return "exited";
    }
    return "unknown";
}

void TLauncher::SetState(ELaunchState state) {
    L_VERBOSE("State {} -> {}", StateName(State), StateName(state));
    State = state;
    if (state != ELaunchState::Exited)
        Reached = state;
}

TError TLauncher::SpawnAndWait(const TPath &command, const std::vector<std::string> &args, int &exitCode) {
    TUnixSocket sock, sock2;
    TError error;
    int status;

    std::vector<std::string> argv_str = { command.ToString() };
    argv_str.insert(argv_str.end(), args.begin(), args.end());

    std::string cmdline = MergeWithQuotes(argv_str, ' ');

    error = TUnixSocket::SocketPair(sock, sock2);
    if (error)
        return TError(EError::SpawnError, error, "Cannot spawn {}", cmdline);

    pid_t pid = fork();
    if (pid < 0)
        return TError(EError::SpawnError, errno, "Cannot spawn {}: fork()", cmdline);

    if (pid == 0) {
        sock.Close();

        int fd = open("/dev/null", O_RDONLY | O_NOCTTY);
        if (fd < 0) {
            close(STDIN_FILENO);
        } else if (fd != STDIN_FILENO) {
            dup2(fd, STDIN_FILENO);
            close(fd);
        }

        std::vector<const char *> argv;
        for (auto &arg: argv_str)
            argv.push_back(arg.c_str());
        argv.push_back(nullptr);

        L_ACT("Exec {}", cmdline);
        execv(command.c_str(), (char *const *)argv.data());

        TError error2(EError::SpawnError, errno, "Cannot exec {}", cmdline);
        (void)sock2.SendError(error2);
        _exit(EXIT_FAILURE);
    }

    sock2.Close();

    SetState(ELaunchState::ChildRunning);

    /* nothing on successful exec, socket closed by O_CLOEXEC */
    TError execError;
    (void)sock.RecvError(execError);

    error = WaitPid(pid, status);
    if (error)
        return TError(EError::SpawnError, error, "Cannot wait {}", cmdline);

    SetState(ELaunchState::Exited);

    if (execError)
        return execError;

    exitCode = ExitCodeFromStatus(status);

    L("Command {} finished with {}", cmdline, FormatExitStatus(status));

    return OK;
}

/* runs in forked supervisor, never returns to caller code */
TError TLauncher::SupervisorMain(const TPath &root, const TPath &command,
                                 const std::vector<std::string> &args, int &exitCode) {
    TError error;

    error = Isolation.EnterRoot(root);
    if (error)
        return error;
    SetState(ELaunchState::RootEntered);

    error = Isolation.UnsharePid();
    if (error) {
        if (!config().isolation().allow_shared_pid_namespace())
            return TError(error, "Cannot isolate pid namespace");
        L_WRN("Pid namespace is shared with host: {}", error);
    }
    SetState(ELaunchState::NamespaceIsolated);

    return SpawnAndWait(command, args, exitCode);
}

/*
 * Process cannot remove its own root directory, so root is entered
 * by supervisor child while this process keeps sandbox ownership.
 */
TError TLauncher::Supervise(const TPath &root, const TPath &command,
                            const std::vector<std::string> &args, int &exitCode) {
    TUnixSocket sock, sock2;
    TError error;
    int status;

    error = TUnixSocket::SocketPair(sock, sock2);
    if (error)
        return TError(EError::SpawnError, error, "Cannot start supervisor");

    pid_t pid = fork();
    if (pid < 0)
        return TError(EError::SpawnError, errno, "Cannot start supervisor: fork()");

    if (pid == 0) {
        int code = EXIT_FAILURE;

        sock.Close();
        SetDieOnParentExit(SIGKILL);

        error = SupervisorMain(root, command, args, code);
        if (sock2.SendInt(static_cast<int>(Reached)) || sock2.SendResult(error, code))
            _exit(EXIT_FAILURE);

        _exit(code);
    }

    sock2.Close();

    TError result;
    int reached = 0;
    bool received = !sock.RecvInt(reached) && sock.RecvResult(result, exitCode);

    error = WaitPid(pid, status);
    if (error)
        return TError(EError::SpawnError, error, "Cannot wait supervisor");

    /* states past fork are entered by supervisor copy of launcher */
    if (received && reached > static_cast<int>(State) &&
            reached < static_cast<int>(ELaunchState::Exited))
        SetState(static_cast<ELaunchState>(reached));
    SetState(ELaunchState::Exited);

    if (!received)
        return TError(EError::SpawnError, "Supervisor died with {}", FormatExitStatus(status));

    return result;
}

TError TLauncher::Run(const TRunRequest &request, int &exitCode) {
    bool pull = request.Image != SKIP_IMAGE;
    TSandboxRoot root;
    TImageRef ref;
    TPath staged;
    TError error;

    if (pull) {
        error = TImageRef::Parse(request.Image, ref);
        if (error)
            return error;
    }

    error = root.Create();
    if (error)
        return TError(error, "Cannot create sandbox root");

    error = root.StageCommand(request.Command, staged);
    if (error)
        return error;

    error = root.CreateDevNull();
    if (error)
        return TError(error, "Cannot create dev/null");

    SetState(ELaunchState::RootBuilt);

    if (pull) {
        TDockerImage image(ref);

        error = image.Pull(Client, root.GetPath());
        if (error)
            return TError(error, "Cannot pull image {}", ref.ToString());

        SetState(ELaunchState::ImagePulled);
    }

    return Supervise(root.GetPath(), staged, request.Args, exitCode);
}
