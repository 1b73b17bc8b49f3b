#pragma once

#include <string>
#include <vector>

#include "common.hpp"
#include "util/path.hpp"
#include "util/http.hpp"

/* privileged operations, replaced by fakes in tests */
class IIsolation {
public:
    virtual ~IIsolation() = default;

    /* chroot and chdir into new root, irreversible */
    virtual TError EnterRoot(const TPath &root) = 0;

    /* following children start in new pid namespace */
    virtual TError UnsharePid() = 0;
};

class THostIsolation : public IIsolation {
public:
    TError EnterRoot(const TPath &root) override;
    TError UnsharePid() override;
};

enum class ELaunchState {
    Created,
    RootBuilt,
    ImagePulled,
    RootEntered,
    NamespaceIsolated,
    ChildRunning,
    Exited,
};

struct TRunRequest {
    /* <name>:<tag> or "skip" */
    std::string Image;
    TPath Command;
    std::vector<std::string> Args;
};

class TLauncher : public TNonCopyable {
public:
    TLauncher(IIsolation &isolation, IHttpClient &client)
        : Isolation(isolation), Client(client) {}

    /*
     * Builds sandbox root, pulls image, then enters root and runs command
     * in supervisor process. Sandbox root is removed before return.
     */
    TError Run(const TRunRequest &request, int &exitCode);

    /* command gets /dev/null or nothing as stdin */
    TError SpawnAndWait(const TPath &command, const std::vector<std::string> &args, int &exitCode);

    ELaunchState GetState() const { return State; }
    /* last state before exit, reported back by supervisor */
    ELaunchState GetReachedState() const { return Reached; }
    static std::string StateName(ELaunchState state);

private:
    IIsolation &Isolation;
    IHttpClient &Client;
    ELaunchState State = ELaunchState::Created;
    ELaunchState Reached = ELaunchState::Created;

    void SetState(ELaunchState state);

    TError Supervise(const TPath &root, const TPath &command,
                     const std::vector<std::string> &args, int &exitCode);
    TError SupervisorMain(const TPath &root, const TPath &command,
                          const std::vector<std::string> &args, int &exitCode);
};
