#pragma once

#include "common.hpp"
#include "util/path.hpp"

/*
 * Ephemeral root owned by one invocation. Removed by destructor on any
 * path out of scope, even after chroot into it: removal goes through
 * descriptor of parent directory opened at creation.
 */
class TSandboxRoot {
public:
    TSandboxRoot() = default;
    TSandboxRoot(TSandboxRoot &&other);
    TSandboxRoot &operator=(TSandboxRoot &&other);
    ~TSandboxRoot();

    TSandboxRoot(const TSandboxRoot &) = delete;
    TSandboxRoot &operator=(const TSandboxRoot &) = delete;

    /* sandbox.tmp_dir, $TMPDIR or /tmp */
    static TPath DefaultParent();

    TError Create(const TPath &parent = TPath());

    /* copy command into root, staged is its path after entering root */
    TError StageCommand(const TPath &command, TPath &staged) const;

    /* placeholder dev/null without write permissions */
    TError CreateDevNull() const;

    TError Remove();

    const TPath &GetPath() const { return Path; }

    explicit operator bool() const { return !Path.IsEmpty(); }

private:
    TPath Path;
    std::string Name;
    TFile Parent;
};
