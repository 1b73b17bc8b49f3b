#include "sandbox.hpp"
#include "config.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

extern "C" {
#include <stdlib.h>
#include <sys/stat.h>
}

TSandboxRoot::TSandboxRoot(TSandboxRoot &&other)
    : Path(other.Path), Name(other.Name)
{
    Parent.Swap(other.Parent);
    other.Path = TPath();
    other.Name.clear();
}

TSandboxRoot &TSandboxRoot::operator=(TSandboxRoot &&other) {
    if (this != &other) {
        (void)Remove();
        Path = other.Path;
        Name = other.Name;
        Parent.Swap(other.Parent);
        other.Path = TPath();
        other.Name.clear();
    }
    return *this;
}

TSandboxRoot::~TSandboxRoot() {
    TPath path = Path;
    TError error = Remove();
    if (error)
        L_WRN("Cannot remove sandbox root {}: {}", path, error);
}

TPath TSandboxRoot::DefaultParent() {
    if (!config().sandbox().tmp_dir().empty())
        return config().sandbox().tmp_dir();

    const char *tmpdir = getenv("TMPDIR");
    if (tmpdir && tmpdir[0])
        return tmpdir;

    return SANDBOX_DEFAULT_TMP;
}

TError TSandboxRoot::Create(const TPath &parent) {
    TPath dir = parent ? parent : DefaultParent();
    TError error;

    if (Path)
        return TError(EError::IoError, "Sandbox root already created: {}", Path);

    dir = dir.AbsolutePath().NormalPath();

    error = Parent.OpenDir(dir);
    if (error)
        return TError(error, "Cannot open sandbox parent {}", dir);

    error = Path.MkdirTmp(dir, SANDBOX_PREFIX, 0755);
    if (error) {
        Path = TPath();
        Parent.Close();
        return TError(error, "Cannot create sandbox root in {}", dir);
    }

    Name = Path.BaseName();

    L_VERBOSE("Created sandbox root {}", Path);

    return OK;
}

TError TSandboxRoot::StageCommand(const TPath &command, TPath &staged) const {
    std::string name = command.ToString();
    struct stat st;
    TError error;

    name.erase(0, name.find_first_not_of('/'));

    TPath inner = TPath(name).NormalPath();
    if (inner.IsEmpty() || inner == "." || inner.StartsWithDotDot())
        return TError(EError::IoError, EINVAL, "Command {} resolves outside of sandbox root", command);

    error = command.StatFollow(st);
    if (error)
        return TError(error, "Cannot stage command {}", command);

    if (!S_ISREG(st.st_mode))
        return TError(EError::IoError, EINVAL, "Command {} is not a regular file", command);

    TPath target = Path / inner;

    error = target.DirName().MkdirAll(0755);
    if (error)
        return TError(error, "Cannot stage command {}", command);

    error = target.CopyRegular(command);
    if (error)
        return TError(error, "Cannot stage command {}", command);

    staged = TPath("/") / inner;

    L_VERBOSE("Staged {} as {}", command, target);

    return OK;
}

TError TSandboxRoot::CreateDevNull() const {
    TPath dev = Path / "dev";
    TPath null = dev / "null";
    TError error;

    if (!dev.IsDirectoryStrict()) {
        error = dev.Mkdir(0755);
        if (error)
            return error;
    }

    if (!null.PathExists()) {
        error = null.Mkfile(0555);
        if (error)
            return error;
    }

    error = null.Chmod(0555);
    if (!error)
        error = dev.Chmod(0555);

    return error;
}

TError TSandboxRoot::Remove() {
    TError error;

    if (!Path)
        return OK;

    if (Parent) {
        error = Parent.RemoveAt(Name);
        if (error && error.Errno == ENOENT)
            error = OK;
    } else
        error = TError(EError::IoError, "No parent directory descriptor for {}", Path);

    if (!error)
        L_VERBOSE("Removed sandbox root {}", Path);

    Path = TPath();
    Name.clear();
    Parent.Close();

    return error;
}
