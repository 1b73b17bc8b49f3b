#include "util/path.hpp"
#include "util/log.hpp"

#include <sstream>
#include <utility>

extern "C" {
#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
#include <string.h>
#include <linux/limits.h>
#include <sys/stat.h>
}

TPath TPath::Join(const TPath &tail) const {
    if (tail.IsEmpty() || tail.IsRoot())
        return *this;
    if (IsEmpty() || (IsRoot() && tail.IsAbsolute()))
        return tail;
    if (tail.IsAbsolute() || Path.back() == '/')
        return TPath(Path + tail.Path);
    return TPath(Path + "/" + tail.Path);
}

std::vector<std::string> TPath::Components() const {
    std::vector<std::string> result;
    std::istringstream ss(Path);
    std::string name;

    if (IsAbsolute())
        result.push_back("/");

    while (std::getline(ss, name, '/')) {
        if (!name.empty() && name != ".")
            result.push_back(name);
    }

    return result;
}

TPath TPath::NormalPath() const {
    std::vector<std::string> stack;
    bool absolute = IsAbsolute();

    if (IsEmpty())
        return TPath();

    for (auto &name: Components()) {
        if (name == "/")
            continue;
        if (name != "..")
            stack.push_back(name);
        else if (!stack.empty() && stack.back() != "..")
            stack.pop_back();
        else if (!absolute)
            stack.push_back(name);
    }

    std::string result = absolute ? "/" : "";
    for (auto &name: stack) {
        if (!result.empty() && result != "/")
            result += "/";
        result += name;
    }

    return TPath(result.empty() ? "." : result);
}

TPath TPath::DirName() const {
    std::string normal = NormalPath().Path;
    auto sep = normal.rfind('/');

    if (sep == std::string::npos)
        return normal.empty() ? TPath() : TPath(".");
    if (sep == 0)
        return TPath("/");
    return TPath(normal.substr(0, sep));
}

std::string TPath::BaseName() const {
    std::string normal = NormalPath().Path;
    auto sep = normal.rfind('/');

    if (sep == std::string::npos || normal == "/")
        return normal;
    return normal.substr(sep + 1);
}

TPath TPath::AbsolutePath() const {
    char cwd[PATH_MAX];

    if (IsEmpty() || IsAbsolute())
        return *this;

    if (!getcwd(cwd, sizeof(cwd)))
        return TPath();

    return TPath(cwd) / *this;
}

TError TPath::StatFollow(struct stat &st) const {
    if (stat(c_str(), &st))
        return TError::Io("stat {}", Path);
    return OK;
}

bool TPath::PathExists() const {
    struct stat st;
    return !lstat(c_str(), &st);
}

bool TPath::IsDirectoryStrict() const {
    struct stat st;
    return !lstat(c_str(), &st) && S_ISDIR(st.st_mode);
}

TError TPath::Chdir() const {
    if (chdir(c_str()))
        return TError::Io("chdir {}", Path);
    return OK;
}

/* caller classifies EPERM */
TError TPath::Chroot() const {
    L_ACT("chroot {}", Path);

    if (chroot(c_str()))
        return TError::Io("chroot {}", Path);
    return OK;
}

TError TPath::Chmod(mode_t mode) const {
    if (chmod(c_str(), mode))
        return TError::Io("chmod {} {:#o}", Path, mode);
    return OK;
}

TError TPath::Lchown(uid_t uid, gid_t gid) const {
    if (lchown(c_str(), uid, gid))
        return TError::Io("lchown {} {}:{}", Path, uid, gid);
    return OK;
}

TError TPath::SetModificationTime(time_t mtime) const {
    struct timespec ts[2];

    ts[0].tv_sec = 0;
    ts[0].tv_nsec = UTIME_OMIT;
    ts[1].tv_sec = mtime;
    ts[1].tv_nsec = 0;

    if (utimensat(AT_FDCWD, c_str(), ts, AT_SYMLINK_NOFOLLOW))
        return TError::Io("utimensat {}", Path);
    return OK;
}

TError TPath::Mkdir(mode_t mode) const {
    if (mkdir(c_str(), mode))
        return TError::Io("mkdir {} {:#o}", Path, mode);
    return OK;
}

TError TPath::MkdirAll(mode_t mode) const {
    std::vector<TPath> missing;
    TPath path = NormalPath();
    struct stat st;
    TError error;

    while (stat(path.c_str(), &st)) {
        if (errno != ENOENT)
            return TError::Io("stat {}", path);
        missing.push_back(path);
        path = path.DirName();
    }

    if (!S_ISDIR(st.st_mode))
        return TError(EError::IoError, ENOTDIR, "Not a directory: {}", path);

    for (auto it = missing.rbegin(); it != missing.rend(); it++) {
        error = it->Mkdir(mode);
        if (error)
            return error;
    }

    return OK;
}

TError TPath::MkdirTmp(const TPath &parent, const std::string &prefix, mode_t mode) {
    Path = (parent / (prefix + "XXXXXX")).Path;

    if (!mkdtemp(&Path[0]))
        return TError::Io("mkdtemp {}", Path);

    return mode == 0700 ? OK : Chmod(mode);
}

TError TPath::Mknod(mode_t mode, dev_t dev) const {
    if (mknod(c_str(), mode, dev))
        return TError::Io("mknod {} {:#o} {:#x}", Path, mode, (unsigned long)dev);
    return OK;
}

TError TPath::Mkfile(mode_t mode) const {
    return Mknod(S_IFREG | (mode & 0777), 0);
}

TError TPath::Mkfifo(mode_t mode) const {
    if (mkfifo(c_str(), mode & 07777))
        return TError::Io("mkfifo {} {:#o}", Path, mode);
    return OK;
}

TError TPath::Symlink(const TPath &target) const {
    if (symlink(target.c_str(), c_str()))
        return TError::Io("symlink {} -> {}", Path, target);
    return OK;
}

TError TPath::Hardlink(const TPath &target) const {
    if (link(target.c_str(), c_str()))
        return TError::Io("link {} -> {}", Path, target);
    return OK;
}

TError TPath::ReadLink(TPath &target) const {
    char buf[PATH_MAX];
    ssize_t len;

    len = readlink(c_str(), buf, sizeof(buf) - 1);
    if (len < 0)
        return TError::Io("readlink {}", Path);

    target = TPath(std::string(buf, len));
    return OK;
}

TError TPath::Unlink() const {
    if (unlink(c_str()))
        return TError::Io("unlink {}", Path);
    return OK;
}

TError TPath::RemoveAll() const {
    TFile parent;
    TError error;

    error = parent.OpenDir(DirName());
    if (!error)
        error = parent.RemoveAt(BaseName());
    return error;
}

TError TPath::ReadDirectory(std::vector<std::string> &names) const {
    struct dirent *de;
    DIR *dir;

    names.clear();

    dir = opendir(c_str());
    if (!dir)
        return TError::Io("opendir {}", Path);

    while ((de = readdir(dir))) {
        if (strcmp(de->d_name, ".") && strcmp(de->d_name, ".."))
            names.push_back(de->d_name);
    }

    closedir(dir);
    return OK;
}

TError TPath::CopyRegular(const TPath &source) const {
    TFile src, dst;
    struct stat st;
    char buf[65536];
    TError error;

    error = src.OpenRead(source);
    if (!error)
        error = src.Stat(st);
    if (error)
        return error;

    if (!S_ISREG(st.st_mode))
        return TError(EError::IoError, EINVAL, "Not a regular file: {}", source);

    error = dst.Create(*this, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (error)
        return error;

    while (true) {
        ssize_t len = read(src.Fd, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR)
                continue;
            return TError::Io("read {}", source);
        }
        if (!len)
            break;

        error = dst.WriteAll(buf, len);
        if (error)
            return TError(error, "Cannot write {}", Path);
    }

    /* umask applies to open */
    return dst.Chmod(st.st_mode & 07777);
}

TError TFile::Open(const TPath &path, int flags, mode_t mode) {
    int fd = open(path.c_str(), flags, mode);

    if (fd < 0)
        return TError::Io("open {}", path);

    Close();
    SetFd = fd;
    return OK;
}

TError TFile::OpenRead(const TPath &path) {
    return Open(path, O_RDONLY | O_CLOEXEC | O_NOCTTY);
}

TError TFile::OpenDir(const TPath &path) {
    return Open(path, O_RDONLY | O_CLOEXEC | O_DIRECTORY | O_NOCTTY);
}

TError TFile::OpenAt(const TFile &dir, const TPath &name, int flags, mode_t mode) {
    if (name.IsAbsolute())
        return TError(EError::IoError, EINVAL, "Absolute path {}", name);

    int fd = openat(dir.Fd, name.c_str(), flags, mode);
    if (fd < 0)
        return TError::Io("openat {}", name);

    Close();
    SetFd = fd;
    return OK;
}

TError TFile::Create(const TPath &path, int flags, mode_t mode) {
    return Open(path, flags | O_CREAT, mode);
}

void TFile::Close() {
    if (Fd >= 0)
        close(Fd);
    SetFd = -1;
}

void TFile::Swap(TFile &other) {
    std::swap(SetFd, other.SetFd);
}

TError TFile::Stat(struct stat &st) const {
    if (fstat(Fd, &st))
        return TError::Io("fstat {}", Fd);
    return OK;
}

TError TFile::StatAt(const TPath &name, struct stat &st) const {
    if (fstatat(Fd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW))
        return TError::Io("fstatat {}", name);
    return OK;
}

TError TFile::Chmod(mode_t mode) const {
    if (fchmod(Fd, mode))
        return TError::Io("fchmod {} {:#o}", Fd, mode);
    return OK;
}

TError TFile::Chown(uid_t uid, gid_t gid) const {
    if (fchown(Fd, uid, gid))
        return TError::Io("fchown {} {}:{}", Fd, uid, gid);
    return OK;
}

TError TFile::SetModificationTime(time_t mtime) const {
    struct timespec ts[2];

    ts[0].tv_sec = 0;
    ts[0].tv_nsec = UTIME_OMIT;
    ts[1].tv_sec = mtime;
    ts[1].tv_nsec = 0;

    if (futimens(Fd, ts))
        return TError::Io("futimens {}", Fd);
    return OK;
}

TError TFile::ReadAll(std::string &text, size_t max) const {
    char buf[65536];

    text.clear();

    while (true) {
        ssize_t len = read(Fd, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR)
                continue;
            return TError::Io("read");
        }
        if (!len)
            break;
        if (text.size() + len > max)
            return TError(EError::IoError, EFBIG, "File larger than {}", max);
        text.append(buf, len);
    }

    return OK;
}

TError TFile::WriteAll(const std::string &text) const {
    return WriteAll(text.data(), text.size());
}

TError TFile::WriteAll(const char *data, size_t len) const {
    while (len) {
        ssize_t ret = write(Fd, data, len);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            return TError::Io("write");
        }
        data += ret;
        len -= ret;
    }
    return OK;
}

TError TFile::UnlinkAt(const TPath &name) const {
    if (unlinkat(Fd, name.c_str(), 0))
        return TError::Io("unlinkat {}", name);
    return OK;
}

TError TFile::RmdirAt(const TPath &name) const {
    if (unlinkat(Fd, name.c_str(), AT_REMOVEDIR))
        return TError::Io("rmdirat {}", name);
    return OK;
}

TError TFile::ClearDirectory() const {
    std::vector<std::string> names;
    struct stat top, st;
    struct dirent *de;
    TError error;

    error = Stat(top);
    if (error)
        return error;

    if (!(top.st_mode & S_IWUSR)) {
        error = Chmod((top.st_mode & 07777) | S_IRWXU);
        if (error)
            return error;
    }

    /* closedir closes the duplicate */
    int fd = fcntl(Fd, F_DUPFD_CLOEXEC, 3);
    if (fd < 0)
        return TError::Io("dup directory");

    DIR *dir = fdopendir(fd);
    if (!dir) {
        error = TError::Io("fdopendir");
        close(fd);
        return error;
    }

    rewinddir(dir);
    while ((de = readdir(dir))) {
        if (strcmp(de->d_name, ".") && strcmp(de->d_name, ".."))
            names.push_back(de->d_name);
    }
    closedir(dir);

    for (auto &name: names) {
        error = StatAt(name, st);
        if (error && error.Errno == ENOENT)
            continue;
        if (error)
            return error;

        if (!S_ISDIR(st.st_mode))
            error = UnlinkAt(name);
        else if (st.st_dev != top.st_dev)
            error = TError(EError::IoError, EBUSY, "Mount point inside removed directory: {}", name);
        else
            error = RemoveAt(name);
        if (error)
            return error;
    }

    return OK;
}

TError TFile::RemoveAt(const TPath &name) const {
    TError error;
    TFile dir;

    error = dir.OpenAt(*this, name, O_RDONLY | O_CLOEXEC | O_DIRECTORY | O_NOFOLLOW | O_NOCTTY);
    if (error)
        return UnlinkAt(name);

    error = dir.ClearDirectory();
    if (!error)
        error = RmdirAt(name);
    return error;
}
