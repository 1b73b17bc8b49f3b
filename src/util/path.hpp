#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

extern "C" {
#include <sys/stat.h>
#include <sys/types.h>
}

class TPath {
    friend class TFile;

    std::string Path;

    TPath Join(const TPath &tail) const;

public:
    TPath() {}
    TPath(const std::string &path) : Path(path) {}
    TPath(const char *path) : Path(path) {}

    bool IsEmpty() const { return Path.empty(); }
    bool IsAbsolute() const { return !Path.empty() && Path[0] == '/'; }
    bool IsRoot() const { return Path == "/"; }

    explicit operator bool() const { return !Path.empty(); }

    /* "..", "../x" but not "..x" */
    bool StartsWithDotDot() const {
        return Path.compare(0, 2, "..") == 0 && (Path.size() == 2 || Path[2] == '/');
    }

    const char *c_str() const noexcept { return Path.c_str(); }
    std::string ToString() const { return Path; }

    friend bool operator==(const TPath &a, const TPath &b) { return a.Path == b.Path; }
    friend bool operator!=(const TPath &a, const TPath &b) { return a.Path != b.Path; }

    friend std::ostream &operator<<(std::ostream &os, const TPath &path) {
        return os << path.Path;
    }

    /* absolute tail is appended as well: "/root" / "/bin" -> "/root/bin" */
    friend TPath operator/(const TPath &a, const TPath &b) { return a.Join(b); }

    /* "/" first for absolute path, empty and "." components dropped */
    std::vector<std::string> Components() const;

    /* lexical, ".." never goes above "/" of absolute path */
    TPath NormalPath() const;
    TPath DirName() const;
    std::string BaseName() const;

    TPath AbsolutePath() const;

    TError StatFollow(struct stat &st) const;

    bool PathExists() const; /* dangling symlink too */
    bool IsDirectoryStrict() const;

    TError Chdir() const;
    TError Chroot() const;

    TError Chmod(mode_t mode) const;
    TError Lchown(uid_t uid, gid_t gid) const;
    TError SetModificationTime(time_t mtime) const;

    TError Mkdir(mode_t mode) const;
    TError MkdirAll(mode_t mode) const;
    /* mkdtemp "<parent>/<prefix>XXXXXX" and chmod */
    TError MkdirTmp(const TPath &parent, const std::string &prefix, mode_t mode);
    TError Mknod(mode_t mode, dev_t dev) const;
    TError Mkfile(mode_t mode) const;
    TError Mkfifo(mode_t mode) const;
    TError Symlink(const TPath &target) const;
    TError Hardlink(const TPath &target) const;
    TError ReadLink(TPath &target) const;

    TError Unlink() const;
    TError RemoveAll() const;
    TError ReadDirectory(std::vector<std::string> &names) const;

    /* content and permission bits, this must not exist */
    TError CopyRegular(const TPath &source) const;
};

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<TPath> : fmt::ostream_formatter {};
#endif

class TFile {
    TFile(const TFile &) = delete;
    TFile &operator=(const TFile &) = delete;

public:
    union {
        const int Fd;
        int SetFd;
    };

    TFile() : Fd(-1) {}
    TFile(int fd) : Fd(fd) {}
    ~TFile() { Close(); }

    explicit operator bool() const { return Fd >= 0; }

    TError Open(const TPath &path, int flags, mode_t mode = 0);
    TError OpenRead(const TPath &path);
    TError OpenDir(const TPath &path);
    TError OpenAt(const TFile &dir, const TPath &name, int flags, mode_t mode = 0);
    TError Create(const TPath &path, int flags, mode_t mode);
    void Close();
    void Swap(TFile &other);

    TError Stat(struct stat &st) const;
    TError StatAt(const TPath &name, struct stat &st) const;
    TError Chmod(mode_t mode) const;
    TError Chown(uid_t uid, gid_t gid) const;
    TError SetModificationTime(time_t mtime) const;

    TError ReadAll(std::string &text, size_t max) const;
    TError WriteAll(const std::string &text) const;
    TError WriteAll(const char *data, size_t len) const;

    TError UnlinkAt(const TPath &name) const;
    TError RmdirAt(const TPath &name) const;

    /*
     * Entries are removed through descriptors, so the directory may be
     * outside of current root. Read-only directories are made writable,
     * mount points inside are EBUSY.
     */
    TError ClearDirectory() const;

    /* file or whole directory tree by name relative to this directory */
    TError RemoveAt(const TPath &name) const;
};
