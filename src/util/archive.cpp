#include "util/archive.hpp"
#include "util/string.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cstring>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

extern "C" {
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <zlib.h>
}

constexpr int MAX_SYMLINK_HOPS = 40;

namespace {

typedef std::unique_ptr<struct archive, int (*)(struct archive *)> TArchivePtr;

/* inflates layer chunk by chunk while libarchive reads it */
class TGzipSource {
    const std::string &Data;
    z_stream Strm;
    bool Ready = false;
    bool Finished = false;
    uint64_t Total = 0;
    char Buf[65536];

public:
    /* failure seen by libarchive as plain read error */
    TError Error;

    TGzipSource(const std::string &data) : Data(data) {
        memset(&Strm, 0, sizeof(Strm));
    }

    ~TGzipSource() {
        if (Ready)
            inflateEnd(&Strm);
    }

    TError Open() {
        /* 16 - gzip header and trailer */
        int ret = inflateInit2(&Strm, 15 + 16);
        if (ret != Z_OK)
            return TError(EError::DecompressError, "inflateInit2 failed: {}", zError(ret));

        Ready = true;
        Strm.next_in = (Bytef *)Data.data();
        Strm.avail_in = Data.size();
        return OK;
    }

    /* empty chunk at end of stream, concatenated members are joined */
    TError Read(const void *&chunk, size_t &len) {
        chunk = Buf;
        len = 0;

        while (!len && !Finished) {
            Strm.next_out = (Bytef *)Buf;
            Strm.avail_out = sizeof(Buf);

            int ret = inflate(&Strm, Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR ||
                    ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR)
                return TError(EError::DecompressError, "Corrupt gzip stream: {}",
                              Strm.msg ? Strm.msg : zError(ret));

            len = sizeof(Buf) - Strm.avail_out;
            Total += len;

            if (ret == Z_STREAM_END) {
                if (Strm.avail_in)
                    inflateReset(&Strm);
                else
                    Finished = true;
            } else if (!len && !Strm.avail_in) {
                return TError(EError::DecompressError, "Truncated gzip stream after {}",
                              StringFormatSize(Total));
            }
        }

        return OK;
    }

    /* trailer is checked only when the whole stream is inflated */
    TError Drain() {
        const void *chunk;
        size_t len;

        do {
            TError error = Read(chunk, len);
            if (error)
                return error;
        } while (len);

        return OK;
    }

    static la_ssize_t ReadCallback(struct archive *a, void *data, const void **chunk) {
        TGzipSource *source = static_cast<TGzipSource *>(data);
        size_t len;

        source->Error = source->Read(*chunk, len);
        if (source->Error) {
            archive_set_error(a, EIO, "%s", source->Error.Text.c_str());
            return -1;
        }

        return len;
    }
};

std::string ArchiveMessage(struct archive *a) {
    const char *msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

TError NewTarReader(TArchivePtr &a) {
    a.reset(archive_read_new());
    if (!a)
        return TError(EError::ExtractError, ENOMEM, "archive_read_new");

    if (archive_read_support_format_tar(a.get()) != ARCHIVE_OK ||
            archive_read_support_format_empty(a.get()) != ARCHIVE_OK)
        return TError(EError::ExtractError, "Cannot setup tar reader: {}", ArchiveMessage(a.get()));

    return OK;
}

std::string JoinComponents(const std::vector<std::string> &components) {
    std::string result;
    for (auto &name: components) {
        if (!result.empty())
            result += "/";
        result += name;
    }
    return result;
}

TPath JoinRelative(const TPath &dir, const std::string &name) {
    if (dir.IsEmpty() || dir == ".")
        return TPath(name);
    return dir / name;
}

}

TTarExtractor::TTarExtractor(const TPath &root) : Root(root), RestoreOwner(geteuid() == 0) {}

TError TTarExtractor::Extract(const std::string &archive) {
    TArchivePtr a(nullptr, archive_read_free);
    TError error;

    error = NewTarReader(a);
    if (error)
        return error;

    if (archive_read_open_memory(a.get(), archive.data(), archive.size()) != ARCHIVE_OK)
        return TError(EError::ExtractError, "Cannot open tar archive: {}", ArchiveMessage(a.get()));

    return ReadEntries(a.get());
}

TError TTarExtractor::ExtractGzip(const std::string &layer) {
    TGzipSource source(layer);
    TArchivePtr a(nullptr, archive_read_free);
    TError error;

    error = source.Open();
    if (!error)
        error = NewTarReader(a);
    if (error)
        return error;

    if (archive_read_open(a.get(), &source, nullptr, TGzipSource::ReadCallback, nullptr) != ARCHIVE_OK) {
        if (source.Error)
            return source.Error;
        return TError(EError::ExtractError, "Cannot open tar stream: {}", ArchiveMessage(a.get()));
    }

    error = ReadEntries(a.get());
    if (error && source.Error)
        return source.Error;

    /* rest of stream after end-of-archive blocks, garbled tar data may come from corrupt stream */
    TError error2 = source.Drain();
    if (error2)
        return error2;

    return error;
}

TError TTarExtractor::ReadEntries(struct archive *a) {
    struct archive_entry *ae;
    TError error;

    Created.clear();
    Parents.clear();
    Dirs.clear();

    while (true) {
        int ret = archive_read_next_header(a, &ae);
        if (ret == ARCHIVE_EOF)
            break;
        if (ret == ARCHIVE_WARN)
            L_WRN("Tar archive: {}", ArchiveMessage(a));
        else if (ret != ARCHIVE_OK)
            return TError(EError::ExtractError, "Malformed tar archive: {}", ArchiveMessage(a));

        const char *name = archive_entry_pathname(ae);
        const char *hardlink = archive_entry_hardlink(ae);
        const char *symlink = archive_entry_symlink(ae);
        TEntry entry;

        entry.Name = name ? name : "";
        if (hardlink) {
            entry.HardLink = true;
            entry.LinkName = hardlink;
        } else if (symlink) {
            entry.LinkName = symlink;
        }
        entry.Type = archive_entry_filetype(ae);
        entry.Mode = archive_entry_perm(ae) & 07777;
        entry.Uid = archive_entry_uid(ae);
        entry.Gid = archive_entry_gid(ae);
        entry.MTime = archive_entry_mtime(ae);
        entry.Dev = makedev(archive_entry_rdevmajor(ae), archive_entry_rdevminor(ae));

        error = ExtractEntry(a, entry);
        if (error)
            return error;
    }

    return RestoreDirs();
}

TError TTarExtractor::Resolve(const TPath &path, bool follow, bool create, TPath &result) {
    std::vector<std::string> todo = path.Components();
    std::vector<std::string> current;
    int hops = 0;
    TError error;

    std::reverse(todo.begin(), todo.end());

    while (!todo.empty()) {
        std::string name = todo.back();
        todo.pop_back();

        if (name == "/") {
            current.clear();
            continue;
        }

        if (name == "." || name.empty())
            continue;

        /* ".." cannot climb above root */
        if (name == "..") {
            if (!current.empty())
                current.pop_back();
            continue;
        }

        bool last = todo.empty();
        TPath rel = JoinRelative(JoinComponents(current), name);
        TPath real = Root / rel;
        struct stat st;

        if (lstat(real.c_str(), &st)) {
            if (errno != ENOENT)
                return TError(EError::ExtractError, errno, "Cannot stat {}", rel);

            if (create) {
                error = real.Mkdir(0755);
                if (error)
                    return TError(EError::ExtractError, error, "Cannot create directory {}", rel);
                Created.insert(rel.ToString());
            }

            current.push_back(name);
            continue;
        }

        if (S_ISLNK(st.st_mode) && (!last || follow)) {
            TPath target;

            if (++hops > MAX_SYMLINK_HOPS)
                return TError(EError::ExtractError, ELOOP, "Too many symlinks in {}", path);

            error = real.ReadLink(target);
            if (error)
                return TError(EError::ExtractError, error, "Cannot resolve {}", rel);

            auto components = target.Components();
            todo.insert(todo.end(), components.rbegin(), components.rend());
            continue;
        }

        if (!last && !S_ISDIR(st.st_mode))
            return TError(EError::ExtractError, ENOTDIR, "Not a directory: {}", rel);

        current.push_back(name);
    }

    if (current.empty())
        result = ".";
    else
        result = JoinComponents(current);

    return OK;
}

TError TTarExtractor::WriteData(struct archive *a, const TFile &file, const std::string &name) {
    char buf[65536];

    while (true) {
        la_ssize_t len = archive_read_data(a, buf, sizeof(buf));
        if (len < 0)
            return TError(EError::ExtractError, "Cannot read {} from archive: {}",
                          name, ArchiveMessage(a));
        if (!len)
            return OK;

        TError error = file.WriteAll(buf, len);
        if (error)
            return error;
    }
}

/* directory modes and times last, children change them */
TError TTarExtractor::RestoreDirs() {
    for (auto dir = Dirs.rbegin(); dir != Dirs.rend(); dir++) {
        TPath resolved;
        TFile file;
        TError error;

        /* path must still lead to the same directory without symlinks */
        error = Resolve(dir->Rel, false, false, resolved);
        if (error || resolved != dir->Rel) {
            L_DBG("Skip attributes of replaced directory {}", dir->Rel);
            continue;
        }

        error = file.Open(Root / dir->Rel, O_RDONLY | O_DIRECTORY | O_NOFOLLOW |
                                           O_CLOEXEC | O_NOCTTY);
        if (!error)
            error = file.Chmod(dir->Mode);
        if (!error)
            error = file.SetModificationTime(dir->MTime);
        if (error)
            return TError(EError::ExtractError, error, "Cannot restore attributes of {}", dir->Rel);
    }

    return OK;
}

TError TTarExtractor::RemoveExisting(const TPath &rel, bool keepDir) {
    TPath path = Root / rel;
    std::string prefix = rel.ToString() + "/";
    struct stat st;
    TError error;

    if (lstat(path.c_str(), &st))
        return OK;

    if (S_ISDIR(st.st_mode) && keepDir)
        return OK;

    if (S_ISDIR(st.st_mode))
        error = path.RemoveAll();
    else
        error = path.Unlink();
    if (error)
        return error;

    /* pending attributes belong to removed directories */
    Dirs.erase(std::remove_if(Dirs.begin(), Dirs.end(), [&](const TDirAttr &dir) {
        return dir.Rel == rel || StringStartsWith(dir.Rel.ToString(), prefix);
    }), Dirs.end());

    return OK;
}

/* for entries just created by mknod, mkfifo or symlink */
TError TTarExtractor::SetAttributes(const TPath &path, const TEntry &entry) const {
    TError error;

    if (RestoreOwner) {
        error = path.Lchown(entry.Uid, entry.Gid);
        if (error)
            return error;
    }

    /* chown drops suid bits, so mode goes after */
    if (entry.Type != AE_IFLNK) {
        error = path.Chmod(entry.Mode);
        if (error)
            return error;
    }

    return path.SetModificationTime(entry.MTime);
}

TError TTarExtractor::Whiteout(const TPath &parent, const std::string &name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        return TError(EError::ExtractError, "Invalid whiteout .wh.{}", name);

    TPath rel = JoinRelative(parent, name);

    /* whiteouts hide lower layers only */
    if (Created.count(rel.ToString()))
        return OK;

    TPath path = Root / rel;
    if (!path.PathExists())
        return OK;

    L_DBG("Whiteout {}", rel);

    return path.RemoveAll();
}

TError TTarExtractor::ClearOpaque(const TPath &dir) {
    std::vector<std::string> names;
    TError error;

    error = (Root / dir).ReadDirectory(names);
    if (error)
        return error;

    for (auto &name: names) {
        TPath rel = JoinRelative(dir, name);
        TPath path = Root / rel;

        if (!Created.count(rel.ToString()) && !Parents.count(rel.ToString()))
            error = path.RemoveAll();
        else if (path.IsDirectoryStrict())
            error = ClearOpaque(rel);

        if (error)
            return error;
    }

    return OK;
}

TError TTarExtractor::ExtractEntry(struct archive *a, const TEntry &entry) {
    TPath name(entry.Name);
    TPath parent, rel, path;
    TError error;

    if (name.IsEmpty())
        return TError(EError::ExtractError, "Empty tar entry name");

    if (name.IsAbsolute())
        return TError(EError::ExtractError, "Absolute path in archive: {}", entry.Name);

    name = name.NormalPath();
    if (name.StartsWithDotDot())
        return TError(EError::ExtractError, "Path escapes root: {}", entry.Name);

    /* root itself */
    if (name == ".")
        return OK;

    std::string base = name.BaseName();

    error = Resolve(name.DirName(), true, true, parent);
    if (error)
        return TError(error, "Cannot extract {}", entry.Name);

    if (StringStartsWith(base, ".wh.")) {
        if (base == ".wh..wh..opq")
            error = ClearOpaque(parent);
        else if (StringStartsWith(base, ".wh..wh."))
            error = OK;
        else
            error = Whiteout(parent, base.substr(4));
        if (error)
            return TError(EError::ExtractError, error, "Cannot apply whiteout {}", entry.Name);
        return OK;
    }

    rel = JoinRelative(parent, base);
    path = Root / rel;

    L_DBG("Extract {} type {:o}", rel, entry.HardLink ? 0 : entry.Type);

    error = RemoveExisting(rel, !entry.HardLink && entry.Type == AE_IFDIR);
    if (error)
        return TError(EError::ExtractError, error, "Cannot replace {}", entry.Name);

    if (entry.HardLink) {
        TPath target(entry.LinkName), resolved;

        if (target.IsEmpty() || target.IsAbsolute() || target.NormalPath().StartsWithDotDot())
            return TError(EError::ExtractError, "Hard link {} escapes root: {}", entry.Name, entry.LinkName);

        error = Resolve(target.NormalPath(), false, false, resolved);
        if (error)
            return TError(error, "Cannot extract {}", entry.Name);

        if (!(Root / resolved).PathExists())
            return TError(EError::ExtractError, "Hard link {} target not found: {}", entry.Name, entry.LinkName);

        error = path.Hardlink(Root / resolved);
    } else {
        switch (entry.Type) {
        case AE_IFREG:
        {
            TFile file;

            error = file.Create(path, O_WRONLY | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
            if (!error)
                error = WriteData(a, file, entry.Name);
            if (!error && RestoreOwner)
                error = file.Chown(entry.Uid, entry.Gid);
            if (!error)
                error = file.Chmod(entry.Mode);
            if (!error)
                error = file.SetModificationTime(entry.MTime);
            break;
        }
        case AE_IFDIR:
            if (!path.IsDirectoryStrict())
                error = path.Mkdir(0700);
            if (!error && RestoreOwner)
                error = path.Lchown(entry.Uid, entry.Gid);
            if (!error)
                Dirs.push_back({rel, entry.Mode, entry.MTime});
            break;
        case AE_IFLNK:
            error = path.Symlink(entry.LinkName);
            if (!error)
                error = SetAttributes(path, entry);
            break;
        case AE_IFCHR:
        case AE_IFBLK:
            error = path.Mknod(entry.Type | entry.Mode, entry.Dev);
            if (error && error.Errno == EPERM) {
                L_WRN("Skip device {}: {}", entry.Name, error);
                return OK;
            }
            if (!error)
                error = SetAttributes(path, entry);
            break;
        case AE_IFIFO:
            error = path.Mkfifo(entry.Mode);
            if (!error)
                error = SetAttributes(path, entry);
            break;
        default:
            L_WRN("Skip unsupported tar entry {} type {:o}", entry.Name, entry.Type);
            return OK;
        }
    }

    if (error)
        return TError(EError::ExtractError, error, "Cannot extract {}", entry.Name);

    Created.insert(rel.ToString());

    for (TPath dir = parent; dir != "."; dir = dir.DirName())
        Parents.insert(dir.ToString());

    return OK;
}
