#pragma once

#include <string>
#include <set>
#include <vector>

#include "util/error.hpp"
#include "util/path.hpp"

struct archive;
struct archive_entry;

/*
 * Extracts image layers into Root. Entries never land outside of Root:
 * names are normalized, absolute and ".." names are rejected and symlinks
 * met on the way are resolved as if Root were "/". Docker whiteouts
 * remove content of lower layers.
 */
class TTarExtractor {
public:
    TTarExtractor(const TPath &root);

    /* gzip-compressed tar, DecompressError for corrupt or truncated stream */
    TError ExtractGzip(const std::string &layer);

    /* uncompressed tar */
    TError Extract(const std::string &archive);

    /* paths relative to root */
    TError Resolve(const TPath &path, bool follow, bool create, TPath &result);

private:
    struct TEntry {
        std::string Name;
        std::string LinkName;
        bool HardLink = false;
        mode_t Type = 0;
        mode_t Mode = 0;
        uid_t Uid = 0;
        gid_t Gid = 0;
        time_t MTime = 0;
        dev_t Dev = 0;
    };

    struct TDirAttr {
        TPath Rel;
        mode_t Mode;
        time_t MTime;
    };

    TPath Root;
    bool RestoreOwner;

    /* created by current layer, relative to root */
    std::set<std::string> Created;
    /* hold entries of current layer, survive opaque whiteout */
    std::set<std::string> Parents;
    std::vector<TDirAttr> Dirs;

    TError ReadEntries(struct archive *a);
    TError ExtractEntry(struct archive *a, const TEntry &entry);
    TError WriteData(struct archive *a, const TFile &file, const std::string &name);
    TError RestoreDirs();

    TError Whiteout(const TPath &parent, const std::string &name);
    TError ClearOpaque(const TPath &dir);
    TError RemoveExisting(const TPath &rel, bool keepDir);
    TError SetAttributes(const TPath &path, const TEntry &entry) const;
};
