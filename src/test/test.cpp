#include <sstream>
#include <cstring>

#include "test.hpp"
#include "docker.hpp"
#include "util/string.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

extern "C" {
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdlib.h>
#include <zlib.h>
}

using json = nlohmann::json;

namespace test {

std::basic_ostream<char> &Say(std::basic_ostream<char> &stream) {
    return stream << "- ";
}

void ExpectReturn(int ret, int exp, int line, const char *func) {
    if (ret == exp)
        return;
    throw std::string("Got " + std::to_string(ret) + ", but expected " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void ExpectError(const TError &ret, EError exp, int line, const char *func) {
    std::stringstream ss;

    if (ret == exp)
        return;

    ss << "Got " << ret << ", but expected " << TError::ErrorName(exp) << " at " << func << ":" << line;

    throw ss.str();
}

template<typename T>
static inline void ExpectEqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret != exp) {
        std::stringstream ss;
        ss << "Unexpected " << ret << " != " << exp << " at " << func << ":" << line;
        throw ss.str();
    }
}

template<typename T>
static inline void ExpectNeqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret == exp) {
        std::stringstream ss;
        ss << "Unexpected " << ret << " == " << exp << " at " << func << ":" << line;
        throw ss.str();
    }
}

void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

bool IsRoot() {
    return geteuid() == 0;
}

bool NetworkTestEnabled() {
    const char *env = getenv("BURROW_NETWORK_TEST");
    return env && std::string(env) == "1";
}

TPath MakeTempDir(const std::string &prefix) {
    const char *tmpdir = getenv("TMPDIR");
    TPath path;

    TError error = path.MkdirTmp(tmpdir && tmpdir[0] ? tmpdir : "/tmp", prefix, 0755);
    if (error)
        throw std::string("Cannot create temporary directory: " + error.ToString());

    return path;
}

size_t CountEntries(const TPath &dir) {
    std::vector<std::string> names;

    TError error = dir.ReadDirectory(names);
    if (error)
        throw std::string("Cannot read directory: " + error.ToString());

    return names.size();
}

std::string ReadFile(const TPath &path) {
    std::string text;
    TFile file;

    TError error = file.OpenRead(path);
    if (!error)
        error = file.ReadAll(text, 64 << 20);
    if (error)
        throw std::string("Cannot read file: " + error.ToString());

    return text;
}

void WriteFile(const TPath &path, const std::string &text, mode_t mode) {
    TFile file;

    TError error = file.Open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, mode);
    if (!error)
        error = file.Chmod(mode);
    if (!error)
        error = file.WriteAll(text);
    if (error)
        throw std::string("Cannot write file: " + error.ToString());
}

struct stat LinkStat(const TPath &path) {
    struct stat st;

    if (lstat(path.c_str(), &st))
        throw std::string("Cannot stat " + path.ToString() + ": " + strerror(errno));

    return st;
}

unsigned FileMode(const TPath &path) {
    return LinkStat(path).st_mode & 07777;
}

bool IsSymlink(const TPath &path) {
    struct stat st;
    return !lstat(path.c_str(), &st) && S_ISLNK(st.st_mode);
}

bool IsRegular(const TPath &path) {
    struct stat st;
    return !lstat(path.c_str(), &st) && S_ISREG(st.st_mode);
}

bool IsBelow(const TPath &path, const TPath &dir) {
    return StringStartsWith(path.NormalPath().ToString(),
                            dir.NormalPath().ToString() + "/");
}

static void SetOctal(char *field, size_t len, uint64_t value) {
    std::string digits = fmt::format("{:0{}o}", value, len - 1);
    memcpy(field, digits.c_str(), len - 1);
    field[len - 1] = '\0';
}

std::string MakeTar(const std::vector<TTarItem> &items) {
    std::string archive;

    for (auto &item: items) {
        char header[512];
        bool hasData = item.Type == '0' || item.Type == 'L' || item.Type == 'x';

        memset(header, 0, sizeof(header));

        strncpy(header, item.Name.c_str(), 100);
        SetOctal(header + 100, 8, item.Mode);
        SetOctal(header + 108, 8, 0);
        SetOctal(header + 116, 8, 0);
        SetOctal(header + 124, 12, hasData ? item.Data.size() : 0);
        SetOctal(header + 136, 12, item.MTime);
        header[156] = item.Type;
        if (!hasData)
            strncpy(header + 157, item.Data.c_str(), 100);
        memcpy(header + 257, "ustar", 6);
        memcpy(header + 263, "00", 2);

        size_t offset = archive.size();
        archive.append(header, sizeof(header));
        SetTarChecksum(archive, offset);

        if (hasData) {
            archive += item.Data;
            archive.append((512 - item.Data.size() % 512) % 512, '\0');
        }
    }

    archive.append(1024, '\0');

    return archive;
}

void SetTarChecksum(std::string &archive, size_t offset) {
    char *header = &archive[offset];
    unsigned sum = 0;

    memset(header + 148, ' ', 8);
    for (size_t i = 0; i < 512; i++)
        sum += (unsigned char)header[i];
    SetOctal(header + 148, 7, sum);
}

std::string Gzip(const std::string &data) {
    z_stream strm;
    char buf[65536];
    std::string result;
    int ret;

    memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::string("deflateInit2 failed");

    strm.next_in = (Bytef *)data.data();
    strm.avail_in = data.size();

    do {
        strm.next_out = (Bytef *)buf;
        strm.avail_out = sizeof(buf);
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            throw std::string("deflate failed");
        }
        result.append(buf, sizeof(buf) - strm.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);

    return result;
}

std::string Sha256Digest(const std::string &data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (!EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr))
        throw std::string("EVP_Digest failed");

    return "sha256:" + StringHex(md, len);
}

TError TFakeHttpClient::Get(const std::string &url, std::string &response, const THeaders &headers) {
    Requests.push_back(url);
    RequestHeaders.push_back(headers);

    auto status = Statuses.find(url);
    if (status != Statuses.end())
        return TError(EError::Unknown, "HTTP request to {} failed: status {}", url, status->second);

    auto it = Responses.find(url);
    if (it == Responses.end())
        return TError(EError::Unknown, "HTTP request to {} failed: status {}", url, 404);

    response = it->second;
    return OK;
}

TFakeIsolation::TFakeIsolation() : Dir(MakeTempDir("burrow-isolation-")) {}

TFakeIsolation::~TFakeIsolation() {
    TError error = Dir.RemoveAll();
    if (error)
        Say() << "Cannot remove " << Dir << ": " << error << std::endl;
}

TError TFakeIsolation::Record(const std::string &call) const {
    TFile journal;

    TError error = journal.Open(Dir / "calls", O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (!error)
        error = journal.WriteAll(call + "\n");
    return error;
}

std::vector<std::string> TFakeIsolation::Calls() const {
    std::vector<std::string> calls;

    if (!(Dir / "calls").PathExists())
        return calls;

    std::stringstream journal(ReadFile(Dir / "calls"));
    std::string line;
    while (std::getline(journal, line))
        calls.push_back(line);

    return calls;
}

TError TFakeIsolation::EnterRoot(const TPath &root) {
    TError error = Record("EnterRoot " + root.ToString());
    return error ? error : EnterRootError;
}

TError TFakeIsolation::UnsharePid() {
    TError error = Record("UnsharePid");
    return error ? error : UnsharePidError;
}

void ServeImage(TFakeHttpClient &client, const std::string &name, const std::string &tag,
                const std::vector<std::string> &blobs) {
    TImageRef ref;
    ref.Name = name;
    ref.Tag = tag;

    TDockerImage image(ref);

    client.Responses[image.AuthUrl()] = json({ { "token", "secret" } }).dump();

    json layers = json::array();
    for (auto &blob: blobs) {
        std::string digest = Sha256Digest(blob);
        layers.push_back({
            { "mediaType", DOCKER_LAYER_GZIP },
            { "digest", digest },
            { "size", blob.size() },
        });
        client.Responses[image.BlobsUrl(digest)] = blob;
    }

    json manifest = {
        { "schemaVersion", 2 },
        { "mediaType", DOCKER_MANIFEST_V2 },
        { "layers", layers },
    };

    client.Responses[image.ManifestsUrl(tag)] = manifest.dump();
}

}
