#pragma once

#include "util/path.hpp"
#include "util/http.hpp"

#include <string>
#include <vector>

constexpr const char *DOCKER_MANIFEST_V2 = "application/vnd.docker.distribution.manifest.v2+json";
constexpr const char *DOCKER_MANIFEST_LIST_V2 = "application/vnd.docker.distribution.manifest.list.v2+json";
constexpr const char *OCI_MANIFEST_V1 = "application/vnd.oci.image.manifest.v1+json";
constexpr const char *OCI_INDEX_V1 = "application/vnd.oci.image.index.v1+json";

constexpr const char *DOCKER_LAYER_GZIP = "application/vnd.docker.image.rootfs.diff.tar.gzip";
constexpr const char *OCI_LAYER_GZIP = "application/vnd.oci.image.layer.v1.tar+gzip";

/* <name>:<tag> */
struct TImageRef {
    std::string Name;
    std::string Tag;

    static TError Parse(const std::string &ref, TImageRef &result);

    std::string ToString() const {
        return Name + ":" + Tag;
    }
};

struct TDockerImage {
    std::string Registry;
    std::string AuthPath;
    std::string AuthService;
    std::string Repository;
    std::string Name;
    std::string Tag;

    struct TLayer {
        std::string MediaType;
        std::string Digest;
        uint64_t Size;

        TLayer(const std::string &mediaType, const std::string &digest, uint64_t size = 0)
            : MediaType(mediaType), Digest(digest), Size(size) {}
    };

    /* in order of application */
    std::vector<TLayer> Layers;

    std::string AuthToken;
    std::string Manifest;
    bool VerifyDigest = true;

    /* registry settings from config */
    TDockerImage(const TImageRef &ref);

    std::string RepositoryAndName() const;
    std::string AuthUrl() const;
    std::string ManifestsUrl(const std::string &tag) const;
    std::string BlobsUrl(const std::string &digest) const;

    TError GetAuthToken(IHttpClient &client);
    TError DownloadManifest(IHttpClient &client);
    TError ParseManifest();

    /* download, verify, decompress and extract one layer into root */
    TError PullLayer(IHttpClient &client, const TLayer &layer, const TPath &root) const;

    /* token, manifest, then every layer in order, first failure stops */
    TError Pull(IHttpClient &client, const TPath &root);

private:
    IHttpClient::THeaders AuthHeaders() const;
};
