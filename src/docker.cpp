#include "docker.hpp"
#include "config.hpp"
#include "util/archive.hpp"
#include "util/string.hpp"
#include "util/log.hpp"

#include <nlohmann/json.hpp>

#include <openssl/evp.h>

using json = nlohmann::json;

TError TImageRef::Parse(const std::string &ref, TImageRef &result) {
    auto colon = ref.find(':');

    if (colon == std::string::npos)
        return TError(EError::UsageError, "Invalid image reference {}: expected <name>:<tag>", ref);

    if (ref.find(':', colon + 1) != std::string::npos)
        return TError(EError::UsageError, "Invalid image reference {}: more than one colon", ref);

    result.Name = ref.substr(0, colon);
    result.Tag = ref.substr(colon + 1);

    if (result.Name.empty() || result.Tag.empty())
        return TError(EError::UsageError, "Invalid image reference {}: empty name or tag", ref);

    return OK;
}

TDockerImage::TDockerImage(const TImageRef &ref)
    : Registry(config().registry().host())
    , AuthPath(config().registry().auth_url())
    , AuthService(config().registry().auth_service())
    , Repository(config().registry().repository_prefix())
    , Name(ref.Name)
    , Tag(ref.Tag)
    , VerifyDigest(config().registry().verify_digest())
{
}

std::string TDockerImage::RepositoryAndName() const {
    return Repository.empty() ? Name : Repository + "/" + Name;
}

std::string TDockerImage::AuthUrl() const {
    std::string authPath = AuthPath;

    if (!StringStartsWith(authPath, "https://") && !StringStartsWith(authPath, "http://"))
        authPath = "https://" + authPath;

    return fmt::format("{}?service={}&scope=repository:{}:pull",
                       authPath,
                       AuthService,
                       RepositoryAndName());
}

static std::string RegistryUrl(const std::string &registry, const std::string &path) {
    if (StringStartsWith(registry, "https://") || StringStartsWith(registry, "http://"))
        return registry + path;
    return "https://" + registry + path;
}

std::string TDockerImage::ManifestsUrl(const std::string &tag) const {
    return RegistryUrl(Registry, fmt::format("/v2/{}/manifests/{}", RepositoryAndName(), tag));
}

std::string TDockerImage::BlobsUrl(const std::string &digest) const {
    return RegistryUrl(Registry, fmt::format("/v2/{}/blobs/{}", RepositoryAndName(), digest));
}

IHttpClient::THeaders TDockerImage::AuthHeaders() const {
    return { { "Authorization", "Bearer " + AuthToken } };
}

TError TDockerImage::GetAuthToken(IHttpClient &client) {
    std::string response;
    TError error;

    L_VERBOSE("Request token for {}", RepositoryAndName());

    error = client.Get(AuthUrl(), response);
    if (error)
        return TError(EError::AuthError, error, "Cannot get token for {}", RepositoryAndName());

    try {
        auto responseJson = json::parse(response);

        for (auto key: { "token", "access_token" }) {
            if (responseJson.is_object() && responseJson.contains(key) && responseJson[key].is_string()) {
                AuthToken = responseJson[key].get<std::string>();
                if (!AuthToken.empty())
                    return OK;
            }
        }
    } catch (const json::exception &err) {
        return TError(EError::AuthError, "Cannot parse token for {}: {}", RepositoryAndName(), err.what());
    }

    return TError(EError::AuthError, "Token is not found in response for {}", RepositoryAndName());
}

TError TDockerImage::DownloadManifest(IHttpClient &client) {
    TError error;

    auto headers = AuthHeaders();
    headers.emplace_back("Accept", DOCKER_MANIFEST_V2);

    L_VERBOSE("Download manifest {}:{}", RepositoryAndName(), Tag);

    error = client.Get(ManifestsUrl(Tag), Manifest, headers);
    if (error)
        return TError(EError::ManifestError, error, "Cannot download manifest {}:{}", RepositoryAndName(), Tag);

    return OK;
}

TError TDockerImage::ParseManifest() {
    Layers.clear();

    try {
        auto manifestJson = json::parse(Manifest);

        if (!manifestJson.is_object())
            return TError(EError::ManifestError, "Manifest is not an object");

        if (manifestJson.contains("schemaVersion")) {
            if (!manifestJson["schemaVersion"].is_number_integer() ||
                    manifestJson["schemaVersion"].get<int>() != 2)
                return TError(EError::ManifestError, "Unsupported manifest schemaVersion: {}",
                              manifestJson["schemaVersion"].dump());
        }

        if (manifestJson.contains("mediaType")) {
            if (!manifestJson["mediaType"].is_string())
                return TError(EError::ManifestError, "Invalid manifest mediaType");
            auto mediaType = manifestJson["mediaType"].get<std::string>();
            if (mediaType == DOCKER_MANIFEST_LIST_V2 || mediaType == OCI_INDEX_V1)
                return TError(EError::ManifestError, "Manifest lists are not supported: {}", mediaType);
            if (mediaType != DOCKER_MANIFEST_V2 && mediaType != OCI_MANIFEST_V1)
                return TError(EError::ManifestError, "Unknown manifest mediaType: {}", mediaType);
        }

        if (!manifestJson.contains("layers") || !manifestJson["layers"].is_array())
            return TError(EError::ManifestError, "Layers are not found in manifest");

        for (const auto &layer: manifestJson["layers"]) {
            if (!layer.is_object() ||
                    !layer.contains("mediaType") || !layer["mediaType"].is_string() ||
                    !layer.contains("digest") || !layer["digest"].is_string())
                return TError(EError::ManifestError, "Invalid layer in manifest: {}", layer.dump());

            auto mediaType = layer["mediaType"].get<std::string>();
            if (mediaType != DOCKER_LAYER_GZIP && mediaType != OCI_LAYER_GZIP)
                return TError(EError::ManifestError, "Unknown layer mediaType: {}", mediaType);

            uint64_t size = 0;
            if (layer.contains("size") && layer["size"].is_number_unsigned())
                size = layer["size"].get<uint64_t>();

            Layers.emplace_back(mediaType, layer["digest"].get<std::string>(), size);
        }
    } catch (const json::exception &err) {
        return TError(EError::ManifestError, "Cannot parse manifest: {}", err.what());
    }

    L_VERBOSE("Manifest {}:{} has {} layers", RepositoryAndName(), Tag, Layers.size());

    return OK;
}

static TError CheckDigest(const std::string &blob, const std::string &digest) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (!StringStartsWith(digest, "sha256:"))
        return TError(EError::LayerFetchError, "Unsupported digest algorithm: {}", digest);

    if (!EVP_Digest(blob.data(), blob.size(), md, &len, EVP_sha256(), nullptr))
        return TError(EError::LayerFetchError, "Cannot compute sha256 of {}", digest);

    std::string actual = "sha256:" + StringHex(md, len);
    if (actual != digest)
        return TError(EError::LayerFetchError, "Digest mismatch: expected {} got {}", digest, actual);

    return OK;
}

TError TDockerImage::PullLayer(IHttpClient &client, const TLayer &layer, const TPath &root) const {
    std::string blob;
    TError error;

    L("Pull layer {} {} {}", layer.Digest, layer.MediaType, StringFormatSize(layer.Size));

    error = client.Get(BlobsUrl(layer.Digest), blob, AuthHeaders());
    if (error)
        return TError(EError::LayerFetchError, error, "Cannot download layer {}", layer.Digest);

    if (layer.Size && blob.size() != layer.Size)
        return TError(EError::LayerFetchError, "Layer {} size mismatch: expected {} got {}",
                      layer.Digest, layer.Size, blob.size());

    if (VerifyDigest) {
        error = CheckDigest(blob, layer.Digest);
        if (error)
            return error;
    }

    TTarExtractor extractor(root);
    error = extractor.ExtractGzip(blob);
    if (error)
        return TError(error, "Cannot extract layer {}", layer.Digest);

    return OK;
}

TError TDockerImage::Pull(IHttpClient &client, const TPath &root) {
    TError error;

    L("Pull image {}:{} from {}", RepositoryAndName(), Tag, Registry);

    error = GetAuthToken(client);
    if (error)
        return error;

    error = DownloadManifest(client);
    if (error)
        return error;

    error = ParseManifest();
    if (error)
        return TError(error, "Invalid manifest {}:{}", RepositoryAndName(), Tag);

    for (const auto &layer: Layers) {
        error = PullLayer(client, layer, root);
        if (error)
            return error;
    }

    L("Image {}:{} pulled", RepositoryAndName(), Tag);

    return OK;
}
