#include "util/http.hpp"
#include "util/log.hpp"

#include <httplib.h>

struct THttpClient::TImpl {
    TImpl(const TOptions &options) : Options(options) {}

    TError SingleRequest(const std::string &url, std::string &response,
                         const THeaders &headers, int redirects) {
        std::string host, path;
        TError error;

        error = SplitUrl(url, host, path);
        if (error)
            return error;

        httplib::Client client(host);
        client.set_connection_timeout(Options.ConnectTimeout, 0);
        client.set_read_timeout(Options.ReadTimeout, 0);
        client.enable_server_certificate_verification(Options.VerifyTls);

        L_NET("GET {}{}", host, path);

        httplib::Headers hdrs(headers.cbegin(), headers.cend());
        auto res = client.Get(path.c_str(), hdrs);

        return HandleResult(res, host, path, response, redirects);
    }

    TError HandleResult(const httplib::Result &res, const std::string &host, const std::string &path,
                        std::string &response, int redirects) {
        if (!res)
            return TError(EError::Unknown, "HTTP request to {} failed: {}",
                          host + path, httplib::to_string(res.error()));

        if (res->status >= 300 && res->status < 400) {
            auto location = res->get_header_value("Location");
            if (!location.empty()) {
                if (redirects >= Options.MaxRedirects)
                    return TError(EError::Unknown, "HTTP request to {} failed: too many redirects", host + path);
                if (location[0] == '/')
                    location = host + location;
                L_DBG("Redirected to {}", location);
                /* credentials are for the registry only, not for blob storage */
                return SingleRequest(location, response, {}, redirects + 1);
            }
        }

        if (res->status < 200 || res->status >= 300)
            return TError(EError::Unknown, "HTTP request to {} failed: status {}", host + path, res->status);

        response = res->body;

        return OK;
    }

    TOptions Options;
};

THttpClient::THttpClient() : Impl(new TImpl(TOptions())) {}
THttpClient::THttpClient(const TOptions &options) : Impl(new TImpl(options)) {}
THttpClient::~THttpClient() = default;

TError THttpClient::Get(const std::string &url, std::string &response, const THeaders &headers) {
    return Impl->SingleRequest(url, response, headers, 0);
}

/* "https://host/path?query" -> "https://host", "/path?query" */
TError THttpClient::SplitUrl(const std::string &url, std::string &host, std::string &path) {
    auto hostPos = url.find("://");
    if (hostPos == std::string::npos)
        hostPos = 0;
    else
        hostPos += 3;

    auto pathPos = url.find('/', hostPos);

    host = url.substr(0, pathPos);
    path = pathPos == std::string::npos ? "/" : url.substr(pathPos);

    if (host.size() <= hostPos)
        return TError(EError::Unknown, "Invalid url: {}", url);

    return OK;
}
