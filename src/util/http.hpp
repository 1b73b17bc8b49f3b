#pragma once

#include <memory>
#include <string>
#include <vector>

#include "util/error.hpp"

class IHttpClient {
public:
    using THeader = std::pair<std::string, std::string>;
    using THeaders = std::vector<THeader>;

    virtual ~IHttpClient() = default;

    /* fails on transport error or non-2xx status */
    virtual TError Get(const std::string &url, std::string &response, const THeaders &headers = {}) = 0;
};

struct THttpClient : public IHttpClient {
    struct TOptions {
        int ConnectTimeout = 30;
        int ReadTimeout = 300;
        bool VerifyTls = true;
        int MaxRedirects = 5;
    };

    THttpClient();
    THttpClient(const TOptions &options);
    ~THttpClient();

    TError Get(const std::string &url, std::string &response, const THeaders &headers = {}) override;

    static TError SplitUrl(const std::string &url, std::string &host, std::string &path);

private:
    struct TImpl;
    std::unique_ptr<TImpl> Impl;
};
