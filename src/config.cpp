#include "config.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

#include <google/protobuf/text_format.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>

#include <algorithm>

extern "C" {
#include <fcntl.h>
}

namespace {

cfg::TConfig Config;

class TConfigErrorLogger : public google::protobuf::io::ErrorCollector {
    const TPath &Path;

public:
    TConfigErrorLogger(const TPath &path) : Path(path) {}

    void AddError(int line, int column, const std::string &message) override {
        L_WRN("Config {}:{}:{}: {}", Path, line + 1, column + 1, message);
    }

    void AddWarning(int line, int column, const std::string &message) override {
        L_WRN("Config {}:{}:{}: {}", Path, line + 1, column + 1, message);
    }
};

void DefaultConfig() {
    auto registry = Config.mutable_registry();
    registry->set_host("registry-1.docker.io");
    registry->set_auth_url("https://auth.docker.io/token");
    registry->set_auth_service("registry.docker.io");
    registry->set_repository_prefix("library");
    registry->set_connect_timeout_s(30);
    registry->set_read_timeout_s(300);
    registry->set_verify_digest(true);
    registry->set_verify_tls(true);

    Config.mutable_log()->set_verbose(false);
    Config.mutable_log()->set_debug(false);
    Config.mutable_isolation()->set_allow_shared_pid_namespace(false);
}

/* parse errors are logged, fields before error are kept */
TError MergeConfig(const TPath &path, bool silent) {
    TFile file;
    TError error;

    error = file.OpenRead(path);
    if (error)
        return error;

    google::protobuf::io::FileInputStream stream(file.Fd);
    google::protobuf::TextFormat::Parser parser;
    TConfigErrorLogger logger(path);

    if (!silent) {
        L_SYS("Read config {}", path);
        parser.RecordErrorsTo(&logger);
    }

    if (!parser.Merge(&stream, &Config) && !silent)
        L_WRN("Config {} is malformed, the rest is skipped", path);

    return OK;
}

void MergeOptional(const TPath &path, bool silent) {
    TError error = MergeConfig(path, silent);
    if (error && error.Errno != ENOENT && !silent)
        L_WRN("Cannot read config {}: {}", path, error);
}

}

cfg::TConfig &config() {
    return Config;
}

TError ReadConfigs(const TPath &path, bool silent) {
    TError error;

    Config.Clear();
    DefaultConfig();

    if (path) {
        error = MergeConfig(path, silent);
        if (error)
            return TError(EError::UsageError, error, "Cannot read config {}", path);
    } else {
        TPath dir = BURROW_CONFIG_DIR;
        std::vector<std::string> names;

        MergeOptional(BURROW_CONFIG_PATH, silent);

        if (!dir.ReadDirectory(names)) {
            std::sort(names.begin(), names.end());
            for (auto &name: names)
                if (StringEndsWith(name, ".conf"))
                    MergeOptional(dir / name, silent);
        }
    }

    Debug |= Config.log().debug();
    Verbose |= Debug || Config.log().verbose();

    if (!Config.log().path().empty()) {
        error = OpenLog(Config.log().path());
        if (error)
            L_WRN("Cannot open log {}: {}", Config.log().path(), error);
    }

    return OK;
}
