#pragma once

#include "util/error.hpp"

class TNonCopyable {
protected:
    TNonCopyable() = default;
    ~TNonCopyable() = default;

    TNonCopyable(const TNonCopyable &) = delete;
    TNonCopyable &operator=(const TNonCopyable &) = delete;
};

constexpr const char *BURROW_CONFIG_PATH = "/etc/burrow.conf";
constexpr const char *BURROW_CONFIG_DIR = "/etc/burrow.conf.d";

constexpr const char *SANDBOX_PREFIX = "burrow-";
constexpr const char *SANDBOX_DEFAULT_TMP = "/tmp";

/* image argument that runs command in empty root */
constexpr const char *SKIP_IMAGE = "skip";

constexpr int EXIT_USAGE = 2;

/* exit code reported for a child killed by signal */
constexpr int EXIT_SIGNALED = 1;
