#pragma once

#include <string>

#include "common.hpp"
#include "util/path.hpp"

#include "config.pb.h"

extern cfg::TConfig &config();

/* defaults, then /etc/burrow.conf and /etc/burrow.conf.d, or only the given file */
TError ReadConfigs(const TPath &path = TPath(), bool silent = false);
