#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

/* decimal, surrounding spaces allowed */
TError StringToUint64(const std::string &str, uint64_t &value);

/* tar numeric field: octal digits padded with spaces or NULs, empty is 0 */
TError StringToOct(const std::string &str, uint64_t &value);

/* command line for logs, arguments with spaces or quotes are quoted */
std::string MergeWithQuotes(const std::vector<std::string> &list, char sep, char quote = '\'');

bool StringStartsWith(const std::string &str, const std::string &prefix);
bool StringEndsWith(const std::string &str, const std::string &suffix);

/* 1536 -> "1.5K" */
std::string StringFormatSize(uint64_t value);

std::string StringHex(const unsigned char *data, size_t len);
