#include "util/string.hpp"

#include <cstdlib>

static TError ParseUnsigned(const std::string &str, const std::string &pad,
                            int base, uint64_t &value) {
    size_t first = str.find_first_not_of(pad);
    if (first == std::string::npos) {
        value = 0;
        return base == 8 ? OK : TError(EError::UsageError, "Empty number");
    }

    std::string digits = str.substr(first, str.find_last_not_of(pad) - first + 1);
    char *end;

    errno = 0;
    value = strtoull(digits.c_str(), &end, base);
    if (errno || end == digits.c_str() || *end || digits[0] == '-')
        return TError(EError::UsageError, errno, "Bad {} value: {}",
                      base == 8 ? "octal" : "uint64", digits);

    return OK;
}

TError StringToUint64(const std::string &str, uint64_t &value) {
    return ParseUnsigned(str, " \t\n", 10, value);
}

TError StringToOct(const std::string &str, uint64_t &value) {
    return ParseUnsigned(str, std::string(" \0", 2), 8, value);
}

std::string MergeWithQuotes(const std::vector<std::string> &list, char sep, char quote) {
    std::string special = std::string(" \t\n\"'\\") + sep;
    std::string result;

    for (auto &str: list) {
        if (&str != &list.front())
            result += sep;

        if (!str.empty() && str.find_first_of(special) == std::string::npos) {
            result += str;
            continue;
        }

        result += quote;
        for (char c: str) {
            if (c == quote || c == '\\')
                result += '\\';
            result += c;
        }
        result += quote;
    }

    return result;
}

bool StringStartsWith(const std::string &str, const std::string &prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringEndsWith(const std::string &str, const std::string &suffix) {
    return str.size() >= suffix.size() &&
        str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringFormatSize(uint64_t value) {
    const char *units = "BKMGTPE";
    unsigned shift = 0;

    while (units[1] && value >> shift >= 1024) {
        shift += 10;
        units++;
    }

    if (value & ((1ull << shift) - 1))
        return fmt::format("{:.1f}{}", (double)value / (1ull << shift), *units);

    return fmt::format("{}{}", value >> shift, *units);
}

std::string StringHex(const unsigned char *data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string result;

    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0xf];
    }

    return result;
}
