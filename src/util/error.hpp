#pragma once

#include <string>
#include <ostream>
#include <cerrno>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "rpc.pb.h"

using ::rpc::EError;

class TError {
public:
    EError Error;
    int Errno = 0;
    std::string Text;

    /* longest text accepted from another process */
    static constexpr unsigned MAX_TEXT = 65536;

    TError() : Error(EError::Success) {}

    TError(EError error, const std::string &text) : Error(error), Text(text) {}

    TError(EError error, int eno, const std::string &text)
        : Error(error), Errno(eno), Text(text) {}

    template <typename... Args> TError(EError error, int eno, const char *fmt, const Args&... args)
        : Error(error), Errno(eno), Text(fmt::format(fmt, args...)) {}

    template <typename... Args> TError(EError error, const char *fmt, const Args&... args)
        : Error(error), Text(fmt::format(fmt, args...)) {}

    /* adds context in front of cause */
    template <typename... Args> TError(const TError &cause, const char *fmt, const Args&... args)
        : Error(cause.Error), Errno(cause.Errno),
          Text(fmt::format(fmt, args...) + ": " + cause.Text) {}

    /* adds context and puts cause into another class */
    template <typename... Args> TError(EError error, const TError &cause, const char *fmt, const Args&... args)
        : Error(error), Errno(cause.Errno),
          Text(fmt::format(fmt, args...) + ": " + cause.Text) {}

    explicit operator bool() const { return Error != EError::Success; }

    bool operator==(EError error) const { return Error == error; }
    bool operator!=(EError error) const { return Error != error; }

    static std::string ErrorName(EError error);

    /* "open /x: No such file or directory" */
    std::string Message() const;

    /* "IoError:(No such file or directory: open /x)" */
    std::string ToString() const;

    /* one record, readable by Deserialize in other process */
    TError Serialize(int fd) const;

    /* false if stream ends before record starts */
    static bool Deserialize(int fd, TError &error);

    template <typename... Args> static TError System(const char *fmt, const Args&... args) {
        return TError(EError::Unknown, errno, fmt::format(fmt, args...));
    }

    template <typename... Args> static TError Io(const char *fmt, const Args&... args) {
        return TError(EError::IoError, errno, fmt::format(fmt, args...));
    }

    friend std::ostream &operator<<(std::ostream &os, const TError &error) {
        return os << error.ToString();
    }
};

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<TError> : fmt::ostream_formatter {};
#endif

extern const TError OK;
