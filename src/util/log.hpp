#pragma once

#include <string>
#include <fmt/format.h>

#include "util/path.hpp"

extern bool Verbose;
extern bool Debug;

enum class ELogLevel {
    Debug,
    Verbose,
    Info,
    Warning,
    Error,
    Action,     /* chroot, unshare, exec, kill */
    System,     /* configuration */
    Network,
};

/* stderr, stdout belongs to sandboxed command */
void OpenLog();

/* append-only log file instead of stderr */
TError OpenLog(const TPath &path);

bool LogEnabled(ELogLevel level);
void WriteLog(ELogLevel level, const std::string &text);

template <typename... Args> inline void LogFormat(ELogLevel level, const char *fmt, const Args&... args) {
    if (LogEnabled(level))
        WriteLog(level, fmt::format(fmt, args...));
}

template <typename... Args> inline void L_DBG(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Debug, fmt, args...);
}

template <typename... Args> inline void L_VERBOSE(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Verbose, fmt, args...);
}

template <typename... Args> inline void L(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Info, fmt, args...);
}

template <typename... Args> inline void L_WRN(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Warning, fmt, args...);
}

template <typename... Args> inline void L_ERR(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Error, fmt, args...);
}

template <typename... Args> inline void L_ACT(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Action, fmt, args...);
}

template <typename... Args> inline void L_SYS(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::System, fmt, args...);
}

template <typename... Args> inline void L_NET(const char *fmt, const Args&... args) {
    LogFormat(ELogLevel::Network, fmt, args...);
}
