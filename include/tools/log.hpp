#pragma once
#include <cstdio>
#include <string>
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/core.h>

namespace nub
{

class Log
{
public:
    // Redirects all output to the given file. An empty path restores stdout.
    static bool SetDestination(const std::string& path);
    static void EnableTrace(bool enabled) { s_trace = enabled; }

    template <typename FormatString, typename... Args>
    static void Debug(const FormatString& fmt, const Args&... args);

    template <typename FormatString, typename... Args>
    static void Info(const FormatString& fmt, const Args&... args);

    template <typename FormatString, typename... Args>
    static void Warn(const FormatString& fmt, const Args&... args);

    template <typename FormatString, typename... Args>
    static void Error(const FormatString& fmt, const Args&... args);

    template <typename FormatString, typename... Args>
    static void Critical(const FormatString& fmt, const Args&... args);

private:
    static void Write(const char* color, const char* tag, const std::string& message);

    static constexpr auto magenta = "\033[35m";
    static constexpr auto green = "\033[32m";
    static constexpr auto red = "\033[31m";
    static constexpr auto cyan = "\033[36m";
    static constexpr auto reset = "\033[0m";

    static inline FILE* s_out = nullptr;
    static inline bool s_trace = false;
};

template <typename FormatString, typename... Args>
inline void Log::Debug(const FormatString& fmt, const Args&... args)
{
    if (!s_trace) return;
    Write(cyan, "debug", fmt::format(fmt::runtime(fmt), args...));
}

template <typename FormatString, typename... Args>
inline void Log::Info(const FormatString& fmt, const Args&... args)
{
    Write(green, "info", fmt::format(fmt::runtime(fmt), args...));
}

template <typename FormatString, typename... Args>
inline void Log::Warn(const FormatString& fmt, const Args&... args)
{
    Write(magenta, "warn", fmt::format(fmt::runtime(fmt), args...));
}

template <typename FormatString, typename... Args>
inline void Log::Error(const FormatString& fmt, const Args&... args)
{
    Write(red, "error", fmt::format(fmt::runtime(fmt), args...));
}

template <typename FormatString, typename... Args>
inline void Log::Critical(const FormatString& fmt, const Args&... args)
{
    Write(red, "critical", fmt::format(fmt::runtime(fmt), args...));
}

}  // namespace nub
