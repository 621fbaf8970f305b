#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace asim::sim::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // default verbosity (overridden by ASIM_LOG if level==Info)
};

inline std::atomic<Level> g_level{Level::Info};

inline Level level_from_env()
{
    const char* v = std::getenv("ASIM_LOG");
    if (!v)
        return Level::Info;
    std::string s(v);
    for (auto& c : s)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "info")
        return Level::Info;
    if (s == "debug" || s == "full")
        return Level::Debug;
    return Level::Info;
}

inline void init(const Config& cfg = {})
{
    // If caller leaves level at Info, allow ASIM_LOG to override
    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

inline bool gate(Level L)
{
    return L > g_level.load(); // filtered by level
}

inline void vprint(Level L, const char* fmt, va_list ap)
{
    if (gate(L))
        return;
    // One buffered write per line so worker-thread output does not interleave mid-line.
    char buf[1024];
    const int tag = std::snprintf(buf, sizeof(buf), "%s", level_tag(L));
    std::vsnprintf(buf + tag, sizeof(buf) - static_cast<std::size_t>(tag), fmt, ap);
    std::fputs(buf, stderr);
    std::fflush(stderr);
}

inline void print(Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, fmt, ap);
    va_end(ap);
}

// Convenience
#define LOGD(...) ::asim::sim::logx::print(::asim::sim::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::asim::sim::logx::print(::asim::sim::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::asim::sim::logx::print(::asim::sim::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::asim::sim::logx::print(::asim::sim::logx::Level::Error, __VA_ARGS__)

} // namespace asim::sim::logx
