#pragma once

#include <cstdarg>
#include <cstdio>

namespace peel {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Maps the -v/-q balance onto a level. Zero is the default (Warn).
LogLevel LogLevelForVerbosity(int verbosity);

// Diagnostics go to stderr as "peel: <level>: <message>". At Debug level each
// line also carries a timestamp and the source location.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    bool Enabled(LogLevel lvl) const { return lvl >= Level(); }

    // Redirects output; nullptr restores stderr.
    void SetStream(std::FILE* stream);

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::peel::Logger::Instance().LogWithSource(::peel::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::peel::Logger::Instance().LogWithSource(::peel::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::peel::Logger::Instance().LogWithSource(::peel::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::peel::Logger::Instance().LogWithSource(::peel::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace peel
