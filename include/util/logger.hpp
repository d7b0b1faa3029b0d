#pragma once

#include <cstdarg>
#include <string>
#include <string_view>

namespace otafetch {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none" (case-insensitive).
bool ParseLogLevel(std::string_view s, LogLevel& out);

// Short name printed with every line from the calling thread ("main" by default).
void SetThreadTag(std::string tag);

// Called under the logger lock before each line is written, e.g. to end a
// console progress line. nullptr removes it.
using LogPreWriteHook = void (*)();
void SetLogPreWriteHook(LogPreWriteHook hook);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
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

#define LogDebug(...) ::otafetch::Logger::Instance().LogWithSource(::otafetch::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::otafetch::Logger::Instance().LogWithSource(::otafetch::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::otafetch::Logger::Instance().LogWithSource(::otafetch::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::otafetch::Logger::Instance().LogWithSource(::otafetch::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace otafetch
