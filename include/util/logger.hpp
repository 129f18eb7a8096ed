#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace filepipe {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Defaults to stderr. The stream is not owned.
    void SetStream(std::FILE* stream);

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

bool ParseLogLevel(const std::string& s, LogLevel& out);

#define LogDebug(...) ::filepipe::Logger::Instance().LogWithSource(::filepipe::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::filepipe::Logger::Instance().LogWithSource(::filepipe::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::filepipe::Logger::Instance().LogWithSource(::filepipe::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::filepipe::Logger::Instance().LogWithSource(::filepipe::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace filepipe
