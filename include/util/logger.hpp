#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace wdi {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);

    // printf-style logging
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

#define LogDebug(...) ::wdi::Logger::Instance().LogWithSource(::wdi::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::wdi::Logger::Instance().LogWithSource(::wdi::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::wdi::Logger::Instance().LogWithSource(::wdi::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::wdi::Logger::Instance().LogWithSource(::wdi::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace wdi
