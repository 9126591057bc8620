#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string_view>

namespace apg {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts debug|info|warn|warning|error|none, case-insensitive.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
  public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Defaults to stderr; tests redirect to a tmpfile.
    void SetSink(std::FILE* sink);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
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

#define LogDebug(...) ::apg::Logger::Instance().LogWithSource(::apg::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::apg::Logger::Instance().LogWithSource(::apg::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::apg::Logger::Instance().LogWithSource(::apg::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::apg::Logger::Instance().LogWithSource(::apg::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace apg
