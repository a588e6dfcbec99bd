#pragma once

namespace ferry {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    SUCCESS
};

// DEBUG lines are dropped unless verbose logging is on.
void SetVerbose(bool enabled);

void LogDebug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogInfo(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogWarn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogError(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogSuccess(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace ferry
