#include "ferry/logger.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <unistd.h>

namespace ferry {

namespace {

std::atomic<bool> g_verbose{false};

bool UseColor(FILE* stream) {
    return ::isatty(::fileno(stream)) == 1;
}

void Emit(LogLevel level, const char* fmt, va_list ap) {
    if (level == LogLevel::DEBUG && !g_verbose.load(std::memory_order_relaxed)) return;

    char stack_buf[1024];
    va_list ap2;
    va_copy(ap2, ap);
    const int n = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, ap);
    std::string message;
    if (n < 0) {
        message = fmt;
    } else if (static_cast<size_t>(n) < sizeof(stack_buf)) {
        message.assign(stack_buf, static_cast<size_t>(n));
    } else {
        message.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(message.data(), message.size(), fmt, ap2);
        message.resize(static_cast<size_t>(n));
    }
    va_end(ap2);

    FILE* out = (level == LogLevel::WARN || level == LogLevel::ERROR) ? stderr : stdout;
    const bool color = UseColor(out);

    switch (level) {
        case LogLevel::DEBUG:
            std::fprintf(out, color ? "\033[90m[DEBUG] %s\033[0m\n" : "[DEBUG] %s\n", message.c_str());
            break;
        case LogLevel::INFO:
            std::fprintf(out, "[INFO]  %s\n", message.c_str());
            break;
        case LogLevel::WARN:
            std::fprintf(out, color ? "\033[33m[WARN]  %s\033[0m\n" : "[WARN]  %s\n", message.c_str());
            break;
        case LogLevel::ERROR:
            std::fprintf(out, color ? "\033[31m[ERROR] %s\033[0m\n" : "[ERROR] %s\n", message.c_str());
            break;
        case LogLevel::SUCCESS:
            std::fprintf(out, color ? "\033[32m[ OK  ] %s\033[0m\n" : "[ OK  ] %s\n", message.c_str());
            break;
    }
    std::fflush(out);
}

} // namespace

void SetVerbose(bool enabled) { g_verbose.store(enabled, std::memory_order_relaxed); }

void LogDebug(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::DEBUG, fmt, ap);
    va_end(ap);
}

void LogInfo(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::INFO, fmt, ap);
    va_end(ap);
}

void LogWarn(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::WARN, fmt, ap);
    va_end(ap);
}

void LogError(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::ERROR, fmt, ap);
    va_end(ap);
}

void LogSuccess(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::SUCCESS, fmt, ap);
    va_end(ap);
}

} // namespace ferry
