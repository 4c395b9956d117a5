/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"
#include <cstdio>

namespace dntkit::log {
void write(Level level, const char* fmt, va_list args) {
    FILE* f = stdout;
    const char* prefix = "";
    switch (level) {
        case Level::Info:
            break;
        case Level::Warn:
            f = stderr;
            prefix = "[WARN] ";
            break;
        case Level::Error:
            f = stderr;
            prefix = "[ERROR] ";
            break;
    }
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Level::Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Level::Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Level::Error, fmt, args);
    va_end(args);
}
}  // namespace dntkit::log
