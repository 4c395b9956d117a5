/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace dntkit::log {
enum class Level {
    Info,
    Warn,
    Error,
};

void write(Level level, const char* fmt, va_list args);

void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace dntkit::log

#define DNTKIT_LOG_INFO(fmt, ...) ::dntkit::log::info(fmt, ##__VA_ARGS__)
#define DNTKIT_LOG_WARN(fmt, ...) ::dntkit::log::warn(fmt, ##__VA_ARGS__)
#define DNTKIT_LOG_ERROR(fmt, ...) ::dntkit::log::error(fmt, ##__VA_ARGS__)
