/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace nska::log {
void info(const char* fmt, ...);
void debug(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace nska::log

#define NSKA_LOG_INFO(fmt, ...) ::nska::log::info(fmt, ##__VA_ARGS__)
#define NSKA_LOG_DEBUG(fmt, ...) ::nska::log::debug(fmt, ##__VA_ARGS__)
#define NSKA_LOG_ERROR(fmt, ...) ::nska::log::error(fmt, ##__VA_ARGS__)
