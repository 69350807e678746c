#pragma once

#include <cstdarg>

namespace nosj::log {
void info(const char* fmt, ...);
// Writes a single "ERROR -- " line to stderr.
void error(const char* fmt, ...);
}  // namespace nosj::log

#define NOSJ_LOG_INFO(fmt, ...) ::nosj::log::info(fmt, ##__VA_ARGS__)
#define NOSJ_LOG_ERROR(fmt, ...) ::nosj::log::error(fmt, ##__VA_ARGS__)
