#pragma once
#include <string>

enum class LogLevel { Error, Warn, Info, Debug };

void set_log_level(LogLevel lvl);

// Accepts "error", "warn", "info", "debug". Returns false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

// printf-style, one line to stderr with a level tag. Never pass secrets.
void log_msg(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;
