#include "log.hpp"
#include <cstdarg>
#include <cstdio>

static LogLevel g_level = LogLevel::Warn;

void set_log_level(LogLevel lvl) { g_level = lvl; }

bool parse_log_level(const std::string& s, LogLevel& out){
    if (s=="error") { out = LogLevel::Error; return true; }
    if (s=="warn")  { out = LogLevel::Warn;  return true; }
    if (s=="info")  { out = LogLevel::Info;  return true; }
    if (s=="debug") { out = LogLevel::Debug; return true; }
    return false;
}

static const char* tag(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "[error]";
        case LogLevel::Warn:  return "[warn]";
        case LogLevel::Info:  return "[info]";
        case LogLevel::Debug: return "[debug]";
    }
    return "[?]";
}

void log_msg(LogLevel lvl, const char* fmt, ...){
    if (static_cast<int>(lvl) > static_cast<int>(g_level)) return;
    fprintf(stderr, "%s ", tag(lvl));
    va_list ap;
    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    va_end(ap);
    fputc('\n', stderr);
}
