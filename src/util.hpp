#pragma once
#include <string>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <filesystem>
#include "errors.hpp"

inline bool file_exists(const std::string& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

inline std::string read_file(const std::string& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw LocalFileMissing(p);
    std::ostringstream ss; ss << f.rdbuf();
    if (f.bad()) throw StoreError("read failed: " + p);
    return ss.str();
}

// Writes to a sibling temp file and renames it over p, so a failed write
// never leaves p half-written.
inline void write_file(const std::string& p, const std::string& s,
                       bool owner_only = false) {
    std::string tmp = p + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw StoreError("cannot open for writing: " + tmp);
        f << s;
        f.flush();
        if (!f) throw StoreError("write failed: " + tmp);
    }
    std::error_code ec;
    if (owner_only) {
        std::filesystem::permissions(tmp,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            throw StoreError("cannot restrict permissions: " + tmp);
        }
    }
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw StoreError("cannot replace " + p + ": " + ec.message());
    }
}

inline std::string file_name_of(const std::string& p) {
    return std::filesystem::path(p).filename().string();
}

inline std::string escape_json(const std::string& s){
    std::string o; o.reserve(s.size()+8);
    for(char c: s){
        switch(c){
            case '\"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\b': o += "\\b"; break;
            case '\f': o += "\\f"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) { char buf[7]; snprintf(buf,sizeof(buf),"\\u%04x", c); o += buf; }
                else o += c;
        }
    }
    return o;
}
