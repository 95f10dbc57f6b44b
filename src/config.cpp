#include "config.hpp"
#include "util.hpp"
#include <json-c/json.h>
#include <memory>
#include <stdexcept>

AppConfig load_app_config(const std::string& path){
    AppConfig c{};
    if (!file_exists(path)) {
        log_msg(LogLevel::Info, "no config file at %s, using defaults", path.c_str());
        return c;
    }
    auto s = read_file(path);
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw std::runtime_error(path + ": parse error");
    std::unique_ptr<json_object, decltype(&json_object_put)> guard(root, &json_object_put);
    if (!json_object_is_type(root, json_type_object))
        throw std::runtime_error(path + ": top level must be an object");

    auto getS=[&](const char* k, std::string& dst){
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return;
        if(!json_object_is_type(v, json_type_string))
            throw std::runtime_error(path + ": \"" + k + "\" must be a string");
        dst = json_object_get_string(v);
    };

    getS("store_file", c.store_file);
    getS("task_file", c.task_file);
    getS("export_file", c.export_file);
    getS("backup_prefix", c.backup_prefix);
    getS("branch", c.branch);
    getS("api_base", c.api_base);

    json_object* jt=nullptr;
    if (json_object_object_get_ex(root, "timeout_seconds", &jt)) {
        if (!json_object_is_type(jt, json_type_int) || json_object_get_int64(jt) < 0)
            throw std::runtime_error(path + ": \"timeout_seconds\" must be a non-negative integer");
        c.timeout_seconds = (long)json_object_get_int64(jt);
    }

    std::string lvl;
    getS("log_level", lvl);
    if (!lvl.empty() && !parse_log_level(lvl, c.log_level))
        throw std::runtime_error(path + ": unknown log_level \"" + lvl + "\"");

    if (c.store_file.empty()||c.task_file.empty()||c.branch.empty()||c.api_base.empty())
        throw std::runtime_error(path + ": store_file, task_file, branch and api_base must not be empty");
    while (!c.backup_prefix.empty() && c.backup_prefix.back()=='/') c.backup_prefix.pop_back();
    return c;
}

SyncConfig make_sync_config(const SecretBundle& bundle, const AppConfig& app){
    auto get=[&](const char* k)->std::string{
        auto it = bundle.find(k);
        return it==bundle.end()? std::string() : it->second;
    };
    SyncConfig s;
    s.token = get(kKeyToken);
    s.data_passphrase = get(kKeyDataPassphrase);
    s.owner = get(kKeyOwner);
    s.repo = get(kKeyRepo);
    s.branch = app.branch;
    s.backup_prefix = app.backup_prefix;
    s.api_base = app.api_base;
    s.timeout_seconds = app.timeout_seconds;
    return s;
}
