#pragma once
#include <string>
#include <map>
#include "log.hpp"

// Non-secret settings, read from an optional JSON file.
struct AppConfig {
    std::string store_file = ".tosk_secrets";
    std::string task_file = "tasks.json";
    std::string export_file = "tasks_export.csv";
    std::string backup_prefix = "backups";
    std::string branch = "main";
    std::string api_base = "https://api.github.com";
    long timeout_seconds = 30;
    LogLevel log_level = LogLevel::Warn;
};

// Missing file yields defaults. Unparseable JSON or a bad field value throws
// std::runtime_error.
AppConfig load_app_config(const std::string& path);

using SecretBundle = std::map<std::string, std::string>;

constexpr const char* kKeyToken = "GITHUB_TOKEN";
constexpr const char* kKeyDataPassphrase = "TOSK_ENCRYPTION_PASSPHRASE";
constexpr const char* kKeyOwner = "GITHUB_OWNER";
constexpr const char* kKeyRepo = "GITHUB_REPO";

// Everything the synchronizer needs, built once after the secret store is
// ready and passed by reference from then on.
struct SyncConfig {
    std::string token;
    std::string data_passphrase;  // empty: backups travel unencrypted
    std::string owner;
    std::string repo;
    std::string branch = "main";
    std::string backup_prefix = "backups";
    std::string api_base = "https://api.github.com";
    long timeout_seconds = 30;

    bool encrypts() const { return !data_passphrase.empty(); }
};

SyncConfig make_sync_config(const SecretBundle& bundle, const AppConfig& app);
