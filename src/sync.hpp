#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "github_client.hpp"

// A locally owned file and where its backup lives. Optional files that do
// not exist locally are skipped on backup instead of failing.
struct FileMapping {
    std::string local_path;
    std::string remote_path;
    bool optional;
};

// Task list (required) and its CSV export (optional), under the backup prefix.
std::vector<FileMapping> default_file_mappings(const AppConfig& app);

enum class PushOutcome { Pushed, Skipped };

// Moves raw file bytes to and from the contents API, sealing them with the
// data passphrase when one is configured. Single-threaded and blocking.
class RemoteSynchronizer {
public:
    RemoteSynchronizer(const SyncConfig& cfg, HttpTransport& transport);

    // Throws MissingCredential, LocalFileMissing (unless optional, which
    // returns Skipped), RemoteRequestFailed or RemoteUnavailable.
    PushOutcome push(const std::string& local_path, const std::string& remote_path,
                     const std::string& message, const std::string& branch,
                     bool optional = false);

    // Replaces local_path with the remote object's plaintext. Throws
    // MissingCredential, RemoteRequestFailed, RemoteUnavailable, FormatError
    // or AuthenticationError; the local file is untouched on any failure.
    void pull(const std::string& remote_path, const std::string& local_path,
              const std::string& branch);

    // One status line per mapping; one entry failing never stops the rest.
    std::vector<std::string> backup_all(const std::vector<FileMapping>& files);
    std::vector<std::string> restore_all(const std::vector<FileMapping>& files);

    // Current version token, nullopt when the object does not exist.
    std::optional<std::string> fetch_version(const std::string& remote_path,
                                             const std::string& branch);

private:
    void require_credentials() const;
    std::string mode_hint() const;

    const SyncConfig& cfg_;
    GitHubClient gh_;
};

// True when every line is an OK or SKIP line.
bool all_succeeded(const std::vector<std::string>& status_lines);
