#include "sync.hpp"
#include "codec.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util.hpp"

static std::string join_remote(const std::string& prefix, const std::string& name){
    if (prefix.empty()) return name;
    return prefix + "/" + name;
}

std::vector<FileMapping> default_file_mappings(const AppConfig& app){
    return {
        {app.task_file, join_remote(app.backup_prefix, file_name_of(app.task_file)), false},
        {app.export_file, join_remote(app.backup_prefix, file_name_of(app.export_file)), true},
    };
}

static GHConfig gh_config(const SyncConfig& cfg){
    GHConfig g;
    g.owner = cfg.owner;
    g.repo = cfg.repo;
    g.token = cfg.token;
    g.api_base = cfg.api_base;
    return g;
}

RemoteSynchronizer::RemoteSynchronizer(const SyncConfig& cfg, HttpTransport& transport)
    : cfg_(cfg), gh_(gh_config(cfg), transport) {}

void RemoteSynchronizer::require_credentials() const {
    if (cfg_.token.empty()) throw MissingCredential(kKeyToken);
    if (cfg_.owner.empty()) throw MissingCredential(kKeyOwner);
    if (cfg_.repo.empty()) throw MissingCredential(kKeyRepo);
}

std::optional<std::string> RemoteSynchronizer::fetch_version(const std::string& remote_path,
                                                             const std::string& branch){
    auto r = gh_.get_contents(remote_path, branch);
    if (r.code == 404) return std::nullopt;
    if (r.code != 200) throw RemoteRequestFailed(r.code, r.body);
    auto entry = parse_contents_response(r.body);
    if (!entry) throw FormatError("contents response for " + remote_path + " has no sha");
    return entry->sha;
}

PushOutcome RemoteSynchronizer::push(const std::string& local_path, const std::string& remote_path,
                                     const std::string& message, const std::string& branch,
                                     bool optional){
    require_credentials();
    if (!file_exists(local_path)) {
        if (optional) {
            log_msg(LogLevel::Info, "skipping %s: not present", local_path.c_str());
            return PushOutcome::Skipped;
        }
        throw LocalFileMissing(local_path);
    }

    std::string payload = read_file(local_path);
    if (cfg_.encrypts()) payload = seal_envelope(payload, cfg_.data_passphrase);
    std::string b64 = base64_encode(payload);

    // Fetched right before the write; a concurrent writer between the two
    // calls is not detected.
    std::optional<std::string> sha = fetch_version(remote_path, branch);
    log_msg(LogLevel::Debug, "%s %s", sha ? "updating" : "creating", remote_path.c_str());

    auto r = gh_.put_contents(remote_path, message, b64, branch, sha);
    if (r.code != 200 && r.code != 201) throw RemoteRequestFailed(r.code, r.body);
    log_msg(LogLevel::Info, "pushed %s -> %s (%s)", local_path.c_str(), remote_path.c_str(),
            cfg_.encrypts() ? "encrypted" : "plain");
    return PushOutcome::Pushed;
}

void RemoteSynchronizer::pull(const std::string& remote_path, const std::string& local_path,
                              const std::string& branch){
    require_credentials();
    auto r = gh_.get_contents(remote_path, branch);
    if (r.code != 200) throw RemoteRequestFailed(r.code, r.body);

    auto entry = parse_contents_response(r.body);
    if (!entry) throw FormatError("contents response for " + remote_path + " is not a file object");
    // Files over 1 MB come back with encoding "none" and empty content;
    // symlinks and submodules carry no content at all.
    if (!entry->has_content || entry->encoding != "base64")
        throw FormatError("no inline base64 content for " + remote_path + " (encoding \""
                          + entry->encoding + "\")");

    std::string payload = base64_decode(entry->content);
    if (cfg_.encrypts()) payload = open_envelope(payload, cfg_.data_passphrase);

    write_file(local_path, payload);
    log_msg(LogLevel::Info, "pulled %s -> %s", remote_path.c_str(), local_path.c_str());
}

std::vector<std::string> RemoteSynchronizer::backup_all(const std::vector<FileMapping>& files){
    std::vector<std::string> lines;
    for (const auto& f: files){
        std::string name = file_name_of(f.local_path);
        try {
            auto out = push(f.local_path, f.remote_path, "Backup " + name, cfg_.branch, f.optional);
            if (out == PushOutcome::Skipped) lines.push_back("SKIP: " + name + " not found");
            else lines.push_back("OK: pushed " + name + " -> " + f.remote_path);
        } catch (const std::exception& e) {
            log_msg(LogLevel::Warn, "backup of %s failed", name.c_str());
            lines.push_back("FAIL: " + name + ": " + e.what());
        }
    }
    return lines;
}

// Encrypted and plain payloads look alike on the wire, so a decrypt failure
// may just mean the backup was written with the other setting.
std::string RemoteSynchronizer::mode_hint() const {
    if (!cfg_.encrypts()) return {};
    return " (wrong passphrase, or backup written with a different encryption setting)";
}

std::vector<std::string> RemoteSynchronizer::restore_all(const std::vector<FileMapping>& files){
    std::vector<std::string> lines;
    for (const auto& f: files){
        std::string name = file_name_of(f.local_path);
        try {
            pull(f.remote_path, f.local_path, cfg_.branch);
            lines.push_back("OK: restored " + name + " <- " + f.remote_path);
        } catch (const RemoteRequestFailed& e) {
            if (f.optional && e.code() == 404) {
                lines.push_back("SKIP: " + name + " not in backup");
                continue;
            }
            log_msg(LogLevel::Warn, "restore of %s failed", name.c_str());
            lines.push_back("FAIL: " + name + ": " + e.what());
        } catch (const AuthenticationError& e) {
            lines.push_back("FAIL: " + name + ": " + e.what() + mode_hint());
        } catch (const FormatError& e) {
            lines.push_back("FAIL: " + name + ": " + e.what() + mode_hint());
        } catch (const std::exception& e) {
            log_msg(LogLevel::Warn, "restore of %s failed", name.c_str());
            lines.push_back("FAIL: " + name + ": " + e.what());
        }
    }
    return lines;
}

bool all_succeeded(const std::vector<std::string>& status_lines){
    for (const auto& l: status_lines)
        if (l.rfind("OK:", 0) != 0 && l.rfind("SKIP:", 0) != 0) return false;
    return true;
}
