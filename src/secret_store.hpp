#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "prompt.hpp"

struct RequiredKey {
    std::string name;
    std::string prompt;
    bool secret;        // read without echo
    bool may_be_blank;  // an empty answer is accepted and stored
};

// Token, data passphrase, owner, repo, in prompting order. Only the data
// passphrase may be blank (backups then travel unencrypted).
const std::vector<RequiredKey>& default_required_keys();

// Canonical byte form: compact JSON object, keys sorted.
std::string encode_bundle(const SecretBundle& b);
// Throws FormatError unless the text is a JSON object of string values.
SecretBundle decode_bundle(const std::string& text);

enum class StoreState {
    NoStoreFile,
    AwaitingMasterPassword,
    Ready,
    PersistedSetup,
};

enum class SetupStatus {
    Ready,
    WrongMasterPassword,
    RequiredValueBlank,
    MasterPasswordMismatch,
    StoreIoFailed,
};

struct SetupResult {
    SetupStatus status = SetupStatus::Ready;
    SecretBundle bundle;
    bool persisted = false;
    std::string message;

    bool ok() const { return status == SetupStatus::Ready; }
};

// The master-password-gated file holding the secret bundle. The file is
// base64 text of seal_envelope(encode_bundle(bundle), master password).
// The master password itself is never stored or kept past a call.
class SecretStore {
public:
    SecretStore(std::string path, Prompter& prompter);

    bool exists() const;
    StoreState state() const { return state_; }
    const std::string& path() const { return path_; }

    // Empty bundle when no store file exists (no prompt). Otherwise prompts
    // once for the master password and decrypts. Throws AuthenticationError,
    // FormatError or StoreError.
    SecretBundle load();

    // Prompts for every required key that is absent, or blank when blank is
    // not allowed. Returns true if anything was filled in. Throws
    // MissingCredential naming the first key left blank that must not be.
    bool ensure_required_keys(SecretBundle& bundle, const std::vector<RequiredKey>& required);

    // Seals and writes the bundle (owner-only permissions). Throws StoreError.
    void persist(const SecretBundle& bundle, const std::string& master_password);

    // Whole startup flow: load, fill missing keys, and persist under a freshly
    // entered master password when the file is new or anything changed.
    // Never throws for the expected failures; reports them in the result.
    SetupResult open_or_setup(const std::vector<RequiredKey>& required = default_required_keys());

private:
    std::string path_;
    Prompter& prompter_;
    StoreState state_;
};
