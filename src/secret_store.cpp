#include "secret_store.hpp"
#include "codec.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util.hpp"
#include <json-c/json.h>
#include <cctype>
#include <memory>

const std::vector<RequiredKey>& default_required_keys(){
    static const std::vector<RequiredKey> keys = {
        {kKeyToken, "GitHub access token: ", true, false},
        {kKeyDataPassphrase, "Backup encryption passphrase (empty = no encryption): ", true, true},
        {kKeyOwner, "GitHub owner (user or organization): ", false, false},
        {kKeyRepo, "GitHub repository name: ", false, false},
    };
    return keys;
}

std::string encode_bundle(const SecretBundle& b){
    std::string j = "{";
    bool first = true;
    for (const auto& kv: b){
        if (!first) j += ",";
        first = false;
        j += "\"" + escape_json(kv.first) + "\":\"" + escape_json(kv.second) + "\"";
    }
    j += "}";
    return j;
}

SecretBundle decode_bundle(const std::string& text){
    json_tokener* tok = json_tokener_new();
    if (!tok) throw std::runtime_error("json_tokener_new failed");
    json_object* root = json_tokener_parse_ex(tok, text.data(), (int)text.size());
    json_tokener_free(tok);
    if (!root) throw FormatError("secret bundle is not valid JSON");
    std::unique_ptr<json_object, decltype(&json_object_put)> guard(root, &json_object_put);
    if (!json_object_is_type(root, json_type_object))
        throw FormatError("secret bundle is not a JSON object");

    SecretBundle b;
    json_object_iterator it = json_object_iter_begin(root);
    json_object_iterator end = json_object_iter_end(root);
    for (; !json_object_iter_equal(&it, &end); json_object_iter_next(&it)){
        const char* key = json_object_iter_peek_name(&it);
        json_object* val = json_object_iter_peek_value(&it);
        if (!json_object_is_type(val, json_type_string))
            throw FormatError(std::string("secret bundle value for ") + key + " is not a string");
        b[key] = std::string(json_object_get_string(val), (size_t)json_object_get_string_len(val));
    }
    return b;
}

static std::string trim(const std::string& s){
    size_t a = 0, e = s.size();
    while (a < e && std::isspace((unsigned char)s[a])) a++;
    while (e > a && std::isspace((unsigned char)s[e-1])) e--;
    return s.substr(a, e-a);
}

SecretStore::SecretStore(std::string path, Prompter& prompter)
    : path_(std::move(path)), prompter_(prompter),
      state_(file_exists(path_) ? StoreState::AwaitingMasterPassword : StoreState::NoStoreFile) {}

bool SecretStore::exists() const { return file_exists(path_); }

SecretBundle SecretStore::load(){
    if (!exists()) {
        state_ = StoreState::NoStoreFile;
        return {};
    }
    state_ = StoreState::AwaitingMasterPassword;
    std::string text;
    try {
        text = read_file(path_);
    } catch (const LocalFileMissing&) {
        throw StoreError("cannot read secret store: " + path_);
    }

    std::string envelope = base64_decode(text);
    std::string master = prompter_.ask_secret("Master password: ");
    std::string plain;
    try {
        plain = open_envelope(envelope, master);
    } catch (...) {
        wipe(master);
        throw;
    }
    wipe(master);

    SecretBundle b;
    try {
        b = decode_bundle(plain);
    } catch (...) {
        wipe(plain);
        throw;
    }
    wipe(plain);
    state_ = StoreState::Ready;
    log_msg(LogLevel::Info, "secret store %s unlocked", path_.c_str());
    return b;
}

bool SecretStore::ensure_required_keys(SecretBundle& bundle, const std::vector<RequiredKey>& required){
    bool changed = false;
    for (const auto& k: required){
        auto it = bundle.find(k.name);
        bool absent = it == bundle.end();
        bool blank = !absent && trim(it->second).empty();
        if (!absent && (!blank || k.may_be_blank)) continue;

        // Secrets are kept byte for byte; whitespace-only still counts as blank.
        std::string answer = k.secret ? prompter_.ask_secret(k.prompt) : trim(prompter_.ask(k.prompt));
        if (k.secret && trim(answer).empty()) wipe(answer);
        if (answer.empty() && !k.may_be_blank) throw MissingCredential(k.name);
        bundle[k.name] = answer;
        wipe(answer);
        changed = true;
    }
    if (state_ != StoreState::PersistedSetup) state_ = StoreState::Ready;
    return changed;
}

void SecretStore::persist(const SecretBundle& bundle, const std::string& master_password){
    std::string plain = encode_bundle(bundle);
    std::string sealed;
    try {
        sealed = seal_envelope(plain, master_password);
    } catch (...) {
        wipe(plain);
        throw;
    }
    wipe(plain);
    write_file(path_, base64_encode(sealed) + "\n", true);
    state_ = StoreState::PersistedSetup;
    log_msg(LogLevel::Info, "secret store written to %s", path_.c_str());
}

SetupResult SecretStore::open_or_setup(const std::vector<RequiredKey>& required){
    SetupResult r;
    bool existed = exists();

    try {
        r.bundle = load();
    } catch (const AuthenticationError&) {
        r.status = SetupStatus::WrongMasterPassword;
        r.message = "wrong master password or corrupted store: " + path_;
        return r;
    } catch (const FormatError&) {
        r.status = SetupStatus::WrongMasterPassword;
        r.message = "wrong master password or corrupted store: " + path_;
        return r;
    } catch (const StoreError& e) {
        r.status = SetupStatus::StoreIoFailed;
        r.message = e.what();
        return r;
    }

    bool changed = false;
    try {
        changed = ensure_required_keys(r.bundle, required);
    } catch (const MissingCredential& e) {
        r.status = SetupStatus::RequiredValueBlank;
        r.message = e.name() + " must not be empty";
        r.bundle.clear();
        return r;
    }

    if (existed && !changed) return r;

    std::string master = prompter_.ask_secret("Set master password: ");
    if (master.empty()) {
        r.status = SetupStatus::RequiredValueBlank;
        r.message = "master password must not be empty";
        r.bundle.clear();
        return r;
    }
    std::string confirm = prompter_.ask_secret("Confirm master password: ");
    bool match = confirm == master;
    wipe(confirm);
    if (!match) {
        wipe(master);
        r.status = SetupStatus::MasterPasswordMismatch;
        r.message = "master passwords do not match; nothing was saved";
        r.bundle.clear();
        return r;
    }
    try {
        persist(r.bundle, master);
    } catch (const StoreError& e) {
        wipe(master);
        r.status = SetupStatus::StoreIoFailed;
        r.message = e.what();
        r.bundle.clear();
        return r;
    }
    wipe(master);
    r.persisted = true;
    return r;
}
