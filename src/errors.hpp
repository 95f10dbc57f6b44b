#pragma once
#include <stdexcept>
#include <string>

// Tag did not verify: wrong passphrase or tampered/corrupted ciphertext.
struct AuthenticationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Envelope shorter than its header, or undecodable transport encoding.
struct FormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct MissingCredential : std::runtime_error {
    explicit MissingCredential(const std::string& name)
        : std::runtime_error("missing credential: " + name), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

struct LocalFileMissing : std::runtime_error {
    explicit LocalFileMissing(const std::string& path)
        : std::runtime_error("local file not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// Non-success HTTP status. Status and body are kept verbatim.
struct RemoteRequestFailed : std::runtime_error {
    RemoteRequestFailed(int code, const std::string& body)
        : std::runtime_error("HTTP " + std::to_string(code) + ": " + body),
          code_(code), body_(body) {}
    int code() const { return code_; }
    const std::string& body() const { return body_; }
private:
    int code_;
    std::string body_;
};

// Transport failure (DNS, TLS, connection, timeout) before any status.
struct RemoteUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
