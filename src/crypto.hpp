#pragma once
#include <array>
#include <cstddef>
#include <string>

constexpr size_t kSaltLen = 16;
constexpr size_t kNonceLen = 12;
constexpr size_t kTagLen = 16;
constexpr size_t kKeyLen = 32;
constexpr size_t kHeaderLen = kSaltLen + kNonceLen;
constexpr int kKdfIterations = 100000;

// 32-byte key that wipes itself on destruction. Not copyable.
class DerivedKey {
public:
    DerivedKey() { bytes_.fill(0); }
    ~DerivedKey();
    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;

    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool operator==(const DerivedKey& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const DerivedKey& o) const { return !(*this == o); }

private:
    std::array<unsigned char, kKeyLen> bytes_;
};

// PBKDF2-HMAC-SHA256, kKdfIterations rounds. salt must be kSaltLen bytes.
void derive_key(const std::string& passphrase, const std::string& salt, DerivedKey& out);

// salt(16) || nonce(12) || ciphertext || tag(16)
struct CryptoEnvelope {
    std::string salt;
    std::string nonce;
    std::string ct;    // ciphertext + tag

    std::string to_bytes() const;
    // Throws FormatError if shorter than the salt+nonce header.
    static CryptoEnvelope from_bytes(const std::string& bytes);
};

// AES-256-GCM under a key derived from passphrase and a fresh salt.
// Returns the serialized envelope.
std::string seal_envelope(const std::string& plaintext, const std::string& passphrase);

// Throws FormatError on a short envelope and AuthenticationError if the tag
// does not verify. No plaintext is returned unless the tag verified.
std::string open_envelope(const std::string& envelope, const std::string& passphrase);
