#include "crypto.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>
#include <stdexcept>

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

DerivedKey::~DerivedKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

void derive_key(const std::string& passphrase, const std::string& salt, DerivedKey& out){
    if (salt.size() != kSaltLen) throw std::invalid_argument("derive_key: salt must be 16 bytes");
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), (int)passphrase.size(),
                          reinterpret_cast<const unsigned char*>(salt.data()), (int)salt.size(),
                          kKdfIterations, EVP_sha256(),
                          (int)out.size(), out.data()) != 1){
        throw std::runtime_error("PBKDF2 failed");
    }
}

std::string CryptoEnvelope::to_bytes() const {
    std::string out;
    out.reserve(salt.size() + nonce.size() + ct.size());
    out += salt;
    out += nonce;
    out += ct;
    return out;
}

CryptoEnvelope CryptoEnvelope::from_bytes(const std::string& bytes){
    if (bytes.size() < kHeaderLen)
        throw FormatError("envelope shorter than " + std::to_string(kHeaderLen) + "-byte header");
    CryptoEnvelope env;
    env.salt  = bytes.substr(0, kSaltLen);
    env.nonce = bytes.substr(kSaltLen, kNonceLen);
    env.ct    = bytes.substr(kHeaderLen);
    return env;
}

static std::string random_bytes(size_t n){
    std::string out(n, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&out[0]), (int)n) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return out;
}

std::string seal_envelope(const std::string& plaintext, const std::string& passphrase){
    CryptoEnvelope env;
    env.salt  = random_bytes(kSaltLen);
    env.nonce = random_bytes(kNonceLen);

    DerivedKey key;
    derive_key(passphrase, env.salt, key);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EncryptInit failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, (int)kNonceLen, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                           reinterpret_cast<const unsigned char*>(env.nonce.data())) != 1)
        throw std::runtime_error("EncryptInit key/iv failed");

    env.ct.resize(plaintext.size() + kTagLen);
    auto* out = reinterpret_cast<unsigned char*>(&env.ct[0]);
    int outlen1=0, outlen2=0;
    if (EVP_EncryptUpdate(ctx.get(), out, &outlen1,
                          reinterpret_cast<const unsigned char*>(plaintext.data()), (int)plaintext.size()) != 1)
        throw std::runtime_error("EncryptUpdate failed");
    if (EVP_EncryptFinal_ex(ctx.get(), out + outlen1, &outlen2) != 1)
        throw std::runtime_error("EncryptFinal failed");

    size_t ctlen = (size_t)(outlen1 + outlen2);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, (int)kTagLen, out + ctlen) != 1)
        throw std::runtime_error("GET_TAG failed");
    env.ct.resize(ctlen + kTagLen);

    return env.to_bytes();
}

std::string open_envelope(const std::string& envelope, const std::string& passphrase){
    CryptoEnvelope env = CryptoEnvelope::from_bytes(envelope);
    // A body shorter than a tag can never verify.
    if (env.ct.size() < kTagLen) throw AuthenticationError("ciphertext shorter than tag");

    const size_t clen = env.ct.size() - kTagLen;
    std::string tag = env.ct.substr(clen);

    DerivedKey key;
    derive_key(passphrase, env.salt, key);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("DecryptInit failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, (int)kNonceLen, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                           reinterpret_cast<const unsigned char*>(env.nonce.data())) != 1)
        throw std::runtime_error("DecryptInit key/iv failed");

    std::string out; out.resize(clen + kTagLen);
    auto* p = reinterpret_cast<unsigned char*>(&out[0]);
    int outlen1=0, outlen2=0;
    if (EVP_DecryptUpdate(ctx.get(), p, &outlen1,
                          reinterpret_cast<const unsigned char*>(env.ct.data()), (int)clen) != 1)
        throw std::runtime_error("DecryptUpdate failed");

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, (int)kTagLen, &tag[0]) != 1)
        throw std::runtime_error("SET_TAG failed");

    if (EVP_DecryptFinal_ex(ctx.get(), p + outlen1, &outlen2) != 1){
        wipe(out);
        throw AuthenticationError("authentication tag mismatch (wrong passphrase or corrupted data)");
    }
    out.resize((size_t)(outlen1 + outlen2));
    return out;
}
