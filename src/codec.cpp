#include "codec.hpp"
#include "errors.hpp"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <cctype>
#include <memory>

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

std::string base64_encode(const std::string& in){
    if (in.empty()) return {};
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem) {
        BIO_free(b64); BIO_free(mem);
        throw std::runtime_error("BIO_new failed");
    }
    BioPtr chain(BIO_push(b64, mem), &BIO_free_all);
    BIO_set_flags(chain.get(), BIO_FLAGS_BASE64_NO_NL);
    if (BIO_write(chain.get(), in.data(), (int)in.size()) != (int)in.size())
        throw std::runtime_error("base64 write failed");
    if (BIO_flush(chain.get()) != 1) throw std::runtime_error("base64 flush failed");
    BUF_MEM* buf = nullptr;
    BIO_get_mem_ptr(chain.get(), &buf);
    return std::string(buf->data, buf->length);
}

static bool is_b64_char(unsigned char c){
    return std::isalnum(c) || c=='+' || c=='/';
}

static std::string strip_and_check(const std::string& in){
    std::string s; s.reserve(in.size());
    for (unsigned char c: in){
        if (std::isspace(c)) continue;
        s += (char)c;
    }
    if (s.size() % 4 != 0) throw FormatError("base64 length is not a multiple of 4");
    size_t pad = 0;
    for (size_t i=0;i<s.size();i++){
        unsigned char c = (unsigned char)s[i];
        if (c=='='){
            if (i < s.size()-2) throw FormatError("base64 padding in the middle");
            pad++;
        } else if (!is_b64_char(c) || pad > 0){
            throw FormatError("invalid base64 character");
        }
    }
    return s;
}

std::string base64_decode(const std::string& in){
    std::string s = strip_and_check(in);
    if (s.empty()) return {};
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new_mem_buf(s.data(), (int)s.size());
    if (!b64 || !mem) {
        BIO_free(b64); BIO_free(mem);
        throw std::runtime_error("BIO_new failed");
    }
    BioPtr chain(BIO_push(b64, mem), &BIO_free_all);
    BIO_set_flags(chain.get(), BIO_FLAGS_BASE64_NO_NL);
    std::string out; out.resize(s.size());
    int outlen = BIO_read(chain.get(), &out[0], (int)out.size());
    if (outlen < 0) throw FormatError("base64 decode failed");
    out.resize(outlen);
    return out;
}

void wipe(std::string& s){
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
    s.clear();
}
