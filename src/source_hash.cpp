#include "source_hash.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <stdexcept>

static std::string openssl_error(const char *what) {
    unsigned long code = ERR_get_error();
    char buf[256] = {0};
    if (code != 0) ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + " failed" + (code != 0 ? std::string(": ") + buf : std::string());
}

std::string hash_source(const std::string &ip, const std::string &salt) {
    const std::string material = ip + "|" + salt;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(material.data(), material.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(openssl_error("EVP_Digest(EVP_sha256)"));
    }

    static const char *hex = "0123456789abcdef";
    std::string out(kSourceHashPrefix);
    out.reserve(out.size() + kSourceHashBytes * 2);
    for (size_t i = 0; i < kSourceHashBytes && i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}
