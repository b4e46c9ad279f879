#pragma once

#include <openssl/evp.h>

#include <cstdio>
#include <stdexcept>
#include <string>

namespace content_hash {

constexpr size_t ID_HEX_CHARS = 16;

// Full lowercase hex SHA-256 of `data`.
inline std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::string hex;
    hex.reserve(digest_len * 2);
    char buf[3];
    for (unsigned int i = 0; i < digest_len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

// Short content id used for scenarios, insights and proposals.
inline std::string short_id(const std::string& data) {
    return sha256_hex(data).substr(0, ID_HEX_CHARS);
}

}  // namespace content_hash
