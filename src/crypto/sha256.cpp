// SPECTRE - SHA-256
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace spectre {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

SHA256& SHA256::Write(const std::string& data) {
    return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
}

Hash256 SHA256::Finalize() {
    Hash256 out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    return hasher.Write(data, len).Finalize();
}

} // namespace spectre
