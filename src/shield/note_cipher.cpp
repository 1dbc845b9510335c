// SPECTRE - Note Encryption
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/note_cipher.h"
#include "spectre/core/random.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace spectre {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr NewCipherCtx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

} // anonymous namespace

AesGcmNoteCipher::AesGcmNoteCipher(const std::array<Byte, KEY_SIZE>& key) : key_(key) {}

AesGcmNoteCipher::~AesGcmNoteCipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

Bytes AesGcmNoteCipher::Encrypt(const std::string& serializedNote) {
    Bytes out(HEADER_SIZE + serializedNote.size());
    std::copy(NOTE_CIPHER_VERSION_V2.begin(), NOTE_CIPHER_VERSION_V2.end(), out.begin());
    Byte* iv = out.data() + 8;
    Byte* tag = iv + IV_SIZE;
    Byte* ciphertext = tag + TAG_SIZE;
    GetRandBytes(iv, IV_SIZE);

    CipherCtxPtr ctx = NewCipherCtx();
    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) != 1 ||
        EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                          reinterpret_cast<const Byte*>(serializedNote.data()),
                          static_cast<int>(serializedNote.size())) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
        throw std::runtime_error("Note encryption failed");
    }
    return out;
}

std::string AesGcmNoteCipher::Decrypt(const Bytes& payload) const {
    if (payload.size() < HEADER_SIZE ||
        !std::equal(NOTE_CIPHER_VERSION_V2.begin(), NOTE_CIPHER_VERSION_V2.end(), payload.begin())) {
        throw std::runtime_error("Unsupported note payload format");
    }
    const Byte* iv = payload.data() + 8;
    const Byte* tag = iv + IV_SIZE;
    const Byte* ciphertext = tag + TAG_SIZE;
    size_t ciphertextLen = payload.size() - HEADER_SIZE;

    std::string plaintext(ciphertextLen, '\0');
    Byte* out = reinterpret_cast<Byte*>(&plaintext[0]);
    CipherCtxPtr ctx = NewCipherCtx();
    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) != 1 ||
        EVP_DecryptUpdate(ctx.get(), out, &len, ciphertext, static_cast<int>(ciphertextLen)) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                            const_cast<Byte*>(tag)) != 1) {
        throw std::runtime_error("Note decryption failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out + len, &len) != 1) {
        throw std::runtime_error("Note authentication failed");
    }
    return plaintext;
}

} // namespace spectre
