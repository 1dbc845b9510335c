// SPECTRE - Note Encryption
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Encrypted note payloads published alongside each output commitment.
// Format: version(8) || iv(12) || tag(16) || ciphertext, AES-256-GCM.

#ifndef SPECTRE_SHIELD_NOTE_CIPHER_H
#define SPECTRE_SHIELD_NOTE_CIPHER_H

#include <array>
#include <string>

#include "spectre/core/types.h"

namespace spectre {

/// Turns a serialized note into the bytes published on chain
class INoteEncryptor {
public:
    virtual ~INoteEncryptor() = default;
    virtual Bytes Encrypt(const std::string& serializedNote) = 0;
};

/// Version prefix of the AES-256-GCM format
constexpr std::array<Byte, 8> NOTE_CIPHER_VERSION_V2 = {0, 0, 0, 0, 0, 0, 0, 2};

class AesGcmNoteCipher : public INoteEncryptor {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t IV_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t HEADER_SIZE = 8 + IV_SIZE + TAG_SIZE;

    explicit AesGcmNoteCipher(const std::array<Byte, KEY_SIZE>& key);
    ~AesGcmNoteCipher() override;

    AesGcmNoteCipher(const AesGcmNoteCipher&) = delete;
    AesGcmNoteCipher& operator=(const AesGcmNoteCipher&) = delete;

    /// Encrypt with a fresh random IV
    Bytes Encrypt(const std::string& serializedNote) override;

    /**
     * Decrypt and authenticate.
     * @throws std::runtime_error on a wrong version, truncated input or a
     *         failed tag check (wrong key or tampered data)
     */
    std::string Decrypt(const Bytes& payload) const;

private:
    std::array<Byte, KEY_SIZE> key_;
};

} // namespace spectre

#endif // SPECTRE_SHIELD_NOTE_CIPHER_H
