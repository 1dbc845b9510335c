// SPECTRE - External Data Binding
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Publicly visible transaction metadata folded into one field element that
// the proof commits to, so a relayer cannot swap the recipient, amount,
// fee or encrypted notes after proving:
//
//   extDataHash = Poseidon(recipientField, extAmount, enc1Field, enc2Field, fee)
//
// recipientField, enc1Field and enc2Field are the first 16 bytes of the
// respective byte strings read big-endian.

#ifndef SPECTRE_SHIELD_EXTDATA_H
#define SPECTRE_SHIELD_EXTDATA_H

#include <optional>
#include <string>

#include "spectre/core/types.h"
#include "spectre/crypto/field.h"
#include "spectre/crypto/hasher.h"

namespace spectre {

/// Number of leading bytes that enter the hash for byte-string fields
constexpr size_t EXT_DATA_FIELD_BYTES = 16;

struct ExtData {
    /// Recipient address (base58)
    std::string recipient;

    /// Signed decimal; positive for deposits, negative for withdrawals
    std::string extAmount;

    Bytes encryptedOutput1;
    Bytes encryptedOutput2;

    /// Non-negative decimal
    std::string fee{"0"};

    /// Carried along for the relayer; not hashed
    std::optional<std::string> feeRecipient;
};

/// First EXT_DATA_FIELD_BYTES bytes of data as a big-endian field element
FieldElement LeadingBytesField(const Bytes& data);

/**
 * Compute the binding hash.
 * @throws std::invalid_argument if the recipient is not a valid address or
 *         extAmount/fee are not decimal numbers
 */
FieldElement ComputeExtDataHash(const IPoseidonHasher& hasher, const ExtData& extData);

} // namespace spectre

#endif // SPECTRE_SHIELD_EXTDATA_H
