// SPECTRE - External Data Binding
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/extdata.h"
#include "spectre/solana/address.h"

#include <algorithm>
#include <stdexcept>

namespace spectre {

FieldElement LeadingBytesField(const Bytes& data) {
    size_t len = std::min(data.size(), EXT_DATA_FIELD_BYTES);
    return FieldElement::FromBigEndian(data.data(), len);
}

FieldElement ComputeExtDataHash(const IPoseidonHasher& hasher, const ExtData& extData) {
    solana::PublicKey recipient = solana::PublicKey::Parse(extData.recipient);
    Bytes recipientBytes(recipient.GetBytes().begin(), recipient.GetBytes().end());

    auto extAmount = FieldElement::TryFromDecimal(extData.extAmount);
    if (!extAmount) {
        throw std::invalid_argument("Invalid extAmount: " + extData.extAmount);
    }
    auto fee = FieldElement::TryFromDecimal(extData.fee);
    if (!fee || (!extData.fee.empty() && extData.fee[0] == '-')) {
        throw std::invalid_argument("Invalid fee: " + extData.fee);
    }

    return hasher.Hash({
        LeadingBytesField(recipientBytes),
        *extAmount,
        LeadingBytesField(extData.encryptedOutput1),
        LeadingBytesField(extData.encryptedOutput2),
        *fee
    });
}

} // namespace spectre
