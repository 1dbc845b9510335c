// SPECTRE - Circuit Input Assembly
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/circuit_input.h"
#include "spectre/prover/errors.h"
#include "spectre/util/logging.h"

#include <stdexcept>
#include <string>

namespace spectre {

namespace {

template<size_t N>
JSONValue DecimalArray(const std::array<FieldElement, N>& values) {
    JSONValue::Array arr;
    arr.reserve(N);
    for (const auto& v : values) {
        arr.emplace_back(v.ToDecimal());
    }
    return JSONValue(std::move(arr));
}

JSONValue DecimalArray(const std::vector<FieldElement>& values) {
    JSONValue::Array arr;
    arr.reserve(values.size());
    for (const auto& v : values) {
        arr.emplace_back(v.ToDecimal());
    }
    return JSONValue(std::move(arr));
}

} // anonymous namespace

const char* OperationToString(Operation op) {
    switch (op) {
        case Operation::Deposit:  return "deposit";
        case Operation::Withdraw: return "withdraw";
    }
    return "unknown";
}

std::optional<Operation> ParseOperation(const std::string& name) {
    if (name == "deposit") return Operation::Deposit;
    if (name == "withdraw") return Operation::Withdraw;
    return std::nullopt;
}

// ============================================================================
// Public Amount
// ============================================================================

FieldElement DepositPublicAmount(uint64_t lamports) {
    return FieldElement(lamports);
}

FieldElement WithdrawPublicAmount(uint64_t lamports, uint64_t fee) {
    return FieldElement(fee) - FieldElement(lamports);
}

uint64_t ComputeWithdrawFee(uint64_t lamports, uint32_t feeBps) {
    constexpr uint64_t BPS_DENOMINATOR = 10000;
    if (feeBps > BPS_DENOMINATOR) {
        throw std::invalid_argument("Fee exceeds 100%");
    }
    uint64_t whole = lamports / BPS_DENOMINATOR;
    uint64_t rest = lamports % BPS_DENOMINATOR;
    return whole * feeBps + (rest * feeBps) / BPS_DENOMINATOR;
}

// ============================================================================
// Circuit Input
// ============================================================================

JSONValue CircuitInput::ToJSON() const {
    JSONValue::Array paths;
    for (const auto& path : inPathElements) {
        paths.push_back(DecimalArray(path));
    }

    JSONValue::Object obj;
    obj["root"] = root.ToDecimal();
    obj["inputNullifier"] = DecimalArray(inputNullifier);
    obj["outputCommitment"] = DecimalArray(outputCommitment);
    obj["publicAmount"] = publicAmount.ToDecimal();
    obj["extDataHash"] = extDataHash.ToDecimal();
    obj["inAmount"] = DecimalArray(inAmount);
    obj["inPrivateKey"] = DecimalArray(inPrivateKey);
    obj["inBlinding"] = DecimalArray(inBlinding);
    obj["inPathIndices"] = DecimalArray(inPathIndices);
    obj["inPathElements"] = JSONValue(std::move(paths));
    obj["outAmount"] = DecimalArray(outAmount);
    obj["outBlinding"] = DecimalArray(outBlinding);
    obj["outPubkey"] = DecimalArray(outPubkey);
    obj["mintAddress"] = mintAddress.ToDecimal();
    return JSONValue(std::move(obj));
}

CircuitInputBuilder::CircuitInputBuilder(HasherPtr hasher, size_t treeDepth)
    : hasher_(std::move(hasher)), treeDepth_(treeDepth) {
    if (!hasher_) {
        throw std::invalid_argument("CircuitInputBuilder requires a hasher");
    }
}

std::vector<FieldElement> CircuitInputBuilder::ZeroPath() const {
    return std::vector<FieldElement>(treeDepth_, FieldElement::Zero());
}

CircuitInput CircuitInputBuilder::Build(const CircuitInputParams& params) const {
    if (params.inputs.size() != CIRCUIT_INPUTS) {
        throw ValidationError("Circuit requires exactly 2 inputs, got " +
                              std::to_string(params.inputs.size()));
    }
    if (params.outputs.size() != CIRCUIT_OUTPUTS) {
        throw ValidationError("Circuit requires exactly 2 outputs, got " +
                              std::to_string(params.outputs.size()));
    }
    if (params.inputMerklePaths.size() != CIRCUIT_INPUTS ||
        params.inputMerklePathIndices.size() != CIRCUIT_INPUTS) {
        throw ValidationError("Expected one Merkle path and path index per input");
    }
    for (const auto& path : params.inputMerklePaths) {
        if (path.size() != treeDepth_) {
            throw ValidationError("Merkle path has " + std::to_string(path.size()) +
                                  " elements, tree depth is " + std::to_string(treeDepth_));
        }
    }

    CircuitInput input;
    input.root = params.root;
    input.publicAmount = params.publicAmount;

    try {
        input.extDataHash = ComputeExtDataHash(*hasher_, params.extData);
        input.mintAddress = params.inputs[0].GetMintField();
    } catch (const std::invalid_argument& e) {
        throw ValidationError(e.what());
    }

    // Malformed notes surface as invalid_argument from the hash derivations
    auto derive = [](const char* side, size_t i, const Utxo& utxo, bool nullifier) {
        try {
            return nullifier ? utxo.GetNullifier() : utxo.GetCommitment();
        } catch (const std::invalid_argument& e) {
            throw ValidationError(std::string(side) + "[" + std::to_string(i) + "]: " + e.what());
        }
    };

    for (size_t i = 0; i < CIRCUIT_INPUTS; ++i) {
        const Utxo& utxo = params.inputs[i];
        input.inputNullifier[i] = derive("inputs", i, utxo, true);
        input.inAmount[i] = FieldElement(utxo.GetAmount());
        input.inPrivateKey[i] = utxo.GetKeypair().GetPrivateKey();
        input.inBlinding[i] = utxo.GetBlinding();
        input.inPathIndices[i] = FieldElement(params.inputMerklePathIndices[i]);
        input.inPathElements[i] = params.inputMerklePaths[i];
    }

    for (size_t i = 0; i < CIRCUIT_OUTPUTS; ++i) {
        const Utxo& utxo = params.outputs[i];
        input.outputCommitment[i] = derive("outputs", i, utxo, false);
        input.outAmount[i] = FieldElement(utxo.GetAmount());
        input.outBlinding[i] = utxo.GetBlinding();
        input.outPubkey[i] = utxo.GetKeypair().GetPublicKey();
    }

    LOG_DEBUG(util::LogCategory::SHIELD)
        << OperationToString(params.operation) << " circuit input: nullifiers "
        << input.inputNullifier[0].ToDecimal() << ", " << input.inputNullifier[1].ToDecimal()
        << "; extDataHash " << input.extDataHash.ToDecimal();

    return input;
}

} // namespace spectre
