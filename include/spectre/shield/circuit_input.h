// SPECTRE - Circuit Input Assembly
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Builds the named-signal input of the 2-in/2-out transaction circuit.
// A CircuitInput holds spending keys: it lives for one proving call and is
// never logged or written anywhere except the prover's private scratch area.

#ifndef SPECTRE_SHIELD_CIRCUIT_INPUT_H
#define SPECTRE_SHIELD_CIRCUIT_INPUT_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "spectre/core/json.h"
#include "spectre/crypto/field.h"
#include "spectre/shield/extdata.h"
#include "spectre/shield/utxo.h"

namespace spectre {

/// Fixed arity of the transaction circuit
constexpr size_t CIRCUIT_INPUTS = 2;
constexpr size_t CIRCUIT_OUTPUTS = 2;

/// Depth of the on-chain commitment tree
constexpr size_t MERKLE_TREE_DEPTH = 26;

enum class Operation {
    Deposit,
    Withdraw
};

/// "deposit" / "withdraw"
const char* OperationToString(Operation op);
std::optional<Operation> ParseOperation(const std::string& name);

// ============================================================================
// Public Amount
// ============================================================================

/// Deposit: publicAmount = extAmount mod p
FieldElement DepositPublicAmount(uint64_t lamports);

/**
 * Withdrawal: extAmount = -lamports, so publicAmount = p - lamports + fee,
 * reduced mod p. Negative values only exist as additive inverses here.
 */
FieldElement WithdrawPublicAmount(uint64_t lamports, uint64_t fee);

/// floor(lamports * feeBps / 10000) without intermediate overflow
uint64_t ComputeWithdrawFee(uint64_t lamports, uint32_t feeBps);

// ============================================================================
// Circuit Input
// ============================================================================

struct CircuitInput {
    FieldElement root;
    std::array<FieldElement, CIRCUIT_INPUTS> inputNullifier;
    std::array<FieldElement, CIRCUIT_OUTPUTS> outputCommitment;
    FieldElement publicAmount;
    FieldElement extDataHash;

    std::array<FieldElement, CIRCUIT_INPUTS> inAmount;
    std::array<FieldElement, CIRCUIT_INPUTS> inPrivateKey;
    std::array<FieldElement, CIRCUIT_INPUTS> inBlinding;
    std::array<FieldElement, CIRCUIT_INPUTS> inPathIndices;
    std::array<std::vector<FieldElement>, CIRCUIT_INPUTS> inPathElements;

    std::array<FieldElement, CIRCUIT_OUTPUTS> outAmount;
    std::array<FieldElement, CIRCUIT_OUTPUTS> outBlinding;
    std::array<FieldElement, CIRCUIT_OUTPUTS> outPubkey;

    FieldElement mintAddress;

    /// Signal name -> decimal string (or nested arrays of them)
    JSONValue ToJSON() const;
};

/// Everything the builder consumes for one proof
struct CircuitInputParams {
    Operation operation{Operation::Deposit};
    std::vector<Utxo> inputs;
    std::vector<Utxo> outputs;
    FieldElement root;
    std::vector<std::vector<FieldElement>> inputMerklePaths;
    std::vector<uint64_t> inputMerklePathIndices;
    ExtData extData;
    FieldElement publicAmount;
};

class CircuitInputBuilder {
public:
    explicit CircuitInputBuilder(HasherPtr hasher, size_t treeDepth = MERKLE_TREE_DEPTH);

    /**
     * Compute nullifiers, commitments and the extDataHash and lay them out
     * as circuit signals. The circuit's mint signal is the field form of
     * the first input's mint.
     *
     * @throws ValidationError on wrong arity or Merkle path length
     */
    CircuitInput Build(const CircuitInputParams& params) const;

    /// All-zero sibling path for padding inputs
    std::vector<FieldElement> ZeroPath() const;

    size_t GetTreeDepth() const { return treeDepth_; }

private:
    HasherPtr hasher_;
    size_t treeDepth_;
};

} // namespace spectre

#endif // SPECTRE_SHIELD_CIRCUIT_INPUT_H
