// SPECTRE - Prove Request/Response Codec
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Wire format of the proof-generation boundary, and the shield/unshield
// planners that assemble requests from a user's notes.

#ifndef SPECTRE_SHIELD_REQUEST_H
#define SPECTRE_SHIELD_REQUEST_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "spectre/core/json.h"
#include "spectre/prover/proof.h"
#include "spectre/shield/circuit_input.h"
#include "spectre/shield/extdata.h"
#include "spectre/shield/keypair.h"
#include "spectre/shield/note_cipher.h"
#include "spectre/shield/utxo.h"

namespace spectre {

/// Error text for a request lacking inputs, outputs or utxoPrivateKey
constexpr const char* MISSING_FIELDS_ERROR = "Missing required fields";

// ============================================================================
// Request
// ============================================================================

/// Note being spent. Numeric fields keep their request text.
struct RequestInput {
    std::string amount;
    std::string blinding;
    std::string privateKey;
    uint64_t index{0};
    std::optional<std::string> mintAddress;
};

/// Note being created; owned by utxoPrivateKey
struct RequestOutput {
    std::string amount;
    std::string blinding;
    uint64_t index{0};
    std::optional<std::string> mintAddress;
};

struct ProveRequest {
    Operation operation{Operation::Deposit};
    std::vector<RequestInput> inputs;
    std::vector<RequestOutput> outputs;
    std::string root;
    std::vector<std::vector<std::string>> inputMerklePaths;
    std::vector<uint64_t> inputMerklePathIndices;
    ExtData extData;
    std::string publicAmount;
    std::string utxoPrivateKey;

    JSONValue ToJSON() const;
};

/**
 * Decode and validate a request body.
 *
 * Missing inputs, outputs or utxoPrivateKey are reported first, as
 * ValidationError("Missing required fields"), before anything else is
 * looked at. Numbers may be JSON integers or decimal/0x strings of any
 * length; note amounts must fit in 64 bits.
 *
 * @throws ValidationError
 */
ProveRequest ParseProveRequest(const JSONValue& body, size_t treeDepth = MERKLE_TREE_DEPTH);

/**
 * Derive keypairs and notes for a validated request. Inputs are owned by
 * their own private keys, outputs by utxoPrivateKey.
 * @throws ValidationError if a value fails to decode
 */
CircuitInputParams ToCircuitInputParams(const ProveRequest& request, const HasherPtr& hasher);

// ============================================================================
// Shield / Unshield Planning
// ============================================================================

/// A note the user can spend, with its Merkle sibling path
struct SpendableNote {
    Utxo utxo;
    std::vector<FieldElement> path;
};

/// Tree state the new outputs are appended to
struct TreeState {
    FieldElement root;
    uint64_t nextIndex{0};
};

/**
 * Shield lamports into the pool, merging up to two existing notes.
 * Output 0 carries sum(existing) + lamports at tree.nextIndex, output 1 is
 * empty at nextIndex + 1. fee is 0 and publicAmount = lamports.
 *
 * @throws ValidationError for more than two existing notes or a bad path
 */
ProveRequest BuildDepositRequest(uint64_t lamports, const Keypair& keypair,
                                 const std::string& recipient, const TreeState& tree,
                                 const std::vector<SpendableNote>& existing,
                                 INoteEncryptor& encryptor,
                                 const std::string& mintAddress = solana::NATIVE_MINT_ADDRESS,
                                 size_t treeDepth = MERKLE_TREE_DEPTH);

/**
 * Unshield lamports to recipient from one or two notes. The change note
 * goes to output 0, a padding note to output 1.
 * extAmount = -lamports, fee = floor(lamports * feeBps / 10000) and
 * publicAmount = p - lamports + fee.
 *
 * @throws ValidationError if no notes are given, more than two, or their
 *         sum is below lamports
 */
ProveRequest BuildWithdrawRequest(uint64_t lamports, const Keypair& keypair,
                                  const std::string& recipient, const TreeState& tree,
                                  const std::vector<SpendableNote>& spend,
                                  INoteEncryptor& encryptor, uint32_t feeBps,
                                  size_t treeDepth = MERKLE_TREE_DEPTH);

// ============================================================================
// Response
// ============================================================================

struct ProveResponse {
    Proof proof;
    std::vector<std::string> publicSignals;
    FormattedProof proofBytes;
    std::vector<PublicInputBytes> publicInputsBytes;

    /// Format a freshly generated proof
    static ProveResponse FromProof(const Proof& proof, std::vector<std::string> publicSignals);

    /// { proof, publicSignals, proofBytes: {proofA, proofB, proofC}, publicInputsBytes }
    JSONValue ToJSON() const;
};

} // namespace spectre

#endif // SPECTRE_SHIELD_REQUEST_H
