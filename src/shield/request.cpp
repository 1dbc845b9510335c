// SPECTRE - Prove Request/Response Codec
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/request.h"
#include "spectre/prover/errors.h"
#include "spectre/solana/address.h"

#include <charconv>
#include <limits>
#include <stdexcept>

namespace spectre {

namespace {

// ----------------------------------------------------------------------------
// Decoding helpers
// ----------------------------------------------------------------------------

[[noreturn]] void Invalid(const std::string& what) {
    throw ValidationError("Invalid request: " + what);
}

bool IsPresent(const JSONValue& obj, const std::string& key) {
    if (!obj.HasKey(key)) return false;
    const JSONValue& v = obj[key];
    if (v.IsNull()) return false;
    if (v.IsString() && v.GetString().empty()) return false;
    return true;
}

std::string RequireScalar(const JSONValue& obj, const std::string& key, const std::string& path) {
    if (!obj.HasKey(key)) {
        Invalid(path + " is required");
    }
    auto text = obj[key].AsScalarText();
    if (!text || text->empty()) {
        Invalid(path + " must be a number or numeric string");
    }
    return *text;
}

enum class Sign { Unsigned, Signed };

/** Field element text; only amounts may carry a minus sign */
std::string RequireField(const JSONValue& obj, const std::string& key, const std::string& path,
                         Sign sign = Sign::Unsigned) {
    std::string text = RequireScalar(obj, key, path);
    if (sign == Sign::Unsigned && text[0] == '-') {
        Invalid(path + " must not be negative: " + text);
    }
    if (!FieldElement::TryFromDecimal(text)) {
        Invalid(path + " is not a decimal or hex number: " + text);
    }
    return text;
}

uint64_t ParseU64(const std::string& text, const std::string& path) {
    uint64_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto result = std::from_chars(first, last, value);
    if (text.empty() || result.ec != std::errc() || result.ptr != last) {
        Invalid(path + " must be a non-negative 64-bit integer: " + text);
    }
    return value;
}

uint64_t RequireU64(const JSONValue& obj, const std::string& key, const std::string& path) {
    return ParseU64(RequireScalar(obj, key, path), path);
}

std::optional<std::string> OptionalMint(const JSONValue& obj, const std::string& path) {
    if (!IsPresent(obj, "mintAddress")) {
        return std::nullopt;
    }
    const JSONValue& v = obj["mintAddress"];
    if (!v.IsString()) {
        Invalid(path + ".mintAddress must be a string");
    }
    const std::string& mint = v.GetString();
    if (mint != solana::NATIVE_MINT_ADDRESS && !solana::PublicKey::FromBase58(mint)) {
        Invalid(path + ".mintAddress is not a valid address: " + mint);
    }
    return mint;
}

Bytes RequireByteArray(const JSONValue& obj, const std::string& key, const std::string& path) {
    if (!obj.HasKey(key) || !obj[key].IsArray()) {
        Invalid(path + " must be an array of bytes");
    }
    Bytes out;
    out.reserve(obj[key].Size());
    for (const auto& v : obj[key].GetArray()) {
        if (!v.IsInt() || v.GetInt() < 0 || v.GetInt() > 255) {
            Invalid(path + " contains a value outside 0..255");
        }
        out.push_back(static_cast<Byte>(v.GetInt()));
    }
    return out;
}

const JSONValue& RequireArray(const JSONValue& obj, const std::string& key,
                              size_t size, const std::string& path) {
    if (!obj.HasKey(key) || !obj[key].IsArray()) {
        Invalid(path + " must be an array");
    }
    if (obj[key].Size() != size) {
        Invalid(path + " must have " + std::to_string(size) + " entries, got " +
                std::to_string(obj[key].Size()));
    }
    return obj[key];
}

RequestInput ParseInput(const JSONValue& v, const std::string& path) {
    if (!v.IsObject()) Invalid(path + " must be an object");
    RequestInput in;
    in.amount = std::to_string(RequireU64(v, "amount", path + ".amount"));
    in.blinding = RequireField(v, "blinding", path + ".blinding");
    in.privateKey = RequireField(v, "privateKey", path + ".privateKey");
    in.index = RequireU64(v, "index", path + ".index");
    in.mintAddress = OptionalMint(v, path);
    return in;
}

RequestOutput ParseOutput(const JSONValue& v, const std::string& path) {
    if (!v.IsObject()) Invalid(path + " must be an object");
    RequestOutput out;
    out.amount = std::to_string(RequireU64(v, "amount", path + ".amount"));
    out.blinding = RequireField(v, "blinding", path + ".blinding");
    out.index = RequireU64(v, "index", path + ".index");
    out.mintAddress = OptionalMint(v, path);
    return out;
}

ExtData ParseExtData(const JSONValue& v) {
    if (!v.IsObject()) Invalid("extData must be an object");
    ExtData ext;
    if (!v.HasKey("recipient") || !v["recipient"].IsString() ||
        !solana::PublicKey::FromBase58(v["recipient"].GetString())) {
        Invalid("extData.recipient must be a base58 address");
    }
    ext.recipient = v["recipient"].GetString();
    ext.extAmount = RequireField(v, "extAmount", "extData.extAmount", Sign::Signed);
    ext.encryptedOutput1 = RequireByteArray(v, "encryptedOutput1", "extData.encryptedOutput1");
    ext.encryptedOutput2 = RequireByteArray(v, "encryptedOutput2", "extData.encryptedOutput2");
    ext.fee = RequireField(v, "fee", "extData.fee");
    if (IsPresent(v, "feeRecipient")) {
        ext.feeRecipient = v["feeRecipient"].GetString();
    }
    return ext;
}

FieldElement DecodeField(const std::string& text, const char* what) {
    auto fe = FieldElement::TryFromDecimal(text);
    if (!fe) Invalid(std::string(what) + " is not a number: " + text);
    return *fe;
}

// ----------------------------------------------------------------------------
// Encoding helpers
// ----------------------------------------------------------------------------

JSONValue ByteVectorToJSON(const Bytes& bytes) {
    JSONValue::Array arr;
    arr.reserve(bytes.size());
    for (Byte b : bytes) {
        arr.emplace_back(static_cast<int>(b));
    }
    return JSONValue(std::move(arr));
}

RequestInput ToRequestInput(const Utxo& utxo) {
    RequestInput in;
    in.amount = std::to_string(utxo.GetAmount());
    in.blinding = utxo.GetBlinding().ToDecimal();
    in.privateKey = utxo.GetKeypair().GetPrivateKey().ToDecimal();
    in.index = utxo.GetIndex();
    in.mintAddress = utxo.GetMintAddress();
    return in;
}

RequestOutput ToRequestOutput(const Utxo& utxo) {
    RequestOutput out;
    out.amount = std::to_string(utxo.GetAmount());
    out.blinding = utxo.GetBlinding().ToDecimal();
    out.index = utxo.GetIndex();
    out.mintAddress = utxo.GetMintAddress();
    return out;
}

std::vector<std::string> PathToStrings(const std::vector<FieldElement>& path) {
    std::vector<std::string> out;
    out.reserve(path.size());
    for (const auto& fe : path) {
        out.push_back(fe.ToDecimal());
    }
    return out;
}

/// Fill request inputs and paths from up to two notes, padding with dummies
uint64_t FillInputs(ProveRequest& request, const std::vector<SpendableNote>& notes,
                    const Keypair& keypair, const std::string& mintAddress, size_t treeDepth) {
    if (notes.size() > CIRCUIT_INPUTS) {
        throw ValidationError("At most 2 notes can be spent per transaction");
    }

    uint64_t sum = 0;
    for (const auto& note : notes) {
        if (note.path.size() != treeDepth) {
            throw ValidationError("Merkle path of note " + std::to_string(note.utxo.GetIndex()) +
                                  " has the wrong depth");
        }
        if (note.utxo.GetAmount() > std::numeric_limits<uint64_t>::max() - sum) {
            throw ValidationError("Note amounts overflow");
        }
        sum += note.utxo.GetAmount();
        request.inputs.push_back(ToRequestInput(note.utxo));
        request.inputMerklePaths.push_back(PathToStrings(note.path));
        request.inputMerklePathIndices.push_back(note.utxo.GetIndex());
    }
    while (request.inputs.size() < CIRCUIT_INPUTS) {
        request.inputs.push_back(ToRequestInput(Utxo::Dummy(keypair, mintAddress)));
        request.inputMerklePaths.emplace_back(treeDepth, "0");
        request.inputMerklePathIndices.push_back(0);
    }
    return sum;
}

/// Fill outputs (amount at nextIndex, padding at nextIndex + 1) and ext data
void FillOutputs(ProveRequest& request, uint64_t amount, const Keypair& keypair,
                 const TreeState& tree, const std::string& mintAddress,
                 INoteEncryptor& encryptor) {
    Utxo primary(amount, Utxo::RandomBlinding(), keypair, tree.nextIndex, mintAddress);
    Utxo padding(0, Utxo::RandomBlinding(), keypair, tree.nextIndex + 1, mintAddress);

    request.outputs.push_back(ToRequestOutput(primary));
    request.outputs.push_back(ToRequestOutput(padding));
    request.extData.encryptedOutput1 = encryptor.Encrypt(primary.Serialize());
    request.extData.encryptedOutput2 = encryptor.Encrypt(padding.Serialize());
}

} // anonymous namespace

// ============================================================================
// Request
// ============================================================================

JSONValue ProveRequest::ToJSON() const {
    JSONValue::Array ins;
    for (const auto& in : inputs) {
        JSONValue::Object o;
        o["amount"] = in.amount;
        o["blinding"] = in.blinding;
        o["privateKey"] = in.privateKey;
        o["index"] = in.index;
        if (in.mintAddress) o["mintAddress"] = *in.mintAddress;
        ins.emplace_back(std::move(o));
    }

    JSONValue::Array outs;
    for (const auto& out : outputs) {
        JSONValue::Object o;
        o["amount"] = out.amount;
        o["blinding"] = out.blinding;
        o["index"] = out.index;
        if (out.mintAddress) o["mintAddress"] = *out.mintAddress;
        outs.emplace_back(std::move(o));
    }

    JSONValue::Array paths;
    for (const auto& path : inputMerklePaths) {
        JSONValue::Array p(path.begin(), path.end());
        paths.emplace_back(std::move(p));
    }

    JSONValue::Array indices;
    for (uint64_t idx : inputMerklePathIndices) {
        indices.emplace_back(idx);
    }

    JSONValue::Object ext;
    ext["recipient"] = extData.recipient;
    ext["extAmount"] = extData.extAmount;
    ext["encryptedOutput1"] = ByteVectorToJSON(extData.encryptedOutput1);
    ext["encryptedOutput2"] = ByteVectorToJSON(extData.encryptedOutput2);
    ext["fee"] = extData.fee;
    if (extData.feeRecipient) ext["feeRecipient"] = *extData.feeRecipient;

    JSONValue::Object obj;
    obj["operation"] = OperationToString(operation);
    obj["inputs"] = JSONValue(std::move(ins));
    obj["outputs"] = JSONValue(std::move(outs));
    obj["root"] = root;
    obj["inputMerklePaths"] = JSONValue(std::move(paths));
    obj["inputMerklePathIndices"] = JSONValue(std::move(indices));
    obj["extData"] = JSONValue(std::move(ext));
    obj["publicAmount"] = publicAmount;
    obj["utxoPrivateKey"] = utxoPrivateKey;
    return JSONValue(std::move(obj));
}

ProveRequest ParseProveRequest(const JSONValue& body, size_t treeDepth) {
    if (!body.IsObject() || !IsPresent(body, "inputs") || !IsPresent(body, "outputs") ||
        !IsPresent(body, "utxoPrivateKey")) {
        throw ValidationError(MISSING_FIELDS_ERROR);
    }

    ProveRequest request;

    if (body.HasKey("operation") && !body["operation"].IsNull()) {
        auto op = ParseOperation(body["operation"].GetString());
        if (!op) Invalid("operation must be \"deposit\" or \"withdraw\"");
        request.operation = *op;
    }

    const JSONValue& ins = RequireArray(body, "inputs", CIRCUIT_INPUTS, "inputs");
    for (size_t i = 0; i < ins.Size(); ++i) {
        request.inputs.push_back(ParseInput(ins[i], "inputs[" + std::to_string(i) + "]"));
    }
    const JSONValue& outs = RequireArray(body, "outputs", CIRCUIT_OUTPUTS, "outputs");
    for (size_t i = 0; i < outs.Size(); ++i) {
        request.outputs.push_back(ParseOutput(outs[i], "outputs[" + std::to_string(i) + "]"));
    }

    request.root = RequireField(body, "root", "root");

    const JSONValue& paths = RequireArray(body, "inputMerklePaths", CIRCUIT_INPUTS, "inputMerklePaths");
    for (size_t i = 0; i < paths.Size(); ++i) {
        std::string path = "inputMerklePaths[" + std::to_string(i) + "]";
        if (!paths[i].IsArray() || paths[i].Size() != treeDepth) {
            Invalid(path + " must have " + std::to_string(treeDepth) + " elements");
        }
        std::vector<std::string> elements;
        elements.reserve(treeDepth);
        for (size_t j = 0; j < paths[i].Size(); ++j) {
            auto text = paths[i][j].AsScalarText();
            if (!text || text->empty() || (*text)[0] == '-' ||
                !FieldElement::TryFromDecimal(*text)) {
                Invalid(path + "[" + std::to_string(j) + "] is not a non-negative number");
            }
            elements.push_back(*text);
        }
        request.inputMerklePaths.push_back(std::move(elements));
    }

    const JSONValue& indices = RequireArray(body, "inputMerklePathIndices", CIRCUIT_INPUTS,
                                            "inputMerklePathIndices");
    for (size_t i = 0; i < indices.Size(); ++i) {
        auto text = indices[i].AsScalarText();
        std::string path = "inputMerklePathIndices[" + std::to_string(i) + "]";
        if (!text) Invalid(path + " is not a number");
        request.inputMerklePathIndices.push_back(ParseU64(*text, path));
    }

    if (!body.HasKey("extData")) Invalid("extData is required");
    request.extData = ParseExtData(body["extData"]);
    request.publicAmount = RequireField(body, "publicAmount", "publicAmount", Sign::Signed);
    request.utxoPrivateKey = RequireField(body, "utxoPrivateKey", "utxoPrivateKey");

    return request;
}

CircuitInputParams ToCircuitInputParams(const ProveRequest& request, const HasherPtr& hasher) {
    CircuitInputParams params;
    params.operation = request.operation;
    params.root = DecodeField(request.root, "root");
    params.publicAmount = DecodeField(request.publicAmount, "publicAmount");
    params.extData = request.extData;
    params.inputMerklePathIndices = request.inputMerklePathIndices;

    for (const auto& path : request.inputMerklePaths) {
        std::vector<FieldElement> elements;
        elements.reserve(path.size());
        for (const auto& text : path) {
            elements.push_back(DecodeField(text, "Merkle path element"));
        }
        params.inputMerklePaths.push_back(std::move(elements));
    }

    for (const auto& in : request.inputs) {
        Keypair owner(DecodeField(in.privateKey, "privateKey"), hasher);
        params.inputs.emplace_back(ParseU64(in.amount, "amount"), DecodeField(in.blinding, "blinding"),
                                   owner, in.index,
                                   in.mintAddress.value_or(solana::NATIVE_MINT_ADDRESS));
    }

    Keypair outputOwner(DecodeField(request.utxoPrivateKey, "utxoPrivateKey"), hasher);
    for (const auto& out : request.outputs) {
        params.outputs.emplace_back(ParseU64(out.amount, "amount"), DecodeField(out.blinding, "blinding"),
                                    outputOwner, out.index,
                                    out.mintAddress.value_or(solana::NATIVE_MINT_ADDRESS));
    }
    return params;
}

// ============================================================================
// Shield / Unshield Planning
// ============================================================================

ProveRequest BuildDepositRequest(uint64_t lamports, const Keypair& keypair,
                                 const std::string& recipient, const TreeState& tree,
                                 const std::vector<SpendableNote>& existing,
                                 INoteEncryptor& encryptor, const std::string& mintAddress,
                                 size_t treeDepth) {
    if (lamports == 0) {
        throw ValidationError("Deposit amount must be positive");
    }
    if (lamports > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw ValidationError("Deposit amount out of range");
    }

    ProveRequest request;
    request.operation = Operation::Deposit;
    request.root = tree.root.ToDecimal();

    uint64_t sum = FillInputs(request, existing, keypair, mintAddress, treeDepth);
    if (lamports > std::numeric_limits<uint64_t>::max() - sum) {
        throw ValidationError("Deposit overflows the note amount");
    }

    request.extData.recipient = recipient;
    request.extData.extAmount = std::to_string(lamports);
    request.extData.fee = "0";
    FillOutputs(request, sum + lamports, keypair, tree, mintAddress, encryptor);

    request.publicAmount = DepositPublicAmount(lamports).ToDecimal();
    request.utxoPrivateKey = keypair.GetPrivateKey().ToDecimal();
    return request;
}

ProveRequest BuildWithdrawRequest(uint64_t lamports, const Keypair& keypair,
                                  const std::string& recipient, const TreeState& tree,
                                  const std::vector<SpendableNote>& spend,
                                  INoteEncryptor& encryptor, uint32_t feeBps,
                                  size_t treeDepth) {
    if (spend.empty()) {
        throw ValidationError("Withdrawal needs at least one note to spend");
    }
    if (lamports == 0 || lamports > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw ValidationError("Withdrawal amount out of range");
    }

    const std::string mintAddress = spend.front().utxo.GetMintAddress();

    ProveRequest request;
    request.operation = Operation::Withdraw;
    request.root = tree.root.ToDecimal();

    uint64_t sum = FillInputs(request, spend, keypair, mintAddress, treeDepth);
    if (sum < lamports) {
        throw ValidationError("Insufficient shielded balance: have " + std::to_string(sum) +
                              ", need " + std::to_string(lamports));
    }

    uint64_t fee = ComputeWithdrawFee(lamports, feeBps);
    request.extData.recipient = recipient;
    request.extData.extAmount = "-" + std::to_string(lamports);
    request.extData.fee = std::to_string(fee);
    FillOutputs(request, sum - lamports, keypair, tree, mintAddress, encryptor);

    request.publicAmount = WithdrawPublicAmount(lamports, fee).ToDecimal();
    request.utxoPrivateKey = keypair.GetPrivateKey().ToDecimal();
    return request;
}

// ============================================================================
// Response
// ============================================================================

ProveResponse ProveResponse::FromProof(const Proof& proof, std::vector<std::string> publicSignals) {
    ProveResponse response;
    response.proof = proof;
    response.proofBytes = FormatProof(proof);
    response.publicInputsBytes = FormatPublicSignals(publicSignals);
    response.publicSignals = std::move(publicSignals);
    return response;
}

JSONValue ProveResponse::ToJSON() const {
    JSONValue::Array signals(publicSignals.begin(), publicSignals.end());

    JSONValue::Object bytes;
    bytes["proofA"] = BytesToJSONArray(proofBytes.proofA);
    bytes["proofB"] = BytesToJSONArray(proofBytes.proofB);
    bytes["proofC"] = BytesToJSONArray(proofBytes.proofC);

    JSONValue::Array inputs;
    inputs.reserve(publicInputsBytes.size());
    for (const auto& input : publicInputsBytes) {
        inputs.push_back(BytesToJSONArray(input));
    }

    JSONValue::Object obj;
    obj["proof"] = proof.ToJSON();
    obj["publicSignals"] = JSONValue(std::move(signals));
    obj["proofBytes"] = JSONValue(std::move(bytes));
    obj["publicInputsBytes"] = JSONValue(std::move(inputs));
    return JSONValue(std::move(obj));
}

} // namespace spectre
