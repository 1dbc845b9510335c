// SPECTRE - Groth16 Proof Encoding
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/prover/proof.h"
#include "spectre/prover/errors.h"

#include <algorithm>
#include <stdexcept>

namespace spectre {

namespace {

Uint256 ParseCoordinate(const JSONValue& value, const char* field) {
    auto text = value.AsScalarText();
    if (!text) {
        throw FormattingError(std::string("Proof field ") + field + " holds a non-scalar value");
    }
    try {
        return Uint256::FromDecimal(*text);
    } catch (const std::invalid_argument&) {
        throw FormattingError(std::string("Proof field ") + field + " is not a decimal: " + *text);
    } catch (const std::out_of_range&) {
        throw FormattingError(std::string("Proof field ") + field + " exceeds 256 bits");
    }
}

const JSONValue& RequireArray(const JSONValue& value, size_t minSize, const char* field) {
    if (!value.IsArray() || value.Size() < minSize) {
        throw FormattingError(std::string("Proof field ") + field + " must be an array of at least " +
                              std::to_string(minSize) + " elements");
    }
    return value;
}

G1Point ParseG1(const JSONValue& json, const char* field) {
    const JSONValue& arr = RequireArray(json, 2, field);
    G1Point p;
    p.x = ParseCoordinate(arr[0], field);
    p.y = ParseCoordinate(arr[1], field);
    if (arr.Size() > 2) {
        p.z = ParseCoordinate(arr[2], field);
    }
    return p;
}

std::array<Uint256, 2> ParseFq2(const JSONValue& json, const char* field) {
    const JSONValue& arr = RequireArray(json, 2, field);
    return {ParseCoordinate(arr[0], field), ParseCoordinate(arr[1], field)};
}

JSONValue G1ToJSON(const G1Point& p) {
    JSONValue::Array arr{p.x.ToDecimal(), p.y.ToDecimal(), p.z.ToDecimal()};
    return JSONValue(std::move(arr));
}

JSONValue Fq2ToJSON(const std::array<Uint256, 2>& v) {
    JSONValue::Array arr{v[0].ToDecimal(), v[1].ToDecimal()};
    return JSONValue(std::move(arr));
}

/// Write value as 32 big-endian bytes at out
void PutBigEndian(const Uint256& value, Byte* out) {
    auto be = value.ToBigEndian();
    std::copy(be.begin(), be.end(), out);
}

/// Little-endian (c0 || c1), reversed as one 64-byte block
void PutFq2Reversed(const std::array<Uint256, 2>& v, Byte* out) {
    std::array<Byte, 64> le;
    auto c0 = v[0].ToBytes();
    auto c1 = v[1].ToBytes();
    std::copy(c0.begin(), c0.end(), le.begin());
    std::copy(c1.begin(), c1.end(), le.begin() + 32);
    std::reverse_copy(le.begin(), le.end(), out);
}

} // anonymous namespace

JSONValue Proof::ToJSON() const {
    JSONValue::Array pib{Fq2ToJSON(b.x), Fq2ToJSON(b.y), Fq2ToJSON(b.z)};

    JSONValue::Object obj;
    obj["pi_a"] = G1ToJSON(a);
    obj["pi_b"] = JSONValue(std::move(pib));
    obj["pi_c"] = G1ToJSON(c);
    return JSONValue(std::move(obj));
}

Proof ParseSnarkjsProof(const JSONValue& json) {
    if (!json.IsObject() || !json.HasKey("pi_a") || !json.HasKey("pi_b") || !json.HasKey("pi_c")) {
        throw FormattingError("Proof must be an object with pi_a, pi_b and pi_c");
    }

    Proof proof;
    proof.a = ParseG1(json["pi_a"], "pi_a");
    proof.c = ParseG1(json["pi_c"], "pi_c");

    const JSONValue& pib = RequireArray(json["pi_b"], 2, "pi_b");
    proof.b.x = ParseFq2(pib[0], "pi_b");
    proof.b.y = ParseFq2(pib[1], "pi_b");
    if (pib.Size() > 2) {
        proof.b.z = ParseFq2(pib[2], "pi_b");
    }
    return proof;
}

std::vector<std::string> ParseSnarkjsPublicSignals(const JSONValue& json) {
    if (!json.IsArray()) {
        throw FormattingError("Public signals must be an array");
    }
    std::vector<std::string> signals;
    signals.reserve(json.Size());
    for (const auto& entry : json.GetArray()) {
        auto text = entry.AsScalarText();
        if (!text || text->empty() ||
            !std::all_of(text->begin(), text->end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
            throw FormattingError("Public signal is not a decimal string");
        }
        signals.push_back(*text);
    }
    return signals;
}

FormattedProof FormatProof(const Proof& proof) {
    FormattedProof out;

    PutBigEndian(proof.a.x, out.proofA.data());
    PutBigEndian(proof.a.y, out.proofA.data() + 32);

    PutFq2Reversed(proof.b.x, out.proofB.data());
    PutFq2Reversed(proof.b.y, out.proofB.data() + 64);

    PutBigEndian(proof.c.x, out.proofC.data());
    PutBigEndian(proof.c.y, out.proofC.data() + 32);

    return out;
}

std::vector<PublicInputBytes> FormatPublicSignals(const std::vector<std::string>& signals) {
    std::vector<PublicInputBytes> out;
    out.reserve(signals.size());
    for (const auto& signal : signals) {
        PublicInputBytes bytes;
        PutBigEndian(ParseCoordinate(JSONValue(signal), "publicSignals"), bytes.data());
        out.push_back(bytes);
    }
    return out;
}

} // namespace spectre
