// SPECTRE - Stored Notes
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/note.h"
#include "spectre/util/fs.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace spectre {

namespace {

const std::string& RequireString(const JSONValue& json, const char* key) {
    if (!json.HasKey(key) || !json[key].IsString()) {
        throw std::invalid_argument(std::string("Note field '") + key + "' must be a string");
    }
    return json[key].GetString();
}

std::optional<std::string> OptionalString(const JSONValue& json, const char* key) {
    if (!json.HasKey(key) || json[key].IsNull()) {
        return std::nullopt;
    }
    if (!json[key].IsString()) {
        throw std::invalid_argument(std::string("Note field '") + key + "' must be a string");
    }
    return json[key].GetString();
}

} // anonymous namespace

const char* TokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::SOL: return "SOL";
        case TokenType::SPL: return "SPL";
    }
    return "SOL";
}

std::optional<TokenType> ParseTokenType(const std::string& str) {
    if (str == "SOL") return TokenType::SOL;
    if (str == "SPL") return TokenType::SPL;
    return std::nullopt;
}

std::string FormatIsoTime(int64_t unixSeconds) {
    std::time_t t = static_cast<std::time_t>(unixSeconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

JSONValue StoredNote::ToJSON() const {
    JSONValue::Object obj;
    obj["id"] = id;
    obj["commitment"] = commitment;
    obj["amount"] = amount;
    obj["tokenType"] = TokenTypeToString(tokenType);
    if (tokenMint) obj["tokenMint"] = *tokenMint;
    obj["createdAt"] = createdAt;
    obj["spent"] = spent;
    if (depositSignature) obj["depositSignature"] = *depositSignature;
    return JSONValue(std::move(obj));
}

StoredNote StoredNote::FromJSON(const JSONValue& json) {
    if (!json.IsObject()) {
        throw std::invalid_argument("Note must be an object");
    }

    StoredNote note;
    note.id = RequireString(json, "id");
    note.commitment = RequireString(json, "commitment");

    if (!json.HasKey("amount") || !json["amount"].IsNumber() || json["amount"].GetInt() < 0) {
        throw std::invalid_argument("Note amount must be a non-negative number");
    }
    note.amount = static_cast<uint64_t>(json["amount"].GetInt());

    auto type = ParseTokenType(RequireString(json, "tokenType"));
    if (!type) {
        throw std::invalid_argument("Note tokenType must be SOL or SPL");
    }
    note.tokenType = *type;
    note.tokenMint = OptionalString(json, "tokenMint");
    note.createdAt = RequireString(json, "createdAt");
    note.spent = json.HasKey("spent") && json["spent"].GetBool();
    note.depositSignature = OptionalString(json, "depositSignature");
    return note;
}

// ============================================================================
// Note Book
// ============================================================================

bool NoteBook::Add(const StoredNote& note) {
    if (FindByCommitment(note.commitment)) {
        return false;
    }
    notes_.push_back(note);
    return true;
}

bool NoteBook::Remove(const std::string& id) {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [&](const StoredNote& n) { return n.id == id; });
    if (it == notes_.end()) {
        return false;
    }
    notes_.erase(it);
    return true;
}

bool NoteBook::MarkSpent(const std::string& id) {
    for (auto& note : notes_) {
        if (note.id == id) {
            note.spent = true;
            return true;
        }
    }
    return false;
}

const StoredNote* NoteBook::Find(const std::string& id) const {
    for (const auto& note : notes_) {
        if (note.id == id) return &note;
    }
    return nullptr;
}

const StoredNote* NoteBook::FindByCommitment(const std::string& commitment) const {
    for (const auto& note : notes_) {
        if (note.commitment == commitment) return &note;
    }
    return nullptr;
}

std::vector<StoredNote> NoteBook::GetUnspent() const {
    std::vector<StoredNote> result;
    std::copy_if(notes_.begin(), notes_.end(), std::back_inserter(result),
                 [](const StoredNote& n) { return !n.spent; });
    return result;
}

uint64_t NoteBook::UnspentBalance(TokenType type) const {
    uint64_t total = 0;
    for (const auto& note : notes_) {
        if (!note.spent && note.tokenType == type) {
            total += note.amount;
        }
    }
    return total;
}

std::string NoteBook::ExportUnspent() const {
    JSONValue::Array arr;
    for (const auto& note : notes_) {
        if (!note.spent) arr.push_back(note.ToJSON());
    }
    return JSONValue(std::move(arr)).ToJSON(true);
}

size_t NoteBook::Import(const std::string& json) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed || !parsed->IsArray()) {
        throw std::invalid_argument("Invalid notes file: expected a JSON array");
    }

    // Decode everything first so a bad entry imports nothing
    std::vector<StoredNote> incoming;
    for (const auto& entry : parsed->GetArray()) {
        incoming.push_back(StoredNote::FromJSON(entry));
    }

    size_t added = 0;
    for (const auto& note : incoming) {
        if (Add(note)) ++added;
    }
    return added;
}

std::string NoteBook::Serialize() const {
    JSONValue::Array arr;
    for (const auto& note : notes_) {
        arr.push_back(note.ToJSON());
    }
    return JSONValue(std::move(arr)).ToJSON(true);
}

NoteBook NoteBook::Load(const std::string& path) {
    NoteBook book;
    std::ifstream in(path);
    if (!in) {
        return book;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string text = buffer.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return book;
    }
    book.Import(text);
    return book;
}

void NoteBook::Save(const std::string& path) const {
    // Owner-only temp file renamed over the old book
    util::fs::Path tmp = path + ".tmp";
    if (!util::fs::SecureWriteFile(tmp, Serialize() + "\n")) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Cannot write notes to " + path);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Failed writing notes to " + path + ": " + ec.message());
    }
}

} // namespace spectre
