// SPECTRE - Stored Notes
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Persistence-facing projection of the user's notes. Holds only public
// data (commitment, amount, timestamps), never keys or blindings.

#ifndef SPECTRE_SHIELD_NOTE_H
#define SPECTRE_SHIELD_NOTE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "spectre/core/json.h"

namespace spectre {

enum class TokenType {
    SOL,
    SPL
};

const char* TokenTypeToString(TokenType type);
std::optional<TokenType> ParseTokenType(const std::string& str);

struct StoredNote {
    std::string id;
    std::string commitment;
    uint64_t amount{0};
    TokenType tokenType{TokenType::SOL};
    std::optional<std::string> tokenMint;
    /// ISO-8601 creation time
    std::string createdAt;
    bool spent{false};
    std::optional<std::string> depositSignature;

    JSONValue ToJSON() const;

    /// @throws std::invalid_argument on missing or mistyped fields
    static StoredNote FromJSON(const JSONValue& json);
};

/// ISO-8601 UTC rendering of a unix timestamp ("2024-01-31T12:00:00Z")
std::string FormatIsoTime(int64_t unixSeconds);

// ============================================================================
// Note Book
// ============================================================================

class NoteBook {
public:
    NoteBook() = default;

    /// Add a note; returns false if one with the same commitment exists
    bool Add(const StoredNote& note);

    /// Explicit user removal. Returns false if the id is unknown.
    bool Remove(const std::string& id);

    /// Flip spent after a successful unshield. Returns false if unknown.
    bool MarkSpent(const std::string& id);

    const StoredNote* Find(const std::string& id) const;
    const StoredNote* FindByCommitment(const std::string& commitment) const;

    const std::vector<StoredNote>& GetNotes() const { return notes_; }
    std::vector<StoredNote> GetUnspent() const;

    /// Sum of unspent amounts for a token type
    uint64_t UnspentBalance(TokenType type) const;

    /// Unspent notes as a JSON array
    std::string ExportUnspent() const;

    /**
     * Import a JSON array of notes, skipping commitments already present.
     * Returns the number of notes added.
     * @throws std::invalid_argument if the text is not an array of notes
     */
    size_t Import(const std::string& json);

    /// Whole book as a JSON array
    std::string Serialize() const;

    /// Load a book written by Save(); a missing file is an empty book
    static NoteBook Load(const std::string& path);

    /// @throws std::runtime_error if the file cannot be written
    void Save(const std::string& path) const;

private:
    std::vector<StoredNote> notes_;
};

} // namespace spectre

#endif // SPECTRE_SHIELD_NOTE_H
