// SPECTRE - Stored Note Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/shield/note.h"
#include "spectre/util/fs.h"

#include <stdexcept>

#include <sys/stat.h>

namespace spectre {
namespace test {

namespace {

StoredNote MakeNote(const std::string& id, const std::string& commitment, uint64_t amount,
                    TokenType type = TokenType::SOL) {
    StoredNote note;
    note.id = id;
    note.commitment = commitment;
    note.amount = amount;
    note.tokenType = type;
    note.createdAt = FormatIsoTime(1706702400);
    return note;
}

} // namespace

// ============================================================================
// StoredNote
// ============================================================================

TEST(StoredNoteTest, FormatIsoTime) {
    EXPECT_EQ(FormatIsoTime(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatIsoTime(1706702400), "2024-01-31T12:00:00Z");
}

TEST(StoredNoteTest, JSONRoundTripKeepsOptionals) {
    StoredNote note = MakeNote("n1", "123", 5000000, TokenType::SPL);
    note.tokenMint = "EPjFWdd5AufqSSqeM2qN1xzybapC2G7wEGGkZwyTDt1v";
    note.depositSignature = "5sig";
    note.spent = true;

    StoredNote back = StoredNote::FromJSON(note.ToJSON());
    EXPECT_EQ(back.id, "n1");
    EXPECT_EQ(back.amount, 5000000u);
    EXPECT_EQ(back.tokenType, TokenType::SPL);
    EXPECT_TRUE(back.tokenMint == note.tokenMint);
    EXPECT_TRUE(back.depositSignature == note.depositSignature);
    EXPECT_TRUE(back.spent);
    EXPECT_EQ(back.createdAt, "2024-01-31T12:00:00Z");
}

TEST(StoredNoteTest, FromJSONRejectsBadFields) {
    JSONValue base = MakeNote("n1", "123", 1).ToJSON();

    JSONValue noId = base;
    JSONValue::Object obj = noId.GetObject();
    obj.erase("id");
    EXPECT_THROW(StoredNote::FromJSON(JSONValue(obj)), std::invalid_argument);

    JSONValue badType = base;
    badType["tokenType"] = "ETH";
    EXPECT_THROW(StoredNote::FromJSON(badType), std::invalid_argument);

    JSONValue negative = base;
    negative["amount"] = -1;
    EXPECT_THROW(StoredNote::FromJSON(negative), std::invalid_argument);

    EXPECT_THROW(StoredNote::FromJSON(JSONValue("note")), std::invalid_argument);
}

// ============================================================================
// NoteBook
// ============================================================================

TEST(NoteBookTest, AddDeduplicatesByCommitment) {
    NoteBook book;
    EXPECT_TRUE(book.Add(MakeNote("a", "c1", 10)));
    EXPECT_FALSE(book.Add(MakeNote("b", "c1", 20)));
    EXPECT_EQ(book.GetNotes().size(), 1u);
    ASSERT_NE(book.FindByCommitment("c1"), nullptr);
    EXPECT_EQ(book.FindByCommitment("c1")->id, "a");
}

TEST(NoteBookTest, SpentNotesLeaveBalance) {
    NoteBook book;
    book.Add(MakeNote("a", "c1", 10));
    book.Add(MakeNote("b", "c2", 20));
    book.Add(MakeNote("c", "c3", 7, TokenType::SPL));

    EXPECT_EQ(book.UnspentBalance(TokenType::SOL), 30u);
    EXPECT_TRUE(book.MarkSpent("a"));
    EXPECT_FALSE(book.MarkSpent("zzz"));
    EXPECT_EQ(book.UnspentBalance(TokenType::SOL), 20u);
    EXPECT_EQ(book.UnspentBalance(TokenType::SPL), 7u);
    EXPECT_EQ(book.GetUnspent().size(), 2u);

    // Spent notes stay in the book until removed explicitly
    EXPECT_EQ(book.GetNotes().size(), 3u);
    EXPECT_TRUE(book.Remove("a"));
    EXPECT_FALSE(book.Remove("a"));
    EXPECT_EQ(book.Find("a"), nullptr);
}

TEST(NoteBookTest, ExportImportUnspent) {
    NoteBook source;
    source.Add(MakeNote("a", "c1", 10));
    source.Add(MakeNote("b", "c2", 20));
    source.MarkSpent("b");

    NoteBook target;
    target.Add(MakeNote("x", "c1", 10));
    EXPECT_EQ(target.Import(source.ExportUnspent()), 0u);

    NoteBook fresh;
    EXPECT_EQ(fresh.Import(source.ExportUnspent()), 1u);
    EXPECT_NE(fresh.Find("a"), nullptr);
    EXPECT_EQ(fresh.Find("b"), nullptr);
}

TEST(NoteBookTest, ImportIsAllOrNothing) {
    NoteBook book;
    EXPECT_THROW(book.Import("{}"), std::invalid_argument);
    EXPECT_THROW(book.Import("not json"), std::invalid_argument);
    EXPECT_THROW(book.Import(R"([{"id":"a","commitment":"c","amount":1,"tokenType":"SOL","createdAt":"t"},{"id":"b"}])"),
                 std::invalid_argument);
    EXPECT_TRUE(book.GetNotes().empty());
}

TEST(NoteBookTest, SaveAndLoad) {
    util::fs::TempDirectory dir;
    ASSERT_TRUE(dir.IsValid());
    auto path = (dir.GetPath() / "notes.json").string();

    EXPECT_TRUE(NoteBook::Load(path).GetNotes().empty());

    NoteBook book;
    book.Add(MakeNote("a", "c1", 10));
    book.Add(MakeNote("b", "c2", 20));
    book.MarkSpent("b");
    book.Save(path);

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    NoteBook loaded = NoteBook::Load(path);
    ASSERT_EQ(loaded.GetNotes().size(), 2u);
    EXPECT_TRUE(loaded.Find("b")->spent);
    EXPECT_EQ(loaded.UnspentBalance(TokenType::SOL), 10u);
}

TEST(NoteBookTest, SaveToMissingDirectoryThrows) {
    NoteBook book;
    EXPECT_THROW(book.Save("/nonexistent-dir-for-spectre-tests/notes.json"), std::runtime_error);
}

} // namespace test
} // namespace spectre
