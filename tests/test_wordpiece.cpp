#include <gtest/gtest.h>
#include "nlp/WordPieceTokenizer.hpp"
#include "util/Uuid.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class WordPieceTest : public ::testing::Test {
protected:
    fs::path vocab;

    void SetUp() override {
        vocab = fs::temp_directory_path() / ("vocab-" + util::new_id() + ".txt");
        std::ofstream out(vocab);
        // ids follow line order
        for (const char* t : {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "omar", "works", "at", "ac", "##me", ".", "Omar"}) {
            out << t << "\n";
        }
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(vocab, ec);
    }
};

TEST_F(WordPieceTest, LoadsVocabulary) {
    nlp::WordPieceTokenizer tok;
    ASSERT_TRUE(tok.load_vocab(vocab.string()));
    EXPECT_EQ(tok.vocab_size(), 11u);
    EXPECT_EQ(tok.pad_id(), 0);
    EXPECT_EQ(tok.unk_id(), 1);
    EXPECT_EQ(tok.cls_id(), 2);
    EXPECT_EQ(tok.sep_id(), 3);
    EXPECT_FALSE(tok.load_vocab("/nonexistent/vocab.txt"));
}

TEST_F(WordPieceTest, OffsetsPointIntoOriginalText) {
    nlp::WordPieceTokenizer tok(true);
    ASSERT_TRUE(tok.load_vocab(vocab.string()));

    const std::string text = "Omar works at Acme.";
    auto pieces = tok.encode_with_offsets(text, 32);

    // [CLS] omar works at ac ##me . [SEP]
    ASSERT_EQ(pieces.size(), 8u);
    EXPECT_TRUE(pieces.front().special);
    EXPECT_TRUE(pieces.back().special);
    EXPECT_EQ(pieces[1].id, 4);
    EXPECT_EQ(text.substr(pieces[1].start, pieces[1].end - pieces[1].start), "Omar");
    EXPECT_EQ(pieces[4].id, 7);
    EXPECT_EQ(pieces[4].start, 14u);
    EXPECT_EQ(pieces[4].end, 16u);
    EXPECT_FALSE(pieces[4].continuation);
    EXPECT_EQ(pieces[5].id, 8);
    EXPECT_EQ(pieces[5].start, 16u);
    EXPECT_EQ(pieces[5].end, 18u);
    EXPECT_TRUE(pieces[5].continuation);
    EXPECT_EQ(pieces[6].id, 9);
}

TEST_F(WordPieceTest, CasedVocabularyKeepsCase) {
    nlp::WordPieceTokenizer tok(false);
    ASSERT_TRUE(tok.load_vocab(vocab.string()));

    auto ids = tok.encode("Omar Zed", 16);
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids[1], 10);
    EXPECT_EQ(ids[2], tok.unk_id());
}

TEST_F(WordPieceTest, UnknownWordCoversWholeWord) {
    nlp::WordPieceTokenizer tok;
    ASSERT_TRUE(tok.load_vocab(vocab.string()));

    auto pieces = tok.encode_with_offsets("at xyzzy", 16);
    ASSERT_EQ(pieces.size(), 4u);
    EXPECT_EQ(pieces[2].id, tok.unk_id());
    EXPECT_EQ(pieces[2].start, 3u);
    EXPECT_EQ(pieces[2].end, 8u);
}

TEST_F(WordPieceTest, TruncatesKeepingSep) {
    nlp::WordPieceTokenizer tok;
    ASSERT_TRUE(tok.load_vocab(vocab.string()));

    auto ids = tok.encode("omar works at omar works at", 4);
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids.front(), tok.cls_id());
    EXPECT_EQ(ids.back(), tok.sep_id());
}

TEST_F(WordPieceTest, NeverExceedsTinyMaxLen) {
    nlp::WordPieceTokenizer tok;
    ASSERT_TRUE(tok.load_vocab(vocab.string()));

    EXPECT_TRUE(tok.encode_with_offsets("omar works", 0).empty());
    EXPECT_TRUE(tok.encode_with_offsets("omar works", 1).empty());

    auto ids = tok.encode("omar works", 2);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], tok.cls_id());
    EXPECT_EQ(ids[1], tok.sep_id());
}
