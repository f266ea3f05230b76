#include <gtest/gtest.h>
#include "engine/tokenizer.hpp"
#include "test_helpers.hpp"

using namespace incidex::engine;
using incidex::testing::TempDir;

namespace {
    // ids: [PAD]=0 [UNK]=1 [CLS]=2 [SEP]=3 disk=4 full=5 ##s=6 !=7 server=8
    const char* kVocab = "[PAD]\n[UNK]\n[CLS]\n[SEP]\ndisk\nfull\n##s\n!\nserver\n";
}

TEST(TokenizerTest, WordPiecesAndSpecialTokens) {
    TempDir dir;
    Tokenizer tok(dir.write("vocab.txt", kVocab).string());
    EXPECT_EQ(tok.vocab_size(), 9u);
    EXPECT_EQ(tok.pad_id(), 0);

    auto ids = tok.encode("Disk FULL! servers");
    std::vector<int64_t> expected = {2, 4, 5, 7, 8, 6, 3};
    EXPECT_EQ(ids, expected);
}

TEST(TokenizerTest, UnknownWordsMapToUnk) {
    TempDir dir;
    Tokenizer tok(dir.write("vocab.txt", kVocab).string());
    auto ids = tok.encode("printer");
    std::vector<int64_t> expected = {2, 1, 3};
    EXPECT_EQ(ids, expected);
}

TEST(TokenizerTest, TruncatesToMaxLength) {
    TempDir dir;
    Tokenizer tok(dir.write("vocab.txt", kVocab).string());
    auto ids = tok.encode("disk disk disk disk disk disk", 4);
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids.front(), 2);
    EXPECT_EQ(ids.back(), 3);
}

TEST(TokenizerTest, MissingVocabIsInvalidConfig) {
    try {
        Tokenizer tok("/nonexistent/vocab.txt");
        FAIL() << "expected an error";
    } catch (const incidex::Error& e) {
        EXPECT_EQ(e.kind(), incidex::ErrorKind::InvalidConfig);
    }
}
