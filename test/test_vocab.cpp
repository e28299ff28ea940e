#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "vocab.h"
#include "errors.h"
#include "test_helpers.h"
#include <set>

TEST(Vocab, IdsFollowFileOrder) {
    TempDir dir;
    auto path = dir.WriteVocab({"the", "good", "bad", "movie"});
    auto vocab = Vocab::Load(path);

    EXPECT_EQ(vocab->Size(), 4u);
    EXPECT_EQ(vocab->Id("the"), 1u);
    EXPECT_EQ(vocab->Id("good"), 2u);
    EXPECT_EQ(vocab->Id("bad"), 3u);
    EXPECT_EQ(vocab->Id("movie"), 4u);
    EXPECT_EQ(vocab->Id("film"), (TWord) PAD_ID);
    EXPECT_FALSE(vocab->Contains("film"));
}

TEST(Vocab, IdsAreABijectionWithoutZero) {
    std::vector<std::string> words;
    for (int i = 0; i < 500; i++)
        words.push_back("w" + std::to_string(i));
    auto vocab = Vocab::FromWords(words);

    std::set<TWord> ids;
    for (auto &entry: vocab->word2id) {
        EXPECT_NE(entry.second, (TWord) PAD_ID);
        EXPECT_LE(entry.second, 500u);
        ids.insert(entry.second);
    }
    EXPECT_EQ(ids.size(), 500u);
}

TEST(Vocab, WindowsLineEndings) {
    TempDir dir;
    auto path = dir.WriteFile("imdb.vocab", "good\r\nbad\r\n");
    auto vocab = Vocab::Load(path);
    EXPECT_EQ(vocab->Size(), 2u);
    EXPECT_EQ(vocab->Id("bad"), 2u);
}

TEST(Vocab, MissingFile) {
    EXPECT_THROW(Vocab::Load("/nonexistent/imdb.vocab"), MissingResource);
}

TEST(Vocab, DirectoryIsNotAVocabulary) {
    TempDir dir;
    EXPECT_THROW(Vocab::Load(dir.MakeDir("imdb.vocab")), MissingResource);
}
