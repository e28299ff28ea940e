#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "review_corpus.h"
#include "errors.h"
#include "test_helpers.h"
#include <algorithm>

using ::testing::EndsWith;
using ::testing::HasSubstr;

class ReviewCorpusTest : public ::testing::Test {
protected:
    virtual void SetUp() {
        vocab_path = dir.WriteVocab({"good", "bad", "movie", "plot", "acting"});
        root = dir.MakeSplit("train");
        dir.WriteFile("train/neg/0_2.txt", "Bad movie. Bad plot.");
        dir.WriteFile("train/neg/1_1.txt", "Bad acting!<br /><br />Bad bad bad.");
        dir.WriteFile("train/pos/0_9.txt", "Good movie.");
        dir.WriteFile("train/pos/1_10.txt", "Good plot. Good acting. Good movie!");
        dir.WriteFile("train/pos/2_8.txt", "Unknown words only.");
        dir.WriteFile("train/pos/notes.txt", "good good good");
    }

    TempDir dir;
    std::string vocab_path;
    std::string root;
};

TEST_F(ReviewCorpusTest, LoadsNegThenPos) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);

    ASSERT_EQ(corpus.Size(), 5u);
    EXPECT_EQ(corpus.NumSkipped(), 0u);
    for (TDoc d = 0; d < 2; d++) {
        EXPECT_EQ(corpus.Labels()[d], LABEL_NEG);
        EXPECT_THAT(corpus.Path(d), HasSubstr("/neg/"));
    }
    for (TDoc d = 2; d < 5; d++) {
        EXPECT_EQ(corpus.Labels()[d], LABEL_POS);
        EXPECT_THAT(corpus.Path(d), HasSubstr("/pos/"));
        EXPECT_THAT(corpus.Path(d), EndsWith(".txt"));
    }
}

TEST_F(ReviewCorpusTest, ItemStatisticsMatchText) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);

    ASSERT_EQ(corpus.TxtLens().size(), corpus.Size());
    for (TDoc d = 0; d < corpus.Size(); d++) {
        auto item = corpus.Get(d);
        EXPECT_EQ(item->txt_len, item->txt.size());
        EXPECT_EQ(item->txt_len, corpus.TxtLens()[d]);
        TLen longest = 0;
        for (auto &snt: item->txt)
            longest = std::max(longest, (TLen) snt.size());
        EXPECT_EQ(item->snt_len, longest);
        EXPECT_EQ(item->label, corpus.Labels()[d]);
    }
}

TEST_F(ReviewCorpusTest, ReviewContents) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);

    bool seen_long = false, seen_unknown = false;
    for (TDoc d = 0; d < corpus.Size(); d++) {
        auto item = corpus.Get(d);
        if (corpus.Path(d).find("1_10.txt") != std::string::npos) {
            seen_long = true;
            EXPECT_EQ(item->txt_len, 3u);
            EXPECT_EQ(item->snt_len, 2u);
            EXPECT_EQ(item->txt[1], (TSentence{1, 5}));
        }
        if (corpus.Path(d).find("2_8.txt") != std::string::npos) {
            seen_unknown = true;
            EXPECT_EQ(item->txt_len, 1u);
            EXPECT_EQ(item->snt_len, 0u);
        }
    }
    EXPECT_TRUE(seen_long);
    EXPECT_TRUE(seen_unknown);
}

TEST_F(ReviewCorpusTest, GetIsMemoized) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);

    EXPECT_EQ(corpus.CacheSize(), 0u);
    auto first = corpus.Get(3);
    auto second = corpus.Get(3);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->txt, second->txt);
    EXPECT_EQ(corpus.CacheSize(), 1u);
}

TEST_F(ReviewCorpusTest, SmallCacheStillServesEqualItems) {
    ReviewCorpus corpus(Vocab::Load(vocab_path), SNT_CLIP, TXT_CLIP, 1);
    corpus.Load(root);

    auto first = corpus.Get(0);
    for (TDoc d = 1; d < corpus.Size(); d++)
        corpus.Get(d);
    auto again = corpus.Get(0);
    EXPECT_EQ(first->txt, again->txt);
    EXPECT_EQ(first->label, again->label);
    EXPECT_LE(corpus.CacheSize(), corpus.Size());
}

TEST_F(ReviewCorpusTest, OutOfRange) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);
    EXPECT_THROW(corpus.Get(corpus.Size()), IndexOutOfRange);
    EXPECT_THROW(corpus.Path(100), IndexOutOfRange);
}

TEST_F(ReviewCorpusTest, SkipsEmptyDocuments) {
    dir.WriteFile("train/neg/5_1.txt", "");
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);
    EXPECT_EQ(corpus.Size(), 5u);
    EXPECT_EQ(corpus.NumSkipped(), 1u);
}

TEST_F(ReviewCorpusTest, MissingDirectories) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    EXPECT_THROW(corpus.Load(dir.path + "/nowhere"), MissingResource);

    auto partial = dir.path + "/partial";
    dir.MakeDir("partial");
    dir.MakeDir("partial/neg");
    EXPECT_THROW(corpus.Load(partial), MissingResource);
    EXPECT_EQ(corpus.Size(), 0u);
}

TEST_F(ReviewCorpusTest, UnreadableDocumentFailsLoad) {
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);
    ASSERT_EQ(corpus.Size(), 5u);

    ASSERT_EQ(symlink((dir.path + "/gone.txt").c_str(), (root + "/neg/2_1.txt").c_str()), 0);
    EXPECT_THROW(corpus.Load(root), MissingResource);
    EXPECT_EQ(corpus.Size(), 5u);
    EXPECT_EQ(corpus.Get(0)->label, LABEL_NEG);
}

TEST_F(ReviewCorpusTest, HiddenReviewFilesAreLoaded) {
    dir.WriteFile("train/pos/.3_7.txt", "Good plot.");
    ReviewCorpus corpus(Vocab::Load(vocab_path));
    corpus.Load(root);
    EXPECT_EQ(corpus.Size(), 6u);
}

TEST_F(ReviewCorpusTest, TrainAndTestShareVocabulary) {
    dir.MakeSplit("test");
    dir.WriteFile("test/neg/0_1.txt", "Bad.");
    dir.WriteFile("test/pos/0_10.txt", "Good!");

    auto datasets = LoadDatasets(dir.path);
    EXPECT_EQ(datasets.first->Size(), 5u);
    EXPECT_EQ(datasets.second->Size(), 2u);
    EXPECT_EQ(datasets.first->GetVocab().get(), datasets.second->GetVocab().get());

    auto test_set = LoadTestDataset(dir.path);
    EXPECT_EQ(test_set->Size(), 2u);
    EXPECT_EQ(test_set->Get(0)->label, LABEL_NEG);
    EXPECT_EQ(test_set->Get(1)->label, LABEL_POS);
}

TEST(ReviewCorpus, MissingVocabulary) {
    TempDir dir;
    EXPECT_THROW(LoadDatasets(dir.path), MissingResource);
    dir.MakeDir("imdb.vocab");
    EXPECT_THROW(LoadDatasets(dir.path), MissingResource);
}
