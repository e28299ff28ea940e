#include "gtest/gtest.h"
#include "batch_loader.h"
#include "errors.h"
#include "test_helpers.h"
#include <algorithm>
#include <stdexcept>

class BatchLoaderTest : public ::testing::Test {
protected:
    virtual void SetUp() {
        dir.WriteVocab({"good", "bad", "movie", "plot"});
        dir.MakeSplit("train");
        dir.MakeSplit("test");
        for (int i = 0; i < 21; i++) {
            std::string text;
            for (int s = 0; s <= i % 5; s++)
                text += (i % 2 ? "Good movie. " : "Bad plot, bad movie! ");
            auto name = std::to_string(i) + "_" + std::to_string(i % 2 ? 8 : 2) + ".txt";
            dir.WriteFile((i % 2 ? "train/pos/" : "train/neg/") + name, text);
        }
        dir.WriteFile("test/neg/0_1.txt", "Bad.");
        dir.WriteFile("test/pos/0_10.txt", "Good movie. Good plot.");
        dir.WriteFile("test/pos/1_9.txt", "Good.");

        auto datasets = LoadDatasets(dir.path);
        train_set = std::move(datasets.first);
        test_set = std::move(datasets.second);
    }

    TempDir dir;
    ReviewCorpusPtr train_set, test_set;
};

TEST_F(BatchLoaderTest, EpochCoversCorpusOnce) {
    BatchLoader loader(*train_set, 4, 2, 11);
    EXPECT_EQ(loader.NumBatches(), 6u);
    EXPECT_EQ(loader.DatasetSize(), 21u);

    std::vector<TDoc> seen;
    size_t num_batches = 0;
    while (loader.HasNext()) {
        auto batch = loader.NextBatch();
        auto &ids = loader.LastBatchIds();
        ASSERT_EQ(batch.NumDocs(), ids.size());
        for (size_t i = 0; i < ids.size(); i++) {
            auto item = train_set->Get(ids[i]);
            EXPECT_FLOAT_EQ(batch.targets((Eigen::Index) i, 0), (float) item->label);
            EXPECT_GE(batch.MaxTxt(), item->txt_len);
            EXPECT_GE(batch.MaxSnt(), item->snt_len);
        }
        seen.insert(seen.end(), ids.begin(), ids.end());
        num_batches++;
    }
    EXPECT_EQ(num_batches, 6u);
    std::sort(seen.begin(), seen.end());
    ASSERT_EQ(seen.size(), 21u);
    for (TDoc d = 0; d < seen.size(); d++)
        EXPECT_EQ(seen[d], d);
}

TEST_F(BatchLoaderTest, ExhaustedUntilReset) {
    BatchLoader loader(*test_set, 2, 1);
    loader.NextBatch();
    loader.NextBatch();
    EXPECT_FALSE(loader.HasNext());
    EXPECT_THROW(loader.NextBatch(), std::runtime_error);

    loader.Reset();
    EXPECT_TRUE(loader.HasNext());
    EXPECT_EQ(loader.NextBatch().NumDocs(), 2u);
}

TEST_F(BatchLoaderTest, SameSeedSameBatches) {
    BatchLoader a(*train_set, 5, 3, 7);
    BatchLoader b(*train_set, 5, 1, 7);
    while (a.HasNext()) {
        ASSERT_TRUE(b.HasNext());
        auto batch_a = a.NextBatch();
        auto batch_b = b.NextBatch();
        EXPECT_EQ(a.LastBatchIds(), b.LastBatchIds());
        EXPECT_EQ(batch_a.MaxTxt(), batch_b.MaxTxt());
        EXPECT_EQ(batch_a.MaxSnt(), batch_b.MaxSnt());
    }
    EXPECT_FALSE(b.HasNext());
}

TEST_F(BatchLoaderTest, MakeLoaders) {
    auto loaders = MakeLoaders(*train_set, *test_set, 8, 2, 3);
    EXPECT_EQ(loaders.first->DatasetSize(), 21u);
    EXPECT_EQ(loaders.first->NumBatches(), 3u);
    EXPECT_EQ(loaders.second->DatasetSize(), 3u);
    EXPECT_EQ(loaders.second->NumBatches(), 1u);

    auto batch = loaders.second->NextBatch();
    EXPECT_EQ(batch.NumDocs(), 3u);
    EXPECT_EQ(batch.MaxTxt(), 2u);
    EXPECT_FALSE(loaders.second->HasNext());
}

TEST_F(BatchLoaderTest, InvalidArguments) {
    EXPECT_THROW(BatchLoader(*train_set, 4, 0), InvalidArgument);
    EXPECT_THROW(BatchLoader(*train_set, 0, 2), InvalidArgument);
    EXPECT_THROW(BatchLoader(*train_set, 4, 2, 0, 0), InvalidArgument);
}
