#ifndef __BATCH_LOADER_H
#define __BATCH_LOADER_H

#include <memory>
#include <random>
#include <vector>
#include <utility>
#include "types.h"
#include "review_corpus.h"
#include "length_local_sampler.h"
#include "collator.h"

/*!
 * Epochs of collated batches over one corpus in length-local order.
 * Items of a batch are fetched by up to num_workers OpenMP threads; they only
 * read the corpus and its vocabulary.
 */
class BatchLoader {
public:
    BatchLoader(ReviewCorpus &corpus, int batch_size, int num_workers = 4,
                uint64_t seed = 0, int diversity = DIVERSITY);

    BatchLoader(const BatchLoader &) = delete;
    BatchLoader &operator=(const BatchLoader &) = delete;

    bool HasNext() const { return current < batches.size(); }

    Batch NextBatch();

    // Start a new epoch with a freshly sampled order
    void Reset();

    size_t NumBatches() const { return sampler.Length(); }

    size_t DatasetSize() const { return corpus.Size(); }

    // corpus indices of the batch last returned by NextBatch
    const std::vector<TDoc> &LastBatchIds() const { return last_ids; }

private:
    ReviewCorpus &corpus;
    int num_workers;
    std::mt19937_64 generator;
    LengthLocalBatchSampler sampler;

    std::vector<std::vector<TDoc>> batches;
    size_t current;
    std::vector<TDoc> last_ids;
};

typedef std::unique_ptr<BatchLoader> BatchLoaderPtr;

// Train and test loaders; the test loader draws from seed + 1
std::pair<BatchLoaderPtr, BatchLoaderPtr> MakeLoaders(ReviewCorpus &train_set,
                                                      ReviewCorpus &test_set,
                                                      int batch_size, int num_workers = 4,
                                                      uint64_t seed = 0,
                                                      int diversity = DIVERSITY);

#endif
