#ifndef __LENGTH_LOCAL_SAMPLER_H
#define __LENGTH_LOCAL_SAMPLER_H

#include <vector>
#include <random>
#include "types.h"

/*!
 * Batches of documents of similar length, drawn at random.
 *
 * Indices are sorted by length once. Every pass then repeats until the pool
 * of unused indices is empty: pick an anchor rank uniformly in the pool, take
 * the window of ranks [anchor - diversity * batch_size,
 * anchor + diversity * batch_size) clipped to the pool, draw
 * min(batch_size, window) of them uniformly without replacement and remove
 * them. Larger diversity gives more random and less homogeneous batches.
 */
class LengthLocalBatchSampler {
public:
    // Throws InvalidArgument if batch_size < 1 or diversity < 1
    LengthLocalBatchSampler(const std::vector<TLen> &lengths, int batch_size,
                            std::mt19937_64 &generator, int diversity = DIVERSITY);

    // One pass: every index exactly once, batch after batch
    std::vector<TDoc> Sample();

    // The same pass split into the drawn batches
    std::vector<std::vector<TDoc>> SampleBatches();

    // ceil(corpus size / batch size)
    size_t Length() const;

    size_t Size() const { return sorted_ids.size(); }

    int BatchSize() const { return batch_size; }

    int Diversity() const { return diversity; }

    // Indices in ascending length order, ties by index
    const std::vector<TDoc> &SortedIds() const { return sorted_ids; }

private:
    std::vector<TDoc> sorted_ids;
    int batch_size;
    int diversity;
    std::mt19937_64 &generator;
};

#endif
