#include "length_local_sampler.h"
#include "rank_pool.h"
#include "errors.h"
#include <algorithm>
#include <numeric>
#include <string>

using namespace std;

LengthLocalBatchSampler::LengthLocalBatchSampler(const vector<TLen> &lengths, int batch_size,
                                                 mt19937_64 &generator, int diversity)
        : batch_size(batch_size), diversity(diversity), generator(generator) {
    if (batch_size < 1)
        throw InvalidArgument("batch_size must be at least 1, got " + to_string(batch_size));
    if (diversity < 1)
        throw InvalidArgument("diversity must be at least 1, got " + to_string(diversity));

    sorted_ids.resize(lengths.size());
    iota(sorted_ids.begin(), sorted_ids.end(), 0);
    stable_sort(sorted_ids.begin(), sorted_ids.end(),
                [&](TDoc a, TDoc b) { return lengths[a] < lengths[b]; });
}

size_t LengthLocalBatchSampler::Length() const {
    return (sorted_ids.size() + batch_size - 1) / batch_size;
}

vector<vector<TDoc>> LengthLocalBatchSampler::SampleBatches() {
    vector<vector<TDoc>> batches;
    batches.reserve(Length());

    RankPool pool(sorted_ids.size());
    size_t half_window = (size_t) diversity * batch_size;
    vector<size_t> ranks;
    vector<size_t> positions;
    while (!pool.Empty()) {
        size_t pool_size = pool.Size();
        uniform_int_distribution<size_t> anchor_dist(0, pool_size - 1);
        size_t anchor = anchor_dist(generator);
        size_t lb = anchor > half_window ? anchor - half_window : 0;
        size_t rb = min(pool_size, anchor + half_window);
        size_t window = rb - lb;
        size_t m = min((size_t) batch_size, window);

        // partial Fisher-Yates over the window ranks
        ranks.resize(window);
        iota(ranks.begin(), ranks.end(), lb);
        for (size_t j = 0; j < m; j++) {
            uniform_int_distribution<size_t> pick(j, window - 1);
            swap(ranks[j], ranks[pick(generator)]);
        }

        // resolve every rank before removing anything
        positions.resize(m);
        for (size_t j = 0; j < m; j++)
            positions[j] = pool.Select(ranks[j]);

        vector<TDoc> batch(m);
        for (size_t j = 0; j < m; j++) {
            batch[j] = sorted_ids[positions[j]];
            pool.Remove(positions[j]);
        }
        batches.push_back(move(batch));
    }
    return batches;
}

vector<TDoc> LengthLocalBatchSampler::Sample() {
    vector<TDoc> order;
    order.reserve(sorted_ids.size());
    for (auto &batch: SampleBatches())
        order.insert(order.end(), batch.begin(), batch.end());
    return order;
}
