#include "batch_loader.h"
#include "errors.h"
#include <exception>
#include <omp.h>
#include "glog/logging.h"

using namespace std;

static int CheckWorkers(int num_workers) {
    if (num_workers < 1)
        throw InvalidArgument("num_workers must be at least 1, got " + to_string(num_workers));
    return num_workers;
}

BatchLoader::BatchLoader(ReviewCorpus &corpus, int batch_size, int num_workers,
                         uint64_t seed, int diversity)
        : corpus(corpus), num_workers(CheckWorkers(num_workers)), generator(seed),
          sampler(corpus.TxtLens(), batch_size, generator, diversity), current(0) {
    Reset();
    LOG(INFO) << "Created BatchLoader with " << NumBatches()
              << " batches of size " << batch_size << ", " << num_workers << " workers.";
}

void BatchLoader::Reset() {
    batches = sampler.SampleBatches();
    current = 0;
}

Batch BatchLoader::NextBatch() {
    if (!HasNext())
        throw runtime_error("No more batches available. Call Reset() to start new epoch.");

    last_ids = batches[current++];
    int n = (int) last_ids.size();
    vector<CorpusItemPtr> items((size_t) n);

    // exceptions must not leave the parallel region
    exception_ptr error;
#pragma omp parallel for num_threads(num_workers) schedule(dynamic)
    for (int i = 0; i < n; i++) {
        try {
            items[i] = corpus.Get(last_ids[i]);
        } catch (...) {
#pragma omp critical
            if (!error) error = current_exception();
        }
    }
    if (error)
        rethrow_exception(error);

    return CollateDocs(items);
}

pair<BatchLoaderPtr, BatchLoaderPtr> MakeLoaders(ReviewCorpus &train_set, ReviewCorpus &test_set,
                                                 int batch_size, int num_workers,
                                                 uint64_t seed, int diversity) {
    BatchLoaderPtr train_loader(new BatchLoader(train_set, batch_size, num_workers, seed, diversity));
    BatchLoaderPtr test_loader(new BatchLoader(test_set, batch_size, num_workers, seed + 1, diversity));
    return make_pair(move(train_loader), move(test_loader));
}
