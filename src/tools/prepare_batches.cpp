#include <iostream>
#include <string>
#include <exception>

#include "glog/logging.h"
#include "gflags/gflags.h"

#include "types.h"
#include "utils.h"
#include "statistics.h"
#include "review_corpus.h"
#include "batch_loader.h"

using namespace std;

DEFINE_string(prefix, "../data/aclImdb", "dataset root holding imdb.vocab, train/ and test/");
DEFINE_int32(snt_clip, SNT_CLIP, "maximal number of words kept per sentence");
DEFINE_int32(txt_clip, TXT_CLIP, "maximal number of sentences kept per review");
DEFINE_int32(batch_size, 32, "number of reviews per batch");
DEFINE_int32(diversity, DIVERSITY, "sampling window, in batches, around the anchor");
DEFINE_int32(num_workers, 4, "threads fetching the items of a batch");
DEFINE_uint64(cache_capacity, CACHE_CAPACITY, "memoized items per corpus");
DEFINE_uint64(seed, 0, "seed of the sampling generators");
DEFINE_int32(epochs, 1, "passes over every loader");
DEFINE_bool(skip_test, false, "load and iterate only the train split");

static void RunEpochs(BatchLoader &loader, const string &name) {
    for (int epoch = 0; epoch < FLAGS_epochs; epoch++) {
        OnlineAvg padding, n_docs, max_txt, max_snt;
        size_t num_batches = 0, docs_seen = 0;
        loader.Reset();
        while (loader.HasNext()) {
            auto batch = loader.NextBatch();
            num_batches++;
            docs_seen += batch.NumDocs();
            padding.Update(PaddingRatio(batch));
            n_docs.Update(batch.NumDocs());
            max_txt.Update(batch.MaxTxt());
            max_snt.Update(batch.MaxSnt());
        }
        LOG(INFO) << name << " epoch " << epoch << ": " << num_batches << " batches, "
                  << docs_seen << " documents, mean shape ["
                  << n_docs.ToString() << ", " << max_txt.ToString() << ", "
                  << max_snt.ToString() << "], mean padding ratio " << padding.ToString();
    }
}

int main(int argc, char **argv) {
    // initialize and set google log
    google::InitGoogleLogging(argv[0]);
    // output all logs to stderr
    FLAGS_logtostderr = true;
    FLAGS_colorlogtostderr = true;

    google::SetUsageMessage("Usage : ./prepare_batches --prefix=<aclImdb root> [ flags... ]");
    google::ParseCommandLineFlags(&argc, &argv, true);
    LOG(INFO) << "Command line : " << argv[0]
              << " --prefix=" << FLAGS_prefix
              << " --snt_clip=" << FLAGS_snt_clip
              << " --txt_clip=" << FLAGS_txt_clip
              << " --batch_size=" << FLAGS_batch_size
              << " --diversity=" << FLAGS_diversity
              << " --num_workers=" << FLAGS_num_workers
              << " --seed=" << FLAGS_seed;

    if (FLAGS_snt_clip < 1 || FLAGS_txt_clip < 1) {
        LOG(ERROR) << "snt_clip and txt_clip must be positive";
        return 1;
    }

    try {
        if (FLAGS_skip_test) {
            auto vocab = Vocab::Load(JoinPath(FLAGS_prefix, "imdb.vocab"));
            ReviewCorpus train_set(vocab, FLAGS_snt_clip, FLAGS_txt_clip, FLAGS_cache_capacity);
            train_set.Load(JoinPath(FLAGS_prefix, "train"));
            BatchLoader train_loader(train_set, FLAGS_batch_size, FLAGS_num_workers,
                                     FLAGS_seed, FLAGS_diversity);
            RunEpochs(train_loader, "train");
        } else {
            auto datasets = LoadDatasets(FLAGS_prefix, FLAGS_snt_clip, FLAGS_txt_clip,
                                         FLAGS_cache_capacity);
            auto loaders = MakeLoaders(*datasets.first, *datasets.second, FLAGS_batch_size,
                                       FLAGS_num_workers, FLAGS_seed, FLAGS_diversity);
            LOG(INFO) << "Vocabulary size : " << datasets.first->GetVocab()->Size();
            RunEpochs(*loaders.first, "train");
            RunEpochs(*loaders.second, "test");
        }
    } catch (const exception &e) {
        LOG(ERROR) << e.what();
        google::ShutdownGoogleLogging();
        return 1;
    }

    google::ShutdownGoogleLogging();
    return 0;
}
