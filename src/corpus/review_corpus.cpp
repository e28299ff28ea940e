#include "review_corpus.h"
#include "utils.h"
#include "errors.h"
#include <algorithm>
#include <chrono>
#include "glog/logging.h"

using namespace std;

ReviewCorpus::ReviewCorpus(VocabPtr vocab, TLen snt_clip, TLen txt_clip,
                           size_t cache_capacity)
        : tokenizer(vocab, snt_clip, txt_clip), cache_capacity(cache_capacity),
          num_skipped(0), num_tokens(0) {
    if (cache_capacity == 0)
        throw InvalidArgument("cache_capacity must be positive");
}

void ReviewCorpus::Load(const string &root) {
    auto start = chrono::high_resolution_clock::now();
    if (!IsDirectory(root)) {
        LOG(ERROR) << root << " does not exist.";
        throw MissingResource("Directory " + root + " does not exist!");
    }

    const string classes[2] = {"neg", "pos"};
    const TLabel class_labels[2] = {LABEL_NEG, LABEL_POS};
    vector<pair<string, TLabel>> files;
    for (int c = 0; c < 2; c++) {
        auto dir = JoinPath(root, classes[c]);
        if (!IsDirectory(dir)) {
            LOG(ERROR) << dir << " does not exist.";
            throw MissingResource("Directory " + dir + " does not exist!");
        }
        for (auto &path: ListFiles(dir, "_", ".txt"))
            files.push_back(make_pair(path, class_labels[c]));
    }

    LOG(INFO) << "Dataset loading from " << root << ", " << files.size() << " files.";

    // build into locals so a failed load leaves the corpus untouched
    vector<string> new_paths;
    vector<TText> new_texts;
    vector<TLabel> new_labels;
    vector<TLen> new_txt_lens, new_snt_lens;
    size_t skipped = 0;
    TSize tokens = 0;
    for (auto &file: files) {
        auto tokenized = tokenizer.Tokenize(ReadFile(file.first));
        if (tokenized.Empty()) {
            LOG(WARNING) << "Skipping " << file.first << ": no sentence left after tokenization.";
            skipped++;
            continue;
        }
        for (auto &sentence: tokenized.text)
            tokens += sentence.size();

        new_paths.push_back(file.first);
        new_texts.push_back(move(tokenized.text));
        new_labels.push_back(file.second);
        new_txt_lens.push_back(tokenized.txt_len);
        new_snt_lens.push_back(tokenized.snt_len_max);
    }

    paths.swap(new_paths);
    texts.swap(new_texts);
    labels.swap(new_labels);
    txt_lens.swap(new_txt_lens);
    snt_lens.swap(new_snt_lens);
    num_skipped = skipped;
    num_tokens = tokens;
    cache.reset(new LRUCache<TDoc, CorpusItemPtr>(max(cache_capacity, (size_t) Size())));

    double seconds = chrono::duration<double>(
            chrono::high_resolution_clock::now() - start).count();
    LOG(INFO) << "Corpus read from " << root << ", " << Size() << " documents, "
              << num_tokens << " tokens, " << num_skipped << " skipped, "
              << seconds << " seconds.";
}

CorpusItemPtr ReviewCorpus::MakeItem(TDoc index) const {
    shared_ptr<CorpusItem> item(new CorpusItem());
    item->txt = texts[index];
    item->label = labels[index];
    item->txt_len = txt_lens[index];
    item->snt_len = snt_lens[index];
    return item;
}

CorpusItemPtr ReviewCorpus::Get(TDoc index) {
    if (index >= Size())
        throw IndexOutOfRange("Corpus index " + to_string(index) +
                              " out of range [0, " + to_string(Size()) + ")");
    return cache->GetOrCompute(index, [this](TDoc i) { return MakeItem(i); });
}

const string &ReviewCorpus::Path(TDoc index) const {
    if (index >= Size())
        throw IndexOutOfRange("Corpus index " + to_string(index) +
                              " out of range [0, " + to_string(Size()) + ")");
    return paths[index];
}

pair<ReviewCorpusPtr, ReviewCorpusPtr> LoadDatasets(
        const string &root, TLen snt_clip, TLen txt_clip, size_t cache_capacity) {
    auto vocab = Vocab::Load(JoinPath(root, "imdb.vocab"));

    ReviewCorpusPtr train_set(new ReviewCorpus(vocab, snt_clip, txt_clip, cache_capacity));
    train_set->Load(JoinPath(root, "train"));
    ReviewCorpusPtr test_set(new ReviewCorpus(vocab, snt_clip, txt_clip, cache_capacity));
    test_set->Load(JoinPath(root, "test"));

    LOG(INFO) << "Train dataset was loaded, " << train_set->Size() << " samples.";
    LOG(INFO) << "Test dataset was loaded, " << test_set->Size() << " samples.";
    return make_pair(move(train_set), move(test_set));
}

ReviewCorpusPtr LoadTestDataset(const string &root, TLen snt_clip, TLen txt_clip,
                                size_t cache_capacity) {
    auto vocab = Vocab::Load(JoinPath(root, "imdb.vocab"));
    ReviewCorpusPtr test_set(new ReviewCorpus(vocab, snt_clip, txt_clip, cache_capacity));
    test_set->Load(JoinPath(root, "test"));
    return test_set;
}
