#ifndef __REVIEW_CORPUS_H
#define __REVIEW_CORPUS_H

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include "types.h"
#include "vocab.h"
#include "tokenizer.h"
#include "lru_cache.h"

// One labeled review after tokenization. Immutable.
struct CorpusItem {
    TText txt;
    TLabel label;
    TLen txt_len;   // number of sentences
    TLen snt_len;   // longest sentence
};

typedef std::shared_ptr<const CorpusItem> CorpusItemPtr;

/*!
 * All reviews of one split (train or test), read from the files named
 * <id>_<rating>.txt under root/neg and root/pos.
 * Every document is tokenized once during Load; documents left without any
 * sentence are skipped. Index order is the neg listing followed by the pos
 * listing, each in directory enumeration order.
 */
class ReviewCorpus {
public:
    ReviewCorpus(VocabPtr vocab, TLen snt_clip = SNT_CLIP, TLen txt_clip = TXT_CLIP,
                 size_t cache_capacity = CACHE_CAPACITY);

    // Throws MissingResource when root, neg/ or pos/ is absent or a file
    // cannot be read; nothing is kept from a failed load.
    void Load(const std::string &root);

    // Memoized, throws IndexOutOfRange outside [0, Size())
    CorpusItemPtr Get(TDoc index);

    TDoc Size() const { return (TDoc) texts.size(); }

    // per-document sentence counts, indexed like the corpus
    const std::vector<TLen> &TxtLens() const { return txt_lens; }

    const std::vector<TLen> &SntLens() const { return snt_lens; }

    const std::vector<TLabel> &Labels() const { return labels; }

    const std::string &Path(TDoc index) const;

    const VocabPtr &GetVocab() const { return tokenizer.GetVocab(); }

    const TextTokenizer &Tokenizer() const { return tokenizer; }

    size_t NumSkipped() const { return num_skipped; }

    TSize NumTokens() const { return num_tokens; }

    // number of memoized items
    size_t CacheSize() { return cache ? cache->Size() : 0; }

private:
    CorpusItemPtr MakeItem(TDoc index) const;

    TextTokenizer tokenizer;
    size_t cache_capacity;

    std::vector<std::string> paths;
    std::vector<TText> texts;
    std::vector<TLabel> labels;
    std::vector<TLen> txt_lens;
    std::vector<TLen> snt_lens;

    size_t num_skipped;
    TSize num_tokens;

    std::unique_ptr<LRUCache<TDoc, CorpusItemPtr>> cache;
};

typedef std::unique_ptr<ReviewCorpus> ReviewCorpusPtr;

// root/imdb.vocab, root/train and root/test sharing one vocabulary
std::pair<ReviewCorpusPtr, ReviewCorpusPtr> LoadDatasets(
        const std::string &root, TLen snt_clip = SNT_CLIP, TLen txt_clip = TXT_CLIP,
        size_t cache_capacity = CACHE_CAPACITY);

ReviewCorpusPtr LoadTestDataset(const std::string &root, TLen snt_clip = SNT_CLIP,
                                TLen txt_clip = TXT_CLIP,
                                size_t cache_capacity = CACHE_CAPACITY);

#endif
