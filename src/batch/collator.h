#ifndef __COLLATOR_H
#define __COLLATOR_H

#include <vector>
#include <cstdint>
#include <unsupported/Eigen/CXX11/Tensor>
#include "review_corpus.h"

typedef Eigen::Tensor<int64_t, 3, Eigen::RowMajor> TFeatures;  // [doc, sentence, word]
typedef Eigen::Tensor<float, 2, Eigen::RowMajor> TTargets;     // [doc, 1]

struct Batch {
    TFeatures features;
    TTargets targets;

    size_t NumDocs() const { return (size_t) features.dimension(0); }
    size_t MaxTxt() const { return (size_t) features.dimension(1); }
    size_t MaxSnt() const { return (size_t) features.dimension(2); }
};

/*!
 * Zero-padded tensors sized to the batch itself: features is
 * [N, max txt_len, max snt_len] with sentence j of document i written to
 * features(i, j, 0..len-1), targets(i, 0) is the label of document i.
 * Throws InvalidArgument for an empty batch.
 */
Batch CollateDocs(const std::vector<CorpusItemPtr> &batch);

// Share of feature cells that hold padding
double PaddingRatio(const Batch &batch);

#endif
