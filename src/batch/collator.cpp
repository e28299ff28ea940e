#include "collator.h"
#include "errors.h"
#include <algorithm>

using namespace std;

Batch CollateDocs(const vector<CorpusItemPtr> &batch) {
    if (batch.empty())
        throw InvalidArgument("Cannot collate an empty batch");

    TLen max_txt = 0, max_snt = 0;
    for (auto &item: batch) {
        max_txt = max(max_txt, item->txt_len);
        max_snt = max(max_snt, item->snt_len);
    }

    auto n_docs = (Eigen::Index) batch.size();
    Batch result;
    result.targets = TTargets(n_docs, 1);
    result.targets.setZero();
    result.features = TFeatures(n_docs, (Eigen::Index) max_txt, (Eigen::Index) max_snt);
    result.features.setZero();

    for (Eigen::Index d = 0; d < n_docs; d++) {
        auto &item = *batch[d];
        result.targets(d, 0) = (float) item.label;
        for (size_t s = 0; s < item.txt.size(); s++) {
            auto &snt = item.txt[s];
            for (size_t w = 0; w < snt.size(); w++)
                result.features(d, (Eigen::Index) s, (Eigen::Index) w) = snt[w];
        }
    }
    return result;
}

double PaddingRatio(const Batch &batch) {
    auto cells = batch.features.size();
    if (cells == 0)
        return 0;
    Eigen::Tensor<int64_t, 0, Eigen::RowMajor> nonzero =
            (batch.features != batch.features.constant(0)).cast<int64_t>().sum();
    return 1.0 - (double) nonzero() / cells;
}
