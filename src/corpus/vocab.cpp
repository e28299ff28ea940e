#include "vocab.h"
#include "errors.h"
#include "utils.h"
#include <fstream>
#include "glog/logging.h"

using namespace std;

shared_ptr<const Vocab> Vocab::Load(const string &vocabPath) {
    ifstream fvocab(vocabPath);
    if (!fvocab || !IsFile(vocabPath)) {
        LOG(ERROR) << vocabPath << " does not exist.";
        throw MissingResource("File " + vocabPath + " does not exist!");
    }

    vector<string> words;
    string line;
    while (getline(fvocab, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        words.push_back(line);
    }
    if (fvocab.bad())
        throw MissingResource("Fail reading file " + vocabPath);

    auto vocab = FromWords(words);
    LOG(INFO) << "Vocabulary read from " << vocabPath << ", "
              << vocab->Size() << " words.";
    return vocab;
}

shared_ptr<const Vocab> Vocab::FromWords(const vector<string> &words) {
    shared_ptr<Vocab> vocab(new Vocab());
    vocab->words = words;
    // a repeated word keeps the id of its last line
    for (size_t i = 0; i < words.size(); i++)
        vocab->word2id[words[i]] = (TWord) (i + 1);
    return vocab;
}
