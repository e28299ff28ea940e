#ifndef __VOCAB_H
#define __VOCAB_H

#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include "types.h"

/*!
 * Fixed word -> id mapping. Ids are 1..N in file order, PAD_ID (0) is kept
 * for padding. Immutable after loading and shared by every corpus split.
 */
class Vocab {
public:
    Vocab() {}

    // One word per line, no header. Throws MissingResource.
    static std::shared_ptr<const Vocab> Load(const std::string &vocabPath);

    static std::shared_ptr<const Vocab> FromWords(const std::vector<std::string> &words);

    // PAD_ID for out-of-vocabulary words
    TWord Id(const std::string &word) const {
        auto it = word2id.find(word);
        return it == word2id.end() ? PAD_ID : it->second;
    }

    bool Contains(const std::string &word) const {
        return word2id.find(word) != word2id.end();
    }

    TWord Size() const { return (TWord) word2id.size(); }

    std::vector<std::string> words;
    std::unordered_map<std::string, TWord> word2id;
};

typedef std::shared_ptr<const Vocab> VocabPtr;

#endif
