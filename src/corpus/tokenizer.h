#ifndef __TOKENIZER_H
#define __TOKENIZER_H

#include <string>
#include <vector>
#include <regex>
#include "types.h"
#include "vocab.h"
#include "sentence_splitter.h"

struct TokenizedText {
    TText text;
    TLen snt_len_max;
    TLen txt_len;

    // no sentence survived, the max sentence length is undefined
    bool Empty() const { return text.empty(); }
};

/*!
 * Raw review -> clipped sentences of word ids.
 *
 * lowercase, replace <...> tags by a space, split sentences, split words
 * on punctuation and whitespace code points, drop out-of-vocabulary words,
 * keep at most snt_clip ids per sentence and txt_clip sentences per text. A pure function of the text,
 * the vocabulary and the two clips.
 */
class TextTokenizer {
public:
    TextTokenizer(VocabPtr vocab, TLen snt_clip = SNT_CLIP, TLen txt_clip = TXT_CLIP);

    TokenizedText Tokenize(const std::string &raw) const;

    std::string StripTags(const std::string &text) const;

    // \w+|[^\w\s]+ over the UTF-8 code points of `sentence`
    static std::vector<std::string> SplitWords(const std::string &sentence);

    TLen SntClip() const { return snt_clip; }
    TLen TxtClip() const { return txt_clip; }
    const VocabPtr &GetVocab() const { return vocab; }

private:
    VocabPtr vocab;
    TLen snt_clip, txt_clip;
    SentenceSplitter splitter;
    std::regex html_re;
};

#endif
