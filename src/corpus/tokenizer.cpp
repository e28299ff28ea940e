#include "tokenizer.h"
#include "unicode.h"
#include "errors.h"
#include <algorithm>

using namespace std;

TextTokenizer::TextTokenizer(VocabPtr vocab, TLen snt_clip, TLen txt_clip)
        : vocab(vocab), snt_clip(snt_clip), txt_clip(txt_clip), html_re("<[^\\n]*?>") {
    if (!vocab)
        throw InvalidArgument("TextTokenizer needs a vocabulary");
    if (snt_clip < 1 || txt_clip < 1)
        throw InvalidArgument("snt_clip and txt_clip must be at least 1, got " +
                              to_string(snt_clip) + " and " + to_string(txt_clip));
}

string TextTokenizer::StripTags(const string &text) const {
    return regex_replace(text, html_re, " ");
}

vector<string> TextTokenizer::SplitWords(const string &sentence) {
    vector<string> words;
    size_t n = sentence.size();
    size_t pos = 0;
    // word-ness of the token being built, -1 between tokens
    int run = -1;
    size_t begin = 0;
    while (pos < n) {
        size_t start = pos;
        uint32_t c = DecodeUtf8(sentence, pos);
        int kind = IsSpaceCodePoint(c) ? -1 : (IsWordCodePoint(c) ? 1 : 0);
        if (kind != run) {
            if (run != -1)
                words.push_back(sentence.substr(begin, start - begin));
            begin = start;
            run = kind;
        }
    }
    if (run != -1)
        words.push_back(sentence.substr(begin, n - begin));
    return words;
}

TokenizedText TextTokenizer::Tokenize(const string &raw) const {
    string plain = StripTags(ToLower(raw));

    TokenizedText result;
    for (auto &span: splitter.SpanTokenize(plain)) {
        if (result.text.size() >= txt_clip)
            break;
        TSentence sentence;
        for (auto &w: SplitWords(plain.substr(span.first, span.second - span.first))) {
            if (sentence.size() >= snt_clip)
                break;
            auto id = vocab->Id(w);
            if (id != PAD_ID)
                sentence.push_back(id);
        }
        result.text.push_back(move(sentence));
    }

    result.txt_len = (TLen) result.text.size();
    result.snt_len_max = 0;
    for (auto &sentence: result.text)
        result.snt_len_max = max(result.snt_len_max, (TLen) sentence.size());
    return result;
}
