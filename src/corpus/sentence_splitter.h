#ifndef __SENTENCE_SPLITTER_H
#define __SENTENCE_SPLITTER_H

#include <string>
#include <vector>
#include <utility>

/*!
 * Unsupervised sentence boundary detection in the manner of Punkt
 * (Kiss & Strunk, 2006) without trained parameters: no abbreviation list,
 * no collocations, empty orthographic context.
 *
 * A sentence may end at '.', '?' or '!' when it is followed by whitespace
 * and another token, or directly by closing punctuation. Ellipses never end
 * a sentence. A single-letter initial or a number ending in '.' does not end
 * a sentence when the next token starts with a lowercase letter or is one of
 * ";:,.!?". Closing quotes and brackets after a boundary are moved to the
 * sentence they close.
 */
class SentenceSplitter {
public:
    typedef std::pair<size_t, size_t> Span;

    // [begin, end) byte offsets of every sentence of `text`
    std::vector<Span> SpanTokenize(const std::string &text) const;

    std::vector<std::string> Tokenize(const std::string &text) const;

    // Word tokens as seen by the boundary heuristics, punctuation kept
    static std::vector<std::string> BoundaryWords(const std::string &text);

private:
    struct Token {
        explicit Token(const std::string &tok)
                : tok(tok), sentbreak(false), ellipsis(false), period_final(false) {}

        std::string tok;
        bool sentbreak;
        bool ellipsis;
        bool period_final;
    };

    static bool ContainsBreak(const std::string &context);

    static void Annotate(std::vector<Token> &tokens);

    static bool IsInitial(const std::string &tok);

    static bool IsNumber(const std::string &tok);

    // false when `next` cannot start a sentence, true when unknown
    static bool MayStartSentence(const std::string &next);
};

#endif
