#include "sentence_splitter.h"
#include <cctype>
#include <cstring>

using namespace std;

static inline bool IsSpace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

static inline bool IsSentEnd(char ch) {
    return ch == '.' || ch == '?' || ch == '!';
}

// characters that cannot be part of a word
static inline bool IsNonWord(char ch) {
    return ch != '\0' && strchr(")\";}]*:@'({[!?", ch) != nullptr;
}

static inline bool IsWordStart(char ch) {
    return !IsSpace(ch) && (ch == '\0' || strchr("(\"`{[:;&#*@)}]-,", ch) == nullptr);
}

static inline bool IsClosing(char ch) {
    return ch == '"' || ch == '\'' || ch == ')' || ch == ']' || ch == '}';
}

static inline bool IsLower(char ch) { return ch >= 'a' && ch <= 'z'; }

static inline bool IsUpper(char ch) { return ch >= 'A' && ch <= 'Z'; }

// Length of "--...", "..." or ". . ." starting at i, 0 if none
static size_t MultiCharLength(const string &s, size_t i) {
    size_t n = s.size();
    if (i >= n) return 0;
    if (s[i] == '-' || s[i] == '.') {
        size_t j = i;
        while (j < n && s[j] == s[i]) j++;
        if (j - i >= 2) return j - i;
    }
    if (s[i] == '.') {
        size_t k = 0;
        while (i + 2 * k + 1 < n && s[i + 2 * k] == '.' && IsSpace(s[i + 2 * k + 1])) k++;
        if (k >= 2 && i + 2 * k < n && s[i + 2 * k] == '.') return 2 * k + 1;
        if (k >= 3) return 2 * (k - 1) + 1;
    }
    return 0;
}

vector<string> SentenceSplitter::BoundaryWords(const string &text) {
    vector<string> words;
    size_t n = text.size();
    size_t pos = 0;
    while (pos < n) {
        if (IsSpace(text[pos])) {
            pos++;
            continue;
        }
        size_t len = MultiCharLength(text, pos);
        if (len > 0) {
            words.push_back(text.substr(pos, len));
            pos += len;
            continue;
        }
        if (IsWordStart(text[pos])) {
            size_t end = pos + 1;
            while (end < n) {
                char ch = text[end];
                if (IsSpace(ch) || IsNonWord(ch) || MultiCharLength(text, end) > 0)
                    break;
                // a comma ends the word only at a word boundary
                if (ch == ',' && (end + 1 == n || IsSpace(text[end + 1]) ||
                                  IsNonWord(text[end + 1]) || MultiCharLength(text, end + 1) > 0))
                    break;
                end++;
            }
            words.push_back(text.substr(pos, end - pos));
            pos = end;
            continue;
        }
        words.push_back(text.substr(pos, 1));
        pos++;
    }
    return words;
}

bool SentenceSplitter::IsInitial(const string &tok) {
    return tok.size() == 2 && tok[1] == '.' &&
           (isalpha((unsigned char) tok[0]) || tok[0] == '_');
}

// -?[.,]?\d[\d,.-]*\.?
bool SentenceSplitter::IsNumber(const string &tok) {
    size_t n = tok.size(), i = 0;
    if (i < n && tok[i] == '-') i++;
    if (i < n && (tok[i] == '.' || tok[i] == ',')) i++;
    if (i >= n || !isdigit((unsigned char) tok[i])) return false;
    i++;
    while (i < n && (isdigit((unsigned char) tok[i]) || tok[i] == ',' ||
                     tok[i] == '.' || tok[i] == '-'))
        i++;
    return i == n;
}

bool SentenceSplitter::MayStartSentence(const string &next) {
    if (next.size() == 1 && strchr(";:,.!?", next[0]) != nullptr)
        return false;
    return !(next.size() > 0 && IsLower(next[0]));
}

void SentenceSplitter::Annotate(vector<Token> &tokens) {
    for (auto &t: tokens) {
        const string &tok = t.tok;
        t.period_final = !tok.empty() && tok.back() == '.';
        t.ellipsis = tok.size() >= 2 && tok.find_first_not_of('.') == string::npos;
        t.sentbreak = false;
        if (tok == "." || tok == "?" || tok == "!")
            t.sentbreak = true;
        else if (!t.ellipsis && t.period_final &&
                 !(tok.size() >= 2 && tok[tok.size() - 2] == '.'))
            t.sentbreak = true;
    }

    for (size_t k = 0; k + 1 < tokens.size(); k++) {
        auto &t1 = tokens[k];
        const auto &t2 = tokens[k + 1];
        if (!t1.period_final || t1.ellipsis)
            continue;
        bool initial = IsInitial(t1.tok);
        if (!initial && !IsNumber(t1.tok))
            continue;
        if (!MayStartSentence(t2.tok))
            t1.sentbreak = false;
        else if (initial && !t2.tok.empty() && IsUpper(t2.tok[0]))
            t1.sentbreak = false;
    }
}

// True if some token before the last one ends a sentence
bool SentenceSplitter::ContainsBreak(const string &context) {
    vector<Token> tokens;
    for (auto &w: BoundaryWords(context))
        tokens.push_back(Token(w));
    Annotate(tokens);

    bool found = false;
    for (auto &t: tokens) {
        if (found) return true;
        if (t.sentbreak) found = true;
    }
    return false;
}

vector<SentenceSplitter::Span> SentenceSplitter::SpanTokenize(const string &text) const {
    vector<Span> slices;
    size_t n = text.size();
    size_t last_break = 0;
    size_t i = 0;
    while (i < n) {
        if (IsSpace(text[i])) {
            i++;
            continue;
        }
        size_t chunk_begin = i, chunk_end = i;
        while (chunk_end < n && !IsSpace(text[chunk_end])) chunk_end++;
        size_t next_begin = chunk_end;
        while (next_begin < n && IsSpace(text[next_begin])) next_begin++;
        size_t next_end = next_begin;
        while (next_end < n && !IsSpace(text[next_end])) next_end++;

        // rightmost candidate followed by punctuation or by another token
        bool found = false, after_char = false;
        size_t p = 0;
        for (size_t k = chunk_end; k-- > chunk_begin;) {
            if (!IsSentEnd(text[k]))
                continue;
            if (k + 1 < chunk_end) {
                if (IsNonWord(text[k + 1])) {
                    found = after_char = true;
                    p = k;
                    break;
                }
            } else if (next_begin < n) {
                found = true;
                p = k;
                break;
            }
        }

        if (found) {
            string context = text.substr(chunk_begin, p + 1 - chunk_begin);
            if (after_char)
                context += text[p + 1];
            else
                context += " " + text.substr(next_begin, next_end - next_begin);
            if (ContainsBreak(context)) {
                slices.push_back(Span(last_break, p + 1));
                last_break = after_char ? p + 1 : next_begin;
            }
        }
        i = chunk_end;
    }
    slices.push_back(Span(last_break, n));

    // move closing quotes and brackets back to the sentence they close
    vector<Span> result;
    size_t realign = 0;
    for (size_t k = 0; k < slices.size(); k++) {
        Span s1(slices[k].first + realign, slices[k].second);
        if (k + 1 == slices.size()) {
            if (s1.second > s1.first) result.push_back(s1);
            continue;
        }
        const Span &s2 = slices[k + 1];
        size_t run = 0, total = 0;
        bool matched = false;
        for (size_t r = 1; s2.first + r <= s2.second && IsClosing(text[s2.first + r - 1]); r++) {
            size_t pos = s2.first + r;
            if (pos == s2.second) {
                matched = true;
                run = total = r;
            } else if (IsSpace(text[pos])) {
                size_t end = pos;
                while (end < s2.second && IsSpace(text[end])) end++;
                matched = true;
                run = r;
                total = end - s2.first;
            } else if (pos + 1 < s2.second && text[pos] == '-' && text[pos + 1] == '-') {
                matched = true;
                run = total = r;
            }
            if (matched) break;
        }
        if (matched) {
            result.push_back(Span(s1.first, s2.first + run));
            realign = total;
        } else {
            realign = 0;
            if (s1.second > s1.first) result.push_back(s1);
        }
    }
    return result;
}

vector<string> SentenceSplitter::Tokenize(const string &text) const {
    vector<string> sentences;
    for (auto &span: SpanTokenize(text))
        sentences.push_back(text.substr(span.first, span.second - span.first));
    return sentences;
}
