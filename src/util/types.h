#ifndef __TYPES
#define __TYPES

#include <vector>
#include <cstdint>

typedef unsigned int TWord;
typedef unsigned int TDoc;
typedef unsigned int TLen;
typedef int TLabel;
typedef long long TSize;

// text[i_sentence][j_word]
typedef std::vector<TWord> TSentence;
typedef std::vector<TSentence> TText;

// 98% quantiles of the review corpus
#define SNT_CLIP 100
#define TXT_CLIP 40

#define DIVERSITY 10
#define CACHE_CAPACITY 50000

// id 0 is never assigned to a word
#define PAD_ID 0

#define LABEL_NEG 0
#define LABEL_POS 1

#endif
