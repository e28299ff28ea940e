#ifndef __UNICODE
#define __UNICODE

#include <string>
#include <cstdint>

// Returned by DecodeUtf8 for a byte that starts no valid sequence
#define INVALID_CODE_POINT 0xFFFFFFFFu

/*!
 * Decodes the code point starting at byte `pos` and advances `pos` past it.
 * A malformed sequence yields INVALID_CODE_POINT and consumes one byte.
 */
uint32_t DecodeUtf8(const std::string &text, size_t &pos);

void AppendUtf8(std::string &out, uint32_t code_point);

// Unicode whitespace, as matched by \s
bool IsSpaceCodePoint(uint32_t code_point);

// Letters, digits, numerals and '_', as matched by \w. Punctuation, symbols,
// combining marks and whitespace are not word characters.
bool IsWordCodePoint(uint32_t code_point);

// Simple lowercase mapping for ASCII, Latin-1, Latin Extended-A, Greek and
// Cyrillic capitals; every other code point maps to itself
uint32_t LowerCodePoint(uint32_t code_point);

// Lowercases valid UTF-8 text; malformed bytes are copied unchanged
std::string ToLower(const std::string &text);

#endif
