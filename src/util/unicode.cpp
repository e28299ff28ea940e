#include "unicode.h"

uint32_t DecodeUtf8(const std::string &text, size_t &pos) {
    auto lead = (unsigned char) text[pos];
    if (lead < 0x80) {
        pos++;
        return lead;
    }

    size_t extra;
    uint32_t code_point, min_value;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1; code_point = lead & 0x1F; min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2; code_point = lead & 0x0F; min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3; code_point = lead & 0x07; min_value = 0x10000;
    } else {
        pos++;
        return INVALID_CODE_POINT;
    }

    // fewer continuation bytes than announced
    if (pos + extra >= text.size()) {
        pos++;
        return INVALID_CODE_POINT;
    }
    for (size_t k = 1; k <= extra; k++) {
        auto ch = (unsigned char) text[pos + k];
        if ((ch & 0xC0) != 0x80) {
            pos++;
            return INVALID_CODE_POINT;
        }
        code_point = (code_point << 6) | (ch & 0x3F);
    }
    if (code_point < min_value || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        pos++;
        return INVALID_CODE_POINT;
    }
    pos += extra + 1;
    return code_point;
}

void AppendUtf8(std::string &out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += (char) code_point;
    } else if (code_point < 0x800) {
        out += (char) (0xC0 | (code_point >> 6));
        out += (char) (0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += (char) (0xE0 | (code_point >> 12));
        out += (char) (0x80 | ((code_point >> 6) & 0x3F));
        out += (char) (0x80 | (code_point & 0x3F));
    } else {
        out += (char) (0xF0 | (code_point >> 18));
        out += (char) (0x80 | ((code_point >> 12) & 0x3F));
        out += (char) (0x80 | ((code_point >> 6) & 0x3F));
        out += (char) (0x80 | (code_point & 0x3F));
    }
}

bool IsSpaceCodePoint(uint32_t c) {
    return (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20) || c == 0x85 ||
           c == 0xA0 || c == 0x1680 || (c >= 0x2000 && c <= 0x200A) ||
           c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000;
}

struct CodeRange {
    uint32_t first, last;
};

// Punctuation, symbol, mark and control blocks that hold no letter or numeral
static const CodeRange kNonWordRanges[] = {
        {0x0080, 0x00A9}, {0x00AB, 0x00B1}, {0x00B4, 0x00B4}, {0x00B6, 0x00B8},
        {0x00BB, 0x00BB}, {0x00BF, 0x00BF}, {0x00D7, 0x00D7}, {0x00F7, 0x00F7},
        {0x02C2, 0x02C5}, {0x02D2, 0x02DF}, {0x02E5, 0x02EB}, {0x02ED, 0x02ED},
        {0x02EF, 0x036F},
        {0x2000, 0x206F}, {0x20A0, 0x20FF}, {0x2190, 0x23FF},
        {0x2500, 0x2775}, {0x2794, 0x27FF}, {0x2E00, 0x2E2E}, {0x2E30, 0x2E7F},
        {0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030}, {0x303D, 0x303F},
        {0xFE10, 0xFE1F}, {0xFE30, 0xFE6B},
        {0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65},
        {0xFFFC, 0xFFFD}, {0x1F000, 0x1F0FF}, {0x1F10D, 0x1FAFF},
};

bool IsWordCodePoint(uint32_t c) {
    if (c < 0x80)
        return c == '_' || (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
               (c >= 'A' && c <= 'Z');
    // undecodable bytes stay inside the surrounding word
    if (c == INVALID_CODE_POINT)
        return true;
    if (IsSpaceCodePoint(c))
        return false;
    for (auto &range: kNonWordRanges)
        if (c >= range.first && c <= range.last)
            return false;
    return true;
}

uint32_t LowerCodePoint(uint32_t c) {
    if (c >= 'A' && c <= 'Z')
        return c + 0x20;
    if (c < 0xC0)
        return c;
    if (c <= 0xDE)
        return c == 0xD7 ? c : c + 0x20;
    if (c >= 0x100 && c <= 0x17F) {
        if (c == 0x178)
            return 0xFF;
        if (c == 0x130)
            return c;
        bool even_capitals = (c <= 0x137) || (c >= 0x14A && c <= 0x177);
        bool odd_capitals = (c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E);
        if ((even_capitals && c % 2 == 0) || (odd_capitals && c % 2 == 1))
            return c + 1;
        return c;
    }
    if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2)
        return c + 0x20;
    if (c >= 0x400 && c <= 0x40F)
        return c + 0x50;
    if (c >= 0x410 && c <= 0x42F)
        return c + 0x20;
    return c;
}

std::string ToLower(const std::string &text) {
    std::string lower;
    lower.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t begin = pos;
        uint32_t c = DecodeUtf8(text, pos);
        if (c == INVALID_CODE_POINT) {
            lower += text[begin];
        } else if (c == 0x130) {
            // capital I with dot above becomes i and a combining dot
            lower += 'i';
            AppendUtf8(lower, 0x307);
        } else {
            AppendUtf8(lower, LowerCodePoint(c));
        }
    }
    return lower;
}
