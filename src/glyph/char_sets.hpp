#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace imgii {

namespace CharSet {

// Ordered from transparent (least ink) to opaque.
const std::string MINIMAL = " .:-=+*#%@";
const std::string DEFAULT = " .,-~:;=!*#$@";
const std::string SLIGHT = " .`-_':,;^=+/\"|)\\<>)iv%xclrs{*}I?!][1taeo7zjLunT#JCwfy325Fp6mqSghVd4EgXPGZbYkOA&8U$@KHDBWNMR0Q";
const std::string BLOCK = " \xE2\x96\x91\xE2\x96\x92\xE2\x96\x93\xE2\x96\x88";
const std::string RUSSIAN = " \xD1\x8F\xD0\xB3\xD0\xBA\xD0\xB0\xD0\xB8\xD0\x96\xD0\xA9\xD0\xA8";
// Moon phases, new to full.
const std::string EMOJI = " \xF0\x9F\x8C\x91\xF0\x9F\x8C\x98\xF0\x9F\x8C\x97\xF0\x9F\x8C\x96\xF0\x9F\x8C\x95";

inline bool is_valid_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the UTF-8 sequence starting at s[pos], or 0 when the bytes there
// do not form a complete, well-formed sequence.
inline size_t sequence_length(const std::string& s, size_t pos) {
    if (pos >= s.size()) return 0;
    unsigned char c = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    if (c < 0x80) len = 1;
    else if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    else return 0;

    if (pos + len > s.size()) return 0;
    for (size_t i = 1; i < len; ++i) {
        if (!is_valid_continuation_byte(static_cast<unsigned char>(s[pos + i]))) return 0;
    }
    return len;
}

inline uint32_t decode_at(const std::string& s, size_t pos, size_t len) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    auto cont = [&](size_t i) { return static_cast<uint32_t>(static_cast<unsigned char>(s[pos + i]) & 0x3F); };
    switch (len) {
        case 1: return c;
        case 2: return ((c & 0x1Fu) << 6) | cont(1);
        case 3: return ((c & 0x0Fu) << 12) | (cont(1) << 6) | cont(2);
        case 4: return ((c & 0x07u) << 18) | (cont(1) << 12) | (cont(2) << 6) | cont(3);
        default: return 0;
    }
}

inline std::vector<uint32_t> to_codepoints(const std::string& s) {
    std::vector<uint32_t> result;
    size_t i = 0;
    while (i < s.size()) {
        size_t len = sequence_length(s, i);
        if (len == 0) {
            ++i;
            continue;
        }
        uint32_t cp = decode_at(s, i, len);
        i += len;
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            continue;
        }
        result.push_back(cp);
    }
    return result;
}

// Splits a UTF-8 string into one string per code point, dropping malformed
// bytes.
inline std::vector<std::string> to_glyphs(const std::string& s) {
    std::vector<std::string> result;
    size_t i = 0;
    while (i < s.size()) {
        size_t len = sequence_length(s, i);
        if (len == 0) {
            ++i;
            continue;
        }
        result.push_back(s.substr(i, len));
        i += len;
    }
    return result;
}

inline bool is_known(const std::string& name) {
    return name == "minimal" || name == "default" || name == "slight" ||
           name == "block" || name == "russian" || name == "emoji";
}

inline std::vector<std::string> get_set(const std::string& name) {
    if (name == "default") return to_glyphs(DEFAULT);
    if (name == "slight") return to_glyphs(SLIGHT);
    if (name == "block") return to_glyphs(BLOCK);
    if (name == "russian") return to_glyphs(RUSSIAN);
    if (name == "emoji") return to_glyphs(EMOJI);
    return to_glyphs(MINIMAL);
}

}

}
