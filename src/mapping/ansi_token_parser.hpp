#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <regex>
#include <string>
#include <vector>

namespace imgii {

// One character and the truecolor foreground it was escaped with.
struct ColorToken {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;
    std::string text;

    // Whitespace tokens render as the shared blank cell.
    bool is_blank() const;

    bool operator==(const ColorToken& other) const {
        return red == other.red && green == other.green && blue == other.blue && text == other.text;
    }
    bool operator!=(const ColorToken& other) const { return !(*this == other); }
};

struct ColorTokenHash {
    size_t operator()(const ColorToken& token) const;
};

// Extracts ESC[38;2;R;G;Bm<char> spans from a line of colored ASCII art.
// Every span yields exactly one token; runs of equal color are not merged.
class AnsiTokenParser {
public:
    static const char* const DEFAULT_PATTERN;

    AnsiTokenParser() = default;

    // The pattern must have three capture groups (red, green, blue) and end
    // right before the character it colors.
    Result compile(const std::string& pattern = DEFAULT_PATTERN);
    bool is_compiled() const { return compiled_; }

    // Clears `out` and fills it left to right. On failure `out` is left empty.
    Result parse_line(const std::string& line, std::vector<ColorToken>& out) const;

private:
    std::regex pattern_;
    bool compiled_ = false;
};

}
