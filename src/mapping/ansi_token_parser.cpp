#include "ansi_token_parser.hpp"
#include "glyph/char_sets.hpp"

#include <charconv>
#include <functional>
#include <system_error>

namespace imgii {

const char* const AnsiTokenParser::DEFAULT_PATTERN = "\x1b\\[38;2;([0-9]+);([0-9]+);([0-9]+)m";

namespace {

bool is_whitespace_codepoint(uint32_t cp) {
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

Result parse_channel(const char* channel, const std::string& digits, const std::string& span, uint8_t& out) {
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec == std::errc() && ptr != last) {
        ec = std::errc::invalid_argument;
    }
    if (ec != std::errc()) {
        Result cause = Result::fail(ErrorCode::PARSE_VALUE, std::make_error_code(ec).message());
        return Result::wrap(ErrorCode::PARSE_VALUE,
                            std::string("failed to parse ") + channel + " channel from \"" + digits +
                            "\" in span \"" + span + "\"",
                            cause);
    }
    return Result::ok();
}

}  // namespace

bool ColorToken::is_blank() const {
    for (uint32_t cp : CharSet::to_codepoints(text)) {
        if (!is_whitespace_codepoint(cp)) return false;
    }
    return true;
}

size_t ColorTokenHash::operator()(const ColorToken& token) const {
    size_t h = std::hash<std::string>()(token.text);
    size_t rgb = (static_cast<size_t>(token.red) << 16) |
                 (static_cast<size_t>(token.green) << 8) |
                 static_cast<size_t>(token.blue);
    h ^= rgb + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

Result AnsiTokenParser::compile(const std::string& pattern) {
    compiled_ = false;
    try {
        pattern_ = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        return Result::wrap(ErrorCode::PATTERN, "invalid color escape pattern",
                            Result::fail(ErrorCode::PATTERN, e.what()));
    }
    if (pattern_.mark_count() != 3) {
        return Result::fail(ErrorCode::PATTERN,
                            "color escape pattern needs 3 capture groups, has " +
                            std::to_string(pattern_.mark_count()));
    }
    compiled_ = true;
    return Result::ok();
}

Result AnsiTokenParser::parse_line(const std::string& line, std::vector<ColorToken>& out) const {
    out.clear();
    if (!compiled_) {
        return Result::fail(ErrorCode::PATTERN, "token parser used before compile()");
    }

    std::smatch match;
    auto search_from = line.cbegin();
    while (std::regex_search(search_from, line.cend(), match, pattern_)) {
        const size_t char_pos = static_cast<size_t>(match[0].second - line.cbegin());
        const size_t char_len = CharSet::sequence_length(line, char_pos);
        if (char_len == 0) {
            // Escape with nothing (or a broken byte) after it colors nothing.
            search_from = match[0].second;
            if (search_from == line.cend()) break;
            ++search_from;
            continue;
        }

        const std::string span = match.str(0) + line.substr(char_pos, char_len);
        ColorToken token;
        Result res = parse_channel("red", match.str(1), span, token.red);
        if (res.success()) res = parse_channel("green", match.str(2), span, token.green);
        if (res.success()) res = parse_channel("blue", match.str(3), span, token.blue);
        if (res.failure()) {
            out.clear();
            return res;
        }
        token.text = line.substr(char_pos, char_len);
        out.push_back(std::move(token));

        search_from = line.cbegin() + static_cast<std::ptrdiff_t>(char_pos + char_len);
    }

    return Result::ok();
}

}
