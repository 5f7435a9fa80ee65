#include <iostream>
#include <cassert>
#include <string>
#include <vector>

#include "../src/core/types.hpp"
#include "../src/core/options.hpp"
#include "../src/glyph/char_sets.hpp"
#include "../src/mapping/ansi_token_parser.hpp"
#include "../src/mapping/ascii_art_renderer.hpp"
#include "../src/render/cell_renderer.hpp"
#include "../src/render/grid_renderer.hpp"
#include "../src/render/image_stitcher.hpp"
#include "../src/render/png_writer.hpp"
#include "fake_glyphs.hpp"

using namespace imgii;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

namespace {

std::string span(int r, int g, int b, const std::string& ch) {
    return "\x1b[38;2;" + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m" + ch;
}

RenderOptions make_options(int font_size, bool background = false) {
    RenderOptions opts;
    Result res = RenderOptions::Builder().font_size(font_size).background(background).build(opts);
    assert(res.success());
    return opts;
}

AnsiTokenParser make_parser() {
    AnsiTokenParser parser;
    Result res = parser.compile();
    assert(res.success());
    return parser;
}

bool all_pixels(const FrameBuffer& fb, const Color& c) {
    for (int y = 0; y < fb.height(); ++y) {
        for (int x = 0; x < fb.width(); ++x) {
            if (fb.get_pixel(x, y) != c) return false;
        }
    }
    return true;
}

}  // namespace

// --- Token parser ---

TEST(parser_reads_each_span) {
    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> tokens;
    Result res = parser.parse_line(span(255, 0, 0, "A") + span(0, 255, 0, "B") + "\x1b[0m", tokens);
    assert(res.success());
    assert(tokens.size() == 2);
    assert(tokens[0].red == 255 && tokens[0].green == 0 && tokens[0].blue == 0);
    assert(tokens[0].text == "A");
    assert(tokens[1].green == 255 && tokens[1].text == "B");
}

TEST(parser_does_not_merge_equal_colors) {
    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> tokens;
    Result res = parser.parse_line(span(7, 7, 7, "x") + span(7, 7, 7, "x") + span(7, 7, 7, "y"), tokens);
    assert(res.success());
    assert(tokens.size() == 3);
    assert(tokens[0] == tokens[1]);
    assert(tokens[1] != tokens[2]);
}

TEST(parser_takes_one_utf8_character) {
    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> tokens;
    Result res = parser.parse_line(span(1, 2, 3, "\xE2\x96\x88") + span(4, 5, 6, "\xD1\x8F"), tokens);
    assert(res.success());
    assert(tokens.size() == 2);
    assert(tokens[0].text == "\xE2\x96\x88");
    assert(tokens[1].text == "\xD1\x8F");
}

TEST(parser_rejects_channel_overflow) {
    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> tokens;
    Result res = parser.parse_line(span(10, 10, 10, "a") + span(256, 0, 0, "b"), tokens);
    assert(res.failure());
    assert(res.error == ErrorCode::PARSE_VALUE);
    assert(tokens.empty());
    assert(res.message.find("red") != std::string::npos);
    assert(res.message.find("256") != std::string::npos);
    assert(res.cause != nullptr);

    res = parser.parse_line(span(0, 0, 999, "c"), tokens);
    assert(res.error == ErrorCode::PARSE_VALUE);
    assert(res.message.find("blue") != std::string::npos);
    assert(tokens.empty());
}

TEST(parser_rejects_non_digit_channel) {
    AnsiTokenParser parser;
    Result res = parser.compile("\x1b\\[38;2;([0-9a-z]+);([0-9]+);([0-9]+)m");
    assert(res.success());

    std::vector<ColorToken> tokens;
    res = parser.parse_line(span(1, 1, 1, "a") + "\x1b[38;2;1x;0;0mB", tokens);
    assert(res.error == ErrorCode::PARSE_VALUE);
    assert(res.message.find("1x") != std::string::npos);
    assert(tokens.empty());
}

TEST(parser_bad_pattern_fails_compile) {
    AnsiTokenParser parser;
    Result res = parser.compile("([0-9]+");
    assert(res.error == ErrorCode::PATTERN);
    assert(!parser.is_compiled());

    res = parser.compile("\x1b\\[38;2;([0-9]+);([0-9]+)m");
    assert(res.error == ErrorCode::PATTERN);

    std::vector<ColorToken> tokens;
    res = parser.parse_line(span(1, 2, 3, "a"), tokens);
    assert(res.failure());
}

TEST(token_blank_detection) {
    ColorToken space{1, 2, 3, " "};
    ColorToken tab{1, 2, 3, "\t"};
    ColorToken nbsp{1, 2, 3, "\xC2\xA0"};
    ColorToken letter{1, 2, 3, "a"};
    assert(space.is_blank());
    assert(tab.is_blank());
    assert(nbsp.is_blank());
    assert(!letter.is_blank());
}

// --- Cell renderer ---

TEST(blank_cell_matches_configuration) {
    FakeGlyphSource glyphs;
    RenderOptions transparent = make_options(16);
    CellRenderer cells(glyphs, transparent);
    FrameBuffer blank = cells.render_blank();
    assert(blank.width() == 8 && blank.height() == 16);
    assert(all_pixels(blank, Color(0, 0, 0, 0)));

    RenderOptions opaque = make_options(16, true);
    CellRenderer black_cells(glyphs, opaque);
    FrameBuffer black = black_cells.render_blank();
    assert(black.width() == 8 && black.height() == 16);
    assert(all_pixels(black, Color(0, 0, 0, 255)));
    assert(glyphs.calls() == 0);
}

TEST(odd_font_size_truncates_cell_width) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(15);
    CellRenderer cells(glyphs, opts);
    FrameBuffer cell = cells.render_glyph(ColorToken{9, 9, 9, "q"});
    assert(cell.width() == 7 && cell.height() == 15);
}

TEST(glyph_cell_draws_in_token_color) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    CellRenderer cells(glyphs, opts);
    FrameBuffer cell = cells.render_glyph(ColorToken{255, 0, 0, "A"});

    const int top = FakeGlyphSource::BASELINE - FakeGlyphSource::GLYPH_H;
    for (int y = 0; y < cell.height(); ++y) {
        for (int x = 0; x < cell.width(); ++x) {
            bool inked = x >= 1 && x < 1 + FakeGlyphSource::GLYPH_W &&
                         y >= top && y < FakeGlyphSource::BASELINE;
            assert(cell.get_pixel(x, y) == (inked ? Color(255, 0, 0, 255) : Color(0, 0, 0, 0)));
        }
    }
}

TEST(glyph_cell_over_black_background) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16, true);
    CellRenderer cells(glyphs, opts);
    FrameBuffer cell = cells.render_glyph(ColorToken{0, 0, 255, "Z"});
    assert(cell.get_pixel(0, 0) == Color(0, 0, 0, 255));
    assert(cell.get_pixel(2, 10) == Color(0, 0, 255, 255));
}

TEST(glyph_ink_outside_cell_is_clipped) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(4);
    CellRenderer cells(glyphs, opts);
    // Cell is 2x4, baseline 12 puts the fake glyph entirely below it.
    FrameBuffer cell = cells.render_glyph(ColorToken{255, 255, 255, "W"});
    assert(cell.width() == 2 && cell.height() == 4);
    assert(all_pixels(cell, Color(0, 0, 0, 0)));
}

// --- Grid renderer ---

TEST(grid_memoizes_identical_tokens) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    AnsiTokenParser parser = make_parser();
    CellRenderer cells(glyphs, opts);
    GridRenderer grid_renderer(cells, parser);

    std::string line = span(10, 20, 30, "#") + span(10, 20, 30, "#") + span(40, 50, 60, "#");
    std::string text = line + "\n" + line + "\n" + line + "\n";

    CellCache cache;
    CharacterGrid grid;
    Result res = grid_renderer.render(text, cache, grid);
    assert(res.success());
    assert(grid.width == 3 && grid.height == 3);
    assert(grid.cells.size() == 9);
    assert(cache.size() == 2);
    assert(glyphs.calls() <= 2 * 4);

    for (int row = 0; row < 3; ++row) {
        assert(grid.cells[row * 3].get() == grid.cells[0].get());
        assert(grid.cells[row * 3 + 1].get() == grid.cells[0].get());
        assert(grid.cells[row * 3 + 2].get() == grid.cells[2].get());
    }

    // Memoized cells are pixel-identical to fresh renders.
    assert(grid.cell(0, 0) == cells.render_glyph(ColorToken{10, 20, 30, "#"}));
    assert(grid.cell(2, 1) == cells.render_glyph(ColorToken{40, 50, 60, "#"}));
}

TEST(grid_whitespace_never_rasterizes) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    AnsiTokenParser parser = make_parser();
    CellRenderer cells(glyphs, opts);
    GridRenderer grid_renderer(cells, parser);

    std::string line = span(255, 255, 255, " ") + span(0, 0, 0, " ");
    CharacterGrid grid;
    Result res = grid_renderer.render(line + "\n" + line, grid);
    assert(res.success());
    assert(glyphs.calls() == 0);
    assert(grid.cells.size() == 4);
    for (const auto& cell : grid.cells) {
        assert(cell.get() == grid_renderer.blank_cell().get());
    }
    assert(all_pixels(grid.cell(1, 1), Color(0, 0, 0, 0)));
}

TEST(grid_rejects_ragged_rows) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    AnsiTokenParser parser = make_parser();
    CellRenderer cells(glyphs, opts);
    GridRenderer grid_renderer(cells, parser);

    std::string text = span(1, 1, 1, "a") + span(1, 1, 1, "b") + "\n" + span(1, 1, 1, "c") + "\n";
    CharacterGrid grid;
    Result res = grid_renderer.render(text, grid);
    assert(res.error == ErrorCode::WIDTH_MISMATCH);
    assert(res.message.find("line 2") != std::string::npos);
    assert(res.message.find("width 1") != std::string::npos);
    assert(res.message.find("expected 2") != std::string::npos);
    assert(grid.cells.empty());
}

TEST(grid_reports_first_failing_line) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    AnsiTokenParser parser = make_parser();
    CellRenderer cells(glyphs, opts);
    GridRenderer grid_renderer(cells, parser);

    std::string good = span(1, 1, 1, "a");
    std::string text = good + "\n" + span(300, 0, 0, "a") + "\n" + good + "\n" + span(0, 400, 0, "a") + "\n";
    CharacterGrid grid;
    Result res = grid_renderer.render(text, grid);
    assert(res.error == ErrorCode::PARSE_VALUE);
    assert(res.message == "line 2");
    assert(res.describe().find("300") != std::string::npos);
}

TEST(grid_handles_crlf_and_trailing_newline) {
    std::vector<std::string> lines = split_lines("a\r\nb\r\n");
    assert(lines.size() == 2);
    assert(lines[0] == "a" && lines[1] == "b");
    assert(split_lines("").empty());
    assert(split_lines("x").size() == 1);
}

// --- Stitcher ---

TEST(stitch_dimension_law) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    AnsiTokenParser parser = make_parser();
    CellRenderer cells(glyphs, opts);
    GridRenderer grid_renderer(cells, parser);

    std::string line = span(1, 2, 3, "a") + span(4, 5, 6, "b") + span(7, 8, 9, "c");
    CharacterGrid grid;
    assert(grid_renderer.render(line + "\n" + line + "\n", grid).success());

    FrameBuffer canvas;
    Result res = ImageStitcher().stitch(grid, canvas);
    assert(res.success());
    assert(canvas.width() == opts.cell_width() * 3);
    assert(canvas.height() == opts.cell_height() * 2);

    // Exact gather mapping.
    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            const FrameBuffer& cell = grid.cell(x / opts.cell_width(), y / opts.cell_height());
            assert(canvas.get_pixel(x, y) == cell.get_pixel(x % opts.cell_width(), y % opts.cell_height()));
        }
    }
}

TEST(stitch_rejects_bad_grids) {
    FrameBuffer canvas;
    CharacterGrid empty;
    assert(ImageStitcher().stitch(empty, canvas).error == ErrorCode::EMPTY_INPUT);

    CharacterGrid wrong;
    wrong.cells.push_back(std::make_shared<const FrameBuffer>(8, 16));
    wrong.width = 2;
    wrong.height = 1;
    assert(ImageStitcher().stitch(wrong, canvas).error == ErrorCode::INVALID_ARGUMENT);

    CharacterGrid missing_first;
    missing_first.cells.push_back(nullptr);
    missing_first.cells.push_back(std::make_shared<const FrameBuffer>(8, 16));
    missing_first.width = 2;
    missing_first.height = 1;
    assert(ImageStitcher().stitch(missing_first, canvas).error == ErrorCode::INVALID_ARGUMENT);
}

TEST(stitch_refuses_oversized_canvas) {
    // One shared 128x128 cell repeated 100000 times is a 12.8M x 128 canvas,
    // past the pixel cap, while the grid itself stays small.
    CharacterGrid huge;
    CellPtr cell = std::make_shared<const FrameBuffer>(128, 128);
    huge.width = 100000;
    huge.height = 1;
    huge.cells.assign(static_cast<size_t>(huge.width), cell);

    FrameBuffer canvas;
    Result res = ImageStitcher().stitch(huge, canvas);
    assert(res.error == ErrorCode::MEMORY_ERROR);
    assert(canvas.empty());
}

// --- End to end ---

TEST(four_color_blocks_end_to_end) {
    FakeGlyphSource glyphs;
    RenderOptions opts = make_options(16);
    AnsiTokenParser parser = make_parser();
    CellRenderer cells(glyphs, opts);
    GridRenderer grid_renderer(cells, parser);

    std::string text = span(255, 0, 0, "A") + span(0, 255, 0, "B") + "\n" +
                       span(0, 0, 255, "C") + span(255, 255, 0, "D") + "\n";
    CharacterGrid grid;
    assert(grid_renderer.render(text, grid).success());
    assert(grid.width == 2 && grid.height == 2);

    FrameBuffer canvas;
    assert(ImageStitcher().stitch(grid, canvas).success());
    assert(canvas.width() == 16 && canvas.height() == 32);

    // Fake glyph ink sits at x 1..3, y 8..11 of each cell.
    assert(canvas.get_pixel(2, 9) == Color(255, 0, 0, 255));
    assert(canvas.get_pixel(8 + 2, 9) == Color(0, 255, 0, 255));
    assert(canvas.get_pixel(2, 16 + 9) == Color(0, 0, 255, 255));
    assert(canvas.get_pixel(8 + 2, 16 + 9) == Color(255, 255, 0, 255));
    assert(canvas.get_pixel(7, 0) == Color(0, 0, 0, 0));
    assert(canvas.get_pixel(15, 31) == Color(0, 0, 0, 0));
}

// --- ASCII-art renderer ---

TEST(ascii_renderer_emits_parsable_spans) {
    FrameBuffer white(4, 4, Color(255, 255, 255, 255));
    AsciiOptions opts;
    opts.width = 2;

    LuminanceAsciiRenderer renderer;
    std::string text;
    Result res = renderer.render(white, opts, text);
    assert(res.success());

    std::vector<std::string> lines = split_lines(text);
    assert(lines.size() == 1);

    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> tokens;
    assert(parser.parse_line(lines[0], tokens).success());
    assert(tokens.size() == 2);
    assert(tokens[0].red == 255 && tokens[0].green == 255 && tokens[0].blue == 255);
    assert(tokens[0].text == "@");

    opts.invert = true;
    assert(renderer.render(white, opts, text).success());
    assert(parser.parse_line(split_lines(text)[0], tokens).success());
    assert(tokens[0].is_blank());
}

TEST(ascii_renderer_sizes_from_aspect) {
    AsciiOptions opts;
    Size s = LuminanceAsciiRenderer::target_size({256, 128}, opts);
    assert(s.width == DEFAULT_ASCII_WIDTH);
    assert(s.height == 32);

    opts.height = 10;
    s = LuminanceAsciiRenderer::target_size({100, 100}, opts);
    assert(s.width == 20 && s.height == 10);
}

TEST(ascii_renderer_charsets) {
    AsciiOptions opts;
    opts.charset = "nonexistent";
    assert(LuminanceAsciiRenderer::resolve_charset(opts) == CharSet::get_set("minimal"));

    opts.charset = "emoji";
    std::vector<std::string> emoji = LuminanceAsciiRenderer::resolve_charset(opts);
    assert(emoji.size() == 6);
    assert(emoji.front() == " ");
    assert(emoji.back() == "\xF0\x9F\x8C\x95");

    // The override never replaces the ramp; it is a separate sequence.
    opts.characters = " \xE2\x96\x88";
    assert(LuminanceAsciiRenderer::resolve_charset(opts) == emoji);
    std::vector<std::string> custom = LuminanceAsciiRenderer::override_sequence(opts);
    assert(custom.size() == 2);
    assert(custom[1] == "\xE2\x96\x88");
}

TEST(ascii_renderer_override_repeats_by_position) {
    // Dark left half, bright right half: the luminance ramp would split them,
    // the override must not.
    FrameBuffer image(4, 2, Color(0, 0, 0, 255));
    for (int y = 0; y < 2; ++y) {
        for (int x = 2; x < 4; ++x) image.set_pixel(x, y, Color(200, 100, 50, 255));
    }
    image.set_pixel(1, 1, Color(0, 0, 0, 0));

    AsciiOptions opts;
    opts.width = 4;
    opts.height = 2;
    opts.charset = "block";
    opts.characters = "ab\xD1\x8F";

    LuminanceAsciiRenderer renderer;
    std::string text;
    assert(renderer.render(image, opts, text).success());

    std::vector<std::string> lines = split_lines(text);
    assert(lines.size() == 2);
    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> row0, row1;
    assert(parser.parse_line(lines[0], row0).success());
    assert(parser.parse_line(lines[1], row1).success());
    assert(row0.size() == 4 && row1.size() == 4);

    // Row 0 is positions 0..3, row 1 continues at 4..7.
    assert(row0[0].text == "a" && row0[1].text == "b");
    assert(row0[2].text == "\xD1\x8F" && row0[3].text == "a");
    assert(row1[0].text == "b");
    assert(row1[1].is_blank());
    assert(row1[2].text == "a" && row1[3].text == "b");

    assert(row0[0].red == 0 && row0[0].green == 0 && row0[0].blue == 0);
    assert(row0[3].red == 200 && row0[3].green == 100 && row0[3].blue == 50);
}

TEST(ascii_renderer_transparent_and_empty) {
    LuminanceAsciiRenderer renderer;
    AsciiOptions opts;
    opts.width = 3;
    opts.height = 1;
    std::string text;
    assert(renderer.render(FrameBuffer(6, 6), opts, text).success());

    AnsiTokenParser parser = make_parser();
    std::vector<ColorToken> tokens;
    assert(parser.parse_line(split_lines(text)[0], tokens).success());
    assert(tokens.size() == 3);
    for (const auto& t : tokens) assert(t.is_blank());

    Result res = renderer.render(FrameBuffer(), opts, text);
    assert(res.error == ErrorCode::RENDER_ERROR);
}

// --- PNG output ---

TEST(png_writer_produces_png) {
    FrameBuffer image(3, 2, Color(10, 20, 30, 128));
    std::vector<uint8_t> bytes;
    Result res = PngWriter().encode(image, bytes);
    assert(res.success());
    assert(bytes.size() > 8);
    const uint8_t signature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    for (int i = 0; i < 8; ++i) assert(bytes[i] == signature[i]);

    assert(PngWriter().encode(FrameBuffer(), bytes).error == ErrorCode::EMPTY_INPUT);
}

int main() {
    std::cout << "=== imgii Pipeline Test Suite ===\n\n";

    std::cout << "--- Token Parser Tests ---\n";
    RUN_TEST(parser_reads_each_span);
    RUN_TEST(parser_does_not_merge_equal_colors);
    RUN_TEST(parser_takes_one_utf8_character);
    RUN_TEST(parser_rejects_channel_overflow);
    RUN_TEST(parser_rejects_non_digit_channel);
    RUN_TEST(parser_bad_pattern_fails_compile);
    RUN_TEST(token_blank_detection);

    std::cout << "\n--- Cell Renderer Tests ---\n";
    RUN_TEST(blank_cell_matches_configuration);
    RUN_TEST(odd_font_size_truncates_cell_width);
    RUN_TEST(glyph_cell_draws_in_token_color);
    RUN_TEST(glyph_cell_over_black_background);
    RUN_TEST(glyph_ink_outside_cell_is_clipped);

    std::cout << "\n--- Grid Renderer Tests ---\n";
    RUN_TEST(grid_memoizes_identical_tokens);
    RUN_TEST(grid_whitespace_never_rasterizes);
    RUN_TEST(grid_rejects_ragged_rows);
    RUN_TEST(grid_reports_first_failing_line);
    RUN_TEST(grid_handles_crlf_and_trailing_newline);

    std::cout << "\n--- Stitcher Tests ---\n";
    RUN_TEST(stitch_dimension_law);
    RUN_TEST(stitch_rejects_bad_grids);
    RUN_TEST(stitch_refuses_oversized_canvas);
    RUN_TEST(four_color_blocks_end_to_end);

    std::cout << "\n--- ASCII Renderer Tests ---\n";
    RUN_TEST(ascii_renderer_emits_parsable_spans);
    RUN_TEST(ascii_renderer_sizes_from_aspect);
    RUN_TEST(ascii_renderer_charsets);
    RUN_TEST(ascii_renderer_override_repeats_by_position);
    RUN_TEST(ascii_renderer_transparent_and_empty);

    std::cout << "\n--- Output Tests ---\n";
    RUN_TEST(png_writer_produces_png);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll pipeline tests passed.\n";
        return 0;
    }

    std::cout << "\nSome pipeline tests failed.\n";
    return 1;
}
