#pragma once

#include "core/types.hpp"
#include "core/options.hpp"
#include "glyph/glyph_source.hpp"
#include "mapping/ansi_token_parser.hpp"

namespace imgii {

// Rasterizes single tokens into fixed-size cells of
// (font_size / 2) x font_size pixels.
class CellRenderer {
public:
    CellRenderer(const GlyphSource& glyphs, const RenderOptions& options);

    // Token text drawn at the cell origin in the token color, over an opaque
    // black fill when the background option is set. Ink outside the cell is
    // clipped.
    FrameBuffer render_glyph(const ColorToken& token) const;

    // Transparent cell, or solid black with the background option. Identical
    // for every call within a run.
    FrameBuffer render_blank() const;

    int cell_width() const { return options_.cell_width(); }
    int cell_height() const { return options_.cell_height(); }

private:
    const GlyphSource& glyphs_;
    const RenderOptions& options_;

    void draw_glyph(FrameBuffer& cell, const GlyphBitmap& glyph, int pen_x, const Color& color) const;
};

}
