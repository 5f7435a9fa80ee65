#include "cell_renderer.hpp"
#include "glyph/char_sets.hpp"

#include <cmath>

namespace imgii {

namespace {

const Color kBackground(0, 0, 0, 255);

// Source-over with a coverage-scaled source alpha.
void blend_over(uint8_t* dst, const Color& src, uint8_t coverage) {
    const float sa = coverage / 255.0f;
    const float da = dst[3] / 255.0f;
    const float out_a = sa + da * (1.0f - sa);
    if (out_a <= 0.0f) {
        return;
    }
    auto mix = [&](uint8_t s, uint8_t d) {
        float v = (s * sa + d * da * (1.0f - sa)) / out_a;
        return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
    };
    dst[0] = mix(src.r, dst[0]);
    dst[1] = mix(src.g, dst[1]);
    dst[2] = mix(src.b, dst[2]);
    dst[3] = static_cast<uint8_t>(std::clamp(std::lround(out_a * 255.0f), 0L, 255L));
}

}  // namespace

CellRenderer::CellRenderer(const GlyphSource& glyphs, const RenderOptions& options)
    : glyphs_(glyphs), options_(options) {}

FrameBuffer CellRenderer::render_blank() const {
    if (options_.background()) {
        return FrameBuffer(cell_width(), cell_height(), kBackground);
    }
    return FrameBuffer(cell_width(), cell_height());
}

FrameBuffer CellRenderer::render_glyph(const ColorToken& token) const {
    FrameBuffer cell = render_blank();
    const Color color(token.red, token.green, token.blue, 255);

    int pen_x = 0;
    for (uint32_t cp : CharSet::to_codepoints(token.text)) {
        GlyphBitmap glyph = glyphs_.render_glyph(cp);
        draw_glyph(cell, glyph, pen_x, color);
        pen_x += glyph.advance;
    }
    return cell;
}

void CellRenderer::draw_glyph(FrameBuffer& cell, const GlyphBitmap& glyph, int pen_x, const Color& color) const {
    if (glyph.empty()) return;

    const int origin_x = pen_x + glyph.bearing_x;
    const int origin_y = glyphs_.baseline() + glyph.bearing_y;

    for (int gy = 0; gy < glyph.height; ++gy) {
        const int py = origin_y + gy;
        if (py < 0 || py >= cell.height()) continue;
        uint8_t* row = cell.row(py);
        for (int gx = 0; gx < glyph.width; ++gx) {
            const int px = origin_x + gx;
            if (px < 0 || px >= cell.width()) continue;
            uint8_t coverage = glyph.pixels[static_cast<size_t>(gy) * glyph.width + gx];
            if (coverage == 0) continue;
            blend_over(row + static_cast<size_t>(px) * 4, color, coverage);
        }
    }
}

}
