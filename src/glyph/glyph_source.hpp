#pragma once

#include <cstdint>
#include <vector>

namespace imgii {

// 8-bit coverage mask for one glyph, positioned relative to the pen origin
// on the baseline.
struct GlyphBitmap {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int advance = 0;
    int bearing_x = 0;
    int bearing_y = 0;

    bool empty() const { return pixels.empty(); }
};

// Rasterization backend used by the cell renderer. Implementations must be
// safe to call concurrently once loaded.
class GlyphSource {
public:
    virtual ~GlyphSource() = default;

    virtual GlyphBitmap render_glyph(uint32_t codepoint) const = 0;
    // Distance in pixels from the top of a cell to the baseline.
    virtual int baseline() const = 0;
};

}
