#pragma once

#include "core/types.hpp"
#include "render/grid_renderer.hpp"

namespace imgii {

// Composites a CharacterGrid into one canvas of
// (cell_width * grid.width) x (cell_height * grid.height) pixels.
class ImageStitcher {
public:
    // 4 GiB of RGBA.
    static constexpr int64_t MAX_CANVAS_PIXELS = int64_t{1} << 30;

    Result stitch(const CharacterGrid& grid, FrameBuffer& out) const;
};

}
