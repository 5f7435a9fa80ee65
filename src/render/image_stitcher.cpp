#include "image_stitcher.hpp"

#include <cstring>
#include <limits>
#include <new>

#ifdef IMGII_HAS_OPENMP
#include <omp.h>
#endif

namespace imgii {

Result ImageStitcher::stitch(const CharacterGrid& grid, FrameBuffer& out) const {
    if (grid.cells.empty()) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "no cells to stitch");
    }
    if (static_cast<size_t>(grid.width) * grid.height != grid.cells.size() || grid.width <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "grid is " + std::to_string(grid.width) + "x" + std::to_string(grid.height) +
                            " but holds " + std::to_string(grid.cells.size()) + " cells");
    }

    for (const CellPtr& cell : grid.cells) {
        if (!cell) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "grid has a missing cell");
        }
    }
    const int cell_w = grid.cells.front()->width();
    const int cell_h = grid.cells.front()->height();
    if (cell_w <= 0 || cell_h <= 0) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "cells have zero size");
    }
    for (const CellPtr& cell : grid.cells) {
        if (cell->width() != cell_w || cell->height() != cell_h) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "cells differ in size");
        }
    }

    const int64_t wide = static_cast<int64_t>(cell_w) * grid.width;
    const int64_t tall = static_cast<int64_t>(cell_h) * grid.height;
    if (wide > std::numeric_limits<int>::max() || tall > std::numeric_limits<int>::max() ||
        wide * tall > MAX_CANVAS_PIXELS) {
        return Result::fail(ErrorCode::MEMORY_ERROR,
                            "canvas of " + std::to_string(wide) + "x" + std::to_string(tall) + " is too large");
    }
    const int out_w = static_cast<int>(wide);
    const int out_h = static_cast<int>(tall);
    try {
        out = FrameBuffer(out_w, out_h);
    } catch (const std::bad_alloc&) {
        return Result::fail(ErrorCode::MEMORY_ERROR,
                            "cannot allocate " + std::to_string(out_w) + "x" + std::to_string(out_h) + " canvas");
    }

    // Each output row touches one cell row; copy whole cell spans at a time.
    const size_t span = static_cast<size_t>(cell_w) * 4;
#ifdef IMGII_HAS_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int y = 0; y < out_h; ++y) {
        const int row = y / cell_h;
        const int cy = y % cell_h;
        uint8_t* dst = out.row(y);
        for (int column = 0; column < grid.width; ++column) {
            const FrameBuffer& cell = grid.cell(column, row);
            std::memcpy(dst + column * span, cell.row(cy), span);
        }
    }

    return Result::ok();
}

}
