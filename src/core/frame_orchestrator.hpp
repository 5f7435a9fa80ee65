#pragma once

#include "core/types.hpp"
#include "core/frame_source.hpp"
#include "mapping/ascii_art_renderer.hpp"
#include "render/gif_encoder.hpp"
#include "render/grid_renderer.hpp"
#include "render/image_stitcher.hpp"
#include <vector>

namespace imgii {

struct FrameStats {
    size_t decoded = 0;
    size_t converted = 0;
    size_t dropped = 0;
};

// image -> ASCII text -> CharacterGrid -> canvas, for one frame.
class FramePipeline {
public:
    FramePipeline(const AsciiArtRenderer& ascii, const GridRenderer& grid, const ImageStitcher& stitcher,
                  const RenderOptions& options);

    Result render(const FrameBuffer& image, CellCache& cache, FrameBuffer& canvas) const;

private:
    const AsciiArtRenderer& ascii_;
    const GridRenderer& grid_;
    const ImageStitcher& stitcher_;
    const RenderOptions& options_;
};

// Runs FramePipeline over every frame of an animation in parallel. A frame
// that fails is dropped with a warning; the rest keep their source order and
// metadata.
class FrameOrchestrator {
public:
    explicit FrameOrchestrator(const FramePipeline& pipeline, bool share_cache = true);

    Result process(const std::vector<DecodedFrame>& frames, std::vector<RenderedFrame>& out,
                   FrameStats* stats = nullptr) const;

private:
    const FramePipeline& pipeline_;
    bool share_cache_;
};

}
