#include "frame_orchestrator.hpp"

#include <exception>
#include <iostream>
#include <new>
#include <optional>
#include <sstream>

#ifdef IMGII_HAS_OPENMP
#include <omp.h>
#endif

namespace imgii {

FramePipeline::FramePipeline(const AsciiArtRenderer& ascii, const GridRenderer& grid,
                             const ImageStitcher& stitcher, const RenderOptions& options)
    : ascii_(ascii), grid_(grid), stitcher_(stitcher), options_(options) {}

Result FramePipeline::render(const FrameBuffer& image, CellCache& cache, FrameBuffer& canvas) const {
    std::string text;
    Result res = ascii_.render(image, options_.ascii(), text);
    if (res.failure()) {
        return Result::wrap(ErrorCode::RENDER_ERROR, "ASCII conversion failed", res);
    }

    CharacterGrid grid;
    res = grid_.render(text, cache, grid);
    if (res.failure()) {
        return res;
    }

    return stitcher_.stitch(grid, canvas);
}

FrameOrchestrator::FrameOrchestrator(const FramePipeline& pipeline, bool share_cache)
    : pipeline_(pipeline), share_cache_(share_cache) {}

Result FrameOrchestrator::process(const std::vector<DecodedFrame>& frames, std::vector<RenderedFrame>& out,
                                  FrameStats* stats) const {
    out.clear();
    const int count = static_cast<int>(frames.size());

    // One slot per source frame; completion order never decides placement.
    std::vector<std::optional<RenderedFrame>> slots(frames.size());
    CellCache shared_cache;

#ifdef IMGII_HAS_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < count; ++i) {
        CellCache local_cache;
        CellCache& cache = share_cache_ ? shared_cache : local_cache;

        FrameBuffer canvas;
        Result res;
        try {
            res = pipeline_.render(frames[i].image, cache, canvas);
        } catch (const std::bad_alloc&) {
            res = Result::fail(ErrorCode::MEMORY_ERROR, "out of memory");
        } catch (const std::exception& e) {
            res = Result::fail(ErrorCode::PROCESSING_ERROR, e.what());
        }

        if (res.success()) {
            slots[i] = RenderedFrame{std::move(canvas), frames[i].metadata};
        } else {
            std::ostringstream msg;
            msg << "Warning: dropping frame " << i << " (" << error_code_name(res.error) << "): "
                << res.describe() << "\n";
            std::cerr << msg.str();
        }
    }

    for (auto& slot : slots) {
        if (slot) {
            out.push_back(std::move(*slot));
        }
    }

    if (stats) {
        stats->decoded = frames.size();
        stats->converted = out.size();
        stats->dropped = frames.size() - out.size();
    }
    return Result::ok();
}

}
