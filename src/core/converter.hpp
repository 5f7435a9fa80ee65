#pragma once

#include "core/types.hpp"
#include "core/options.hpp"
#include "core/frame_orchestrator.hpp"
#include "glyph/glyph_source.hpp"
#include "mapping/ansi_token_parser.hpp"
#include "mapping/ascii_art_renderer.hpp"
#include "render/cell_renderer.hpp"
#include "render/grid_renderer.hpp"
#include "render/image_stitcher.hpp"
#include <string>

namespace imgii {

enum class OutputKind {
    Unknown,
    Png,
    Gif
};

OutputKind output_kind(const std::string& path);

// Replaces the first "%d" in `pattern` with `index`.
std::string expand_template(const std::string& pattern, int index);

struct BatchSummary {
    size_t succeeded = 0;
    size_t failed = 0;

    bool all_ok() const { return failed == 0; }
};

// Image/GIF -> colored ASCII -> PNG/GIF. Call init() once before converting.
class Converter {
public:
    Converter(const GlyphSource& glyphs, const RenderOptions& options, const AsciiArtRenderer& ascii);

    Result init(const std::string& pattern = AnsiTokenParser::DEFAULT_PATTERN);

    void set_quiet(bool quiet) { quiet_ = quiet; }

    // Dispatches on the output extension.
    Result convert(const std::string& input, const std::string& output) const;

    // Never throw; allocation and filesystem failures come back as Results.
    Result convert_image(const std::string& input, const std::string& output) const;
    Result convert_gif(const std::string& input, const std::string& output, FrameStats* stats = nullptr) const;

    // Converts input_template/output_template with %d = 1..last_index. PNG
    // output only. Fails if any unit failed; `summary` has the counts.
    Result convert_batch(const std::string& input_template, const std::string& output_template,
                         int last_index, BatchSummary& summary) const;

    // Single-image path without file I/O.
    Result render_image(const FrameBuffer& image, FrameBuffer& canvas) const;

    const FramePipeline& pipeline() const { return pipeline_; }

private:
    // Bodies of convert_image and convert_gif; may throw.
    Result write_image(const std::string& input, const std::string& output) const;
    Result write_gif(const std::string& input, const std::string& output, FrameStats* stats) const;

    const RenderOptions& options_;
    AnsiTokenParser parser_;
    CellRenderer cells_;
    GridRenderer grid_;
    ImageStitcher stitcher_;
    FramePipeline pipeline_;
    FrameOrchestrator orchestrator_;
    bool ready_ = false;
    bool quiet_ = false;
};

}
