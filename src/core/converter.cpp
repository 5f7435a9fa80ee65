#include "converter.hpp"
#include "render/gif_encoder.hpp"
#include "render/png_writer.hpp"

#include <cctype>
#include <iostream>
#include <new>
#include <sstream>

#ifdef IMGII_HAS_OPENMP
#include <omp.h>
#endif

namespace imgii {

namespace {

bool ends_with_ci(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    size_t offset = value.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(value[offset + i]);
        unsigned char b = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

}  // namespace

OutputKind output_kind(const std::string& path) {
    if (ends_with_ci(path, ".png")) return OutputKind::Png;
    if (ends_with_ci(path, ".gif")) return OutputKind::Gif;
    return OutputKind::Unknown;
}

std::string expand_template(const std::string& pattern, int index) {
    std::string result = pattern;
    size_t pos = result.find("%d");
    if (pos != std::string::npos) {
        result.replace(pos, 2, std::to_string(index));
    }
    return result;
}

Converter::Converter(const GlyphSource& glyphs, const RenderOptions& options, const AsciiArtRenderer& ascii)
    : options_(options),
      cells_(glyphs, options),
      grid_(cells_, parser_),
      pipeline_(ascii, grid_, stitcher_, options),
      orchestrator_(pipeline_, options.share_cache_across_frames()) {}

Result Converter::init(const std::string& pattern) {
    Result res = parser_.compile(pattern);
    ready_ = res.success();
    return res;
}

Result Converter::render_image(const FrameBuffer& image, FrameBuffer& canvas) const {
    if (!ready_) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "converter used before init()");
    }
    CellCache cache;
    return pipeline_.render(image, cache, canvas);
}

Result Converter::convert(const std::string& input, const std::string& output) const {
    switch (output_kind(output)) {
        case OutputKind::Png:
            return convert_image(input, output);
        case OutputKind::Gif:
            return convert_gif(input, output);
        default:
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                                "Unsupported output format: " + output + " (expected .png or .gif)");
    }
}

Result Converter::convert_image(const std::string& input, const std::string& output) const {
    try {
        return write_image(input, output);
    } catch (const std::bad_alloc&) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "out of memory converting " + input);
    } catch (const std::exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "converting " + input + ": " + e.what());
    }
}

Result Converter::convert_gif(const std::string& input, const std::string& output, FrameStats* stats) const {
    try {
        return write_gif(input, output, stats);
    } catch (const std::bad_alloc&) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "out of memory converting " + input);
    } catch (const std::exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "converting " + input + ": " + e.what());
    }
}

Result Converter::write_image(const std::string& input, const std::string& output) const {
    FrameBuffer image;
    Result res = load_still_image(input, image);
    if (res.failure()) {
        return res;
    }

    FrameBuffer canvas;
    res = render_image(image, canvas);
    if (res.failure()) {
        return Result::wrap(res.error, "Failed to convert " + input, res);
    }

    res = PngWriter().write(output, canvas);
    if (res.failure()) {
        return res;
    }

    if (!quiet_) {
        std::cout << "Wrote " << output << " (" << canvas.width() << "x" << canvas.height() << ")\n";
    }
    return Result::ok();
}

Result Converter::write_gif(const std::string& input, const std::string& output, FrameStats* stats) const {
    if (!ready_) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "converter used before init()");
    }

    std::vector<DecodedFrame> frames;
    Result res = GifDecoder().decode(input, frames);
    if (res.failure()) {
        return res;
    }

    std::vector<RenderedFrame> rendered;
    FrameStats local_stats;
    res = orchestrator_.process(frames, rendered, &local_stats);
    if (stats) *stats = local_stats;
    if (res.failure()) {
        return res;
    }
    if (rendered.empty()) {
        return Result::fail(ErrorCode::EMPTY_INPUT,
                            "all " + std::to_string(local_stats.decoded) + " frames of " + input + " failed");
    }

    GifEncoder encoder;
    res = encoder.encode(output, rendered);
    if (res.failure()) {
        return res;
    }

    if (!quiet_) {
        std::cout << "Wrote " << output << ": " << local_stats.converted << "/" << local_stats.decoded
                  << " frames";
        if (local_stats.dropped > 0) {
            std::cout << ", " << local_stats.dropped << " dropped";
        }
        std::cout << "\n";
    }
    return Result::ok();
}

Result Converter::convert_batch(const std::string& input_template, const std::string& output_template,
                                int last_index, BatchSummary& summary) const {
    summary = BatchSummary();

    if (output_kind(output_template) != OutputKind::Png) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "batch mode writes PNG only, got " + output_template);
    }
    if (input_template.find("%d") == std::string::npos || output_template.find("%d") == std::string::npos) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "batch mode needs %d in both input and output paths");
    }
    if (last_index < 1) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "final index must be at least 1, got " + std::to_string(last_index));
    }

    size_t succeeded = 0;
    size_t failed = 0;

#ifdef IMGII_HAS_OPENMP
    #pragma omp parallel for schedule(dynamic) reduction(+:succeeded, failed)
#endif
    for (int i = 1; i <= last_index; ++i) {
        // Exceptions must not escape an OpenMP loop body.
        try {
            const std::string input = expand_template(input_template, i);
            const std::string output = expand_template(output_template, i);
            Result res = convert_image(input, output);
            if (res.success()) {
                ++succeeded;
            } else {
                ++failed;
                std::ostringstream msg;
                msg << "Error: " << input << ": " << res.describe() << "\n";
                std::cerr << msg.str();
            }
        } catch (const std::exception& e) {
            ++failed;
            std::ostringstream msg;
            msg << "Error: unit " << i << ": " << e.what() << "\n";
            std::cerr << msg.str();
        }
    }

    summary.succeeded = succeeded;
    summary.failed = failed;

    if (!quiet_) {
        std::cout << "Converted " << succeeded << "/" << last_index << " files\n";
    }
    if (failed > 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR,
                            std::to_string(failed) + " of " + std::to_string(last_index) + " files failed");
    }
    return Result::ok();
}

}
