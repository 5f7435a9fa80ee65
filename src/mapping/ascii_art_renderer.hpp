#pragma once

#include "core/types.hpp"
#include "core/options.hpp"
#include <string>
#include <vector>

namespace imgii {

// Image -> colored ASCII art. Each output line is a run of
// ESC[38;2;R;G;Bm<char> spans.
class AsciiArtRenderer {
public:
    virtual ~AsciiArtRenderer() = default;
    virtual Result render(const FrameBuffer& image, const AsciiOptions& options, std::string& out) const = 0;
};

// Picks each cell's character by mean luminance, or from the repeating
// override, and colors it with the mean color of the pixels it covers.
class LuminanceAsciiRenderer : public AsciiArtRenderer {
public:
    Result render(const FrameBuffer& image, const AsciiOptions& options, std::string& out) const override;

    // Resolves the character grid size for an image. Missing dimensions follow
    // the image aspect, with characters assumed twice as tall as wide.
    static Size target_size(const Size& image, const AsciiOptions& options);

    // Named luminance ramp, minimal when unknown.
    static std::vector<std::string> resolve_charset(const AsciiOptions& options);

    // Characters of the literal override, empty when none is set. Cell
    // (row, col) gets sequence[(row * width + col) % size], ignoring luminance.
    static std::vector<std::string> override_sequence(const AsciiOptions& options);
};

}
