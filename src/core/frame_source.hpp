#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace imgii {

// Placement and timing of one animation frame on the shared canvas.
struct FrameMetadata {
    int left = 0;
    int top = 0;
    int delay_ms = 100;

    bool operator==(const FrameMetadata& other) const {
        return left == other.left && top == other.top && delay_ms == other.delay_ms;
    }
    bool operator!=(const FrameMetadata& other) const { return !(*this == other); }
};

struct DecodedFrame {
    FrameBuffer image;
    FrameMetadata metadata;
};

// Decodes a still image to RGBA. stb_image first, then the first frame FFmpeg
// can decode.
Result load_still_image(const std::string& path, FrameBuffer& out);

// Decodes every frame of an animated GIF, composited to the full logical
// screen. Delays are the file's own, zero included; DEFAULT_DELAY_MS only
// fills in when a frame carries none.
class GifDecoder {
public:
    static constexpr int DEFAULT_DELAY_MS = 100;

    Result decode(const std::string& path, std::vector<DecodedFrame>& out) const;
};

}
