#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace imgii {

// RGBA PNG output through libavcodec's png encoder.
class PngWriter {
public:
    Result encode(const FrameBuffer& image, std::vector<uint8_t>& out) const;
    Result write(const std::string& filename, const FrameBuffer& image) const;
};

}
