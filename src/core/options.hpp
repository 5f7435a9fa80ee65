#pragma once

#include "core/types.hpp"
#include <string>

namespace imgii {

constexpr int DEFAULT_FONT_SIZE = 16;
constexpr int DEFAULT_ASCII_WIDTH = 128;

// Settings handed to the ASCII-art renderer.
struct AsciiOptions {
    int width = 0;
    int height = 0;
    std::string charset = "minimal";
    std::string characters;
    bool invert = false;
};

// Immutable settings for one conversion run. Build once, pass by const
// reference.
class RenderOptions {
public:
    class Builder {
    public:
        Builder& font_size(int size) { font_size_ = size; return *this; }
        Builder& background(bool enabled) { background_ = enabled; return *this; }
        Builder& width(int cols) { ascii_.width = cols; return *this; }
        Builder& height(int rows) { ascii_.height = rows; return *this; }
        Builder& charset(const std::string& name) { ascii_.charset = name; return *this; }
        Builder& characters(const std::string& chars) { ascii_.characters = chars; return *this; }
        Builder& invert(bool enabled) { ascii_.invert = enabled; return *this; }
        Builder& share_cache_across_frames(bool enabled) { share_cache_ = enabled; return *this; }

        Result build(RenderOptions& out) const;

    private:
        int font_size_ = DEFAULT_FONT_SIZE;
        bool background_ = false;
        bool share_cache_ = true;
        AsciiOptions ascii_;
    };

    RenderOptions() = default;

    int font_size() const { return font_size_; }
    bool background() const { return background_; }
    bool share_cache_across_frames() const { return share_cache_; }
    const AsciiOptions& ascii() const { return ascii_; }

    // Cells assume a monospace face roughly twice as tall as it is wide.
    int cell_width() const { return font_size_ / 2; }
    int cell_height() const { return font_size_; }

private:
    int font_size_ = DEFAULT_FONT_SIZE;
    bool background_ = false;
    bool share_cache_ = true;
    AsciiOptions ascii_;
};

}
