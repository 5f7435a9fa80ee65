#pragma once

#include "core/types.hpp"
#include "glyph/glyph_source.hpp"
#include <string>
#include <vector>
#include <memory>

namespace imgii {

struct FontInfoImpl;

// Read-only TrueType handle. Load once before fanning work out, then share
// by const reference.
class FontLoader : public GlyphSource {
public:
    FontLoader();
    ~FontLoader() override;

    FontLoader(const FontLoader&) = delete;
    FontLoader& operator=(const FontLoader&) = delete;

    Result load(const std::string& path, float pixel_height = 16.0f);
    Result load_from_memory(std::vector<uint8_t> data, float pixel_height = 16.0f);
    Result load_system_fallback(float pixel_height = 16.0f);

    GlyphBitmap render_glyph(uint32_t codepoint) const override;
    int baseline() const override { return ascent_px_; }

    bool has_glyph(uint32_t codepoint) const;
    bool is_loaded() const { return loaded_; }

    int line_height() const { return line_height_; }
    int max_advance() const { return max_advance_; }
    float pixel_height() const { return pixel_height_; }
    const std::string& source() const { return source_; }

    static std::string find_system_monospace_font();

private:
    std::unique_ptr<FontInfoImpl> font_info_;
    std::vector<uint8_t> font_data_;
    std::string source_ = "<memory>";
    float scale_ = 1.0f;
    float pixel_height_ = 16.0f;
    int line_height_ = 0;
    int max_advance_ = 0;
    int ascent_px_ = 0;
    bool loaded_ = false;

    static bool validate_font_data(const uint8_t* data, size_t size);
};

}
