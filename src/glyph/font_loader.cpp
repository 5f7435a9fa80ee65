#include "font_loader.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

#include <cmath>
#include <fstream>
#include <cstdlib>

namespace imgii {

struct FontInfoImpl {
    stbtt_fontinfo info;
};

namespace {

constexpr size_t kMaxFontBytes = 32 * 1024 * 1024;

bool has_path_traversal(const std::string& path) {
    if (path.find("..") != std::string::npos) return true;
    if (path.find('\0') != std::string::npos) return true;
    return false;
}

bool is_safe_font_path(const std::string& path) {
    if (path.empty()) return false;
    if (has_path_traversal(path)) return false;
    if (path.size() > 4096) return false;
    return true;
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

}  // namespace

std::string FontLoader::find_system_monospace_font() {
    static const char* linux_fonts[] = {
        "/usr/share/fonts/truetype/ubuntu/UbuntuMono-R.ttf",
        "/usr/share/fonts/truetype/ubuntu/UbuntuMono[wght].ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoSansMono-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/liberation-mono.ttf",
        "/usr/share/fonts/dejavu-sans-mono-fonts/DejaVuSansMono.ttf",
        "/usr/local/share/fonts/DejaVuSansMono.ttf",
        nullptr
    };

    static const char* macos_fonts[] = {
        "/System/Library/Fonts/Monaco.ttf",
        "/Library/Fonts/Courier New.ttf",
        nullptr
    };

    static const char* windows_fonts[] = {
        "C:\\Windows\\Fonts\\consola.ttf",
        "C:\\Windows\\Fonts\\cour.ttf",
        "C:\\Windows\\Fonts\\lucon.ttf",
        nullptr
    };

    const char* home = std::getenv("HOME");
    if (home) {
        std::string home_font = std::string(home) + "/.local/share/fonts/UbuntuMono-R.ttf";
        if (file_exists(home_font)) return home_font;
        home_font = std::string(home) + "/.local/share/fonts/DejaVuSansMono.ttf";
        if (file_exists(home_font)) return home_font;
        home_font = std::string(home) + "/.fonts/DejaVuSansMono.ttf";
        if (file_exists(home_font)) return home_font;
    }

    for (const char** paths = linux_fonts; *paths; ++paths) {
        if (file_exists(*paths)) return *paths;
    }

    for (const char** paths = macos_fonts; *paths; ++paths) {
        if (file_exists(*paths)) return *paths;
    }

    for (const char** paths = windows_fonts; *paths; ++paths) {
        if (file_exists(*paths)) return *paths;
    }

    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data) {
        std::string path = std::string(xdg_data) + "/fonts/DejaVuSansMono.ttf";
        if (file_exists(path)) return path;
    }

    return "";
}

FontLoader::FontLoader() : font_info_(std::make_unique<FontInfoImpl>()) {}
FontLoader::~FontLoader() = default;

Result FontLoader::load(const std::string& path, float pixel_height) {
    if (!is_safe_font_path(path)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Invalid or unsafe font path: " + path);
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open font file: " + path);
    }

    std::streamoff fsize = file.tellg();
    if (fsize <= 0) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "Font file is empty: " + path);
    }
    if (static_cast<size_t>(fsize) > kMaxFontBytes) {
        return Result::fail(ErrorCode::FONT_ERROR, "Font file is too large: " + path);
    }
    file.seekg(0);

    std::vector<uint8_t> bytes(static_cast<size_t>(fsize));
    if (!file.read(reinterpret_cast<char*>(bytes.data()), fsize)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Failed to read font file: " + path);
    }

    Result res = load_from_memory(std::move(bytes), pixel_height);
    if (res.failure()) {
        return Result::wrap(ErrorCode::FONT_ERROR, "Unusable font " + path, res);
    }
    source_ = path;
    return res;
}

Result FontLoader::load_from_memory(std::vector<uint8_t> data, float pixel_height) {
    if (!validate_font_data(data.data(), data.size())) {
        return Result::fail(ErrorCode::FONT_ERROR, "Invalid font data");
    }
    if (pixel_height <= 0.0f) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Font pixel height must be positive");
    }

    // stbtt_fontinfo points into the buffer, so it must be owned before init.
    font_data_ = std::move(data);
    loaded_ = false;

    const int offset = stbtt_GetFontOffsetForIndex(font_data_.data(), 0);
    if (offset < 0 || !stbtt_InitFont(&font_info_->info, font_data_.data(), offset)) {
        font_data_.clear();
        return Result::fail(ErrorCode::FONT_ERROR, "Failed to initialize font");
    }

    pixel_height_ = pixel_height;
    scale_ = stbtt_ScaleForPixelHeight(&font_info_->info, pixel_height);

    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(&font_info_->info, &ascent, &descent, &line_gap);
    ascent_px_ = static_cast<int>(std::lround(ascent * scale_));
    line_height_ = static_cast<int>((ascent - descent + line_gap) * scale_);

    int advance, lsb;
    stbtt_GetCodepointHMetrics(&font_info_->info, 'M', &advance, &lsb);
    max_advance_ = static_cast<int>(advance * scale_);

    loaded_ = true;
    return Result::ok();
}

GlyphBitmap FontLoader::render_glyph(uint32_t codepoint) const {
    if (!loaded_) return GlyphBitmap();

    int advance, lsb;
    stbtt_GetCodepointHMetrics(&font_info_->info, static_cast<int>(codepoint), &advance, &lsb);

    int x0, y0, x1, y1;
    stbtt_GetCodepointBitmapBox(&font_info_->info, static_cast<int>(codepoint), scale_, scale_, &x0, &y0, &x1, &y1);

    int w = x1 - x0;
    int h = y1 - y0;

    GlyphBitmap bitmap;
    bitmap.advance = static_cast<int>(advance * scale_);
    bitmap.bearing_x = x0;
    bitmap.bearing_y = y0;
    if (w <= 0 || h <= 0) {
        return bitmap;
    }

    bitmap.width = w;
    bitmap.height = h;
    bitmap.pixels.resize(static_cast<size_t>(w) * h, 0);

    stbtt_MakeCodepointBitmap(&font_info_->info, bitmap.pixels.data(), w, h, w, scale_, scale_,
                              static_cast<int>(codepoint));
    return bitmap;
}

bool FontLoader::has_glyph(uint32_t codepoint) const {
    if (!loaded_) return false;
    return stbtt_FindGlyphIndex(&font_info_->info, static_cast<int>(codepoint)) != 0;
}

bool FontLoader::validate_font_data(const uint8_t* data, size_t size) {
    if (!data || size < 12) return false;

    if (size > kMaxFontBytes) return false;

    uint32_t signature = (static_cast<uint32_t>(data[0]) << 24) |
                         (static_cast<uint32_t>(data[1]) << 16) |
                         (static_cast<uint32_t>(data[2]) << 8) |
                         static_cast<uint32_t>(data[3]);

    return (signature == 0x00010000) ||
           (signature == 0x74727565) ||
           (signature == 0x4F54544F) ||
           (signature == 0x74746366);
}

Result FontLoader::load_system_fallback(float pixel_height) {
    std::string font_path = find_system_monospace_font();

    if (font_path.empty()) {
        return Result::fail(ErrorCode::FONT_ERROR, "No system monospace font found");
    }

    return load(font_path, pixel_height);
}

}
