#include "ascii_art_renderer.hpp"
#include "glyph/char_sets.hpp"

#include <cmath>
#include <sstream>

namespace imgii {

namespace {

constexpr float CHAR_ASPECT = 2.0f;

struct CellColor {
    uint8_t r = 0, g = 0, b = 0;
    bool transparent = true;
};

// Box filter over the source pixels a cell covers, weighted by alpha.
CellColor sample_cell(const FrameBuffer& image, int x0, int y0, int x1, int y1) {
    uint64_t sr = 0, sg = 0, sb = 0, sa = 0;
    for (int y = y0; y < y1; ++y) {
        const uint8_t* row = image.row(y);
        for (int x = x0; x < x1; ++x) {
            const uint8_t* px = row + static_cast<size_t>(x) * 4;
            sr += static_cast<uint64_t>(px[0]) * px[3];
            sg += static_cast<uint64_t>(px[1]) * px[3];
            sb += static_cast<uint64_t>(px[2]) * px[3];
            sa += px[3];
        }
    }
    CellColor c;
    if (sa == 0) return c;
    c.r = static_cast<uint8_t>((sr + sa / 2) / sa);
    c.g = static_cast<uint8_t>((sg + sa / 2) / sa);
    c.b = static_cast<uint8_t>((sb + sa / 2) / sa);
    c.transparent = false;
    return c;
}

}  // namespace

Size LuminanceAsciiRenderer::target_size(const Size& image, const AsciiOptions& options) {
    if (image.width <= 0 || image.height <= 0) return {};

    int w = options.width;
    int h = options.height;
    if (w <= 0 && h <= 0) w = DEFAULT_ASCII_WIDTH;

    const float aspect = static_cast<float>(image.height) / image.width;
    if (h <= 0) {
        h = static_cast<int>(std::lround(w * aspect / CHAR_ASPECT));
    } else if (w <= 0) {
        w = static_cast<int>(std::lround(h * CHAR_ASPECT / aspect));
    }
    return {std::max(w, 1), std::max(h, 1)};
}

std::vector<std::string> LuminanceAsciiRenderer::resolve_charset(const AsciiOptions& options) {
    return CharSet::get_set(options.charset);
}

std::vector<std::string> LuminanceAsciiRenderer::override_sequence(const AsciiOptions& options) {
    return CharSet::to_glyphs(options.characters);
}

Result LuminanceAsciiRenderer::render(const FrameBuffer& image, const AsciiOptions& options, std::string& out) const {
    out.clear();
    if (image.empty()) {
        return Result::fail(ErrorCode::RENDER_ERROR, "cannot render an empty image");
    }

    const Size grid = target_size(image.size(), options);
    if (grid.width <= 0 || grid.height <= 0) {
        return Result::fail(ErrorCode::RENDER_ERROR, "target size is zero");
    }

    const std::vector<std::string> sequence = override_sequence(options);
    const std::vector<std::string> chars = resolve_charset(options);
    if (chars.empty()) {
        return Result::fail(ErrorCode::RENDER_ERROR, "character set is empty");
    }
    const int last = static_cast<int>(chars.size()) - 1;
    static const std::string space = " ";

    std::ostringstream ss;
    for (int row = 0; row < grid.height; ++row) {
        const int y0 = static_cast<int>(static_cast<int64_t>(row) * image.height() / grid.height);
        int y1 = static_cast<int>(static_cast<int64_t>(row + 1) * image.height() / grid.height);
        y1 = std::max(y1, y0 + 1);

        for (int col = 0; col < grid.width; ++col) {
            const int x0 = static_cast<int>(static_cast<int64_t>(col) * image.width() / grid.width);
            int x1 = static_cast<int>(static_cast<int64_t>(col + 1) * image.width() / grid.width);
            x1 = std::max(x1, x0 + 1);

            CellColor c = sample_cell(image, x0, y0, std::min(x1, image.width()), std::min(y1, image.height()));
            const std::string* ch = &space;
            if (!c.transparent && !sequence.empty()) {
                // Indexed by position, so transparent cells still use up a slot.
                const size_t pos = static_cast<size_t>(row) * grid.width + col;
                ch = &sequence[pos % sequence.size()];
            } else if (!c.transparent) {
                float lum = Color(c.r, c.g, c.b).luminance();
                if (options.invert) lum = 1.0f - lum;
                int idx = static_cast<int>(std::lround(lum * last));
                ch = &chars[std::clamp(idx, 0, last)];
            }

            ss << "\033[38;2;" << static_cast<int>(c.r) << ";" << static_cast<int>(c.g) << ";"
               << static_cast<int>(c.b) << "m" << *ch;
        }
        ss << "\033[0m\n";
    }

    out = ss.str();
    return Result::ok();
}

}
