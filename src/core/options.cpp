#include "core/options.hpp"

namespace imgii {

Result RenderOptions::Builder::build(RenderOptions& out) const {
    if (font_size_ < 2) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "font size must be at least 2, got " + std::to_string(font_size_));
    }
    if (ascii_.width < 0 || ascii_.height < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "ASCII width and height must not be negative");
    }

    RenderOptions opts;
    opts.font_size_ = font_size_;
    opts.background_ = background_;
    opts.share_cache_ = share_cache_;
    opts.ascii_ = ascii_;
    if (opts.ascii_.width == 0 && opts.ascii_.height == 0) {
        opts.ascii_.width = DEFAULT_ASCII_WIDTH;
    }
    out = opts;
    return Result::ok();
}

}
