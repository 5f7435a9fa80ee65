#pragma once

#include <vector>
#include <cstdint>
#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

namespace imgii {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    MEMORY_ERROR,
    PROCESSING_ERROR,
    FONT_ERROR,
    INVALID_ARGUMENT,
    PARSE_VALUE,
    PATTERN,
    WIDTH_MISMATCH,
    EMPTY_INPUT,
    RENDER_ERROR,
    CODEC_ERROR
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;
    std::shared_ptr<const Result> cause;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    // Full message including every wrapped cause, outermost first.
    std::string describe() const;

    static Result ok() { return {ErrorCode::SUCCESS, "", nullptr}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg, nullptr}; }
    static Result wrap(ErrorCode code, const std::string& msg, const Result& inner) {
        return {code, msg, std::make_shared<const Result>(inner)};
    }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    float luminance() const {
        return (0.2126f * r + 0.7152f * g + 0.0722f * b) / 255.0f;
    }
};

// Row-major RGBA8 pixel buffer. Used for glyph cells, stitched canvases and
// decoded source images alike.
class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    const uint8_t* row(int y) const { return data_.data() + static_cast<size_t>(y) * width_ * 4; }
    uint8_t* row(int y) { return data_.data() + static_cast<size_t>(y) * width_ * 4; }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    void fill(const Color& c) {
        for (size_t i = 0; i + 3 < data_.size(); i += 4) {
            data_[i] = c.r;
            data_[i+1] = c.g;
            data_[i+2] = c.b;
            data_[i+3] = c.a;
        }
    }

    void clear() {
        std::fill(data_.begin(), data_.end(), 0);
    }

    bool operator==(const FrameBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }
    bool operator!=(const FrameBuffer& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

}
