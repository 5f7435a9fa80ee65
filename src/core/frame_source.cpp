#include "frame_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <limits>
#include <system_error>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include "stb_image.h"

#ifdef IMGII_USE_OPENCV
#include <opencv2/opencv.hpp>
#endif

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace imgii {

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool check_image_extension(const std::string& path) {
    std::string lower = to_lower_copy(path);
    return lower.ends_with(".png") || lower.ends_with(".jpg") ||
           lower.ends_with(".jpeg") || lower.ends_with(".bmp") ||
           lower.ends_with(".gif") || lower.ends_with(".tiff") ||
           lower.ends_with(".webp");
}

AVCodecID image_codec_from_extension(const std::string& path) {
    std::string lower = to_lower_copy(path);
    if (lower.ends_with(".png")) return AV_CODEC_ID_PNG;
    if (lower.ends_with(".jpg") || lower.ends_with(".jpeg")) return AV_CODEC_ID_MJPEG;
    if (lower.ends_with(".bmp")) return AV_CODEC_ID_BMP;
    if (lower.ends_with(".gif")) return AV_CODEC_ID_GIF;
    if (lower.ends_with(".tiff")) return AV_CODEC_ID_TIFF;
    if (lower.ends_with(".webp")) return AV_CODEC_ID_WEBP;
    return AV_CODEC_ID_NONE;
}

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Owns every FFmpeg handle of one decode; released on scope exit.
struct FFmpegDecoder {
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    const AVCodec* codec = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    AVFrame* rgba_frame = nullptr;
    SwsContext* sws_ctx = nullptr;
    int stream_idx = -1;
    bool eof = false;
    Size size;
    std::vector<uint8_t> rgba_buffer;

    FFmpegDecoder() = default;
    FFmpegDecoder(const FFmpegDecoder&) = delete;
    FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;
    ~FFmpegDecoder() { close(); }

    void close() {
        if (sws_ctx) sws_freeContext(sws_ctx);
        if (rgba_frame) av_frame_free(&rgba_frame);
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        if (format_ctx) avformat_close_input(&format_ctx);

        sws_ctx = nullptr;
        rgba_frame = nullptr;
        frame = nullptr;
        packet = nullptr;
        codec_ctx = nullptr;
        format_ctx = nullptr;
        stream_idx = -1;
        eof = false;
        rgba_buffer.clear();
    }

    AVStream* stream() const { return format_ctx->streams[stream_idx]; }
};

bool ensure_rgba_pipeline(FFmpegDecoder& dec, int width, int height, AVPixelFormat src_fmt) {
    if (width <= 0 || height <= 0 || !dec.rgba_frame) {
        return false;
    }

    if (dec.sws_ctx) {
        sws_freeContext(dec.sws_ctx);
        dec.sws_ctx = nullptr;
    }

    int rgba_size = av_image_get_buffer_size(AV_PIX_FMT_RGBA, width, height, 1);
    if (rgba_size <= 0) {
        return false;
    }

    dec.rgba_buffer.resize(static_cast<size_t>(rgba_size));
    if (av_image_fill_arrays(dec.rgba_frame->data, dec.rgba_frame->linesize, dec.rgba_buffer.data(),
                             AV_PIX_FMT_RGBA, width, height, 1) < 0) {
        dec.rgba_buffer.clear();
        return false;
    }

    dec.sws_ctx = sws_getContext(width, height, src_fmt,
                                 width, height, AV_PIX_FMT_RGBA,
                                 SWS_POINT, nullptr, nullptr, nullptr);
    if (!dec.sws_ctx) {
        dec.rgba_buffer.clear();
        return false;
    }

    return true;
}

Result open_decoder(const std::string& path, FFmpegDecoder& dec) {
    dec.close();

    // The gif demuxer swaps delays under min_delay for its own default; keep
    // what the file says.
    AVDictionary* demux_opts = nullptr;
    av_dict_set(&demux_opts, "min_delay", "0", 0);
    int open_ret = avformat_open_input(&dec.format_ctx, path.c_str(), nullptr, &demux_opts);
    av_dict_free(&demux_opts);
    if (open_ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot open " + path + ": " + av_error_string(open_ret));
    }
    avformat_find_stream_info(dec.format_ctx, nullptr);

    dec.stream_idx = av_find_best_stream(dec.format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (dec.stream_idx < 0 && check_image_extension(path) && dec.format_ctx->nb_streams > 0) {
        dec.stream_idx = 0;
    }
    if (dec.stream_idx < 0) {
        dec.close();
        return Result::fail(ErrorCode::INVALID_FORMAT, path + " has no image stream");
    }

    AVStream* stream = dec.stream();
    AVCodecID codec_id = stream->codecpar ? stream->codecpar->codec_id : AV_CODEC_ID_NONE;
    if (codec_id == AV_CODEC_ID_NONE) {
        codec_id = image_codec_from_extension(path);
    }
    dec.codec = avcodec_find_decoder(codec_id);
    if (!dec.codec) {
        dec.close();
        return Result::fail(ErrorCode::CODEC_ERROR, "no decoder for " + path);
    }

    dec.codec_ctx = avcodec_alloc_context3(dec.codec);
    if (!dec.codec_ctx) {
        dec.close();
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate decoder context");
    }
    if (avcodec_parameters_to_context(dec.codec_ctx, stream->codecpar) < 0 ||
        avcodec_open2(dec.codec_ctx, dec.codec, nullptr) < 0) {
        dec.close();
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot open decoder for " + path);
    }

    dec.packet = av_packet_alloc();
    dec.frame = av_frame_alloc();
    dec.rgba_frame = av_frame_alloc();
    if (!dec.packet || !dec.frame || !dec.rgba_frame) {
        dec.close();
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate decoder frames");
    }

    dec.eof = false;
    return Result::ok();
}

void copy_rgba_frame_to_buffer(const AVFrame* rgba, int width, int height, FrameBuffer& out) {
    if (out.width() != width || out.height() != height) {
        out = FrameBuffer(width, height);
    }
    const size_t row_bytes = static_cast<size_t>(width) * 4;
    for (int y = 0; y < height; ++y) {
        std::memcpy(out.row(y), rgba->data[0] + static_cast<size_t>(y) * rgba->linesize[0], row_bytes);
    }
}

// Source delay in milliseconds. Zero stays zero; only a missing duration
// gets the default.
int frame_delay_ms(const FFmpegDecoder& dec) {
    int64_t duration = dec.frame->duration;
    if (duration < 0 || duration == AV_NOPTS_VALUE) {
        return GifDecoder::DEFAULT_DELAY_MS;
    }
    int64_t ms = av_rescale_q(duration, dec.stream()->time_base, AVRational{1, 1000});
    return static_cast<int>(std::clamp<int64_t>(ms, 0, std::numeric_limits<int>::max()));
}

// Returns true with a frame in `out`, false at end of stream. Decode errors
// land in `error`.
bool decode_next_frame(FFmpegDecoder& dec, FrameBuffer& out, int& delay_ms, Result& error) {
    while (true) {
        int recv = avcodec_receive_frame(dec.codec_ctx, dec.frame);
        if (recv == 0) {
            int frame_w = dec.frame->width;
            int frame_h = dec.frame->height;
            AVPixelFormat src_fmt = static_cast<AVPixelFormat>(dec.frame->format);
            if (frame_w <= 0 || frame_h <= 0) {
                av_frame_unref(dec.frame);
                error = Result::fail(ErrorCode::CODEC_ERROR, "decoded frame has no size");
                return false;
            }
            if (!dec.sws_ctx || dec.size.width != frame_w || dec.size.height != frame_h) {
                if (!ensure_rgba_pipeline(dec, frame_w, frame_h, src_fmt)) {
                    av_frame_unref(dec.frame);
                    error = Result::fail(ErrorCode::CODEC_ERROR, "cannot convert decoded frame to RGBA");
                    return false;
                }
            }
            dec.size = {frame_w, frame_h};
            sws_scale(dec.sws_ctx,
                      dec.frame->data, dec.frame->linesize,
                      0, frame_h,
                      dec.rgba_frame->data, dec.rgba_frame->linesize);
            copy_rgba_frame_to_buffer(dec.rgba_frame, frame_w, frame_h, out);
            delay_ms = frame_delay_ms(dec);
            av_frame_unref(dec.frame);
            return true;
        }

        if (recv == AVERROR_EOF) {
            return false;
        }
        if (recv != AVERROR(EAGAIN)) {
            error = Result::fail(ErrorCode::CODEC_ERROR, "decode failed: " + av_error_string(recv));
            return false;
        }

        bool fed_decoder = false;
        while (!fed_decoder) {
            int read_ret = av_read_frame(dec.format_ctx, dec.packet);
            if (read_ret < 0) {
                if (dec.eof) return false;
                dec.eof = true;
                int flush_ret = avcodec_send_packet(dec.codec_ctx, nullptr);
                if (flush_ret < 0 && flush_ret != AVERROR_EOF) {
                    error = Result::fail(ErrorCode::CODEC_ERROR, "decoder flush failed: " + av_error_string(flush_ret));
                    return false;
                }
                fed_decoder = true;
                continue;
            }

            if (dec.packet->stream_index == dec.stream_idx) {
                int send_ret = avcodec_send_packet(dec.codec_ctx, dec.packet);
                av_packet_unref(dec.packet);
                if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
                    error = Result::fail(ErrorCode::CODEC_ERROR, "bad packet: " + av_error_string(send_ret));
                    return false;
                }
                fed_decoder = true;
            } else {
                av_packet_unref(dec.packet);
            }
        }
    }
}

Result decode_first_frame(const std::string& path, FrameBuffer& out) {
    FFmpegDecoder dec;
    Result res = open_decoder(path, dec);
    if (res.failure()) return res;

    int delay_ms = 0;
    Result error = Result::ok();
    if (!decode_next_frame(dec, out, delay_ms, error)) {
        if (error.failure()) return error;
        return Result::fail(ErrorCode::INVALID_FORMAT, path + " contains no frames");
    }
    return Result::ok();
}

bool decode_image_file_direct(const std::string& path, FrameBuffer& out) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!data) {
        return false;
    }

    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return false;
    }

    out = FrameBuffer(w, h);
    std::memcpy(out.data(), data, out.byte_size());

    stbi_image_free(data);
    return true;
}

// Over-long or otherwise unusable paths report through `ec` instead of
// throwing.
Result check_input_path(const std::string& path) {
    std::error_code ec;
    const bool found = std::filesystem::exists(path, ec);
    if (ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot access input " + path + ": " + ec.message());
    }
    if (!found) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Input file not found: " + path);
    }
    return Result::ok();
}

#ifdef IMGII_USE_OPENCV
void convert_mat_to_framebuffer(const cv::Mat& mat, FrameBuffer& out) {
    if (mat.empty()) return;

    cv::Mat rgba_mat;
    if (mat.channels() == 3) {
        cv::cvtColor(mat, rgba_mat, cv::COLOR_BGR2RGBA);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, rgba_mat, cv::COLOR_BGRA2RGBA);
    } else if (mat.channels() == 1) {
        cv::cvtColor(mat, rgba_mat, cv::COLOR_GRAY2RGBA);
    } else {
        return;
    }

    if (rgba_mat.empty()) return;

    int w = rgba_mat.cols;
    int h = rgba_mat.rows;
    out = FrameBuffer(w, h);
    for (int y = 0; y < h; ++y) {
        std::memcpy(out.row(y), rgba_mat.ptr<uint8_t>(y), static_cast<size_t>(w) * 4);
    }
}
#endif

}  // namespace

Result load_still_image(const std::string& path, FrameBuffer& out) {
    Result res = check_input_path(path);
    if (res.failure()) {
        return res;
    }

#ifdef IMGII_USE_OPENCV
    cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (!image.empty()) {
        convert_mat_to_framebuffer(image, out);
        if (!out.empty()) return Result::ok();
    }
#endif

    if (decode_image_file_direct(path, out)) {
        return Result::ok();
    }

    res = decode_first_frame(path, out);
    if (res.failure()) {
        return Result::wrap(ErrorCode::INVALID_FORMAT, "cannot decode image " + path, res);
    }
    return Result::ok();
}

Result GifDecoder::decode(const std::string& path, std::vector<DecodedFrame>& out) const {
    out.clear();
    Result res = check_input_path(path);
    if (res.failure()) {
        return res;
    }

    FFmpegDecoder dec;
    res = open_decoder(path, dec);
    if (res.failure()) {
        return res;
    }

    // The gif decoder hands back whole-screen frames with disposal applied, so
    // every frame sits at the canvas origin.
    while (true) {
        DecodedFrame decoded;
        Result error = Result::ok();
        if (!decode_next_frame(dec, decoded.image, decoded.metadata.delay_ms, error)) {
            if (error.failure()) {
                return Result::wrap(ErrorCode::CODEC_ERROR,
                                    "GIF decode failed after " + std::to_string(out.size()) + " frames", error);
            }
            break;
        }
        out.push_back(std::move(decoded));
    }

    if (out.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, path + " contains no frames");
    }
    return Result::ok();
}

}
