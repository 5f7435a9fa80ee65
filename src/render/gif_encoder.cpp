#include "gif_encoder.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/mem.h>
#include <libavutil/pixfmt.h>
}

namespace imgii {

namespace {

// GIF delays are counted in centiseconds.
constexpr AVRational GIF_TIME_BASE = {1, 100};

// One palette per frame. palettegen holds one entry back for transparency
// and paletteuse maps alpha under the threshold onto it.
constexpr const char* PALETTE_FILTER =
    "split[pal_in][img_in];"
    "[pal_in]palettegen=stats_mode=single:reserve_transparent=1[pal];"
    "[img_in][pal]paletteuse=new=1:alpha_threshold=128";

bool supports_pixel_format(const AVCodec* codec, AVPixelFormat wanted) {
    if (!codec) {
        return false;
    }

    const void* raw_formats = nullptr;
    int num_formats = 0;
    const int ret = avcodec_get_supported_config(
        nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0, &raw_formats, &num_formats);
    if (ret < 0 || !raw_formats || num_formats <= 0) {
        return false;
    }

    const auto* pix_fmts = static_cast<const AVPixelFormat*>(raw_formats);
    for (int i = 0; i < num_formats; ++i) {
        if (pix_fmts[i] == wanted) {
            return true;
        }
    }
    return false;
}

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Copies `src` onto `dst` at (left, top), clipped to `dst`.
void place_frame(FrameBuffer& dst, const FrameBuffer& src, int left, int top) {
    const int x0 = std::max(0, left);
    const int x1 = std::min(dst.width(), left + src.width());
    if (x1 <= x0) return;
    for (int y = 0; y < src.height(); ++y) {
        const int dy = top + y;
        if (dy < 0 || dy >= dst.height()) continue;
        std::memcpy(dst.row(dy) + static_cast<size_t>(x0) * 4,
                    src.row(y) + static_cast<size_t>(x0 - left) * 4,
                    static_cast<size_t>(x1 - x0) * 4);
    }
}

}  // namespace

GifEncoder::GifEncoder() = default;

GifEncoder::~GifEncoder() {
    close();
}

Size GifEncoder::logical_screen(const std::vector<RenderedFrame>& frames) {
    Size screen;
    for (const RenderedFrame& f : frames) {
        screen.width = std::max(screen.width, std::max(0, f.metadata.left) + f.canvas.width());
        screen.height = std::max(screen.height, std::max(0, f.metadata.top) + f.canvas.height());
    }
    return screen;
}

Result GifEncoder::encode(const std::string& filename, const std::vector<RenderedFrame>& frames) {
    if (frames.empty()) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "no frames to encode into " + filename);
    }

    const Size screen = logical_screen(frames);
    if (screen.width <= 0 || screen.height <= 0) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "all frames are empty");
    }

    Result res = open(filename, screen);
    if (res.failure()) {
        close();
        return res;
    }

    FrameBuffer composed(screen.width, screen.height);
    for (const RenderedFrame& f : frames) {
        composed.clear();
        place_frame(composed, f.canvas, f.metadata.left, f.metadata.top);
        res = write_frame(composed, f.metadata.delay_ms);
        if (res.failure()) {
            close();
            return res;
        }
    }

    res = write_trailer();
    close();
    return res;
}

Result GifEncoder::open(const std::string& filename, Size screen) {
    screen_ = screen;

    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "gif", filename.c_str());
    if (ret < 0 || !format_ctx_) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot create GIF muxer: " + av_error_string(ret));
    }

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_GIF);
    if (!codec) {
        return Result::fail(ErrorCode::CODEC_ERROR, "FFmpeg has no GIF encoder");
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate GIF encoder");
    }
    codec_ctx_->width = screen.width;
    codec_ctx_->height = screen.height;
    codec_ctx_->time_base = GIF_TIME_BASE;
    if (!supports_pixel_format(codec, AV_PIX_FMT_PAL8)) {
        return Result::fail(ErrorCode::CODEC_ERROR, "GIF encoder does not take paletted frames");
    }
    codec_ctx_->pix_fmt = AV_PIX_FMT_PAL8;
    if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
        codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot open GIF encoder: " + av_error_string(ret));
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate GIF stream");
    }
    stream_->time_base = codec_ctx_->time_base;
    ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot configure GIF stream");
    }

    rgba_frame_ = av_frame_alloc();
    frame_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!rgba_frame_ || !frame_ || !pkt_) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate encoder frames");
    }
    rgba_frame_->format = AV_PIX_FMT_RGBA;
    rgba_frame_->width = screen.width;
    rgba_frame_->height = screen.height;
    if (av_frame_get_buffer(rgba_frame_, 0) < 0) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate encoder frame buffer");
    }

    Result res = open_palette_graph(screen);
    if (res.failure()) {
        return res;
    }

    if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&format_ctx_->pb, filename.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot write " + filename + ": " + av_error_string(ret));
        }
    }

    // loop=0 repeats forever.
    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "loop", "0", 0);
    ret = avformat_write_header(format_ctx_, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot write GIF header: " + av_error_string(ret));
    }
    header_written_ = true;
    return Result::ok();
}

Result GifEncoder::open_palette_graph(Size screen) {
    const AVFilter* buffer_src = avfilter_get_by_name("buffer");
    const AVFilter* buffer_sink = avfilter_get_by_name("buffersink");
    if (!buffer_src || !buffer_sink) {
        return Result::fail(ErrorCode::CODEC_ERROR, "FFmpeg has no buffer filters");
    }

    graph_ = avfilter_graph_alloc();
    if (!graph_) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate filter graph");
    }

    char args[160];
    std::snprintf(args, sizeof(args), "video_size=%dx%d:pix_fmt=%d:time_base=%d/%d:pixel_aspect=1/1",
                  screen.width, screen.height, static_cast<int>(AV_PIX_FMT_RGBA),
                  GIF_TIME_BASE.num, GIF_TIME_BASE.den);

    int ret = avfilter_graph_create_filter(&source_ctx_, buffer_src, "in", args, nullptr, graph_);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot create frame source: " + av_error_string(ret));
    }
    ret = avfilter_graph_create_filter(&sink_ctx_, buffer_sink, "out", nullptr, nullptr, graph_);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot create frame sink: " + av_error_string(ret));
    }

    // Open ends of the parsed chain: its input reads from "in", its output
    // feeds "out".
    AVFilterInOut* outputs = avfilter_inout_alloc();
    AVFilterInOut* inputs = avfilter_inout_alloc();
    if (!outputs || !inputs) {
        avfilter_inout_free(&outputs);
        avfilter_inout_free(&inputs);
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate filter pads");
    }
    outputs->name = av_strdup("in");
    outputs->filter_ctx = source_ctx_;
    outputs->pad_idx = 0;
    outputs->next = nullptr;
    inputs->name = av_strdup("out");
    inputs->filter_ctx = sink_ctx_;
    inputs->pad_idx = 0;
    inputs->next = nullptr;

    ret = avfilter_graph_parse_ptr(graph_, PALETTE_FILTER, &inputs, &outputs, nullptr);
    avfilter_inout_free(&outputs);
    avfilter_inout_free(&inputs);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot build palette filter: " + av_error_string(ret));
    }

    ret = avfilter_graph_config(graph_, nullptr);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot configure palette filter: " + av_error_string(ret));
    }
    return Result::ok();
}

Result GifEncoder::write_frame(const FrameBuffer& screen, int delay_ms) {
    if (av_frame_make_writable(rgba_frame_) < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "encoder frame is not writable");
    }

    const size_t row_bytes = static_cast<size_t>(screen.width()) * 4;
    for (int y = 0; y < screen.height(); ++y) {
        std::memcpy(rgba_frame_->data[0] + static_cast<size_t>(y) * rgba_frame_->linesize[0],
                    screen.row(y), row_bytes);
    }

    const int64_t duration = std::max<int64_t>(1, (static_cast<int64_t>(delay_ms) + 5) / 10);
    rgba_frame_->pts = pts_;
    rgba_frame_->duration = duration;
    pts_ += duration;
    durations_.push_back(duration);

    int ret = av_buffersrc_add_frame_flags(source_ctx_, rgba_frame_, AV_BUFFERSRC_FLAG_KEEP_REF);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot queue frame for palette: " + av_error_string(ret));
    }
    return encode_filtered_frames();
}

// Sends every paletted frame the graph has ready to the encoder. Frames leave
// the graph in input order, so each takes the oldest queued duration.
Result GifEncoder::encode_filtered_frames() {
    while (true) {
        int ret = av_buffersink_get_frame(sink_ctx_, frame_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            return Result::fail(ErrorCode::CODEC_ERROR, "palette filter failed: " + av_error_string(ret));
        }

        int64_t duration = 1;
        if (!durations_.empty()) {
            duration = durations_.front();
            durations_.pop_front();
        }
        frame_->pts = out_pts_;
        frame_->duration = duration;
        frame_->pict_type = AV_PICTURE_TYPE_NONE;
        out_pts_ += duration;

        ret = avcodec_send_frame(codec_ctx_, frame_);
        av_frame_unref(frame_);
        if (ret < 0) {
            return Result::fail(ErrorCode::CODEC_ERROR, "GIF encode failed: " + av_error_string(ret));
        }
        Result res = drain_packets();
        if (res.failure()) return res;
    }
    return Result::ok();
}

Result GifEncoder::drain_packets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            return Result::fail(ErrorCode::CODEC_ERROR, "GIF encode failed: " + av_error_string(ret));
        }

        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        ret = av_interleaved_write_frame(format_ctx_, pkt_);
        if (ret < 0) {
            return Result::fail(ErrorCode::CODEC_ERROR, "cannot write GIF frame: " + av_error_string(ret));
        }
    }
    return Result::ok();
}

Result GifEncoder::write_trailer() {
    // Closing the source makes the graph hand over anything it still holds.
    int ret = av_buffersrc_add_frame_flags(source_ctx_, nullptr, 0);
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot flush palette filter: " + av_error_string(ret));
    }
    Result res = encode_filtered_frames();
    if (res.failure()) return res;

    ret = avcodec_send_frame(codec_ctx_, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return Result::fail(ErrorCode::CODEC_ERROR, "GIF encoder flush failed: " + av_error_string(ret));
    }
    res = drain_packets();
    if (res.failure()) return res;

    ret = av_write_trailer(format_ctx_);
    header_written_ = false;
    if (ret < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot finish GIF: " + av_error_string(ret));
    }
    return Result::ok();
}

void GifEncoder::close() {
    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }

    if (format_ctx_) {
        if (header_written_) {
            av_write_trailer(format_ctx_);
            header_written_ = false;
        }
        if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&format_ctx_->pb);
        }
        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
    }

    if (rgba_frame_) {
        av_frame_free(&rgba_frame_);
    }

    if (frame_) {
        av_frame_free(&frame_);
    }

    if (pkt_) {
        av_packet_free(&pkt_);
    }

    if (graph_) {
        avfilter_graph_free(&graph_);
    }
    source_ctx_ = nullptr;
    sink_ctx_ = nullptr;
    durations_.clear();

    stream_ = nullptr;
    pts_ = 0;
    out_pts_ = 0;
}

}
