#pragma once

#include "core/types.hpp"
#include "core/frame_source.hpp"
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

extern "C" {
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct AVFilterGraph;
struct AVFilterContext;
}

namespace imgii {

struct RenderedFrame {
    FrameBuffer canvas;
    FrameMetadata metadata;
};

// Writes an infinitely looping GIF. Frames are placed on the logical screen
// at their metadata offsets and shown for their metadata delay, rounded to
// centiseconds with a floor of one (the muxer needs rising timestamps).
// Every frame gets its own palette with one entry kept for transparency, so
// pixels below half alpha stay see-through.
class GifEncoder {
public:
    GifEncoder();
    ~GifEncoder();
    GifEncoder(const GifEncoder&) = delete;
    GifEncoder& operator=(const GifEncoder&) = delete;

    Result encode(const std::string& filename, const std::vector<RenderedFrame>& frames);

    // Smallest screen holding every frame at its offset.
    static Size logical_screen(const std::vector<RenderedFrame>& frames);

private:
    Result open(const std::string& filename, Size screen);
    Result open_palette_graph(Size screen);
    Result write_frame(const FrameBuffer& screen, int delay_ms);
    Result encode_filtered_frames();
    Result write_trailer();
    Result drain_packets();
    void close();

    Size screen_;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* rgba_frame_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    AVFilterGraph* graph_ = nullptr;
    AVFilterContext* source_ctx_ = nullptr;
    AVFilterContext* sink_ctx_ = nullptr;
    std::deque<int64_t> durations_;
    int64_t pts_ = 0;
    int64_t out_pts_ = 0;
    bool header_written_ = false;
};

}
