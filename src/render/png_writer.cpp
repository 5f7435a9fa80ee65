#include "png_writer.hpp"

#include <cstring>
#include <fstream>
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
}

namespace imgii {

namespace {

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};

}  // namespace

Result PngWriter::encode(const FrameBuffer& image, std::vector<uint8_t>& out) const {
    out.clear();
    if (image.empty()) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "cannot write an empty image");
    }

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PNG);
    if (!codec) {
        return Result::fail(ErrorCode::CODEC_ERROR, "FFmpeg has no PNG encoder");
    }

    std::unique_ptr<AVCodecContext, CodecContextDeleter> ctx(avcodec_alloc_context3(codec));
    std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
    std::unique_ptr<AVPacket, PacketDeleter> pkt(av_packet_alloc());
    if (!ctx || !frame || !pkt) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate PNG encoder");
    }

    ctx->width = image.width();
    ctx->height = image.height();
    ctx->pix_fmt = AV_PIX_FMT_RGBA;
    ctx->time_base = {1, 1};
    if (avcodec_open2(ctx.get(), codec, nullptr) < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "cannot open PNG encoder");
    }

    frame->format = AV_PIX_FMT_RGBA;
    frame->width = image.width();
    frame->height = image.height();
    if (av_frame_get_buffer(frame.get(), 0) < 0) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate PNG frame");
    }
    const size_t row_bytes = static_cast<size_t>(image.width()) * 4;
    for (int y = 0; y < image.height(); ++y) {
        std::memcpy(frame->data[0] + static_cast<size_t>(y) * frame->linesize[0], image.row(y), row_bytes);
    }
    frame->pts = 0;

    if (avcodec_send_frame(ctx.get(), frame.get()) < 0 || avcodec_send_frame(ctx.get(), nullptr) < 0) {
        return Result::fail(ErrorCode::CODEC_ERROR, "PNG encode failed");
    }

    while (true) {
        int ret = avcodec_receive_packet(ctx.get(), pkt.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            return Result::fail(ErrorCode::CODEC_ERROR, "PNG encode failed");
        }
        out.insert(out.end(), pkt->data, pkt->data + pkt->size);
        av_packet_unref(pkt.get());
    }

    if (out.empty()) {
        return Result::fail(ErrorCode::CODEC_ERROR, "PNG encoder produced no data");
    }
    return Result::ok();
}

Result PngWriter::write(const std::string& filename, const FrameBuffer& image) const {
    std::vector<uint8_t> bytes;
    Result res = encode(image, bytes);
    if (res.failure()) {
        return res;
    }

    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open " + filename + " for writing");
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "failed writing " + filename);
    }
    return Result::ok();
}

}
