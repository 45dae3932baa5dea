// Declares the FFmpeg-backed implementation of VideoDecoder.

#pragma once

#include "VideoDecoder.hpp"

#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

namespace framelab
{
    class FFmpegVideoDecoder : public VideoDecoder
    {
    public:
        FFmpegVideoDecoder() = default;
        ~FFmpegVideoDecoder() override;

        FFmpegVideoDecoder(const FFmpegVideoDecoder&) = delete;
        FFmpegVideoDecoder& operator=(const FFmpegVideoDecoder&) = delete;

        void open(const std::string& path) override;
        [[nodiscard]] bool isOpen() const override;
        [[nodiscard]] int streamCount() const override;
        [[nodiscard]] StreamInfo videoStream() const override;
        void seek(std::int64_t tick) override;
        bool decodeNext(DecodedFrame& frame) override;
        void close() override;

    private:
        struct FormatDeleter { void operator()(AVFormatContext* ctx) const; };
        struct CodecDeleter { void operator()(AVCodecContext* ctx) const; };
        struct FrameDeleter { void operator()(AVFrame* frame) const; };
        struct PacketDeleter { void operator()(AVPacket* packet) const; };
        struct SwsDeleter { void operator()(SwsContext* ctx) const; };

        cv::Mat convertToBgr(const AVFrame* frame);

        std::unique_ptr<AVFormatContext, FormatDeleter> format_;
        std::unique_ptr<AVCodecContext, CodecDeleter> codec_;
        std::unique_ptr<AVFrame, FrameDeleter> frame_;
        std::unique_ptr<AVPacket, PacketDeleter> packet_;
        std::unique_ptr<SwsContext, SwsDeleter> sws_;

        int streamIndex_ = -1;
        bool draining_ = false;
        bool finished_ = false;
        std::string path_;
    };
}
