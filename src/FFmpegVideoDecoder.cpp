// Implements VideoDecoder with libavformat/libavcodec and converts decoded
// pictures to BGR with libswscale.

#include "FFmpegVideoDecoder.hpp"

#include "Error.hpp"

extern "C" {
#include <libavutil/error.h>
}

#include <iostream>

namespace
{
    std::string ffmpegErrorString(int errorCode)
    {
        char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(errorCode, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    double rationalToDouble(AVRational value)
    {
        if (value.num <= 0 || value.den <= 0)
        {
            return 0.0;
        }
        return av_q2d(value);
    }
}

namespace framelab
{
    void FFmpegVideoDecoder::FormatDeleter::operator()(AVFormatContext* ctx) const
    {
        avformat_close_input(&ctx);
    }

    void FFmpegVideoDecoder::CodecDeleter::operator()(AVCodecContext* ctx) const
    {
        avcodec_free_context(&ctx);
    }

    void FFmpegVideoDecoder::FrameDeleter::operator()(AVFrame* frame) const
    {
        av_frame_free(&frame);
    }

    void FFmpegVideoDecoder::PacketDeleter::operator()(AVPacket* packet) const
    {
        av_packet_free(&packet);
    }

    void FFmpegVideoDecoder::SwsDeleter::operator()(SwsContext* ctx) const
    {
        sws_freeContext(ctx);
    }

    FFmpegVideoDecoder::~FFmpegVideoDecoder()
    {
        close();
    }

    void FFmpegVideoDecoder::open(const std::string& path)
    {
        close();
        path_ = path;

        AVFormatContext* rawFormat = nullptr;
        int ret = avformat_open_input(&rawFormat, path.c_str(), nullptr, nullptr);
        if (ret < 0)
        {
            throw Error(ErrorKind::StreamUnavailable,
                        "Failed to open " + path + ": " + ffmpegErrorString(ret));
        }
        format_.reset(rawFormat);

        ret = avformat_find_stream_info(format_.get(), nullptr);
        if (ret < 0)
        {
            close();
            throw Error(ErrorKind::StreamUnavailable,
                        "Failed to read stream info from " + path + ": " + ffmpegErrorString(ret));
        }

        streamIndex_ = av_find_best_stream(format_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (streamIndex_ < 0)
        {
            close();
            throw Error(ErrorKind::StreamUnavailable, "No video stream in " + path);
        }

        const AVCodecParameters* parameters = format_->streams[streamIndex_]->codecpar;
        const AVCodec* codec = avcodec_find_decoder(parameters->codec_id);
        if (codec == nullptr)
        {
            close();
            throw Error(ErrorKind::StreamUnavailable,
                        "No decoder for the video stream of " + path);
        }

        codec_.reset(avcodec_alloc_context3(codec));
        if (!codec_)
        {
            close();
            throw Error(ErrorKind::StreamUnavailable, "Failed to allocate codec context.");
        }

        ret = avcodec_parameters_to_context(codec_.get(), parameters);
        if (ret >= 0)
        {
            ret = avcodec_open2(codec_.get(), codec, nullptr);
        }
        if (ret < 0)
        {
            close();
            throw Error(ErrorKind::StreamUnavailable,
                        "Failed to open video codec: " + ffmpegErrorString(ret));
        }

        frame_.reset(av_frame_alloc());
        packet_.reset(av_packet_alloc());
        if (!frame_ || !packet_)
        {
            close();
            throw Error(ErrorKind::StreamUnavailable, "Failed to allocate decode buffers.");
        }

        draining_ = false;
        finished_ = false;
    }

    bool FFmpegVideoDecoder::isOpen() const
    {
        return format_ != nullptr && codec_ != nullptr;
    }

    int FFmpegVideoDecoder::streamCount() const
    {
        return format_ ? static_cast<int>(format_->nb_streams) : 0;
    }

    StreamInfo FFmpegVideoDecoder::videoStream() const
    {
        if (!isOpen())
        {
            throw Error(ErrorKind::StreamUnavailable, "Decoder is not open.");
        }

        const AVStream* stream = format_->streams[streamIndex_];

        StreamInfo info;
        info.index = streamIndex_;
        info.timeBaseNum = stream->time_base.num;
        info.timeBaseDen = stream->time_base.den;
        info.startTick = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
        info.width = stream->codecpar->width;
        info.height = stream->codecpar->height;

        info.frameRate = rationalToDouble(stream->avg_frame_rate);
        if (info.frameRate <= 0.0)
        {
            info.frameRate = rationalToDouble(stream->r_frame_rate);
        }

        if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        {
            info.durationSeconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
        }
        else if (format_->duration != AV_NOPTS_VALUE && format_->duration > 0)
        {
            info.durationSeconds = static_cast<double>(format_->duration) / AV_TIME_BASE;
        }

        return info;
    }

    void FFmpegVideoDecoder::seek(std::int64_t tick)
    {
        if (!isOpen())
        {
            throw Error(ErrorKind::StreamUnavailable, "Decoder is not open.");
        }

        const int ret = av_seek_frame(format_.get(), streamIndex_, tick, AVSEEK_FLAG_BACKWARD);
        if (ret < 0)
        {
            throw Error(ErrorKind::SeekOutOfRange,
                        "Seek to tick " + std::to_string(tick) + " failed: " + ffmpegErrorString(ret));
        }

        avcodec_flush_buffers(codec_.get());
        draining_ = false;
        finished_ = false;
    }

    bool FFmpegVideoDecoder::decodeNext(DecodedFrame& decoded)
    {
        if (!isOpen() || finished_)
        {
            return false;
        }

        while (true)
        {
            int ret = avcodec_receive_frame(codec_.get(), frame_.get());
            if (ret == 0)
            {
                const std::int64_t pts = frame_->best_effort_timestamp;
                decoded.hasPts = pts != AV_NOPTS_VALUE;
                decoded.pts = decoded.hasPts ? pts : 0;
                decoded.imageBgr = convertToBgr(frame_.get());
                av_frame_unref(frame_.get());
                return true;
            }

            if (ret == AVERROR_EOF || (ret == AVERROR(EAGAIN) && draining_))
            {
                finished_ = true;
                return false;
            }

            if (ret != AVERROR(EAGAIN))
            {
                throw Error(ErrorKind::DecodeFailure,
                            "Video decode failed in " + path_ + ": " + ffmpegErrorString(ret));
            }

            ret = av_read_frame(format_.get(), packet_.get());
            if (ret < 0)
            {
                // End of input: flush the frames still held by the decoder.
                draining_ = true;
                const int flushed = avcodec_send_packet(codec_.get(), nullptr);
                if (flushed < 0 && flushed != AVERROR_EOF)
                {
                    throw Error(ErrorKind::DecodeFailure,
                                "Failed to flush decoder: " + ffmpegErrorString(flushed));
                }
                continue;
            }

            if (packet_->stream_index == streamIndex_)
            {
                const int sent = avcodec_send_packet(codec_.get(), packet_.get());
                if (sent < 0 && sent != AVERROR(EAGAIN))
                {
                    std::cerr << "[Decoder] Dropped corrupt packet: "
                              << ffmpegErrorString(sent) << std::endl;
                }
            }
            av_packet_unref(packet_.get());
        }
    }

    void FFmpegVideoDecoder::close()
    {
        sws_.reset();
        packet_.reset();
        frame_.reset();
        codec_.reset();
        format_.reset();
        streamIndex_ = -1;
        draining_ = false;
        finished_ = false;
    }

    cv::Mat FFmpegVideoDecoder::convertToBgr(const AVFrame* frame)
    {
        const int width = frame->width;
        const int height = frame->height;

        sws_.reset(sws_getCachedContext(sws_.release(),
                                        width, height,
                                        static_cast<AVPixelFormat>(frame->format),
                                        width, height, AV_PIX_FMT_BGR24,
                                        SWS_BICUBIC | SWS_ACCURATE_RND,
                                        nullptr, nullptr, nullptr));
        if (!sws_)
        {
            throw Error(ErrorKind::DecodeFailure, "Unsupported decoded pixel format.");
        }

        cv::Mat bgr(height, width, CV_8UC3);
        std::uint8_t* dstData[4] = { bgr.data, nullptr, nullptr, nullptr };
        int dstLinesize[4] = { static_cast<int>(bgr.step[0]), 0, 0, 0 };

        sws_scale(sws_.get(), frame->data, frame->linesize, 0, height, dstData, dstLinesize);
        return bgr;
    }
}
