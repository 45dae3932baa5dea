// Declares the narrow video decoding interface the frame locator depends on.

#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>

namespace framelab
{
    // Description of the first video stream of an opened container.
    struct StreamInfo
    {
        int index = -1;
        std::int64_t timeBaseNum = 1;     // Seconds per tick = num / den.
        std::int64_t timeBaseDen = 1;
        std::int64_t startTick = 0;
        double frameRate = 0.0;           // 0 when the container does not report one.
        double durationSeconds = -1.0;    // Negative when unknown.
        int width = 0;
        int height = 0;
    };

    struct DecodedFrame
    {
        std::int64_t pts = 0;
        bool hasPts = false;
        cv::Mat imageBgr;
    };

    class VideoDecoder
    {
    public:
        virtual ~VideoDecoder() = default;

        // Opens the container and its first video stream. Throws
        // Error(StreamUnavailable) when no video stream can be decoded.
        virtual void open(const std::string& path) = 0;

        [[nodiscard]] virtual bool isOpen() const = 0;

        // Number of streams of any media type in the container.
        [[nodiscard]] virtual int streamCount() const = 0;

        [[nodiscard]] virtual StreamInfo videoStream() const = 0;

        // Positions the demuxer on the nearest keyframe at or before the tick
        // and drops any frames buffered in the decoder.
        virtual void seek(std::int64_t tick) = 0;

        // Decodes the next frame in presentation order. Returns false at the
        // end of the stream.
        virtual bool decodeNext(DecodedFrame& frame) = 0;

        // Releases the container and codec. Safe to call more than once.
        virtual void close() = 0;
    };
}
