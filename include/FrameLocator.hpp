// Declares exact-frame extraction: backward keyframe seek followed by a
// forward decode until the requested presentation time is reached.

#pragma once

#include "ImageCodec.hpp"
#include "Types.hpp"
#include "VideoDecoder.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace framelab
{
    struct LocatorOptions
    {
        // Wall-clock budget for the forward decode scan.
        std::chrono::milliseconds timeout{30000};
    };

    namespace FrameLocator
    {
        // Absorbs floating point error when a timestamp lands on a tick
        // boundary, e.g. 1.1 s at 1/30 s ticks.
        constexpr double kTickEpsilon = 1e-6;

        // Fallback when the stream carries no usable frame rate.
        constexpr double kDefaultFrameRate = 30.0;

        [[nodiscard]] std::int64_t secondsToTick(double seconds, const StreamInfo& stream);
        [[nodiscard]] double tickToSeconds(std::int64_t tick, const StreamInfo& stream);

        // Returns the first decoded frame whose pts is >= the tick of `seconds`.
        // The decoder is opened on entry and closed on every exit path.
        // Throws Error(StreamUnavailable | SeekOutOfRange | Timeout | DecodeFailure).
        DecodedFrame locate(VideoDecoder& decoder,
                            const std::string& videoPath,
                            double seconds,
                            const LocatorOptions& options = LocatorOptions());

        // Locates the frame and writes it as a PNG, creating parent directories.
        void extractExactFrame(VideoDecoder& decoder,
                               const std::string& videoPath,
                               double seconds,
                               const std::string& outPath,
                               const LocatorOptions& options = LocatorOptions(),
                               int compression = ImageCodec::kPngCompression);

        // Reads frame rate, duration and size of the first video stream. The
        // returned session has no id yet.
        VideoSession probeVideo(VideoDecoder& decoder, const std::string& videoPath);
    }
}
