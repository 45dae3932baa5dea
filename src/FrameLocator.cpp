// Implements exact-frame location on top of the VideoDecoder interface.

#include "FrameLocator.hpp"

#include "Error.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace
{
    // Keeps the decoder open for the lifetime of one request.
    class DecoderSession
    {
    public:
        DecoderSession(framelab::VideoDecoder& decoder, const std::string& path)
            : decoder_(decoder)
        {
            try
            {
                decoder_.open(path);
            }
            catch (...)
            {
                decoder_.close();
                throw;
            }
        }

        ~DecoderSession()
        {
            decoder_.close();
        }

        DecoderSession(const DecoderSession&) = delete;
        DecoderSession& operator=(const DecoderSession&) = delete;

    private:
        framelab::VideoDecoder& decoder_;
    };

    std::string formatSeconds(double seconds)
    {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(3);
        oss << seconds << "s";
        return oss.str();
    }
}

namespace framelab
{
    namespace FrameLocator
    {
        std::int64_t secondsToTick(double seconds, const StreamInfo& stream)
        {
            if (stream.timeBaseNum <= 0 || stream.timeBaseDen <= 0)
            {
                throw Error(ErrorKind::StreamUnavailable, "Stream has an invalid time base.");
            }

            const double ticks = seconds * static_cast<double>(stream.timeBaseDen) /
                                 static_cast<double>(stream.timeBaseNum);
            return stream.startTick + static_cast<std::int64_t>(std::floor(ticks + kTickEpsilon));
        }

        double tickToSeconds(std::int64_t tick, const StreamInfo& stream)
        {
            if (stream.timeBaseDen <= 0)
            {
                return 0.0;
            }
            return static_cast<double>(tick - stream.startTick) *
                   static_cast<double>(stream.timeBaseNum) /
                   static_cast<double>(stream.timeBaseDen);
        }

        DecodedFrame locate(VideoDecoder& decoder,
                            const std::string& videoPath,
                            double seconds,
                            const LocatorOptions& options)
        {
            if (!std::isfinite(seconds))
            {
                throw Error(ErrorKind::ValidationError, "Timestamp is not a finite number.");
            }
            if (seconds < 0.0)
            {
                throw Error(ErrorKind::SeekOutOfRange,
                            "Timestamp " + formatSeconds(seconds) + " is negative.");
            }

            DecoderSession session(decoder, videoPath);

            const StreamInfo stream = decoder.videoStream();
            if (stream.durationSeconds > 0.0 && seconds >= stream.durationSeconds)
            {
                throw Error(ErrorKind::SeekOutOfRange,
                            "Timestamp " + formatSeconds(seconds) + " is beyond the duration " +
                            formatSeconds(stream.durationSeconds) + " of " + videoPath);
            }

            const std::int64_t target = secondsToTick(seconds, stream);
            const auto deadline = std::chrono::steady_clock::now() + options.timeout;

            // Compressed video can only start decoding at a keyframe, so land on
            // the one before the target and walk forward to the exact frame.
            decoder.seek(target);

            DecodedFrame frame;
            while (true)
            {
                if (std::chrono::steady_clock::now() > deadline)
                {
                    throw Error(ErrorKind::Timeout,
                                "Gave up decoding toward " + formatSeconds(seconds) +
                                " in " + videoPath);
                }

                if (!decoder.decodeNext(frame))
                {
                    break;
                }

                if (frame.hasPts && frame.pts >= target)
                {
                    return frame;
                }
            }

            throw Error(ErrorKind::SeekOutOfRange,
                        "No frame at or after " + formatSeconds(seconds) + " in " + videoPath);
        }

        void extractExactFrame(VideoDecoder& decoder,
                               const std::string& videoPath,
                               double seconds,
                               const std::string& outPath,
                               const LocatorOptions& options,
                               int compression)
        {
            const DecodedFrame frame = locate(decoder, videoPath, seconds, options);
            if (frame.imageBgr.empty())
            {
                throw Error(ErrorKind::DecodeFailure,
                            "Decoder returned an empty picture at " + formatSeconds(seconds));
            }

            ImageCodec::writePng(outPath, frame.imageBgr, compression);
            std::cout << "[Locator] " << formatSeconds(seconds) << " -> pts " << frame.pts
                      << ", saved " << outPath << std::endl;
        }

        VideoSession probeVideo(VideoDecoder& decoder, const std::string& videoPath)
        {
            DecoderSession session(decoder, videoPath);
            const StreamInfo stream = decoder.videoStream();

            VideoSession video;
            video.sourcePath = videoPath;
            video.displayName = std::filesystem::path(videoPath).stem().string();
            video.frameRate = stream.frameRate > 0.0 ? stream.frameRate : kDefaultFrameRate;
            video.durationSeconds = stream.durationSeconds;
            video.width = stream.width;
            video.height = stream.height;
            return video;
        }
    }
}
