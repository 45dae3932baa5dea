// Declares the capture service tying the active video, the frame record store
// and the category list to the locator and the composition pipeline.

#pragma once

#include "CategoryStore.hpp"
#include "Config.hpp"
#include "FrameStore.hpp"
#include "Serialization.hpp"
#include "Types.hpp"
#include "VideoDecoder.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace framelab
{
    struct CaptureRequest
    {
        std::string videoId;
        double timestampSeconds = 0.0;
        std::string categoryId;
    };

    using DecoderFactory = std::function<std::unique_ptr<VideoDecoder>()>;

    class CaptureSession
    {
    public:
        CaptureSession(AppConfig config,
                       FrameStore& frames,
                       CategoryStore& categories,
                       DecoderFactory decoderFactory);

        // Probes the file and makes it the single active video. Frames of the
        // previous video are dropped together with their image files.
        const VideoSession& openVideo(const std::string& path);

        [[nodiscard]] std::optional<VideoSession> activeVideo() const;

        // Extracts the exact frame and records it with the default filter
        // stack, no annotations and scale 1. Unknown categories fall back to
        // the default category.
        Frame capture(const CaptureRequest& request);

        // Renders the current record of a frame to PNG bytes.
        [[nodiscard]] std::vector<unsigned char> renderPreview(const std::string& frameId) const;

        // Writes every frame of the active video as <outDir>/<category>/<file>.
        // Returns the number of files written.
        std::size_t exportRendered(const std::string& outDir) const;

        // category,timestamp,file,note rows for the active video.
        void exportCsv(const std::string& path) const;

        [[nodiscard]] json exportGallery() const;

        // Replaces the frames of the active video with the gallery entries,
        // re-extracting each one. Returns the number of frames created.
        std::size_t importGallery(const json& gallery);

        void deleteFrame(const std::string& frameId);

        // Removes the category and moves its frames to the default category.
        void deleteCategory(const std::string& categoryId);

        // <video stem>_frame<N>_ts<sss>_<mmm>.png
        [[nodiscard]] static std::string frameFileName(const std::string& videoName,
                                                       std::size_t frameNumber,
                                                       double seconds);

    private:
        const VideoSession& requireActive(const std::string& videoId) const;
        Frame extractAndRecord(const VideoSession& video,
                               double seconds,
                               const Category& category);
        [[nodiscard]] std::string categoryName(const std::string& categoryId) const;

        AppConfig config_;
        FrameStore& frames_;
        CategoryStore& categories_;
        DecoderFactory decoderFactory_;
        std::optional<VideoSession> active_;
        std::size_t lastFrameNumber_ = 0;
    };
}
