// Implements capture, preview rendering, bulk export and gallery round trips.

#include "CaptureSession.hpp"

#include "Compositor.hpp"
#include "Error.hpp"
#include "FrameLocator.hpp"
#include "ImageCodec.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace
{
    std::string formatTimestamp(double seconds)
    {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "%.3f", seconds);
        return std::string(buffer);
    }

    std::string csvField(const std::string& value)
    {
        std::string quoted = "\"";
        for (const char c : value)
        {
            if (c == '"')
            {
                quoted += '"';
            }
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    // Category names become directory names inside the export tree.
    std::string safeDirectoryName(const std::string& name)
    {
        std::string safe = name;
        for (char& c : safe)
        {
            if (c == '/' || c == '\\' || c == ':')
            {
                c = '_';
            }
        }
        if (safe.empty() || safe == "." || safe == "..")
        {
            return "uncategorized";
        }
        return safe;
    }

    struct GalleryEntry
    {
        double seconds = 0.0;
        std::string categoryName;
        std::string note;
        bool hasNote = false;
        std::vector<framelab::FilterSpec> filters;
        std::vector<framelab::AnnotationSpec> annotations;
        int scale = 1;
    };
}

namespace framelab
{
    CaptureSession::CaptureSession(AppConfig config,
                                   FrameStore& frames,
                                   CategoryStore& categories,
                                   DecoderFactory decoderFactory)
        : config_(std::move(config))
        , frames_(frames)
        , categories_(categories)
        , decoderFactory_(std::move(decoderFactory))
    {
        if (!decoderFactory_)
        {
            throw Error(ErrorKind::ValidationError, "A decoder factory is required.");
        }
    }

    const VideoSession& CaptureSession::openVideo(const std::string& path)
    {
        std::unique_ptr<VideoDecoder> decoder = decoderFactory_();
        if (!decoder)
        {
            throw Error(ErrorKind::StreamUnavailable, "Decoder factory returned no decoder.");
        }

        VideoSession video = FrameLocator::probeVideo(*decoder, path);
        video.id = generateId();

        if (active_)
        {
            const std::size_t dropped = frames_.clearVideo(active_->id, true);
            std::cout << "[Capture] Replaced " << active_->sourcePath << ", dropped "
                      << dropped << " frame(s)" << std::endl;
        }

        active_ = video;
        lastFrameNumber_ = 0;
        std::cout << "[Capture] Opened " << path << " (" << video.width << "x" << video.height
                  << ", " << video.frameRate << " fps)" << std::endl;
        return *active_;
    }

    std::optional<VideoSession> CaptureSession::activeVideo() const
    {
        return active_;
    }

    const VideoSession& CaptureSession::requireActive(const std::string& videoId) const
    {
        if (!active_ || active_->id != videoId)
        {
            throw Error(ErrorKind::NotFound, "Video not found: " + videoId);
        }
        return *active_;
    }

    std::string CaptureSession::frameFileName(const std::string& videoName,
                                              std::size_t frameNumber,
                                              double seconds)
    {
        std::string ts = formatTimestamp(seconds);
        for (char& c : ts)
        {
            if (c == '.')
            {
                c = '_';
            }
        }
        return videoName + "_frame" + std::to_string(frameNumber) + "_ts" + ts + ".png";
    }

    Frame CaptureSession::extractAndRecord(const VideoSession& video,
                                           double seconds,
                                           const Category& category)
    {
        std::unique_ptr<VideoDecoder> decoder = decoderFactory_();
        if (!decoder)
        {
            throw Error(ErrorKind::StreamUnavailable, "Decoder factory returned no decoder.");
        }

        // Numbers only grow within a video, and names left on disk by an
        // earlier run are never reused, so each frame owns its own file.
        std::size_t frameNumber = lastFrameNumber_;
        Frame frame;
        do
        {
            ++frameNumber;
            frame.fileName = frameFileName(video.displayName, frameNumber, seconds);
            frame.imagePath = (std::filesystem::path(config_.framesDir()) / frame.fileName).string();
        } while (std::filesystem::exists(frame.imagePath));

        frame.videoId = video.id;
        frame.timestampSeconds = seconds;
        frame.categoryId = category.id;
        frame.note = "Frame: " + std::to_string(frameNumber) + ", Time: " +
                     formatTimestamp(seconds) + "s";
        frame.filters = defaultFilterStack();
        frame.scale = 1;

        LocatorOptions options;
        options.timeout = config_.locatorTimeout;
        FrameLocator::extractExactFrame(*decoder, video.sourcePath, seconds,
                                        frame.imagePath, options, config_.pngCompression);

        lastFrameNumber_ = frameNumber;
        return frames_.add(frame);
    }

    Frame CaptureSession::capture(const CaptureRequest& request)
    {
        const VideoSession& video = requireActive(request.videoId);
        const Category category = categories_.find(request.categoryId)
                                      .value_or(categories_.defaultCategory());
        return extractAndRecord(video, request.timestampSeconds, category);
    }

    std::vector<unsigned char> CaptureSession::renderPreview(const std::string& frameId) const
    {
        const Frame frame = frames_.get(frameId);
        const std::vector<unsigned char> source = ImageCodec::readFileBytes(frame.imagePath);
        return Compositor::compose(source, frame.filters, frame.annotations, frame.scale);
    }

    std::string CaptureSession::categoryName(const std::string& categoryId) const
    {
        const std::optional<Category> category = categories_.find(categoryId);
        return category ? category->name : std::string("uncategorized");
    }

    std::size_t CaptureSession::exportRendered(const std::string& outDir) const
    {
        if (!active_)
        {
            throw Error(ErrorKind::NotFound, "No active video to export.");
        }

        std::size_t written = 0;
        for (const Frame& frame : frames_.list(active_->id))
        {
            if (!std::filesystem::exists(frame.imagePath))
            {
                std::cerr << "[Export] Missing source image " << frame.imagePath
                          << ", skipping" << std::endl;
                continue;
            }

            const std::filesystem::path target = std::filesystem::path(outDir) /
                                                 safeDirectoryName(categoryName(frame.categoryId)) /
                                                 frame.fileName;
            try
            {
                const std::vector<unsigned char> rendered = Compositor::compose(
                    ImageCodec::readFileBytes(frame.imagePath),
                    frame.filters, frame.annotations, frame.scale);
                ImageCodec::writeFileBytes(target.string(), rendered);
                ++written;
            }
            catch (const Error& ex)
            {
                // One bad frame does not abort the rest of the export.
                std::cerr << "[Export] Failed to render " << frame.fileName << ": "
                          << ex.what() << std::endl;
            }
            catch (const cv::Exception& ex)
            {
                std::cerr << "[Export] OpenCV failed on " << frame.fileName << ": "
                          << ex.what() << std::endl;
            }
        }

        std::cout << "[Export] Wrote " << written << " frame(s) to " << outDir << std::endl;
        return written;
    }

    void CaptureSession::exportCsv(const std::string& path) const
    {
        if (!active_)
        {
            throw Error(ErrorKind::NotFound, "No active video to export.");
        }

        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw Error(ErrorKind::Io, "Failed to create directory " + parent.string());
            }
        }

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open())
        {
            throw Error(ErrorKind::Io, "Failed to create " + path);
        }

        file << "category,timestamp,file,note\n";
        file << std::fixed << std::setprecision(3);
        for (const Frame& frame : frames_.list(active_->id))
        {
            file << csvField(categoryName(frame.categoryId)) << ','
                 << frame.timestampSeconds << ','
                 << csvField(frame.fileName) << ','
                 << csvField(frame.note)
                 << '\n';
        }

        if (!file)
        {
            throw Error(ErrorKind::Io, "Failed to write " + path);
        }
    }

    json CaptureSession::exportGallery() const
    {
        if (!active_)
        {
            throw Error(ErrorKind::NotFound, "No active video to export.");
        }

        json gallery = json::array();
        for (const Frame& frame : frames_.list(active_->id))
        {
            gallery.push_back(json{
                {"ts", frame.timestampSeconds},
                {"cat_name", categoryName(frame.categoryId)},
                {"note", frame.note},
                {"filters", Serialization::filtersToJson(frame.filters)},
                {"annotations", Serialization::annotationsToJson(frame.annotations)},
                {"scale", frame.scale}
            });
        }
        return gallery;
    }

    std::size_t CaptureSession::importGallery(const json& gallery)
    {
        if (!active_)
        {
            throw Error(ErrorKind::NotFound, "No active video to import into.");
        }
        if (!gallery.is_array())
        {
            throw Error(ErrorKind::ValidationError, "Gallery must be a JSON list.");
        }

        // Parse everything before touching the current frames so that a bad
        // file leaves the gallery as it was.
        std::vector<GalleryEntry> entries;
        for (const json& node : gallery)
        {
            if (!node.is_object() || !node.contains("ts") || !node["ts"].is_number())
            {
                continue;
            }

            GalleryEntry entry;
            entry.seconds = node["ts"].get<double>();
            if (entry.seconds < 0.0 ||
                (active_->durationSeconds > 0.0 && entry.seconds >= active_->durationSeconds))
            {
                throw Error(ErrorKind::SeekOutOfRange,
                            "Gallery timestamp " + formatTimestamp(entry.seconds) +
                            "s is outside the active video.");
            }
            if (node.contains("cat_name") && node["cat_name"].is_string())
            {
                entry.categoryName = node["cat_name"].get<std::string>();
            }
            if (node.contains("note") && node["note"].is_string())
            {
                entry.note = node["note"].get<std::string>();
                entry.hasNote = true;
            }
            entry.filters = node.contains("filters")
                                ? Serialization::filtersFromJson(node["filters"])
                                : defaultFilterStack();
            entry.annotations = node.contains("annotations")
                                    ? Serialization::annotationsFromJson(node["annotations"])
                                    : std::vector<AnnotationSpec>();
            entry.scale = Serialization::scaleFromJson(node.value("scale", json()));
            Compositor::validate(entry.annotations, entry.scale);
            entries.push_back(std::move(entry));
        }

        const VideoSession video = *active_;
        frames_.clearVideo(video.id, true);
        lastFrameNumber_ = 0;

        std::size_t imported = 0;
        for (const GalleryEntry& entry : entries)
        {
            const Category category = categories_.findByName(entry.categoryName)
                                          .value_or(categories_.defaultCategory());

            const Frame frame = extractAndRecord(video, entry.seconds, category);
            frames_.updateFilters(frame.id, entry.filters);
            frames_.updateAnnotations(frame.id, entry.annotations);
            frames_.updateScale(frame.id, entry.scale);
            if (entry.hasNote)
            {
                frames_.updateNote(frame.id, entry.note);
            }
            ++imported;
        }

        std::cout << "[Capture] Imported " << imported << " frame(s) from gallery" << std::endl;
        return imported;
    }

    void CaptureSession::deleteFrame(const std::string& frameId)
    {
        frames_.remove(frameId);
    }

    void CaptureSession::deleteCategory(const std::string& categoryId)
    {
        categories_.remove(categoryId);
        const std::size_t moved = frames_.reassignCategory(categoryId, CategoryStore::kDefaultId);
        std::cout << "[Capture] Moved " << moved << " frame(s) to the default category" << std::endl;
    }
}
