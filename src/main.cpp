// Command line entry point: probe, capture, render and session commands.

#include "CaptureSession.hpp"
#include "CategoryStore.hpp"
#include "Compositor.hpp"
#include "Config.hpp"
#include "Error.hpp"
#include "FFmpegVideoDecoder.hpp"
#include "FrameLocator.hpp"
#include "FrameStore.hpp"
#include "ImageCodec.hpp"
#include "Serialization.hpp"
#include "ViewTransform.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>

namespace
{
    std::unique_ptr<framelab::VideoDecoder> makeDecoder()
    {
        return std::make_unique<framelab::FFmpegVideoDecoder>();
    }

    double parseSeconds(const std::string& value)
    {
        std::size_t used = 0;
        double seconds = 0.0;
        try
        {
            seconds = std::stod(value, &used);
        }
        catch (const std::exception&)
        {
            throw framelab::Error(framelab::ErrorKind::ValidationError,
                                  "Expected a timestamp in seconds, got '" + value + "'");
        }
        if (used != value.size())
        {
            throw framelab::Error(framelab::ErrorKind::ValidationError,
                                  "Expected a timestamp in seconds, got '" + value + "'");
        }
        return seconds;
    }

    int runProbe(const framelab::CommandLine& cli)
    {
        if (cli.positional.empty())
        {
            std::cout << framelab::usage();
            return EXIT_FAILURE;
        }

        framelab::FFmpegVideoDecoder decoder;
        const framelab::VideoSession video = framelab::FrameLocator::probeVideo(decoder, cli.positional[0]);
        std::cout << "File: " << video.sourcePath << "\n"
                  << "Size: " << video.width << "x" << video.height << "\n"
                  << "Frame rate: " << video.frameRate << " fps\n"
                  << "Duration: ";
        if (video.durationSeconds >= 0.0)
        {
            std::cout << video.durationSeconds << " s\n";
        }
        else
        {
            std::cout << "unknown\n";
        }
        return EXIT_SUCCESS;
    }

    int runCapture(const framelab::CommandLine& cli)
    {
        if (cli.positional.size() < 2)
        {
            std::cout << framelab::usage();
            return EXIT_FAILURE;
        }

        const std::string& videoPath = cli.positional[0];
        const std::size_t count = cli.positional.size() - 1;
        if (!cli.outPath.empty() && count > 1)
        {
            throw framelab::Error(framelab::ErrorKind::ValidationError,
                                  "--out accepts a single timestamp");
        }

        framelab::LocatorOptions options;
        options.timeout = cli.config.locatorTimeout;
        const std::string stem = std::filesystem::path(videoPath).stem().string();

        for (std::size_t i = 1; i < cli.positional.size(); ++i)
        {
            const double seconds = parseSeconds(cli.positional[i]);
            const std::string outPath = !cli.outPath.empty()
                ? cli.outPath
                : (std::filesystem::path(cli.config.framesDir()) /
                   framelab::CaptureSession::frameFileName(stem, i, seconds)).string();

            framelab::FFmpegVideoDecoder decoder;
            framelab::FrameLocator::extractExactFrame(decoder, videoPath, seconds, outPath,
                                                      options, cli.config.pngCompression);
            std::cout << "Saved: " << outPath << std::endl;
        }
        return EXIT_SUCCESS;
    }

    int runRender(const framelab::CommandLine& cli)
    {
        if (cli.positional.empty())
        {
            std::cout << framelab::usage();
            return EXIT_FAILURE;
        }

        const std::string& imagePath = cli.positional[0];

        std::vector<framelab::FilterSpec> filters = framelab::defaultFilterStack();
        if (!cli.filtersPath.empty())
        {
            filters = framelab::Serialization::filtersFromJson(
                framelab::Serialization::loadJsonFile(cli.filtersPath));
        }

        std::vector<framelab::AnnotationSpec> annotations;
        if (!cli.annotationsPath.empty())
        {
            // Annotation files are in display coordinates at --view-zoom.
            framelab::ViewTransform view;
            view.zoom = cli.viewZoom;
            annotations = view.toStorage(framelab::Serialization::annotationsFromJson(
                framelab::Serialization::loadJsonFile(cli.annotationsPath)));
        }

        framelab::RenderRequest request;
        request.imageBytes = framelab::ImageCodec::readFileBytes(imagePath);
        request.filters = filters;
        request.annotations = annotations;
        request.scale = cli.scale;

        const std::vector<unsigned char> rendered = framelab::Compositor::compose(request);

        std::string outPath = cli.outPath;
        if (outPath.empty())
        {
            const std::filesystem::path source(imagePath);
            outPath = (source.parent_path() / (source.stem().string() + "_rendered.png")).string();
        }
        framelab::ImageCodec::writeFileBytes(outPath, rendered);
        std::cout << "Saved: " << outPath << std::endl;
        return EXIT_SUCCESS;
    }

    int runSession(const framelab::CommandLine& cli)
    {
        if (cli.positional.empty())
        {
            std::cout << framelab::usage();
            return EXIT_FAILURE;
        }

        framelab::FrameStore frames;
        framelab::CategoryStore categories;
        categories.load(cli.config.categoriesFile());

        framelab::CaptureSession session(cli.config, frames, categories, &makeDecoder);
        const framelab::VideoSession video = session.openVideo(cli.positional[0]);

        if (!cli.galleryPath.empty())
        {
            session.importGallery(framelab::Serialization::loadJsonFile(cli.galleryPath));
        }

        std::string categoryId = framelab::CategoryStore::kDefaultId;
        if (!cli.category.empty())
        {
            const std::optional<framelab::Category> existing = categories.findByName(cli.category);
            categoryId = existing ? existing->id : categories.add(cli.category).id;
            categories.save(cli.config.categoriesFile());
        }

        for (std::size_t i = 1; i < cli.positional.size(); ++i)
        {
            framelab::CaptureRequest request;
            request.videoId = video.id;
            request.timestampSeconds = parseSeconds(cli.positional[i]);
            request.categoryId = categoryId;

            const framelab::Frame frame = session.capture(request);
            std::cout << "Captured: " << frame.fileName << std::endl;
        }

        const std::string galleryOut = cli.config.dataDir + "/gallery.json";
        framelab::Serialization::saveJsonFile(galleryOut, session.exportGallery());
        std::cout << "Gallery: " << galleryOut << std::endl;

        if (!cli.exportDir.empty())
        {
            session.exportRendered(cli.exportDir);
        }
        if (!cli.csvPath.empty())
        {
            session.exportCsv(cli.csvPath);
            std::cout << "Report: " << cli.csvPath << std::endl;
        }
        return EXIT_SUCCESS;
    }
}

int main(int argc, char** argv)
{
    try
    {
        const framelab::CommandLine cli = framelab::parseCommandLine(argc, argv);
        for (const std::string& warning : cli.warnings)
        {
            std::cerr << warning << std::endl;
        }

        if (cli.command == "probe") {
            return runProbe(cli);
        } else if (cli.command == "capture") {
            return runCapture(cli);
        } else if (cli.command == "render") {
            return runRender(cli);
        } else if (cli.command == "session") {
            return runSession(cli);
        }

        std::cout << framelab::usage();
        return cli.command.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
