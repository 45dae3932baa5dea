// Declares the runtime configuration and command line parsing of the CLI.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace framelab
{
    struct AppConfig
    {
        std::string dataDir = "data";
        std::chrono::milliseconds locatorTimeout{30000};
        int pngCompression = 3;

        [[nodiscard]] std::string framesDir() const { return dataDir + "/frames"; }
        [[nodiscard]] std::string categoriesFile() const { return dataDir + "/categories.json"; }
    };

    struct CommandLine
    {
        std::string command;
        std::vector<std::string> positional;
        AppConfig config;

        std::string outPath;
        std::string filtersPath;
        std::string annotationsPath;
        std::string galleryPath;
        std::string exportDir;
        std::string csvPath;
        std::string category;
        int scale = 1;
        double viewZoom = 1.0;

        std::vector<std::string> warnings;
    };

    // Throws Error(ValidationError) on malformed flag values. Unknown flags are
    // collected as warnings rather than rejected.
    CommandLine parseCommandLine(int argc, const char* const* argv);

    std::string usage();
}
