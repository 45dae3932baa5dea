// Parses the command line into a CommandLine/AppConfig pair.

#include "Config.hpp"

#include "Error.hpp"

#include <sstream>

namespace
{
    [[noreturn]] void rejectValue(const std::string& flag, const std::string& expected,
                                  const std::string& value)
    {
        throw framelab::Error(framelab::ErrorKind::ValidationError,
                              flag + " expects " + expected + ", got '" + value + "'");
    }

    int parseInt(const std::string& flag, const std::string& value)
    {
        std::size_t used = 0;
        int parsed = 0;
        try
        {
            parsed = std::stoi(value, &used);
        }
        catch (const std::exception&)
        {
            rejectValue(flag, "an integer", value);
        }
        if (used != value.size())
        {
            rejectValue(flag, "an integer", value);
        }
        return parsed;
    }

    double parseDouble(const std::string& flag, const std::string& value)
    {
        std::size_t used = 0;
        double parsed = 0.0;
        try
        {
            parsed = std::stod(value, &used);
        }
        catch (const std::exception&)
        {
            rejectValue(flag, "a number", value);
        }
        if (used != value.size())
        {
            rejectValue(flag, "a number", value);
        }
        return parsed;
    }
}

namespace framelab
{
    CommandLine parseCommandLine(int argc, const char* const* argv)
    {
        CommandLine cli;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            const bool hasValue = i + 1 < argc;

            if (a == "--data-dir" && hasValue) {
                cli.config.dataDir = argv[++i];
            } else if (a == "--timeout-ms" && hasValue) {
                const int ms = parseInt(a, argv[++i]);
                if (ms <= 0)
                {
                    throw Error(ErrorKind::ValidationError, "--timeout-ms must be positive");
                }
                cli.config.locatorTimeout = std::chrono::milliseconds(ms);
            } else if (a == "--png-level" && hasValue) {
                const int level = parseInt(a, argv[++i]);
                if (level < 0 || level > 9)
                {
                    throw Error(ErrorKind::ValidationError, "--png-level must be within 0..9");
                }
                cli.config.pngCompression = level;
            } else if ((a == "--out" || a == "-o") && hasValue) {
                cli.outPath = argv[++i];
            } else if (a == "--filters" && hasValue) {
                cli.filtersPath = argv[++i];
            } else if (a == "--annotations" && hasValue) {
                cli.annotationsPath = argv[++i];
            } else if (a == "--scale" && hasValue) {
                cli.scale = parseInt(a, argv[++i]);
            } else if (a == "--view-zoom" && hasValue) {
                cli.viewZoom = parseDouble(a, argv[++i]);
            } else if (a == "--gallery" && hasValue) {
                cli.galleryPath = argv[++i];
            } else if (a == "--export" && hasValue) {
                cli.exportDir = argv[++i];
            } else if (a == "--csv" && hasValue) {
                cli.csvPath = argv[++i];
            } else if (a == "--category" && hasValue) {
                cli.category = argv[++i];
            } else if (a.size() > 1 && a[0] == '-' && a != "-") {
                cli.warnings.push_back("Ignoring unknown option " + a);
            } else if (cli.command.empty()) {
                cli.command = a;
            } else {
                cli.positional.push_back(a);
            }
        }

        return cli;
    }

    std::string usage()
    {
        std::ostringstream oss;
        oss << "Usage: framelab <command> [args] [options]\n"
            << "Commands:\n"
            << "  probe <video>                      Print stream frame rate, duration and size\n"
            << "  capture <video> <seconds>...       Extract exact frames as PNG (--out for one)\n"
            << "  render <image>                     Filter, upscale and annotate one image\n"
            << "  session <video>                    Capture a gallery and export it\n"
            << "Options: --data-dir <dir> --timeout-ms <ms> --png-level <0-9> --out <path>\n"
            << "         --filters <json> --annotations <json> --scale <1-3> --view-zoom <z>\n"
            << "         --gallery <json> --export <dir> --csv <path> --category <name>\n";
        return oss.str();
    }
}
