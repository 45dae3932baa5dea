#include "Config.hpp"
#include "Error.hpp"

#include <gtest/gtest.h>

using namespace framelab;

namespace
{
    CommandLine parse(std::vector<const char*> args)
    {
        args.insert(args.begin(), "framelab");
        return parseCommandLine(static_cast<int>(args.size()), args.data());
    }
}

TEST(ConfigTest, DefaultsWithoutFlags)
{
    const CommandLine cli = parse({});
    EXPECT_TRUE(cli.command.empty());
    EXPECT_EQ(cli.config.dataDir, "data");
    EXPECT_EQ(cli.config.framesDir(), "data/frames");
    EXPECT_EQ(cli.config.categoriesFile(), "data/categories.json");
    EXPECT_EQ(cli.config.locatorTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(cli.scale, 1);
}

TEST(ConfigTest, CommandPositionalsAndFlags)
{
    const CommandLine cli = parse({"capture", "clip.mp4", "1.5", "--data-dir", "/tmp/fl",
                                   "--timeout-ms", "500", "--png-level", "6", "-o", "out.png"});
    EXPECT_EQ(cli.command, "capture");
    ASSERT_EQ(cli.positional.size(), 2u);
    EXPECT_EQ(cli.positional[0], "clip.mp4");
    EXPECT_EQ(cli.positional[1], "1.5");
    EXPECT_EQ(cli.config.dataDir, "/tmp/fl");
    EXPECT_EQ(cli.config.locatorTimeout, std::chrono::milliseconds(500));
    EXPECT_EQ(cli.config.pngCompression, 6);
    EXPECT_EQ(cli.outPath, "out.png");
}

TEST(ConfigTest, RenderFlags)
{
    const CommandLine cli = parse({"render", "frame.png", "--filters", "f.json",
                                   "--annotations", "a.json", "--scale", "2", "--view-zoom", "1.5"});
    EXPECT_EQ(cli.filtersPath, "f.json");
    EXPECT_EQ(cli.annotationsPath, "a.json");
    EXPECT_EQ(cli.scale, 2);
    EXPECT_DOUBLE_EQ(cli.viewZoom, 1.5);
}

TEST(ConfigTest, UnknownFlagsBecomeWarnings)
{
    const CommandLine cli = parse({"probe", "--verbose", "clip.mp4"});
    EXPECT_EQ(cli.command, "probe");
    ASSERT_EQ(cli.warnings.size(), 1u);
    EXPECT_NE(cli.warnings[0].find("--verbose"), std::string::npos);
    ASSERT_EQ(cli.positional.size(), 1u);
}

TEST(ConfigTest, MalformedValuesAreRejected)
{
    EXPECT_THROW((void)parse({"render", "--scale", "two"}), Error);
    EXPECT_THROW((void)parse({"render", "--scale", "2x"}), Error);
    EXPECT_THROW((void)parse({"render", "--view-zoom", "big"}), Error);
    EXPECT_THROW((void)parse({"capture", "--timeout-ms", "0"}), Error);
    EXPECT_THROW((void)parse({"capture", "--png-level", "10"}), Error);
}

TEST(ConfigTest, UsageListsEveryCommand)
{
    const std::string text = usage();
    for (const char* command : {"probe", "capture", "render", "session"})
    {
        EXPECT_NE(text.find(command), std::string::npos) << command;
    }
}
