#include "CaptureSession.hpp"
#include "Error.hpp"
#include "ImageCodec.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace framelab;
using framelab::test::DecoderScript;
using framelab::test::DecoderStats;
using framelab::test::FakeVideoDecoder;

namespace
{
    class CaptureSessionTest : public ::testing::Test
    {
    protected:
        CaptureSessionTest()
        {
            script_ = test::makeThirtyFpsScript(120);
            script_.width = 64;
            script_.height = 48;
            script_.stream.width = 64;
            script_.stream.height = 48;

            config_.dataDir = dir_.file("data");
            config_.locatorTimeout = std::chrono::milliseconds(5000);
        }

        CaptureSession makeSession()
        {
            const DecoderScript script = script_;
            const std::shared_ptr<DecoderStats> stats = stats_;
            return CaptureSession(config_, frames_, categories_, [script, stats] {
                return std::unique_ptr<VideoDecoder>(new FakeVideoDecoder(script, stats));
            });
        }

        CaptureRequest request(const VideoSession& video, double seconds,
                               const std::string& categoryId = CategoryStore::kDefaultId)
        {
            CaptureRequest req;
            req.videoId = video.id;
            req.timestampSeconds = seconds;
            req.categoryId = categoryId;
            return req;
        }

        test::TempDir dir_;
        DecoderScript script_;
        std::shared_ptr<DecoderStats> stats_ = std::make_shared<DecoderStats>();
        AppConfig config_;
        FrameStore frames_;
        CategoryStore categories_;
    };

    std::string readText(const std::string& path)
    {
        std::ifstream file(path);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }
}

TEST_F(CaptureSessionTest, OpenVideoProbesAndAssignsAnId)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    EXPECT_FALSE(video.id.empty());
    EXPECT_EQ(video.displayName, "match");
    EXPECT_DOUBLE_EQ(video.frameRate, 30.0);
    EXPECT_DOUBLE_EQ(video.durationSeconds, 4.0);
    ASSERT_TRUE(session.activeVideo().has_value());
    EXPECT_EQ(session.activeVideo()->id, video.id);
}

TEST_F(CaptureSessionTest, CaptureCreatesARecordWithDefaults)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    const Frame frame = session.capture(request(video, 2.5));

    EXPECT_EQ(frame.videoId, video.id);
    EXPECT_DOUBLE_EQ(frame.timestampSeconds, 2.5);
    EXPECT_EQ(frame.fileName, "match_frame1_ts2_500.png");
    EXPECT_EQ(frame.note, "Frame: 1, Time: 2.500s");
    EXPECT_EQ(frame.categoryId, CategoryStore::kDefaultId);
    EXPECT_EQ(frame.scale, 1);
    EXPECT_TRUE(frame.annotations.empty());
    ASSERT_EQ(frame.filters.size(), 3u);
    EXPECT_EQ(frame.filters[0].type(), FilterType::BrightnessContrast);
    EXPECT_EQ(frame.filters[1].type(), FilterType::Clahe);
    EXPECT_EQ(frame.filters[2].type(), FilterType::WhiteBalance);
    for (const FilterSpec& filter : frame.filters)
    {
        EXPECT_FALSE(filter.enabled);
    }

    const cv::Mat written = cv::imread(frame.imagePath, cv::IMREAD_COLOR);
    ASSERT_FALSE(written.empty());
    EXPECT_EQ(written.at<cv::Vec3b>(0, 0), cv::Vec3b(75, 75, 75));
}

TEST_F(CaptureSessionTest, FrameNumbersFollowCaptureCount)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    session.capture(request(video, 0.5));
    const Frame second = session.capture(request(video, 1.0));
    EXPECT_EQ(second.fileName, "match_frame2_ts1_000.png");
}

TEST_F(CaptureSessionTest, RecaptureAfterDeleteGetsItsOwnFile)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    const Frame first = session.capture(request(video, 1.0));
    const Frame second = session.capture(request(video, 2.0));
    session.deleteFrame(first.id);

    const Frame third = session.capture(request(video, 2.0));
    EXPECT_EQ(third.fileName, "match_frame3_ts2_000.png");
    EXPECT_NE(third.imagePath, second.imagePath);

    session.deleteFrame(third.id);
    EXPECT_TRUE(std::filesystem::exists(second.imagePath));
}

TEST_F(CaptureSessionTest, ExistingFilesAreNotOverwritten)
{
    std::filesystem::create_directories(config_.framesDir());
    const std::string leftover = config_.framesDir() + "/match_frame1_ts1_000.png";
    {
        std::ofstream file(leftover);
        file << "older run";
    }

    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Frame frame = session.capture(request(video, 1.0));

    EXPECT_EQ(frame.fileName, "match_frame2_ts1_000.png");
    EXPECT_EQ(readText(leftover), "older run");
}

TEST_F(CaptureSessionTest, UnknownCategoryFallsBackToDefault)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    EXPECT_EQ(session.capture(request(video, 1.0, "missing")).categoryId, CategoryStore::kDefaultId);

    const Category goals = categories_.add("Goals");
    EXPECT_EQ(session.capture(request(video, 1.5, goals.id)).categoryId, goals.id);
}

TEST_F(CaptureSessionTest, CaptureForAnotherVideoIsNotFound)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    CaptureRequest req = request(video, 1.0);
    req.videoId = "someone-else";
    try
    {
        session.capture(req);
        FAIL() << "expected NotFound";
    }
    catch (const Error& ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::NotFound);
    }
    EXPECT_EQ(frames_.count(video.id), 0u);
}

TEST_F(CaptureSessionTest, CaptureOutsideTheVideoIsSeekOutOfRange)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    try
    {
        session.capture(request(video, 10.0));
        FAIL() << "expected SeekOutOfRange";
    }
    catch (const Error& ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::SeekOutOfRange);
    }
    EXPECT_EQ(frames_.count(video.id), 0u);
}

TEST_F(CaptureSessionTest, CaptureEditAndRenderAtScaleTwo)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Frame frame = session.capture(request(video, 2.5));

    frames_.updateFilters(frame.id, {FilterSpec{true, "Brightness/Contrast",
                                                BrightnessContrastParams{20, 0}}});

    ShapeAnnotation box;
    box.kind = ShapeKind::Rectangle;
    box.start = {10, 10};
    box.end = {50, 40};
    box.color = Color{255, 0, 0};
    box.thickness = 2.0;
    frames_.updateAnnotations(frame.id, {box});
    frames_.updateScale(frame.id, 2);

    const std::vector<unsigned char> png = session.renderPreview(frame.id);
    const cv::Mat rendered = ImageCodec::decodeImage(png);
    ASSERT_FALSE(rendered.empty());
    EXPECT_EQ(rendered.size(), cv::Size(128, 96));

    // Base pixels were 75, brightened by 20.
    const cv::Vec3b inside = rendered.at<cv::Vec3b>(50, 60);
    for (int c = 0; c < 3; ++c)
    {
        EXPECT_NEAR(inside[c], 95, 1);
    }

    // The rectangle edge sits at twice its base-frame coordinates.
    const cv::Vec3b red(0, 0, 255);
    EXPECT_EQ(rendered.at<cv::Vec3b>(20, 60), red);
    EXPECT_EQ(rendered.at<cv::Vec3b>(80, 60), red);
    EXPECT_EQ(rendered.at<cv::Vec3b>(50, 20), red);
    EXPECT_EQ(rendered.at<cv::Vec3b>(50, 100), red);

    EXPECT_EQ(session.renderPreview(frame.id), png);
}

TEST_F(CaptureSessionTest, UneditedPreviewIsTheCapturedFile)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Frame frame = session.capture(request(video, 1.0));

    EXPECT_EQ(session.renderPreview(frame.id), ImageCodec::readFileBytes(frame.imagePath));
}

TEST_F(CaptureSessionTest, OpeningAnotherVideoDropsPreviousFrames)
{
    CaptureSession session = makeSession();
    const VideoSession first = session.openVideo("/videos/match.mp4");
    const Frame frame = session.capture(request(first, 1.0));
    ASSERT_TRUE(std::filesystem::exists(frame.imagePath));

    const VideoSession second = session.openVideo("/videos/training.mp4");
    EXPECT_NE(second.id, first.id);
    EXPECT_EQ(frames_.count(first.id), 0u);
    EXPECT_FALSE(std::filesystem::exists(frame.imagePath));
}

TEST_F(CaptureSessionTest, ExportRenderedGroupsByCategory)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Category goals = categories_.add("Goals");

    const Frame a = session.capture(request(video, 1.0, goals.id));
    const Frame b = session.capture(request(video, 2.0));
    const Frame missing = session.capture(request(video, 3.0));
    frames_.updateScale(a.id, 2);
    std::filesystem::remove(missing.imagePath);

    const std::string outDir = dir_.file("export");
    EXPECT_EQ(session.exportRendered(outDir), 2u);

    const cv::Mat scaled = cv::imread(outDir + "/Goals/" + a.fileName, cv::IMREAD_COLOR);
    ASSERT_FALSE(scaled.empty());
    EXPECT_EQ(scaled.size(), cv::Size(128, 96));
    EXPECT_TRUE(std::filesystem::exists(outDir + "/Uncategorized/" + b.fileName));
    EXPECT_FALSE(std::filesystem::exists(outDir + "/Uncategorized/" + missing.fileName));
}

TEST_F(CaptureSessionTest, ExportSkipsAFrameWithAnOversizedStroke)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");

    const Frame wide = session.capture(request(video, 1.0));
    const Frame plain = session.capture(request(video, 2.0));

    ShapeAnnotation box;
    box.kind = ShapeKind::Rectangle;
    box.start = {1, 1};
    box.end = {10, 10};
    box.thickness = 11000.0;
    frames_.updateAnnotations(wide.id, {box});
    frames_.updateScale(wide.id, 3);

    const std::string outDir = dir_.file("export");
    EXPECT_EQ(session.exportRendered(outDir), 1u);
    EXPECT_FALSE(std::filesystem::exists(outDir + "/Uncategorized/" + wide.fileName));
    EXPECT_TRUE(std::filesystem::exists(outDir + "/Uncategorized/" + plain.fileName));
}

TEST_F(CaptureSessionTest, CsvReportListsEveryFrame)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Frame frame = session.capture(request(video, 1.5));
    frames_.updateNote(frame.id, "said \"wow\"");

    const std::string path = dir_.file("reports/frames.csv");
    session.exportCsv(path);

    const std::string csv = readText(path);
    EXPECT_EQ(csv.rfind("category,timestamp,file,note\n", 0), 0u);
    EXPECT_NE(csv.find("\"Uncategorized\",1.500,\"match_frame1_ts1_500.png\",\"said \"\"wow\"\"\""),
              std::string::npos);
}

TEST_F(CaptureSessionTest, GalleryRoundTripRecreatesFrames)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Category goals = categories_.add("Goals");

    const Frame frame = session.capture(request(video, 2.0, goals.id));
    frames_.updateFilters(frame.id, {FilterSpec{true, "Brightness/Contrast",
                                                BrightnessContrastParams{10, 5}}});
    frames_.updateScale(frame.id, 3);
    frames_.updateNote(frame.id, "header");
    session.capture(request(video, 3.0));

    const json gallery = session.exportGallery();
    ASSERT_EQ(gallery.size(), 2u);
    EXPECT_EQ(gallery[0]["cat_name"], "Goals");
    EXPECT_EQ(gallery[0]["scale"], 3);

    EXPECT_EQ(session.importGallery(gallery), 2u);
    EXPECT_FALSE(frames_.find(frame.id).has_value());

    const std::vector<Frame> restored = frames_.list(video.id);
    ASSERT_EQ(restored.size(), 2u);
    EXPECT_DOUBLE_EQ(restored[0].timestampSeconds, 2.0);
    EXPECT_EQ(restored[0].categoryId, goals.id);
    EXPECT_EQ(restored[0].scale, 3);
    EXPECT_EQ(restored[0].note, "header");
    ASSERT_EQ(restored[0].filters.size(), 1u);
    EXPECT_TRUE(restored[0].filters[0].enabled);
    EXPECT_TRUE(std::filesystem::exists(restored[0].imagePath));
    EXPECT_EQ(restored[1].categoryId, CategoryStore::kDefaultId);
}

TEST_F(CaptureSessionTest, GalleryImportSkipsEntriesWithoutTimestamp)
{
    CaptureSession session = makeSession();
    session.openVideo("/videos/match.mp4");

    const json gallery = json::parse(R"([
        {"cat_name": "Nowhere", "note": "no ts"},
        {"ts": 1.0, "cat_name": "Nowhere"}
    ])");

    EXPECT_EQ(session.importGallery(gallery), 1u);
    const std::vector<Frame> frames = frames_.list(session.activeVideo()->id);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].categoryId, CategoryStore::kDefaultId);
    EXPECT_EQ(frames[0].filters.size(), 3u);
}

TEST_F(CaptureSessionTest, MalformedGalleryKeepsCurrentFrames)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    session.capture(request(video, 1.0));

    const json gallery = json::parse(R"([{"ts": 1.0, "scale": 9}])");
    EXPECT_THROW(session.importGallery(gallery), Error);
    EXPECT_EQ(frames_.count(video.id), 1u);
}

TEST_F(CaptureSessionTest, GalleryTimestampOutsideTheVideoKeepsCurrentFrames)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Frame kept = session.capture(request(video, 1.0));

    for (const char* text : {R"([{"ts": 1.0}, {"ts": 2.0}, {"ts": 4.0}])",
                             R"([{"ts": 1.0}, {"ts": -0.5}])"})
    {
        try
        {
            session.importGallery(json::parse(text));
            FAIL() << "expected SeekOutOfRange for " << text;
        }
        catch (const Error& ex)
        {
            EXPECT_EQ(ex.kind(), ErrorKind::SeekOutOfRange);
        }
        const std::vector<Frame> frames = frames_.list(video.id);
        ASSERT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0].id, kept.id);
        EXPECT_TRUE(std::filesystem::exists(kept.imagePath));
    }
}

TEST_F(CaptureSessionTest, DeletingACategoryMovesItsFrames)
{
    CaptureSession session = makeSession();
    const VideoSession video = session.openVideo("/videos/match.mp4");
    const Category goals = categories_.add("Goals");
    const Frame frame = session.capture(request(video, 1.0, goals.id));

    session.deleteCategory(goals.id);
    EXPECT_FALSE(categories_.find(goals.id).has_value());
    EXPECT_EQ(frames_.get(frame.id).categoryId, CategoryStore::kDefaultId);

    session.deleteFrame(frame.id);
    EXPECT_EQ(frames_.count(video.id), 0u);
    EXPECT_FALSE(std::filesystem::exists(frame.imagePath));
}
